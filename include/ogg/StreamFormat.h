/*
 * StreamFormat.h - Codec identification from the first packet of a bitstream
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Recognises the identification packets of the codecs commonly carried in
 * Ogg. Only Opus can be put into a TAF container; the other formats are
 * recognised so that a wrong input is reported by name.
 */

#ifndef TAFKIT_OGG_STREAMFORMAT_H
#define TAFKIT_OGG_STREAMFORMAT_H

#include "opus/OpusHeaders.h"

#include <string>
#include <variant>
#include <vector>

namespace TafKit {
namespace Ogg {

struct VorbisIdentification {
    uint8_t channels = 0;
    uint32_t sample_rate = 0;
};

struct SpeexIdentification {
    uint32_t channels = 0;
    uint32_t sample_rate = 0;
};

struct FLACIdentification {
    uint8_t channels = 0;
    uint32_t sample_rate = 0;
};

using StreamIdentification = std::variant<Opus::OpusHeader,
                                          VorbisIdentification,
                                          SpeexIdentification,
                                          FLACIdentification>;

/**
 * @brief Identify a codec from the first packet of a logical bitstream.
 * @throws StructuralError(UnsupportedStreamFormat) for unknown signatures
 * @throws StructuralError(InvalidIdentificationHeader) for a known but broken header
 */
StreamIdentification identifyStream(const std::vector<uint8_t>& bos_packet);

std::string streamFormatName(const StreamIdentification& identification);

} // namespace Ogg
} // namespace TafKit

#endif // TAFKIT_OGG_STREAMFORMAT_H
