/*
 * OpusPacketTraits.h - Page writer traits for Ogg Opus streams
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAFKIT_OPUS_OPUSPACKETTRAITS_H
#define TAFKIT_OPUS_OPUSPACKETTRAITS_H

#include "ogg/PacketTraits.h"

namespace TafKit {
namespace Opus {

/**
 * @brief Granule and padding rules of RFC 7845.
 *
 * Audio packets are padded with Opus code 3 padding. OpusHead and OpusTags
 * are padded with trailing zero bytes, which decoders ignore.
 */
class OpusPacketTraits : public Ogg::PacketTraits {
public:
    uint32_t sampleCount(const std::vector<uint8_t>& packet) const override;
    std::vector<uint8_t> pad(const std::vector<uint8_t>& packet, Ogg::PacketRole role,
                             size_t growth) const override;
};

} // namespace Opus
} // namespace TafKit

#endif // TAFKIT_OPUS_OPUSPACKETTRAITS_H
