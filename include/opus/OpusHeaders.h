/*
 * OpusHeaders.h - Ogg Opus identification and comment headers (RFC 7845 section 5)
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAFKIT_OPUS_OPUSHEADERS_H
#define TAFKIT_OPUS_OPUSHEADERS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace TafKit {
namespace Opus {

constexpr size_t OPUS_HEAD_MIN_SIZE = 19;

/**
 * @brief Opus identification header ("OpusHead")
 */
struct OpusHeader {
    uint8_t version = 1;
    uint8_t channel_count = 2;
    uint16_t pre_skip = 0;
    uint32_t input_sample_rate = 48000;
    int16_t output_gain = 0;
    uint8_t channel_mapping_family = 0;

    // Channel mapping table, present when channel_mapping_family != 0
    uint8_t stream_count = 0;
    uint8_t coupled_stream_count = 0;
    std::vector<uint8_t> channel_mapping;

    bool isValid() const;

    static bool hasSignature(const std::vector<uint8_t>& packet_data);

    /**
     * @brief Parse an identification packet. Trailing bytes are ignored.
     * @throws StructuralError(InvalidIdentificationHeader)
     */
    static OpusHeader parseFromPacket(const std::vector<uint8_t>& packet_data);

    std::vector<uint8_t> toPacket() const;
};

/**
 * @brief Opus comment header ("OpusTags")
 */
struct OpusComments {
    std::string vendor_string;
    std::vector<std::pair<std::string, std::string>> user_comments;

    static bool hasSignature(const std::vector<uint8_t>& packet_data);

    /**
     * @brief Parse a comment packet. Data after the comment list is ignored.
     * @throws StructuralError(InvalidCommentHeader)
     */
    static OpusComments parseFromPacket(const std::vector<uint8_t>& packet_data);

    std::vector<uint8_t> toPacket() const;

    /**
     * @brief First value of a field, compared case-insensitively.
     */
    std::string get(const std::string& field) const;
};

} // namespace Opus
} // namespace TafKit

#endif // TAFKIT_OPUS_OPUSHEADERS_H
