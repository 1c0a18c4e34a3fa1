/*
 * TafHeader.h - Fixed-size TAF header block
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Layout of the 4096 byte block:
 *   [0..4)        big-endian length N of the structured header
 *   [4..4+N)      protobuf message
 *                   1: bytes  hash       (SHA-1, 20 bytes)
 *                   2: uint32 length     (page stream size)
 *                   3: uint32 timestamp  (= Ogg serial number)
 *                   4: repeated uint32 chapter_pages (packed)
 *                   5: bytes  padding
 *   [4+N..4096)   zero fill
 */

#ifndef TAFKIT_TAF_TAFHEADER_H
#define TAFKIT_TAF_TAFHEADER_H

#include "core/Sha1.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace TafKit {
namespace Taf {

constexpr size_t TAF_HEADER_BLOCK_SIZE = 4096;
constexpr size_t TAF_HEADER_PREFIX_SIZE = 4;
constexpr size_t TAF_HEADER_MAX_MESSAGE = TAF_HEADER_BLOCK_SIZE - TAF_HEADER_PREFIX_SIZE;

struct TafHeader {
    Core::Sha1Digest hash{};
    uint32_t length = 0;
    uint32_t timestamp = 0;
    std::vector<uint32_t> chapter_pages;

    // Filled in by decode()
    uint32_t message_size = 0;
    size_t padding_size = 0;

    bool operator==(const TafHeader& other) const {
        return hash == other.hash && length == other.length && timestamp == other.timestamp &&
               chapter_pages == other.chapter_pages;
    }
    bool operator!=(const TafHeader& other) const { return !(*this == other); }
};

class TafHeaderCodec {
public:
    /**
     * @brief Encode a header into a full 4096 byte block.
     *
     * The padding field is sized so that the message fills the block. When
     * varint sizes make that impossible the last byte is left as zero fill.
     * @throws CapacityError(HeaderOverflow) if the message does not fit
     */
    static std::vector<uint8_t> encode(const TafHeader& header);

    /**
     * @brief Decode a header block. Only the first 4096 bytes are examined.
     * @throws FormatError(TruncatedHeader) if the length prefix claims more
     *         bytes than the block holds
     * @throws FormatError(MalformedHeader) on invalid protobuf encoding or a
     *         hash that is not 20 bytes
     */
    static TafHeader decode(const uint8_t* data, size_t size);
    static TafHeader decode(const std::vector<uint8_t>& block) { return decode(block.data(), block.size()); }

    /**
     * @brief Read the big-endian length prefix.
     * @throws FormatError(TruncatedHeader) if fewer than 4 bytes are available
     */
    static uint32_t lengthPrefix(const uint8_t* data, size_t size);
};

} // namespace Taf
} // namespace TafKit

#endif // TAFKIT_TAF_TAFHEADER_H
