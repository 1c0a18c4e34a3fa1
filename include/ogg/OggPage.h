/*
 * OggPage.h - Ogg page model and page codec (RFC 3533)
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Parses and serializes single Ogg pages. Checksums are computed through
 * libogg so that the CRC is bit-identical to what every Ogg decoder uses.
 */

#ifndef TAFKIT_OGG_OGGPAGE_H
#define TAFKIT_OGG_OGGPAGE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace TafKit {
namespace Ogg {

constexpr size_t OGG_PAGE_HEADER_SIZE = 27;
constexpr size_t OGG_MAX_SEGMENTS = 255;
constexpr size_t OGG_MAX_PAGE_SIZE = OGG_PAGE_HEADER_SIZE + OGG_MAX_SEGMENTS + OGG_MAX_SEGMENTS * 255;
constexpr uint8_t OGG_LACING_CONTINUES = 255;

constexpr uint8_t OGG_FLAG_CONTINUED = 0x01;
constexpr uint8_t OGG_FLAG_BOS = 0x02;
constexpr uint8_t OGG_FLAG_EOS = 0x04;

// Granule position of a page on which no packet completes
constexpr uint64_t OGG_GRANULE_NONE = ~static_cast<uint64_t>(0);

/**
 * @brief Number of lacing values needed for a packet of the given size
 * when it is stored complete on one page.
 */
inline size_t laceCount(size_t packet_size) {
    return packet_size / 255 + 1;
}

struct OggPage {
    uint8_t version = 0;
    uint8_t flags = 0;
    uint64_t granule_position = 0;
    uint32_t serial_number = 0;
    uint32_t sequence_number = 0;
    uint32_t checksum = 0;            ///< Value read from / written to the wire
    std::vector<uint8_t> segments;    ///< Lacing table
    std::vector<uint8_t> body;

    bool isContinued() const { return (flags & OGG_FLAG_CONTINUED) != 0; }
    bool isBeginOfStream() const { return (flags & OGG_FLAG_BOS) != 0; }
    bool isEndOfStream() const { return (flags & OGG_FLAG_EOS) != 0; }

    size_t headerSize() const { return OGG_PAGE_HEADER_SIZE + segments.size(); }
    size_t size() const { return headerSize() + body.size(); }

    /**
     * @brief True if the last packet on this page continues on the next one.
     */
    bool endsWithOpenPacket() const {
        return !segments.empty() && segments.back() == OGG_LACING_CONTINUES;
    }

    /**
     * @brief Number of packets that end on this page.
     */
    size_t completedPacketCount() const;

    /**
     * @brief Append a packet fragment and its lacing values.
     * @param complete false if the packet continues on the next page; the
     *        fragment size must then be a multiple of 255
     * @throws CapacityError(LacingOverflow) if the lacing table would exceed 255 entries
     */
    void appendFragment(const uint8_t* data, size_t size, bool complete);
};

/**
 * @brief Result of framing a page stream without stopping at the first defect.
 */
struct PageScan {
    struct Entry {
        OggPage page;
        size_t offset = 0;   ///< Byte offset of the page in the scanned buffer
        size_t size = 0;
    };

    std::vector<Entry> pages;
    bool complete = true;     ///< False if framing stopped before the end of the buffer
    size_t error_offset = 0;
    std::string error;
};

class OggPageCodec {
public:
    /**
     * @brief Parse one page from the start of a buffer.
     * @param data Buffer holding the page
     * @param size Number of bytes available
     * @param[out] consumed Size of the parsed page, may be null
     * @param verify_checksum Recompute the CRC and reject mismatches
     * @throws FormatError on bad capture pattern, truncation, version or checksum
     */
    static OggPage parse(const uint8_t* data, size_t size, size_t* consumed = nullptr,
                         bool verify_checksum = true);
    static OggPage parse(const std::vector<uint8_t>& bytes);

    /**
     * @brief Parse a contiguous run of pages filling the whole buffer.
     */
    static std::vector<OggPage> parseStream(const uint8_t* data, size_t size,
                                            bool verify_checksum = true);
    static std::vector<OggPage> parseStream(const std::vector<uint8_t>& bytes,
                                            bool verify_checksum = true);

    /**
     * @brief Frame as many pages as possible without verifying checksums.
     * Never throws a FormatError; the first framing defect ends the scan.
     */
    static PageScan scanStream(const uint8_t* data, size_t size);

    /**
     * @brief Serialize a page, computing a fresh checksum.
     * @throws CapacityError(LacingOverflow), FormatError(MalformedPage)
     */
    static std::vector<uint8_t> serialize(const OggPage& page);
    static void serializeTo(const OggPage& page, std::vector<uint8_t>& out);

    /**
     * @brief Check the stored CRC of a raw page.
     * @return false on mismatch
     * @throws FormatError if the bytes do not hold a framed page
     */
    static bool verifyChecksum(const uint8_t* data, size_t size);

    /**
     * @brief Size of the page starting at data, from its header only.
     * @throws FormatError on bad capture pattern or truncation
     */
    static size_t framedSize(const uint8_t* data, size_t size);

private:
    static uint32_t computeChecksum(std::vector<uint8_t>& header, const uint8_t* body, size_t body_size);
};

} // namespace Ogg
} // namespace TafKit

#endif // TAFKIT_OGG_OGGPAGE_H
