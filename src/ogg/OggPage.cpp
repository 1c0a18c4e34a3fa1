/*
 * OggPage.cpp - Ogg page model and page codec (RFC 3533)
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"
#include "ogg/OggPage.h"

namespace TafKit {
namespace Ogg {

using Core::readLE32;

size_t OggPage::completedPacketCount() const {
    size_t count = 0;
    for (uint8_t lace : segments) {
        if (lace < OGG_LACING_CONTINUES) {
            count++;
        }
    }
    return count;
}

void OggPage::appendFragment(const uint8_t* data, size_t size, bool complete) {
    if (!complete && (size == 0 || size % 255 != 0)) {
        throw FormatError(ErrorCode::MalformedPage,
                          "open packet fragment of " + std::to_string(size) + " bytes is not a multiple of 255");
    }

    size_t needed = complete ? laceCount(size) : size / 255;
    if (segments.size() + needed > OGG_MAX_SEGMENTS) {
        throw CapacityError(ErrorCode::LacingOverflow,
                            "fragment of " + std::to_string(size) + " bytes needs " + std::to_string(needed) +
                            " lacing values, " + std::to_string(OGG_MAX_SEGMENTS - segments.size()) + " left");
    }

    segments.insert(segments.end(), size / 255, OGG_LACING_CONTINUES);
    if (complete) {
        segments.push_back(static_cast<uint8_t>(size % 255));
    }
    body.insert(body.end(), data, data + size);
}

size_t OggPageCodec::framedSize(const uint8_t* data, size_t size) {
    if (size < OGG_PAGE_HEADER_SIZE) {
        throw FormatError(ErrorCode::TruncatedPage,
                          "need " + std::to_string(OGG_PAGE_HEADER_SIZE) + " header bytes, have " + std::to_string(size));
    }
    if (std::memcmp(data, "OggS", 4) != 0) {
        throw FormatError(ErrorCode::BadCapturePattern, "page does not start with OggS");
    }

    size_t segment_count = data[26];
    size_t header_size = OGG_PAGE_HEADER_SIZE + segment_count;
    if (size < header_size) {
        throw FormatError(ErrorCode::TruncatedPage, "lacing table runs past end of data");
    }

    size_t body_size = 0;
    for (size_t i = 0; i < segment_count; ++i) {
        body_size += data[OGG_PAGE_HEADER_SIZE + i];
    }
    if (size < header_size + body_size) {
        throw FormatError(ErrorCode::TruncatedPage,
                          "page body needs " + std::to_string(body_size) + " bytes, have " +
                          std::to_string(size - header_size));
    }
    return header_size + body_size;
}

uint32_t OggPageCodec::computeChecksum(std::vector<uint8_t>& header, const uint8_t* body, size_t body_size) {
    // ogg_page_checksum_set() zeroes the CRC field, hashes header and body
    // and stores the result little-endian at offset 22.
    ogg_page og;
    og.header = header.data();
    og.header_len = static_cast<long>(header.size());
    og.body = const_cast<unsigned char*>(body);
    og.body_len = static_cast<long>(body_size);
    ogg_page_checksum_set(&og);
    return readLE32(header.data() + 22);
}

bool OggPageCodec::verifyChecksum(const uint8_t* data, size_t size) {
    size_t total = framedSize(data, size);
    size_t header_size = OGG_PAGE_HEADER_SIZE + data[26];

    std::vector<uint8_t> header(data, data + header_size);
    uint32_t stored = readLE32(data + 22);
    uint32_t computed = computeChecksum(header, data + header_size, total - header_size);
    return stored == computed;
}

OggPage OggPageCodec::parse(const uint8_t* data, size_t size, size_t* consumed, bool verify_checksum) {
    size_t total = framedSize(data, size);
    size_t segment_count = data[26];
    size_t header_size = OGG_PAGE_HEADER_SIZE + segment_count;

    ogg_page og;
    og.header = const_cast<unsigned char*>(data);
    og.header_len = static_cast<long>(header_size);
    og.body = const_cast<unsigned char*>(data + header_size);
    og.body_len = static_cast<long>(total - header_size);

    if (ogg_page_version(&og) != 0) {
        throw FormatError(ErrorCode::MalformedPage,
                          "unsupported stream structure version " + std::to_string(ogg_page_version(&og)));
    }

    OggPage page;
    page.version = 0;
    page.flags = data[5];
    page.granule_position = static_cast<uint64_t>(ogg_page_granulepos(&og));
    page.serial_number = static_cast<uint32_t>(ogg_page_serialno(&og));
    page.sequence_number = static_cast<uint32_t>(ogg_page_pageno(&og));
    page.checksum = readLE32(data + 22);
    page.segments.assign(data + OGG_PAGE_HEADER_SIZE, data + header_size);
    page.body.assign(data + header_size, data + total);

    if (verify_checksum) {
        std::vector<uint8_t> header(data, data + header_size);
        uint32_t computed = computeChecksum(header, page.body.data(), page.body.size());
        if (computed != page.checksum) {
            std::ostringstream oss;
            oss << "page " << page.sequence_number << " stores 0x" << std::hex << std::setw(8)
                << std::setfill('0') << page.checksum << ", computed 0x" << std::setw(8) << computed;
            throw FormatError(ErrorCode::ChecksumMismatch, oss.str());
        }
    }

    if (consumed) {
        *consumed = total;
    }
    return page;
}

OggPage OggPageCodec::parse(const std::vector<uint8_t>& bytes) {
    return parse(bytes.data(), bytes.size());
}

std::vector<OggPage> OggPageCodec::parseStream(const uint8_t* data, size_t size, bool verify_checksum) {
    std::vector<OggPage> pages;
    size_t offset = 0;
    while (offset < size) {
        size_t consumed = 0;
        pages.push_back(parse(data + offset, size - offset, &consumed, verify_checksum));
        offset += consumed;
    }
    DEBUG_LOG("ogg", "parsed ", pages.size(), " pages from ", size, " bytes");
    return pages;
}

std::vector<OggPage> OggPageCodec::parseStream(const std::vector<uint8_t>& bytes, bool verify_checksum) {
    return parseStream(bytes.data(), bytes.size(), verify_checksum);
}

PageScan OggPageCodec::scanStream(const uint8_t* data, size_t size) {
    PageScan scan;
    size_t offset = 0;
    while (offset < size) {
        try {
            PageScan::Entry entry;
            entry.page = parse(data + offset, size - offset, &entry.size, false);
            entry.offset = offset;
            offset += entry.size;
            scan.pages.push_back(std::move(entry));
        } catch (const FormatError& e) {
            scan.complete = false;
            scan.error_offset = offset;
            scan.error = e.what();
            DEBUG_LOG("ogg", "stopped at offset ", offset, ": ", e.what());
            break;
        }
    }
    return scan;
}

void OggPageCodec::serializeTo(const OggPage& page, std::vector<uint8_t>& out) {
    if (page.segments.size() > OGG_MAX_SEGMENTS) {
        throw CapacityError(ErrorCode::LacingOverflow,
                            "page " + std::to_string(page.sequence_number) + " needs " +
                            std::to_string(page.segments.size()) + " lacing values");
    }

    size_t lacing_total = 0;
    for (uint8_t lace : page.segments) {
        lacing_total += lace;
    }
    if (lacing_total != page.body.size()) {
        throw FormatError(ErrorCode::MalformedPage,
                          "lacing table describes " + std::to_string(lacing_total) + " bytes, body holds " +
                          std::to_string(page.body.size()));
    }

    std::vector<uint8_t> header(OGG_PAGE_HEADER_SIZE + page.segments.size(), 0);
    std::memcpy(header.data(), "OggS", 4);
    header[4] = page.version;
    header[5] = page.flags;
    Core::writeLE64(header.data() + 6, page.granule_position);
    Core::writeLE32(header.data() + 14, page.serial_number);
    Core::writeLE32(header.data() + 18, page.sequence_number);
    header[26] = static_cast<uint8_t>(page.segments.size());
    std::copy(page.segments.begin(), page.segments.end(), header.begin() + OGG_PAGE_HEADER_SIZE);

    computeChecksum(header, page.body.data(), page.body.size());

    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), page.body.begin(), page.body.end());
}

std::vector<uint8_t> OggPageCodec::serialize(const OggPage& page) {
    std::vector<uint8_t> out;
    out.reserve(page.size());
    serializeTo(page, out);
    return out;
}

} // namespace Ogg
} // namespace TafKit
