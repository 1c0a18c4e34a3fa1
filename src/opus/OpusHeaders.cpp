/*
 * OpusHeaders.cpp - Ogg Opus identification and comment headers (RFC 7845 section 5)
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"
#include "opus/OpusHeaders.h"

#include <cctype>

namespace TafKit {
namespace Opus {

using Core::readLE16;
using Core::readLE32;

// ========== OpusHeader Implementation ==========

bool OpusHeader::isValid() const
{
    // Major version nibble 0 is compatible; version 0 itself was never defined
    if (version == 0 || (version & 0xF0) != 0) {
        return false;
    }
    if (channel_count < 1) {
        return false;
    }
    if (channel_mapping_family == 0) {
        return channel_count <= 2;
    }
    return stream_count >= 1 &&
           coupled_stream_count <= stream_count &&
           channel_mapping.size() == channel_count;
}

bool OpusHeader::hasSignature(const std::vector<uint8_t>& packet_data)
{
    return packet_data.size() >= 8 && std::memcmp(packet_data.data(), "OpusHead", 8) == 0;
}

OpusHeader OpusHeader::parseFromPacket(const std::vector<uint8_t>& packet_data)
{
    if (!hasSignature(packet_data)) {
        throw StructuralError(ErrorCode::InvalidIdentificationHeader, "missing OpusHead signature");
    }
    if (packet_data.size() < OPUS_HEAD_MIN_SIZE) {
        throw StructuralError(ErrorCode::InvalidIdentificationHeader,
                              "OpusHead packet too small: " + std::to_string(packet_data.size()) + " bytes");
    }

    OpusHeader header;
    header.version = packet_data[8];
    header.channel_count = packet_data[9];
    header.pre_skip = readLE16(packet_data.data() + 10);
    header.input_sample_rate = readLE32(packet_data.data() + 12);
    header.output_gain = static_cast<int16_t>(readLE16(packet_data.data() + 16));
    header.channel_mapping_family = packet_data[18];

    if (header.channel_mapping_family != 0) {
        if (packet_data.size() < 21 + static_cast<size_t>(header.channel_count)) {
            throw StructuralError(ErrorCode::InvalidIdentificationHeader,
                                  "channel mapping table truncated for family " +
                                  std::to_string(header.channel_mapping_family));
        }
        header.stream_count = packet_data[19];
        header.coupled_stream_count = packet_data[20];
        header.channel_mapping.assign(packet_data.begin() + 21,
                                      packet_data.begin() + 21 + header.channel_count);
    }

    if (!header.isValid()) {
        throw StructuralError(ErrorCode::InvalidIdentificationHeader,
                              "invalid OpusHead: version " + std::to_string(header.version) +
                              ", channels " + std::to_string(header.channel_count) +
                              ", mapping family " + std::to_string(header.channel_mapping_family));
    }

    Debug::log("opus", "OpusHead: channels=", static_cast<unsigned>(header.channel_count),
               ", pre_skip=", header.pre_skip, ", rate=", header.input_sample_rate,
               ", mapping_family=", static_cast<unsigned>(header.channel_mapping_family));
    return header;
}

std::vector<uint8_t> OpusHeader::toPacket() const
{
    std::vector<uint8_t> packet = { 'O', 'p', 'u', 's', 'H', 'e', 'a', 'd' };
    packet.push_back(version);
    packet.push_back(channel_count);
    Core::appendLE16(packet, pre_skip);
    Core::appendLE32(packet, input_sample_rate);
    Core::appendLE16(packet, static_cast<uint16_t>(output_gain));
    packet.push_back(channel_mapping_family);
    if (channel_mapping_family != 0) {
        packet.push_back(stream_count);
        packet.push_back(coupled_stream_count);
        packet.insert(packet.end(), channel_mapping.begin(), channel_mapping.end());
    }
    return packet;
}

// ========== OpusComments Implementation ==========

bool OpusComments::hasSignature(const std::vector<uint8_t>& packet_data)
{
    return packet_data.size() >= 8 && std::memcmp(packet_data.data(), "OpusTags", 8) == 0;
}

OpusComments OpusComments::parseFromPacket(const std::vector<uint8_t>& packet_data)
{
    if (!hasSignature(packet_data)) {
        throw StructuralError(ErrorCode::InvalidCommentHeader, "missing OpusTags signature");
    }

    const uint8_t* data = packet_data.data();
    size_t size = packet_data.size();
    size_t offset = 8;

    auto need = [&](size_t bytes, const char* what) {
        if (bytes > size - offset) {
            throw StructuralError(ErrorCode::InvalidCommentHeader,
                                  std::string("OpusTags truncated in ") + what);
        }
    };

    OpusComments comments;

    need(4, "vendor length");
    uint32_t vendor_length = readLE32(data + offset);
    offset += 4;
    need(vendor_length, "vendor string");
    comments.vendor_string.assign(reinterpret_cast<const char*>(data + offset), vendor_length);
    offset += vendor_length;

    need(4, "comment count");
    uint32_t comment_count = readLE32(data + offset);
    offset += 4;

    for (uint32_t i = 0; i < comment_count; ++i) {
        need(4, "comment length");
        uint32_t comment_length = readLE32(data + offset);
        offset += 4;
        need(comment_length, "comment");
        std::string comment(reinterpret_cast<const char*>(data + offset), comment_length);
        offset += comment_length;

        size_t equals = comment.find('=');
        if (equals == std::string::npos) {
            comments.user_comments.emplace_back(comment, std::string());
        } else {
            comments.user_comments.emplace_back(comment.substr(0, equals), comment.substr(equals + 1));
        }
    }

    Debug::log("opus", "OpusTags: vendor='", comments.vendor_string, "', ", comment_count, " comments, ",
               size - offset, " trailing bytes");
    return comments;
}

std::vector<uint8_t> OpusComments::toPacket() const
{
    std::vector<uint8_t> packet = { 'O', 'p', 'u', 's', 'T', 'a', 'g', 's' };
    Core::appendLE32(packet, static_cast<uint32_t>(vendor_string.size()));
    packet.insert(packet.end(), vendor_string.begin(), vendor_string.end());
    Core::appendLE32(packet, static_cast<uint32_t>(user_comments.size()));
    for (const auto& comment : user_comments) {
        std::string text = comment.first + "=" + comment.second;
        Core::appendLE32(packet, static_cast<uint32_t>(text.size()));
        packet.insert(packet.end(), text.begin(), text.end());
    }
    return packet;
}

std::string OpusComments::get(const std::string& field) const
{
    auto same = [](const std::string& a, const std::string& b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::toupper(static_cast<unsigned char>(x)) ==
                          std::toupper(static_cast<unsigned char>(y));
               });
    };
    for (const auto& comment : user_comments) {
        if (same(comment.first, field)) {
            return comment.second;
        }
    }
    return std::string();
}

} // namespace Opus
} // namespace TafKit
