/*
 * StreamFormat.cpp - Codec identification from the first packet of a bitstream
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"
#include "ogg/StreamFormat.h"

namespace TafKit {
namespace Ogg {

namespace {

[[noreturn]] void invalid(const std::string& codec, const std::string& why) {
    throw StructuralError(ErrorCode::InvalidIdentificationHeader, codec + " identification header: " + why);
}

VorbisIdentification parseVorbis(const std::vector<uint8_t>& data) {
    // type(1) "vorbis"(6) version(4) channels(1) rate(4) bitrates(12) blocksizes(1) framing(1)
    if (data.size() < 30) invalid("Vorbis", "too small");
    if (Core::readLE32(data.data() + 7) != 0) invalid("Vorbis", "unsupported version");

    VorbisIdentification id;
    id.channels = data[11];
    id.sample_rate = Core::readLE32(data.data() + 12);
    if (id.channels == 0 || id.sample_rate == 0) invalid("Vorbis", "zero channels or rate");
    return id;
}

SpeexIdentification parseSpeex(const std::vector<uint8_t>& data) {
    if (data.size() < 80) invalid("Speex", "too small");

    SpeexIdentification id;
    id.sample_rate = Core::readLE32(data.data() + 36);
    id.channels = Core::readLE32(data.data() + 48);
    if (id.sample_rate == 0) invalid("Speex", "zero rate");
    return id;
}

FLACIdentification parseFLAC(const std::vector<uint8_t>& data) {
    // 0x7F "FLAC" major minor header_count(2) "fLaC" STREAMINFO block
    if (data.size() < 13 + 4 + 34) invalid("FLAC", "too small");
    if (data[5] != 1) invalid("FLAC", "unsupported mapping version");
    if (std::memcmp(data.data() + 9, "fLaC", 4) != 0) invalid("FLAC", "missing fLaC marker");
    if ((data[13] & 0x7F) != 0) invalid("FLAC", "first metadata block is not STREAMINFO");

    const uint8_t* streaminfo = data.data() + 17;
    FLACIdentification id;
    id.sample_rate = (static_cast<uint32_t>(streaminfo[10]) << 12) |
                     (static_cast<uint32_t>(streaminfo[11]) << 4) |
                     (streaminfo[12] >> 4);
    id.channels = static_cast<uint8_t>(((streaminfo[12] >> 1) & 0x07) + 1);
    if (id.sample_rate == 0) invalid("FLAC", "zero rate");
    return id;
}

} // namespace

StreamIdentification identifyStream(const std::vector<uint8_t>& bos_packet) {
    const uint8_t* data = bos_packet.data();
    size_t size = bos_packet.size();

    if (Opus::OpusHeader::hasSignature(bos_packet)) {
        return Opus::OpusHeader::parseFromPacket(bos_packet);
    }
    if (size >= 7 && std::memcmp(data, "\x01vorbis", 7) == 0) {
        return parseVorbis(bos_packet);
    }
    if (size >= 5 && std::memcmp(data, "\x7f" "FLAC", 5) == 0) {
        return parseFLAC(bos_packet);
    }
    if (size >= 8 && std::memcmp(data, "Speex   ", 8) == 0) {
        return parseSpeex(bos_packet);
    }

    throw StructuralError(ErrorCode::UnsupportedStreamFormat,
                          "unrecognised identification packet of " + std::to_string(size) + " bytes");
}

std::string streamFormatName(const StreamIdentification& identification) {
    return std::visit([](const auto& id) -> std::string {
        using T = std::decay_t<decltype(id)>;
        if constexpr (std::is_same_v<T, Opus::OpusHeader>) {
            return "Opus";
        } else if constexpr (std::is_same_v<T, VorbisIdentification>) {
            return "Vorbis";
        } else if constexpr (std::is_same_v<T, SpeexIdentification>) {
            return "Speex";
        } else {
            return "FLAC";
        }
    }, identification);
}

} // namespace Ogg
} // namespace TafKit
