/*
 * OpusPacket.cpp - Opus packet framing (RFC 6716 section 3)
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"
#include "opus/OpusPacket.h"

namespace TafKit {
namespace Opus {

namespace {

[[noreturn]] void malformed(const std::string& why) {
    throw FormatError(ErrorCode::MalformedOpusPacket, why);
}

// Frame length coding of section 3.2.1. Returns the number of bytes used.
size_t readFrameLength(const uint8_t* data, size_t available, size_t& length) {
    if (available < 1) {
        malformed("frame length runs past end of packet");
    }
    if (data[0] < 252) {
        length = data[0];
        return 1;
    }
    if (available < 2) {
        malformed("two-byte frame length runs past end of packet");
    }
    length = static_cast<size_t>(data[1]) * 4 + data[0];
    return 2;
}

void addFrame(OpusPacketLayout& layout, size_t offset, size_t size) {
    if (size > OPUS_MAX_FRAME_BYTES) {
        malformed("frame of " + std::to_string(size) + " bytes exceeds " + std::to_string(OPUS_MAX_FRAME_BYTES));
    }
    layout.frame_offsets.push_back(offset);
    layout.frame_sizes.push_back(size);
}

} // namespace

OpusMode OpusToc::mode() const {
    if (config < 12) return OpusMode::Silk;
    if (config < 16) return OpusMode::Hybrid;
    return OpusMode::Celt;
}

uint32_t OpusToc::frameSamples() const {
    static constexpr uint32_t silk[4] = { 480, 960, 1920, 2880 };
    static constexpr uint32_t hybrid[2] = { 480, 960 };
    static constexpr uint32_t celt[4] = { 120, 240, 480, 960 };

    switch (mode()) {
        case OpusMode::Silk:
            return silk[config % 4];
        case OpusMode::Hybrid:
            return hybrid[config % 2];
        case OpusMode::Celt:
            return celt[config % 4];
    }
    return 0;
}

OpusToc OpusToc::fromByte(uint8_t toc) {
    OpusToc result;
    result.config = (toc >> 3) & 0x1F;
    result.stereo = (toc & 0x04) != 0;
    result.frame_count_code = toc & 0x03;
    return result;
}

OpusPacketLayout OpusPacket::layout(const uint8_t* data, size_t size) {
    if (size < 1) {
        malformed("empty packet");
    }

    OpusPacketLayout layout;
    layout.toc = OpusToc::fromByte(data[0]);

    switch (layout.toc.frame_count_code) {
        case 0:
            addFrame(layout, 1, size - 1);
            break;

        case 1: {
            size_t payload = size - 1;
            if (payload % 2 != 0) {
                malformed("code 1 packet with odd payload size " + std::to_string(payload));
            }
            addFrame(layout, 1, payload / 2);
            addFrame(layout, 1 + payload / 2, payload / 2);
            break;
        }

        case 2: {
            size_t first = 0;
            size_t used = readFrameLength(data + 1, size - 1, first);
            size_t offset = 1 + used;
            if (first > size - offset) {
                malformed("code 2 first frame runs past end of packet");
            }
            layout.vbr = true;
            layout.length_bytes_offset = 1;
            layout.length_bytes_size = used;
            addFrame(layout, offset, first);
            addFrame(layout, offset + first, size - offset - first);
            break;
        }

        case 3: {
            if (size < 2) {
                malformed("code 3 packet without frame count byte");
            }
            uint8_t count_byte = data[1];
            layout.vbr = (count_byte & 0x80) != 0;
            bool has_padding = (count_byte & 0x40) != 0;
            size_t count = count_byte & 0x3F;
            if (count == 0) {
                malformed("code 3 packet with zero frames");
            }
            if (count * layout.toc.frameSamples() > OPUS_MAX_PACKET_SAMPLES) {
                malformed("code 3 packet longer than 120 ms");
            }

            size_t offset = 2;
            if (has_padding) {
                for (;;) {
                    if (offset >= size) {
                        malformed("padding length runs past end of packet");
                    }
                    uint8_t value = data[offset++];
                    if (value == 255) {
                        layout.padding_length += 254;
                    } else {
                        layout.padding_length += value;
                        break;
                    }
                }
            }
            if (layout.padding_length > size - offset) {
                malformed("padding of " + std::to_string(layout.padding_length) + " bytes exceeds packet");
            }
            size_t end = size - layout.padding_length;

            if (layout.vbr) {
                std::vector<size_t> lengths;
                size_t total = 0;
                layout.length_bytes_offset = offset;
                for (size_t i = 0; i + 1 < count; ++i) {
                    size_t length = 0;
                    offset += readFrameLength(data + offset, end - offset, length);
                    lengths.push_back(length);
                    total += length;
                }
                layout.length_bytes_size = offset - layout.length_bytes_offset;
                if (total > end - offset) {
                    malformed("code 3 frame lengths exceed packet");
                }
                lengths.push_back(end - offset - total);
                for (size_t length : lengths) {
                    addFrame(layout, offset, length);
                    offset += length;
                }
            } else {
                size_t payload = end - offset;
                if (payload % count != 0) {
                    malformed("code 3 CBR payload of " + std::to_string(payload) + " bytes not divisible by " +
                              std::to_string(count));
                }
                for (size_t i = 0; i < count; ++i) {
                    addFrame(layout, offset + i * (payload / count), payload / count);
                }
            }
            break;
        }
    }

    return layout;
}

uint32_t OpusPacket::sampleCount(const std::vector<uint8_t>& packet) {
    return layout(packet).sampleCount();
}

std::vector<std::vector<uint8_t>> OpusPacket::frames(const std::vector<uint8_t>& packet) {
    OpusPacketLayout parsed = layout(packet);
    std::vector<std::vector<uint8_t>> result;
    result.reserve(parsed.frameCount());
    for (size_t i = 0; i < parsed.frameCount(); ++i) {
        auto begin = packet.begin() + parsed.frame_offsets[i];
        result.emplace_back(begin, begin + parsed.frame_sizes[i]);
    }
    return result;
}

std::vector<uint8_t> OpusPacket::pad(const std::vector<uint8_t>& packet, size_t growth) {
    if (growth == 0) {
        return packet;
    }

    OpusPacketLayout parsed = layout(packet);

    size_t frame_bytes = 0;
    for (size_t size : parsed.frame_sizes) {
        frame_bytes += size;
    }

    // TOC, count byte, frame lengths and frames; the rest is padding overhead
    size_t base = 2 + parsed.length_bytes_size + frame_bytes;
    size_t target = packet.size() + growth;
    if (target < base) {
        throw CapacityError(ErrorCode::PagePaddingFailed,
                            "cannot grow a " + std::to_string(packet.size()) + " byte packet by " +
                            std::to_string(growth));
    }
    size_t overhead = target - base;

    std::vector<uint8_t> out;
    out.reserve(target);
    out.push_back(static_cast<uint8_t>((packet[0] & ~0x03) | 0x03));

    uint8_t count_byte = static_cast<uint8_t>(parsed.frameCount());
    if (parsed.vbr) count_byte |= 0x80;
    if (overhead > 0) count_byte |= 0x40;
    out.push_back(count_byte);

    size_t padding = 0;
    if (overhead > 0) {
        // k bytes of 255 each add 254 bytes of padding, the final byte adds its value
        size_t runs = (overhead - 1) / 255;
        size_t last = (overhead - 1) % 255;
        out.insert(out.end(), runs, 255);
        out.push_back(static_cast<uint8_t>(last));
        padding = runs * 254 + last;
    }

    auto lengths = packet.begin() + parsed.length_bytes_offset;
    out.insert(out.end(), lengths, lengths + parsed.length_bytes_size);
    for (size_t i = 0; i < parsed.frameCount(); ++i) {
        auto begin = packet.begin() + parsed.frame_offsets[i];
        out.insert(out.end(), begin, begin + parsed.frame_sizes[i]);
    }
    out.insert(out.end(), padding, 0);

    DEBUG_LOG("opus", packet.size(), " -> ", out.size(), " bytes, ",
              parsed.frameCount(), " frames, ", padding, " padding bytes");
    return out;
}

} // namespace Opus
} // namespace TafKit
