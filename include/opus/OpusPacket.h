/*
 * OpusPacket.h - Opus packet framing (RFC 6716 section 3)
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAFKIT_OPUS_OPUSPACKET_H
#define TAFKIT_OPUS_OPUSPACKET_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace TafKit {
namespace Opus {

constexpr uint32_t OPUS_SAMPLE_RATE = 48000;
constexpr size_t OPUS_MAX_FRAME_BYTES = 1275;
constexpr uint32_t OPUS_MAX_PACKET_SAMPLES = 5760;  // 120 ms at 48 kHz

enum class OpusMode {
    Silk,
    Hybrid,
    Celt
};

/**
 * @brief Decoded table-of-contents byte.
 */
struct OpusToc {
    uint8_t config = 0;           ///< Bits 3-7
    bool stereo = false;          ///< Bit 2
    uint8_t frame_count_code = 0; ///< Bits 0-1

    OpusMode mode() const;

    /**
     * @brief Duration of one frame in 48 kHz samples.
     */
    uint32_t frameSamples() const;

    static OpusToc fromByte(uint8_t toc);
};

/**
 * @brief Frame layout of one Opus packet.
 */
struct OpusPacketLayout {
    OpusToc toc;
    bool vbr = false;
    size_t padding_length = 0;            ///< Trailing padding bytes (code 3 only)
    size_t length_bytes_offset = 0;       ///< Start of the encoded frame lengths
    size_t length_bytes_size = 0;         ///< Size of the encoded frame lengths
    std::vector<size_t> frame_offsets;
    std::vector<size_t> frame_sizes;

    size_t frameCount() const { return frame_sizes.size(); }
    uint32_t sampleCount() const { return static_cast<uint32_t>(frameCount()) * toc.frameSamples(); }
};

class OpusPacket {
public:
    /**
     * @brief Parse the frame layout of a packet.
     * @throws FormatError(MalformedOpusPacket) on any framing violation
     */
    static OpusPacketLayout layout(const uint8_t* data, size_t size);
    static OpusPacketLayout layout(const std::vector<uint8_t>& packet) {
        return layout(packet.data(), packet.size());
    }

    static uint32_t sampleCount(const std::vector<uint8_t>& packet);

    /**
     * @brief Compressed frames of a packet, without framing or padding.
     */
    static std::vector<std::vector<uint8_t>> frames(const std::vector<uint8_t>& packet);

    /**
     * @brief Grow a packet by exactly `growth` bytes without changing its frames.
     *
     * The packet is rewritten in code 3 framing with the padding flag set
     * as needed. Frame data and encoded frame lengths are copied verbatim.
     * @throws FormatError(MalformedOpusPacket) if the packet cannot be parsed
     */
    static std::vector<uint8_t> pad(const std::vector<uint8_t>& packet, size_t growth);
};

} // namespace Opus
} // namespace TafKit

#endif // TAFKIT_OPUS_OPUSPACKET_H
