/*
 * PacketTraits.h - Codec-specific packet knowledge needed by the page writer
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAFKIT_OGG_PACKETTRAITS_H
#define TAFKIT_OGG_PACKETTRAITS_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace TafKit {
namespace Ogg {

enum class PacketRole {
    Identification,
    Comment,
    Audio
};

class PacketTraits {
public:
    virtual ~PacketTraits() = default;

    /**
     * @brief Number of granule units (samples) an audio packet advances the stream by.
     */
    virtual uint32_t sampleCount(const std::vector<uint8_t>& packet) const = 0;

    /**
     * @brief Grow a packet by exactly `growth` bytes so that a decoder
     * produces the same output from it.
     */
    virtual std::vector<uint8_t> pad(const std::vector<uint8_t>& packet, PacketRole role,
                                     size_t growth) const = 0;
};

} // namespace Ogg
} // namespace TafKit

#endif // TAFKIT_OGG_PACKETTRAITS_H
