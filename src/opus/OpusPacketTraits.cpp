/*
 * OpusPacketTraits.cpp - Page writer traits for Ogg Opus streams
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"
#include "opus/OpusPacket.h"
#include "opus/OpusPacketTraits.h"

namespace TafKit {
namespace Opus {

uint32_t OpusPacketTraits::sampleCount(const std::vector<uint8_t>& packet) const
{
    return OpusPacket::sampleCount(packet);
}

std::vector<uint8_t> OpusPacketTraits::pad(const std::vector<uint8_t>& packet, Ogg::PacketRole role,
                                           size_t growth) const
{
    if (role == Ogg::PacketRole::Audio) {
        return OpusPacket::pad(packet, growth);
    }

    std::vector<uint8_t> padded(packet);
    padded.insert(padded.end(), growth, 0);
    return padded;
}

} // namespace Opus
} // namespace TafKit
