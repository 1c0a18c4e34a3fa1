/*
 * ByteOrder.h - Fixed-width integer load/store helpers
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAFKIT_CORE_BYTEORDER_H
#define TAFKIT_CORE_BYTEORDER_H

#include <cstdint>
#include <vector>

namespace TafKit {
namespace Core {

// Ogg framing and Opus headers are little-endian, the TAF prefix is big-endian.

inline uint16_t readLE16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t readLE32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

inline uint32_t readBE32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

inline void writeLE32(uint8_t* p, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        p[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

inline void writeLE64(uint8_t* p, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

inline void writeBE32(uint8_t* p, uint32_t value) {
    p[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
    p[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    p[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    p[3] = static_cast<uint8_t>(value & 0xFF);
}

inline void appendLE16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

inline void appendLE32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

} // namespace Core
} // namespace TafKit

#endif // TAFKIT_CORE_BYTEORDER_H
