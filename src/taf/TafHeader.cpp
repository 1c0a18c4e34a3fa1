/*
 * TafHeader.cpp - Fixed-size TAF header block
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"
#include "taf/TafHeader.h"

namespace TafKit {
namespace Taf {

namespace {

enum WireType : uint8_t {
    WIRE_VARINT = 0,
    WIRE_FIXED64 = 1,
    WIRE_LENGTH_DELIMITED = 2,
    WIRE_START_GROUP = 3,
    WIRE_END_GROUP = 4,
    WIRE_FIXED32 = 5
};

enum HeaderField : uint32_t {
    FIELD_HASH = 1,
    FIELD_LENGTH = 2,
    FIELD_TIMESTAMP = 3,
    FIELD_CHAPTER_PAGES = 4,
    FIELD_PADDING = 5
};

constexpr size_t MAX_VARINT_BYTES = 10;

size_t varintSize(uint64_t value) {
    size_t size = 1;
    while (value >= 0x80) {
        value >>= 7;
        size++;
    }
    return size;
}

void appendVarint(std::vector<uint8_t>& out, uint64_t value) {
    while (value >= 0x80) {
        out.push_back(static_cast<uint8_t>(value | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<uint8_t>(value));
}

void appendKey(std::vector<uint8_t>& out, uint32_t field, WireType type) {
    appendVarint(out, (static_cast<uint64_t>(field) << 3) | type);
}

[[noreturn]] void malformed(const std::string& why) {
    throw FormatError(ErrorCode::MalformedHeader, why);
}

class MessageReader {
public:
    MessageReader(const uint8_t* data, size_t size)
        : m_data(data), m_size(size), m_pos(0) {}

    bool atEnd() const { return m_pos >= m_size; }
    size_t position() const { return m_pos; }

    uint64_t readVarint() {
        uint64_t value = 0;
        for (size_t i = 0; i < MAX_VARINT_BYTES; ++i) {
            if (m_pos >= m_size) {
                malformed("varint runs past end of message at offset " + std::to_string(m_pos));
            }
            uint8_t byte = m_data[m_pos++];
            value |= static_cast<uint64_t>(byte & 0x7F) << (7 * i);
            if ((byte & 0x80) == 0) {
                return value;
            }
        }
        malformed("varint longer than 10 bytes at offset " + std::to_string(m_pos));
    }

    const uint8_t* readBytes(size_t count) {
        if (count > m_size - m_pos) {
            malformed("field of " + std::to_string(count) + " bytes runs past end of message");
        }
        const uint8_t* start = m_data + m_pos;
        m_pos += count;
        return start;
    }

    void skip(WireType type) {
        switch (type) {
            case WIRE_VARINT:
                readVarint();
                break;
            case WIRE_FIXED64:
                readBytes(8);
                break;
            case WIRE_LENGTH_DELIMITED:
                readBytes(readLength());
                break;
            case WIRE_FIXED32:
                readBytes(4);
                break;
            default:
                malformed("unsupported wire type " + std::to_string(type));
        }
    }

    size_t readLength() {
        uint64_t length = readVarint();
        if (length > m_size - m_pos) {
            malformed("length " + std::to_string(length) + " runs past end of message");
        }
        return static_cast<size_t>(length);
    }

private:
    const uint8_t* m_data;
    size_t m_size;
    size_t m_pos;
};

} // namespace

std::vector<uint8_t> TafHeaderCodec::encode(const TafHeader& header) {
    std::vector<uint8_t> message;
    message.reserve(TAF_HEADER_MAX_MESSAGE);

    appendKey(message, FIELD_HASH, WIRE_LENGTH_DELIMITED);
    appendVarint(message, header.hash.size());
    message.insert(message.end(), header.hash.begin(), header.hash.end());

    appendKey(message, FIELD_LENGTH, WIRE_VARINT);
    appendVarint(message, header.length);

    appendKey(message, FIELD_TIMESTAMP, WIRE_VARINT);
    appendVarint(message, header.timestamp);

    if (!header.chapter_pages.empty()) {
        size_t packed_size = 0;
        for (uint32_t page : header.chapter_pages) {
            packed_size += varintSize(page);
        }
        appendKey(message, FIELD_CHAPTER_PAGES, WIRE_LENGTH_DELIMITED);
        appendVarint(message, packed_size);
        for (uint32_t page : header.chapter_pages) {
            appendVarint(message, page);
        }
    }

    if (message.size() > TAF_HEADER_MAX_MESSAGE) {
        throw CapacityError(ErrorCode::HeaderOverflow,
                            "header message of " + std::to_string(message.size()) + " bytes with " +
                            std::to_string(header.chapter_pages.size()) + " chapters exceeds " +
                            std::to_string(TAF_HEADER_MAX_MESSAGE));
    }

    // Padding field: key(1) + varint(n) + n bytes. Try to fill the block
    // exactly, otherwise leave one byte of zero fill.
    size_t remaining = TAF_HEADER_MAX_MESSAGE - message.size();
    for (size_t target : { remaining, remaining - 1 }) {
        if (remaining < 2 || target < 2) {
            break;
        }
        bool placed = false;
        for (size_t length_bytes = 1; length_bytes <= MAX_VARINT_BYTES && length_bytes < target; ++length_bytes) {
            size_t padding = target - 1 - length_bytes;
            if (varintSize(padding) == length_bytes) {
                appendKey(message, FIELD_PADDING, WIRE_LENGTH_DELIMITED);
                appendVarint(message, padding);
                message.insert(message.end(), padding, 0);
                placed = true;
                break;
            }
        }
        if (placed) {
            break;
        }
    }

    std::vector<uint8_t> block(TAF_HEADER_BLOCK_SIZE, 0);
    Core::writeBE32(block.data(), static_cast<uint32_t>(message.size()));
    std::copy(message.begin(), message.end(), block.begin() + TAF_HEADER_PREFIX_SIZE);

    DEBUG_LOG("taf", "message ", message.size(), " bytes, timestamp ",
              header.timestamp, ", ", header.chapter_pages.size(), " chapters");
    return block;
}

uint32_t TafHeaderCodec::lengthPrefix(const uint8_t* data, size_t size) {
    if (size < TAF_HEADER_PREFIX_SIZE) {
        throw FormatError(ErrorCode::TruncatedHeader,
                          "need 4 bytes of length prefix, have " + std::to_string(size));
    }
    return Core::readBE32(data);
}

TafHeader TafHeaderCodec::decode(const uint8_t* data, size_t size) {
    uint32_t prefix = lengthPrefix(data, size);
    size_t available = std::min(size, TAF_HEADER_BLOCK_SIZE) - TAF_HEADER_PREFIX_SIZE;
    if (prefix > available) {
        throw FormatError(ErrorCode::TruncatedHeader,
                          "length prefix " + std::to_string(prefix) + " exceeds the " +
                          std::to_string(available) + " bytes available");
    }

    TafHeader header;
    header.message_size = prefix;
    bool hash_seen = false;
    MessageReader reader(data + TAF_HEADER_PREFIX_SIZE, prefix);

    while (!reader.atEnd()) {
        uint64_t key = reader.readVarint();
        uint64_t field = key >> 3;
        WireType type = static_cast<WireType>(key & 0x07);
        if (field == 0) {
            malformed("field number 0");
        }
        if (type == WIRE_START_GROUP || type == WIRE_END_GROUP || type > WIRE_FIXED32) {
            malformed("unsupported wire type " + std::to_string(type) + " for field " + std::to_string(field));
        }

        switch (field) {
            case FIELD_HASH: {
                if (type != WIRE_LENGTH_DELIMITED) malformed("hash field has wire type " + std::to_string(type));
                size_t length = reader.readLength();
                if (length != header.hash.size()) {
                    malformed("hash field is " + std::to_string(length) + " bytes, expected 20");
                }
                const uint8_t* bytes = reader.readBytes(length);
                std::copy(bytes, bytes + length, header.hash.begin());
                hash_seen = true;
                break;
            }
            case FIELD_LENGTH:
                if (type != WIRE_VARINT) malformed("length field has wire type " + std::to_string(type));
                header.length = static_cast<uint32_t>(reader.readVarint());
                break;
            case FIELD_TIMESTAMP:
                if (type != WIRE_VARINT) malformed("timestamp field has wire type " + std::to_string(type));
                header.timestamp = static_cast<uint32_t>(reader.readVarint());
                break;
            case FIELD_CHAPTER_PAGES:
                if (type == WIRE_VARINT) {
                    header.chapter_pages.push_back(static_cast<uint32_t>(reader.readVarint()));
                } else if (type == WIRE_LENGTH_DELIMITED) {
                    size_t length = reader.readLength();
                    MessageReader packed(reader.readBytes(length), length);
                    while (!packed.atEnd()) {
                        header.chapter_pages.push_back(static_cast<uint32_t>(packed.readVarint()));
                    }
                } else {
                    malformed("chapter field has wire type " + std::to_string(type));
                }
                break;
            case FIELD_PADDING:
                if (type != WIRE_LENGTH_DELIMITED) malformed("padding field has wire type " + std::to_string(type));
                {
                    size_t length = reader.readLength();
                    reader.readBytes(length);
                    header.padding_size += length;
                }
                break;
            default:
                DEBUG_LOG("taf", "skipping unknown field ", field);
                reader.skip(type);
                break;
        }
    }

    if (!hash_seen) {
        malformed("hash field missing");
    }
    return header;
}

} // namespace Taf
} // namespace TafKit
