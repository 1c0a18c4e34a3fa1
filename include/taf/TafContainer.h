/*
 * TafContainer.h - TAF container parser and builder
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAFKIT_TAF_TAFCONTAINER_H
#define TAFKIT_TAF_TAFCONTAINER_H

#include "ogg/OggPage.h"
#include "ogg/PacketReassembler.h"
#include "ogg/PageWriter.h"
#include "opus/OpusHeaders.h"
#include "taf/TafHeader.h"

#include <string>
#include <utility>
#include <vector>

namespace TafKit {
namespace Taf {

/**
 * @brief What the content hash in the header covers.
 */
enum class HashScope {
    PageBodies,   ///< Concatenated page bodies; independent of serial number and page headers
    WholePages    ///< The complete page stream
};

const char* hashScopeName(HashScope scope);

/**
 * @brief Parse "bodies" or "pages".
 * @return false for anything else
 */
bool parseHashScope(const std::string& text, HashScope& scope);

/**
 * @brief SHA-1 over a page stream.
 * @throws FormatError if `WholePages` is not requested and the stream cannot be framed
 */
Core::Sha1Digest computeContentHash(const uint8_t* stream, size_t size, HashScope scope);

/**
 * @brief Read-only view of a complete container.
 *
 * Construction only splits off the header block. Header decoding, page
 * parsing and packet reassembly happen when asked for.
 */
class TafContainer {
public:
    /**
     * @throws FormatError(TruncatedHeader) if fewer than 4096 bytes are given
     */
    static TafContainer parse(std::vector<uint8_t> bytes);

    const std::vector<uint8_t>& bytes() const { return m_bytes; }
    size_t size() const { return m_bytes.size(); }

    const uint8_t* headerBlock() const { return m_bytes.data(); }
    const uint8_t* pageStream() const { return m_bytes.data() + TAF_HEADER_BLOCK_SIZE; }
    size_t pageStreamSize() const { return m_bytes.size() - TAF_HEADER_BLOCK_SIZE; }

    /**
     * @brief Copy of the page stream without the header block.
     *
     * The result is a plain Ogg Opus file.
     */
    std::vector<uint8_t> pageStreamBytes() const;

    TafHeader header() const;
    std::vector<Ogg::OggPage> pages(bool verify_checksums = true) const;
    std::vector<Ogg::OggPacket> packets() const;

    /**
     * @brief Check the header's length and hash against the page stream.
     * @throws IntegrityError(ContentLengthMismatch) if the length field disagrees
     * @throws IntegrityError(ContentHashMismatch) if the stored digest disagrees
     * @throws FormatError if the header or the page stream cannot be read
     */
    void verify(HashScope scope = HashScope::PageBodies) const;

private:
    explicit TafContainer(std::vector<uint8_t> bytes);

    std::vector<uint8_t> m_bytes;
};

/**
 * @brief Where the build takes its timestamp (and bitstream serial) from.
 */
class TimestampSource {
public:
    static TimestampSource fixed(uint32_t timestamp);
    static TimestampSource currentTime();

    /**
     * @throws FormatError if the reference header cannot be decoded
     */
    static TimestampSource fromReference(const TafContainer& reference);

    uint32_t resolve() const;

private:
    enum class Kind {
        Fixed,
        CurrentTime
    };

    TimestampSource(Kind kind, uint32_t value);

    Kind m_kind;
    uint32_t m_value;
};

/**
 * @brief Which OpusTags packet the container carries.
 */
enum class CommentSource {
    Generated,   ///< Built from BuildOptions::vendor and BuildOptions::user_comments
    FirstTrack   ///< The first track's own, with trailing comments dropped until it fits a page
};

struct BuildOptions {
    HashScope hash_scope = HashScope::PageBodies;
    size_t page_size = Ogg::DEFAULT_PAGE_SIZE;
    CommentSource comment_source = CommentSource::Generated;
    std::string vendor;  ///< Empty selects "TafKit <version>"
    std::vector<std::pair<std::string, std::string>> user_comments;
};

class TafBuilder {
public:
    explicit TafBuilder(BuildOptions options = BuildOptions());

    /**
     * @brief Build a container from complete Ogg Opus streams, one per track.
     * @throws InputError(EmptyInput) if no tracks are given
     * @throws StructuralError for non-Opus or incompatible tracks
     * @throws CapacityError(PacketTooLarge) for packets larger than one page body
     * (4053 bytes at the default page size), including generated comments
     * Every page codec and reassembly error propagates unchanged.
     */
    TafContainer build(const std::vector<std::vector<uint8_t>>& tracks,
                       const TimestampSource& timestamp) const;

    const BuildOptions& options() const { return m_options; }

private:
    BuildOptions m_options;
};

} // namespace Taf
} // namespace TafKit

#endif // TAFKIT_TAF_TAFCONTAINER_H
