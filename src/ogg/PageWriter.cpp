/*
 * PageWriter.cpp - Lays logical packets out into fixed-size Ogg pages
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"
#include "ogg/PageWriter.h"

namespace TafKit {
namespace Ogg {

namespace {

struct Piece {
    std::vector<uint8_t> data;
    PacketRole role = PacketRole::Audio;
    bool whole = true;          // complete packet starting on this page, may be padded
    bool continuation = false;  // continues a packet from the previous page
    bool complete = true;       // packet ends on this page
    uint64_t granule_after = 0;
};

size_t pieceLaces(const Piece& piece) {
    return piece.complete ? laceCount(piece.data.size()) : piece.data.size() / 255;
}

size_t segmentTotal(const std::vector<Piece>& pieces) {
    size_t total = 0;
    for (const Piece& piece : pieces) {
        total += pieceLaces(piece);
    }
    return total;
}

size_t pageBytes(const std::vector<Piece>& pieces) {
    size_t total = OGG_PAGE_HEADER_SIZE;
    for (const Piece& piece : pieces) {
        total += pieceLaces(piece) + piece.data.size();
    }
    return total;
}

/**
 * Accumulates pieces into pages. m_current is the page being filled.
 */
class LayoutSession {
public:
    LayoutSession(const PacketTraits& traits, const PageWriterOptions& options, size_t max_whole,
                  size_t fragment)
        : m_traits(traits)
        , m_options(options)
        , m_max_whole(max_whole)
        , m_fragment(fragment)
    {
    }

    size_t pageCount() const { return m_pages.size(); }

    void addPacket(const std::vector<uint8_t>& data, PacketRole role, uint64_t granule_after) {
        if (data.size() > m_max_whole) {
            addOversized(data, role, granule_after);
            return;
        }

        Piece piece;
        piece.data = data;
        piece.role = role;
        piece.granule_after = granule_after;

        while (!m_current.empty() && !admits(piece)) {
            flushOnce();
        }
        m_current.push_back(std::move(piece));
    }

    // Finish the current page, including any packets carried over from it.
    void startNewPage() {
        while (!m_current.empty()) {
            flushOnce();
        }
    }

    std::vector<OggPage> takePages() { return std::move(m_pages); }

private:
    bool admits(const Piece& piece) const {
        size_t segments = segmentTotal(m_current) + pieceLaces(piece);
        size_t bytes = pageBytes(m_current) + pieceLaces(piece) + piece.data.size();
        if (bytes > m_options.page_size) {
            return false;
        }
        // Keep enough lacing values free to pad the rest of the page
        size_t free = m_options.page_size - bytes;
        return segments + free / 255 + 2 <= OGG_MAX_SEGMENTS;
    }

    void addOversized(const std::vector<uint8_t>& data, PacketRole role, uint64_t granule_after) {
        startNewPage();
        Debug::log("ogg", "PageWriter: splitting ", data.size(), " byte packet into ", m_fragment,
                   " byte fragments");

        size_t offset = 0;
        for (;;) {
            size_t remaining = data.size() - offset;
            size_t chunk = std::min(remaining, m_fragment);
            bool complete = chunk == remaining;
            if (complete && OGG_PAGE_HEADER_SIZE + laceCount(chunk) + chunk > m_options.page_size) {
                chunk -= 255;
                complete = false;
            }

            Piece piece;
            piece.data.assign(data.begin() + offset, data.begin() + offset + chunk);
            piece.role = role;
            piece.whole = false;
            piece.continuation = offset > 0;
            piece.complete = complete;
            piece.granule_after = granule_after;
            offset += chunk;

            if (!complete) {
                emit({ std::move(piece) });
            } else {
                // The tail page stays open for the packets that follow
                m_current.push_back(std::move(piece));
                return;
            }
        }
    }

    void flushOnce() {
        std::vector<Piece> page = std::move(m_current);
        m_current = padOrCarry(page);
        emit(std::move(page));
    }

    /**
     * Bring `pieces` to the page size. Packets that have to move to the
     * next page are removed from `pieces` and returned in order.
     */
    std::vector<Piece> padOrCarry(std::vector<Piece>& pieces) {
        std::vector<Piece> carried;
        for (;;) {
            size_t used = pageBytes(pieces);
            if (used == m_options.page_size) {
                break;
            }
            size_t free = m_options.page_size - used;

            bool padded = false;
            bool has_whole = false;
            for (size_t j = pieces.size(); j-- > 0;) {
                if (!pieces[j].whole) {
                    continue;
                }
                has_whole = true;
                if (tryPad(pieces, j, free)) {
                    padded = true;
                    break;
                }
            }
            if (padded) {
                break;
            }
            if (!has_whole) {
                Debug::log("ogg", "PageWriter: page ", m_pages.size(), " holds only packet fragments, ",
                           used, " bytes");
                break;
            }
            if (pieces.size() == 1) {
                throw CapacityError(ErrorCode::PagePaddingFailed,
                                    "cannot pad a " + std::to_string(pieces.front().data.size()) +
                                    " byte packet by " + std::to_string(free) + " bytes on page " +
                                    std::to_string(m_pages.size()));
            }

            Debug::log("ogg", "PageWriter: page ", m_pages.size(), " cannot absorb ", free,
                       " bytes, moving last packet to the next page");
            carried.insert(carried.begin(), std::move(pieces.back()));
            pieces.pop_back();
        }
        return carried;
    }

    // Grow piece `index` so that the page gains exactly `free` bytes.
    bool tryPad(std::vector<Piece>& pieces, size_t index, size_t free) {
        Piece& piece = pieces[index];
        size_t size = piece.data.size();
        size_t other_segments = segmentTotal(pieces) - laceCount(size);

        for (size_t extra_laces = 0; extra_laces < free; ++extra_laces) {
            size_t growth = free - extra_laces;
            if (laceCount(size + growth) - laceCount(size) != extra_laces) {
                continue;
            }
            if (other_segments + laceCount(size + growth) > OGG_MAX_SEGMENTS) {
                return false;
            }
            piece.data = m_traits.pad(piece.data, piece.role, growth);
            if (piece.data.size() != size + growth) {
                throw CapacityError(ErrorCode::PagePaddingFailed,
                                    "padding produced " + std::to_string(piece.data.size()) + " bytes, expected " +
                                    std::to_string(size + growth));
            }
            return true;
        }
        return false;
    }

    void emit(std::vector<Piece> pieces) {
        OggPage page;
        page.serial_number = m_options.serial_number;
        page.sequence_number = static_cast<uint32_t>(m_pages.size());
        page.granule_position = OGG_GRANULE_NONE;
        if (m_pages.empty()) {
            page.flags |= OGG_FLAG_BOS;
        }
        if (!pieces.empty() && pieces.front().continuation) {
            page.flags |= OGG_FLAG_CONTINUED;
        }

        for (const Piece& piece : pieces) {
            page.appendFragment(piece.data.data(), piece.data.size(), piece.complete);
            if (piece.complete) {
                page.granule_position = piece.granule_after;
            }
        }
        m_pages.push_back(std::move(page));
    }

    const PacketTraits& m_traits;
    const PageWriterOptions& m_options;
    size_t m_max_whole;
    size_t m_fragment;

    std::vector<Piece> m_current;
    std::vector<OggPage> m_pages;
};

} // namespace

PageWriter::PageWriter(const PacketTraits& traits, PageWriterOptions options)
    : m_traits(traits)
    , m_options(options)
{
    if (m_options.page_size < MIN_PAGE_SIZE || m_options.page_size > OGG_MAX_PAGE_SIZE) {
        throw std::invalid_argument("page size " + std::to_string(m_options.page_size) + " out of range");
    }
}

size_t PageWriter::maxWholePacketSize() const {
    size_t room = m_options.page_size - OGG_PAGE_HEADER_SIZE;
    size_t size = room;
    while (size + laceCount(size) > room || laceCount(size) > OGG_MAX_SEGMENTS) {
        size--;
    }
    return size;
}

size_t PageWriter::fragmentSize() const {
    size_t runs = (m_options.page_size - OGG_PAGE_HEADER_SIZE) / 256;
    return 255 * std::min(runs, OGG_MAX_SEGMENTS);
}

PageLayout PageWriter::write(const std::vector<OggPacket>& packets,
                             const std::vector<size_t>& track_starts) const {
    if (packets.size() < 2) {
        throw StructuralError(ErrorCode::MissingStreamHeader,
                              "need identification and comment packets, got " +
                              std::to_string(packets.size()) + " packets");
    }

    size_t previous = 2;
    for (size_t start : track_starts) {
        if (start <= previous || start >= packets.size()) {
            throw InputError(ErrorCode::InvalidTrackBoundary,
                             "track boundary at packet " + std::to_string(start) + " of " +
                             std::to_string(packets.size()) + " does not start a non-empty track");
        }
        previous = start;
    }

    LayoutSession session(m_traits, m_options, maxWholePacketSize(), fragmentSize());
    PageLayout layout;
    uint64_t granule = 0;
    size_t next_boundary = 0;

    for (size_t i = 0; i < packets.size(); ++i) {
        PacketRole role = i == 0 ? PacketRole::Identification
                        : i == 1 ? PacketRole::Comment
                                 : PacketRole::Audio;

        // The comment packet and the first audio packet each start a page
        if (i == 1 || i == 2) {
            session.startNewPage();
        }
        if (next_boundary < track_starts.size() && track_starts[next_boundary] == i) {
            session.startNewPage();
            layout.chapter_pages.push_back(static_cast<uint32_t>(session.pageCount()));
            next_boundary++;
        }

        if (role == PacketRole::Audio) {
            granule += m_traits.sampleCount(packets[i].data);
        }
        session.addPacket(packets[i].data, role, granule);
    }
    session.startNewPage();

    layout.pages = session.takePages();
    if (!layout.pages.empty()) {
        layout.pages.back().flags |= OGG_FLAG_EOS;
    }

    DEBUG_LOG("ogg", packets.size(), " packets -> ", layout.pages.size(),
              " pages, ", layout.chapter_pages.size(), " chapter marks, final granule ", granule);
    return layout;
}

} // namespace Ogg
} // namespace TafKit
