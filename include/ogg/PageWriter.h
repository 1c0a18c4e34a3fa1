/*
 * PageWriter.h - Lays logical packets out into fixed-size Ogg pages
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Every page the writer emits is exactly `page_size` bytes long. Pages are
 * brought to size by growing one whole packet on the page through the
 * PacketTraits padding rule; if no packet on a page can absorb the exact
 * number of missing bytes, the last packet moves to the next page.
 *
 * Packets too large for an empty page are split across pages. Pages that
 * carry only fragments of such a packet hold no paddable packet and keep
 * their natural size; callers that need strict page sizes reject those
 * packets up front (see maxWholePacketSize()).
 */

#ifndef TAFKIT_OGG_PAGEWRITER_H
#define TAFKIT_OGG_PAGEWRITER_H

#include "ogg/OggPage.h"
#include "ogg/PacketReassembler.h"
#include "ogg/PacketTraits.h"

namespace TafKit {
namespace Ogg {

constexpr size_t DEFAULT_PAGE_SIZE = 4096;
constexpr size_t MIN_PAGE_SIZE = OGG_PAGE_HEADER_SIZE + 2 * 256;

struct PageWriterOptions {
    size_t page_size = DEFAULT_PAGE_SIZE;
    uint32_t serial_number = 0;
};

struct PageLayout {
    std::vector<OggPage> pages;
    std::vector<uint32_t> chapter_pages;  ///< First page of every track after the first
};

class PageWriter {
public:
    /**
     * @throws std::invalid_argument if the page size is outside
     *         [MIN_PAGE_SIZE, OGG_MAX_PAGE_SIZE]
     */
    PageWriter(const PacketTraits& traits, PageWriterOptions options = PageWriterOptions());

    /**
     * @brief Lay out a packet sequence.
     * @param packets Identification packet, comment packet, then audio packets
     * @param track_starts Index into `packets` of the first audio packet of
     *        each track after the first, strictly increasing
     * @throws StructuralError(MissingStreamHeader) if fewer than two packets are given
     * @throws InputError(InvalidTrackBoundary) for a boundary that does not
     *         start a non-empty track
     * @throws CapacityError(PagePaddingFailed) if a page holding a single
     *         packet cannot be brought to size
     */
    PageLayout write(const std::vector<OggPacket>& packets,
                     const std::vector<size_t>& track_starts = {}) const;

    /**
     * @brief Largest packet that fits complete on an empty page.
     */
    size_t maxWholePacketSize() const;

    /**
     * @brief Bytes of an oversized packet carried by each intermediate page.
     */
    size_t fragmentSize() const;

    const PageWriterOptions& options() const { return m_options; }

private:
    const PacketTraits& m_traits;
    PageWriterOptions m_options;
};

} // namespace Ogg
} // namespace TafKit

#endif // TAFKIT_OGG_PAGEWRITER_H
