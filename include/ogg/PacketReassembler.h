/*
 * PacketReassembler.h - Rebuilds logical packets from an Ogg page sequence
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * The reassembler walks the lacing tables of a single logical bitstream and
 * hands out complete packets one at a time. It can be restarted from the
 * first page at any point.
 */

#ifndef TAFKIT_OGG_PACKETREASSEMBLER_H
#define TAFKIT_OGG_PACKETREASSEMBLER_H

#include "ogg/OggPage.h"

namespace TafKit {
namespace Ogg {

struct OggPacket {
    std::vector<uint8_t> data;
    size_t track = 0;
    uint64_t granule_position = OGG_GRANULE_NONE;  ///< Set only on the last packet completed on a page
    uint32_t first_page = 0;                       ///< Sequence number of the page the packet starts on
};

class PacketReassembler {
public:
    /**
     * @param pages Pages of one logical bitstream, in stream order
     * @param track Track index stamped on every packet produced
     */
    explicit PacketReassembler(std::vector<OggPage> pages, size_t track = 0);

    /**
     * @brief Produce the next complete packet.
     * @return false once the stream is exhausted
     * @throws InputError(SerialDiscontinuity, SequenceGap)
     * @throws FormatError(UnexpectedContinuation, MissingContinuation, TruncatedPacket)
     */
    bool next(OggPacket& packet);

    /**
     * @brief Rewind to the first page.
     */
    void reset();

    /**
     * @brief Collect every packet not yet returned by next().
     */
    std::vector<OggPacket> drain();

    const std::vector<OggPage>& pages() const { return m_pages; }

private:
    void enterPage(const OggPage& page);

    std::vector<OggPage> m_pages;
    size_t m_track;

    size_t m_page_index;
    size_t m_segment_index;
    size_t m_body_offset;
    bool m_page_entered;
    size_t m_page_completions;      // packets ending on the current page
    size_t m_completed_on_page;     // of which already returned

    bool m_open;
    std::vector<uint8_t> m_partial;
    uint32_t m_partial_first_page;
};

} // namespace Ogg
} // namespace TafKit

#endif // TAFKIT_OGG_PACKETREASSEMBLER_H
