/*
 * PacketReassembler.cpp - Rebuilds logical packets from an Ogg page sequence
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"
#include "ogg/PacketReassembler.h"

namespace TafKit {
namespace Ogg {

PacketReassembler::PacketReassembler(std::vector<OggPage> pages, size_t track)
    : m_pages(std::move(pages))
    , m_track(track)
{
    reset();
}

void PacketReassembler::reset() {
    m_page_index = 0;
    m_segment_index = 0;
    m_body_offset = 0;
    m_page_entered = false;
    m_page_completions = 0;
    m_completed_on_page = 0;
    m_open = false;
    m_partial.clear();
    m_partial_first_page = 0;
}

void PacketReassembler::enterPage(const OggPage& page) {
    if (m_page_index > 0) {
        const OggPage& previous = m_pages[m_page_index - 1];
        if (page.serial_number != previous.serial_number) {
            throw InputError(ErrorCode::SerialDiscontinuity,
                             "page " + std::to_string(m_page_index) + " has serial " +
                             std::to_string(page.serial_number) + ", stream serial is " +
                             std::to_string(previous.serial_number));
        }
        if (page.sequence_number != previous.sequence_number + 1) {
            throw InputError(ErrorCode::SequenceGap,
                             "sequence number " + std::to_string(page.sequence_number) + " follows " +
                             std::to_string(previous.sequence_number));
        }
    }

    if (page.isContinued() && !m_open) {
        throw FormatError(ErrorCode::UnexpectedContinuation,
                          "page " + std::to_string(page.sequence_number) +
                          " is flagged continued but no packet is open");
    }
    if (!page.isContinued() && m_open) {
        throw FormatError(ErrorCode::MissingContinuation,
                          "packet started on page " + std::to_string(m_partial_first_page) +
                          " is not continued on page " + std::to_string(page.sequence_number));
    }

    m_page_entered = true;
    m_page_completions = page.completedPacketCount();
    m_completed_on_page = 0;
}

bool PacketReassembler::next(OggPacket& packet) {
    while (m_page_index < m_pages.size()) {
        const OggPage& page = m_pages[m_page_index];
        if (!m_page_entered) {
            enterPage(page);
        }

        while (m_segment_index < page.segments.size()) {
            uint8_t lace = page.segments[m_segment_index++];
            if (!m_open) {
                m_open = true;
                m_partial.clear();
                m_partial_first_page = page.sequence_number;
            }

            m_partial.insert(m_partial.end(), page.body.begin() + m_body_offset,
                             page.body.begin() + m_body_offset + lace);
            m_body_offset += lace;

            if (lace < OGG_LACING_CONTINUES) {
                m_open = false;
                m_completed_on_page++;

                packet.data = std::move(m_partial);
                m_partial.clear();
                packet.track = m_track;
                packet.first_page = m_partial_first_page;
                packet.granule_position = (m_completed_on_page == m_page_completions)
                                              ? page.granule_position
                                              : OGG_GRANULE_NONE;
                return true;
            }
        }

        m_page_index++;
        m_segment_index = 0;
        m_body_offset = 0;
        m_page_entered = false;
    }

    if (m_open) {
        throw FormatError(ErrorCode::TruncatedPacket,
                          "stream ends inside the packet started on page " +
                          std::to_string(m_partial_first_page));
    }
    return false;
}

std::vector<OggPacket> PacketReassembler::drain() {
    std::vector<OggPacket> packets;
    OggPacket packet;
    while (next(packet)) {
        packets.push_back(std::move(packet));
        packet = OggPacket();
    }
    DEBUG_LOG("ogg", "track ", m_track, ": ", packets.size(),
              " packets from ", m_pages.size(), " pages");
    return packets;
}

} // namespace Ogg
} // namespace TafKit
