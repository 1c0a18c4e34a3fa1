/*
 * TafAnalyzer.cpp - Container information and track extraction
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"
#include "opus/OpusPacket.h"
#include "taf/TafAnalyzer.h"

namespace TafKit {
namespace Taf {

using Ogg::OGG_GRANULE_NONE;
using Ogg::OggPage;

namespace {

constexpr uint32_t FIRST_AUDIO_PAGE = 2;

// Granule position reached by the end of page `index`, looking back past
// pages on which no packet completes.
uint64_t granuleBefore(const std::vector<OggPage>& pages, uint32_t page_index) {
    for (uint32_t i = page_index; i-- > 0;) {
        if (pages[i].granule_position != OGG_GRANULE_NONE) {
            return pages[i].granule_position;
        }
    }
    return 0;
}

/**
 * Page ranges [start, end) of every track, the first one included.
 */
std::vector<std::pair<uint32_t, uint32_t>> chapterRanges(const TafHeader& header,
                                                        const std::vector<OggPage>& pages) {
    uint32_t page_count = static_cast<uint32_t>(pages.size());
    if (page_count <= FIRST_AUDIO_PAGE) {
        throw StructuralError(ErrorCode::MissingStreamHeader, "container holds no audio pages");
    }

    std::vector<uint32_t> starts = { FIRST_AUDIO_PAGE };
    for (uint32_t chapter : header.chapter_pages) {
        if (chapter <= starts.back() || chapter >= page_count) {
            throw StructuralError(ErrorCode::NonMonotonicChapters,
                                  "chapter page " + std::to_string(chapter) + " after " +
                                  std::to_string(starts.back()) + " in " + std::to_string(page_count) + " pages");
        }
        starts.push_back(chapter);
    }

    std::vector<std::pair<uint32_t, uint32_t>> ranges;
    for (size_t i = 0; i < starts.size(); ++i) {
        uint32_t end = i + 1 < starts.size() ? starts[i + 1] : page_count;
        ranges.emplace_back(starts[i], end);
    }
    return ranges;
}

} // namespace

TafAnalyzer::TafAnalyzer(HashScope hash_scope)
    : m_hash_scope(hash_scope)
{
}

TafInfo TafAnalyzer::describe(const TafContainer& container) const {
    TafHeader header = container.header();
    std::vector<OggPage> pages = container.pages();
    std::vector<Ogg::OggPacket> packets = container.packets();
    if (packets.size() < 2) {
        throw StructuralError(ErrorCode::MissingStreamHeader, "container lacks stream headers");
    }

    Opus::OpusHeader head = Opus::OpusHeader::parseFromPacket(packets[0].data);
    Opus::OpusComments tags = Opus::OpusComments::parseFromPacket(packets[1].data);

    TafInfo info;
    info.file_size = container.size();
    info.page_stream_size = container.pageStreamSize();
    info.stored_length = header.length;
    info.stored_hash = Core::Sha1::toHex(header.hash);
    Core::Sha1Digest computed = computeContentHash(container.pageStream(), container.pageStreamSize(), m_hash_scope);
    info.computed_hash = Core::Sha1::toHex(computed);
    info.hash_matches = computed == header.hash;
    info.timestamp = header.timestamp;
    info.serial_number = pages.empty() ? 0 : pages.front().serial_number;
    info.channels = head.channel_count;
    info.input_sample_rate = head.input_sample_rate;
    info.pre_skip = head.pre_skip;
    info.page_count = pages.size();
    info.total_granule = granuleBefore(pages, static_cast<uint32_t>(pages.size()));
    info.vendor = tags.vendor_string;
    info.comments = tags.user_comments;

    uint64_t playable = info.total_granule > head.pre_skip ? info.total_granule - head.pre_skip : 0;
    info.duration_seconds = static_cast<double>(playable) / Opus::OPUS_SAMPLE_RATE;

    for (const auto& range : chapterRanges(header, pages)) {
        ChapterInfo chapter;
        chapter.start_page = range.first;
        chapter.end_page = range.second;
        chapter.start_granule = granuleBefore(pages, range.first);
        chapter.end_granule = granuleBefore(pages, range.second);

        uint64_t samples = chapter.end_granule - chapter.start_granule;
        if (range.first == FIRST_AUDIO_PAGE) {
            samples = samples > head.pre_skip ? samples - head.pre_skip : 0;
        }
        chapter.duration_seconds = static_cast<double>(samples) / Opus::OPUS_SAMPLE_RATE;
        info.chapters.push_back(chapter);
    }

    DEBUG_LOG("taf", info.page_count, " pages, ", info.chapters.size(),
              " chapters, ", info.duration_seconds, " s");
    return info;
}

std::vector<std::vector<uint8_t>> TafAnalyzer::splitTracks(const TafContainer& container) const {
    TafHeader header = container.header();
    std::vector<OggPage> pages = container.pages();

    std::vector<std::vector<uint8_t>> tracks;
    for (const auto& range : chapterRanges(header, pages)) {
        if (pages[range.first].isContinued()) {
            throw StructuralError(ErrorCode::ChapterNotPageAligned,
                                  "chapter page " + std::to_string(range.first) + " continues a packet");
        }

        uint64_t base = granuleBefore(pages, range.first);
        std::vector<OggPage> track_pages = { pages[0], pages[1] };
        track_pages.insert(track_pages.end(), pages.begin() + range.first, pages.begin() + range.second);

        std::vector<uint8_t> stream;
        for (size_t i = 0; i < track_pages.size(); ++i) {
            OggPage& page = track_pages[i];
            page.sequence_number = static_cast<uint32_t>(i);
            page.flags &= static_cast<uint8_t>(~Ogg::OGG_FLAG_EOS);
            if (i + 1 == track_pages.size()) {
                page.flags |= Ogg::OGG_FLAG_EOS;
            }
            if (i >= FIRST_AUDIO_PAGE && page.granule_position != OGG_GRANULE_NONE) {
                page.granule_position -= base;
            }
            Ogg::OggPageCodec::serializeTo(page, stream);
        }

        DEBUG_LOG("taf", "track ", tracks.size(), ": pages ", range.first, "..",
                  range.second - 1, ", granule base ", base);
        tracks.push_back(std::move(stream));
    }
    return tracks;
}

} // namespace Taf
} // namespace TafKit
