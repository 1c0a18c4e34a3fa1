/*
 * TafAnalyzer.h - Container information and track extraction
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAFKIT_TAF_TAFANALYZER_H
#define TAFKIT_TAF_TAFANALYZER_H

#include "taf/TafContainer.h"

#include <string>
#include <utility>
#include <vector>

namespace TafKit {
namespace Taf {

struct ChapterInfo {
    uint32_t start_page = 0;
    uint32_t end_page = 0;        ///< One past the last page of the chapter
    uint64_t start_granule = 0;
    uint64_t end_granule = 0;
    double duration_seconds = 0.0;
};

struct TafInfo {
    size_t file_size = 0;
    size_t page_stream_size = 0;
    uint32_t stored_length = 0;
    std::string stored_hash;
    std::string computed_hash;
    bool hash_matches = false;
    uint32_t timestamp = 0;
    uint32_t serial_number = 0;

    unsigned channels = 0;
    uint32_t input_sample_rate = 0;
    uint16_t pre_skip = 0;

    size_t page_count = 0;
    uint64_t total_granule = 0;
    double duration_seconds = 0.0;
    std::vector<ChapterInfo> chapters;  ///< Every track, the first included

    std::string vendor;
    std::vector<std::pair<std::string, std::string>> comments;
};

class TafAnalyzer {
public:
    explicit TafAnalyzer(HashScope hash_scope = HashScope::PageBodies);

    /**
     * @throws TafException if the header, pages or stream headers are unreadable
     */
    TafInfo describe(const TafContainer& container) const;

    /**
     * @brief Split a container into one standalone Ogg Opus stream per chapter.
     *
     * Each stream holds the container's identification and comment pages
     * followed by the chapter's pages, renumbered from 0, with granule
     * positions rebased to the chapter start and end-of-stream on the last page.
     * @throws StructuralError(ChapterNotPageAligned) if a chapter starts inside a packet
     * @throws StructuralError(NonMonotonicChapters) for chapters out of order or range
     */
    std::vector<std::vector<uint8_t>> splitTracks(const TafContainer& container) const;

private:
    HashScope m_hash_scope;
};

} // namespace Taf
} // namespace TafKit

#endif // TAFKIT_TAF_TAFANALYZER_H
