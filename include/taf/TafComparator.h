/*
 * TafComparator.h - Structural diff of two TAF containers
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAFKIT_TAF_TAFCOMPARATOR_H
#define TAFKIT_TAF_TAFCOMPARATOR_H

#include "taf/TafContainer.h"

#include <string>
#include <vector>

namespace TafKit {
namespace Taf {

/**
 * @brief A top-level difference. Field names are "size", "header",
 * "header.hash", "header.length", "header.timestamp", "header.chapters",
 * "pages.framing" and "pages.count".
 */
struct FieldDifference {
    std::string field;
    std::string left;
    std::string right;
};

struct PageDifference {
    size_t page_index = 0;
    size_t first_offset = 0;     ///< First differing byte within the page
    size_t left_size = 0;
    size_t right_size = 0;
    bool body_identical = false;
};

struct DiffReport {
    std::vector<FieldDifference> fields;
    std::vector<PageDifference> pages;   ///< Only filled in detailed mode

    bool identical() const { return fields.empty() && pages.empty(); }
    const FieldDifference* findField(const std::string& field) const;
};

class TafComparator {
public:
    /**
     * @brief Compare two containers. Never throws for malformed input.
     * @param detailed Also compare the page streams page by page
     */
    static DiffReport diff(const TafContainer& left, const TafContainer& right, bool detailed = false);
};

} // namespace Taf
} // namespace TafKit

#endif // TAFKIT_TAF_TAFCOMPARATOR_H
