/*
 * TafComparator.cpp - Structural diff of two TAF containers
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"
#include "taf/TafComparator.h"

namespace TafKit {
namespace Taf {

namespace {

std::string joinChapters(const std::vector<uint32_t>& chapters) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < chapters.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << chapters[i];
    }
    oss << "]";
    return oss.str();
}

std::optional<TafHeader> tryDecode(const TafContainer& container, std::string& error) {
    try {
        return container.header();
    } catch (const TafException& e) {
        error = e.what();
        return std::nullopt;
    }
}

void compareHeaders(const TafContainer& left, const TafContainer& right, DiffReport& report) {
    if (std::equal(left.headerBlock(), left.headerBlock() + TAF_HEADER_BLOCK_SIZE, right.headerBlock())) {
        return;
    }

    std::string left_error = "decodable";
    std::string right_error = "decodable";
    std::optional<TafHeader> a = tryDecode(left, left_error);
    std::optional<TafHeader> b = tryDecode(right, right_error);
    if (!a || !b) {
        report.fields.push_back({ "header", left_error, right_error });
        return;
    }

    if (a->hash != b->hash) {
        report.fields.push_back({ "header.hash", Core::Sha1::toHex(a->hash), Core::Sha1::toHex(b->hash) });
    }
    if (a->length != b->length) {
        report.fields.push_back({ "header.length", std::to_string(a->length), std::to_string(b->length) });
    }
    if (a->timestamp != b->timestamp) {
        report.fields.push_back({ "header.timestamp", std::to_string(a->timestamp), std::to_string(b->timestamp) });
    }
    if (a->chapter_pages != b->chapter_pages) {
        report.fields.push_back({ "header.chapters", joinChapters(a->chapter_pages), joinChapters(b->chapter_pages) });
    }
}

void comparePages(const TafContainer& left, const TafContainer& right, DiffReport& report) {
    Ogg::PageScan a = Ogg::OggPageCodec::scanStream(left.pageStream(), left.pageStreamSize());
    Ogg::PageScan b = Ogg::OggPageCodec::scanStream(right.pageStream(), right.pageStreamSize());

    if (!a.complete || !b.complete) {
        auto describe = [](const Ogg::PageScan& scan) {
            return scan.complete ? std::string("ok")
                                 : "stops at offset " + std::to_string(scan.error_offset) + ": " + scan.error;
        };
        if (describe(a) != describe(b)) {
            report.fields.push_back({ "pages.framing", describe(a), describe(b) });
        }
    }
    if (a.pages.size() != b.pages.size()) {
        report.fields.push_back({ "pages.count", std::to_string(a.pages.size()), std::to_string(b.pages.size()) });
    }

    size_t common = std::min(a.pages.size(), b.pages.size());
    for (size_t i = 0; i < common; ++i) {
        const Ogg::PageScan::Entry& pa = a.pages[i];
        const Ogg::PageScan::Entry& pb = b.pages[i];
        const uint8_t* raw_a = left.pageStream() + pa.offset;
        const uint8_t* raw_b = right.pageStream() + pb.offset;

        size_t shorter = std::min(pa.size, pb.size);
        size_t first = static_cast<size_t>(std::mismatch(raw_a, raw_a + shorter, raw_b).first - raw_a);
        if (first == shorter && pa.size == pb.size) {
            continue;
        }

        PageDifference diff;
        diff.page_index = i;
        diff.first_offset = first;
        diff.left_size = pa.size;
        diff.right_size = pb.size;
        diff.body_identical = pa.page.body == pb.page.body;
        report.pages.push_back(diff);
    }
}

} // namespace

const FieldDifference* DiffReport::findField(const std::string& field) const {
    for (const FieldDifference& difference : fields) {
        if (difference.field == field) {
            return &difference;
        }
    }
    return nullptr;
}

DiffReport TafComparator::diff(const TafContainer& left, const TafContainer& right, bool detailed) {
    DiffReport report;

    if (left.size() != right.size()) {
        report.fields.push_back({ "size", std::to_string(left.size()), std::to_string(right.size()) });
    }
    compareHeaders(left, right, report);

    if (detailed) {
        comparePages(left, right, report);
    }

    DEBUG_LOG("compare", report.fields.size(), " field differences, ",
              report.pages.size(), " page differences", detailed ? " (detailed)" : "");
    return report;
}

} // namespace Taf
} // namespace TafKit
