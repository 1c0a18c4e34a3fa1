/*
 * TafValidator.cpp - Structural validation of TAF containers
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"
#include "ogg/StreamFormat.h"
#include "taf/TafValidator.h"

namespace TafKit {
namespace Taf {

namespace {

const char* const ALL_CHECKS[] = {
    "header.length_prefix",
    "header.decode",
    "header.content_length",
    "content.hash",
    "pages.framing",
    "pages.size",
    "pages.checksum",
    "pages.sequence",
    "stream.serial",
    "stream.identification",
    "stream.comment",
    "chapters.order",
    "chapters.alignment"
};

constexpr size_t MAX_LISTED = 5;

/**
 * Collects indices of offending pages and renders them as "page 3, page 7 (+2 more)".
 */
class Offenders {
public:
    void add(const std::string& what) {
        if (m_items.size() < MAX_LISTED) {
            m_items.push_back(what);
        }
        m_count++;
    }

    bool empty() const { return m_count == 0; }

    std::string str() const {
        std::ostringstream oss;
        for (size_t i = 0; i < m_items.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << m_items[i];
        }
        if (m_count > m_items.size()) {
            oss << " (+" << (m_count - m_items.size()) << " more)";
        }
        return oss.str();
    }

private:
    std::vector<std::string> m_items;
    size_t m_count = 0;
};

class ReportBuilder {
public:
    void add(const std::string& name, bool passed, const std::string& detail) {
        if (!passed) {
            Debug::log("validate", "FAIL ", name, ": ", detail);
        }
        m_report.checks.push_back({ name, passed, detail });
    }

    ValidationReport take() { return std::move(m_report); }

private:
    ValidationReport m_report;
};

} // namespace

bool ValidationReport::valid() const {
    return failureCount() == 0;
}

size_t ValidationReport::failureCount() const {
    return static_cast<size_t>(std::count_if(checks.begin(), checks.end(),
                                             [](const ValidationCheck& check) { return !check.passed; }));
}

const ValidationCheck* ValidationReport::find(const std::string& name) const {
    for (const ValidationCheck& check : checks) {
        if (check.name == name) {
            return &check;
        }
    }
    return nullptr;
}

TafValidator::TafValidator(ValidationOptions options)
    : m_options(options)
{
}

ValidationReport TafValidator::validate(const std::vector<uint8_t>& bytes) const {
    if (bytes.size() < TAF_HEADER_BLOCK_SIZE) {
        ReportBuilder report;
        std::string detail = "file of " + std::to_string(bytes.size()) + " bytes is shorter than the " +
                             std::to_string(TAF_HEADER_BLOCK_SIZE) + " byte header block";
        for (const char* name : ALL_CHECKS) {
            report.add(name, false, detail);
        }
        return report.take();
    }
    return validate(TafContainer::parse(bytes));
}

ValidationReport TafValidator::validate(const TafContainer& container) const {
    ReportBuilder report;
    const uint8_t* stream = container.pageStream();
    size_t stream_size = container.pageStreamSize();

    // ---- Header ----
    uint32_t prefix = Core::readBE32(container.headerBlock());
    report.add("header.length_prefix", prefix <= TAF_HEADER_MAX_MESSAGE,
               "message of " + std::to_string(prefix) + " bytes, limit " + std::to_string(TAF_HEADER_MAX_MESSAGE));

    std::optional<TafHeader> header;
    try {
        header = container.header();
        report.add("header.decode", true,
                   "timestamp " + std::to_string(header->timestamp) + ", " +
                   std::to_string(header->chapter_pages.size()) + " chapters");
    } catch (const TafException& e) {
        report.add("header.decode", false, e.what());
    }

    if (header) {
        report.add("header.content_length", header->length == stream_size,
                   "stored " + std::to_string(header->length) + ", page stream " + std::to_string(stream_size));
    } else {
        report.add("header.content_length", false, "header not decodable");
    }

    try {
        Core::Sha1Digest computed = computeContentHash(stream, stream_size, m_options.hash_scope);
        std::string computed_hex = Core::Sha1::toHex(computed);
        if (header) {
            report.add("content.hash", header->hash == computed,
                       "stored " + Core::Sha1::toHex(header->hash) + ", computed " + computed_hex +
                       " over " + hashScopeName(m_options.hash_scope));
        } else {
            report.add("content.hash", false, "header not decodable, computed " + computed_hex);
        }
    } catch (const TafException& e) {
        report.add("content.hash", false, std::string("cannot hash page stream: ") + e.what());
    }

    // ---- Pages ----
    Ogg::PageScan scan = Ogg::OggPageCodec::scanStream(stream, stream_size);
    if (scan.complete) {
        report.add("pages.framing", !scan.pages.empty(),
                   scan.pages.empty() ? std::string("no pages") : std::to_string(scan.pages.size()) + " pages");
    } else {
        report.add("pages.framing", false,
                   "stopped at stream offset " + std::to_string(scan.error_offset) + " after " +
                   std::to_string(scan.pages.size()) + " pages: " + scan.error);
    }

    Offenders wrong_size;
    Offenders bad_checksum;
    Offenders out_of_sequence;
    Offenders wrong_serial;
    uint32_t expected_serial = header ? header->timestamp
                                      : (scan.pages.empty() ? 0 : scan.pages.front().page.serial_number);

    for (size_t i = 0; i < scan.pages.size(); ++i) {
        const Ogg::PageScan::Entry& entry = scan.pages[i];
        if (entry.size != m_options.page_size) {
            wrong_size.add("page " + std::to_string(i) + " is " + std::to_string(entry.size) + " bytes");
        }
        if (!Ogg::OggPageCodec::verifyChecksum(stream + entry.offset, entry.size)) {
            bad_checksum.add("page " + std::to_string(i));
        }
        if (entry.page.sequence_number != i) {
            out_of_sequence.add("page " + std::to_string(i) + " numbered " +
                                std::to_string(entry.page.sequence_number));
        }
        if (entry.page.serial_number != expected_serial) {
            wrong_serial.add("page " + std::to_string(i) + " serial " + std::to_string(entry.page.serial_number));
        }
    }

    std::string scanned = std::to_string(scan.pages.size()) + " pages checked";
    report.add("pages.size", wrong_size.empty() && !scan.pages.empty(),
               wrong_size.empty() ? scanned + " of " + std::to_string(m_options.page_size) + " bytes"
                                  : wrong_size.str());
    report.add("pages.checksum", bad_checksum.empty(),
               bad_checksum.empty() ? scanned : "checksum mismatch on " + bad_checksum.str());
    report.add("pages.sequence", out_of_sequence.empty(),
               out_of_sequence.empty() ? scanned : out_of_sequence.str());
    report.add("stream.serial", wrong_serial.empty(),
               wrong_serial.empty() ? "serial " + std::to_string(expected_serial)
                                    : "expected " + std::to_string(expected_serial) + ": " + wrong_serial.str());

    // ---- Stream headers ----
    std::vector<Ogg::OggPage> pages;
    pages.reserve(scan.pages.size());
    for (const Ogg::PageScan::Entry& entry : scan.pages) {
        pages.push_back(entry.page);
    }
    Ogg::PacketReassembler reassembler(std::move(pages));
    Ogg::OggPacket packet;

    bool id_read = false;
    try {
        if (!reassembler.next(packet)) {
            report.add("stream.identification", false, "no packets");
        } else {
            id_read = true;
            Ogg::StreamIdentification id = Ogg::identifyStream(packet.data);
            if (!std::holds_alternative<Opus::OpusHeader>(id)) {
                report.add("stream.identification", false, "stream is " + Ogg::streamFormatName(id));
            } else {
                const Opus::OpusHeader& head = std::get<Opus::OpusHeader>(id);
                bool ok = head.channel_count == m_options.expected_channels &&
                          head.input_sample_rate == m_options.expected_sample_rate;
                report.add("stream.identification", ok,
                           "Opus, " + std::to_string(head.channel_count) + " channels (expected " +
                           std::to_string(m_options.expected_channels) + "), " +
                           std::to_string(head.input_sample_rate) + " Hz (expected " +
                           std::to_string(m_options.expected_sample_rate) + ")");
            }
        }
    } catch (const TafException& e) {
        report.add("stream.identification", false, e.what());
    }

    if (!id_read) {
        report.add("stream.comment", false, "identification packet not read");
    } else {
        try {
            if (!reassembler.next(packet)) {
                report.add("stream.comment", false, "stream ends after the identification packet");
            } else {
                Opus::OpusComments comments = Opus::OpusComments::parseFromPacket(packet.data);
                report.add("stream.comment", true,
                           "vendor '" + comments.vendor_string + "', " +
                           std::to_string(comments.user_comments.size()) + " comments");
            }
        } catch (const TafException& e) {
            report.add("stream.comment", false, e.what());
        }
    }

    // ---- Chapters ----
    if (!header) {
        report.add("chapters.order", false, "header not decodable");
        report.add("chapters.alignment", false, "header not decodable");
    } else {
        Offenders misordered;
        Offenders misaligned;
        const std::vector<uint32_t>& chapters = header->chapter_pages;
        for (size_t i = 0; i < chapters.size(); ++i) {
            uint32_t chapter = chapters[i];
            if (i > 0 && chapter <= chapters[i - 1]) {
                misordered.add("chapter " + std::to_string(i) + " page " + std::to_string(chapter) +
                               " after " + std::to_string(chapters[i - 1]));
            }
            if (chapter < 2 || chapter >= scan.pages.size()) {
                misordered.add("chapter " + std::to_string(i) + " page " + std::to_string(chapter) +
                               " outside audio pages 2.." + std::to_string(scan.pages.size()));
            } else if (scan.pages[chapter].page.isContinued()) {
                misaligned.add("chapter " + std::to_string(i) + " page " + std::to_string(chapter));
            }
        }
        report.add("chapters.order", misordered.empty(),
                   misordered.empty() ? std::to_string(chapters.size()) + " chapters" : misordered.str());
        report.add("chapters.alignment", misaligned.empty(),
                   misaligned.empty() ? "every chapter starts a packet"
                                      : "continued packet at " + misaligned.str());
    }

    ValidationReport result = report.take();
    DEBUG_LOG("validate", result.checks.size(), " checks, ",
              result.failureCount(), " failed");
    return result;
}

} // namespace Taf
} // namespace TafKit
