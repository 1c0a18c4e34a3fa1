/*
 * TafContainer.cpp - TAF container parser and builder
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"
#include "ogg/StreamFormat.h"
#include "opus/OpusPacketTraits.h"
#include "taf/TafContainer.h"

namespace TafKit {
namespace Taf {

using Ogg::OggPacket;
using Ogg::OggPage;
using Ogg::OggPageCodec;

// ========== Hash scope ==========

const char* hashScopeName(HashScope scope) {
    switch (scope) {
        case HashScope::PageBodies:
            return "bodies";
        case HashScope::WholePages:
            return "pages";
    }
    return "unknown";
}

bool parseHashScope(const std::string& text, HashScope& scope) {
    if (text == "bodies") {
        scope = HashScope::PageBodies;
        return true;
    }
    if (text == "pages") {
        scope = HashScope::WholePages;
        return true;
    }
    return false;
}

Core::Sha1Digest computeContentHash(const uint8_t* stream, size_t size, HashScope scope) {
    if (scope == HashScope::WholePages) {
        return Core::Sha1::digest(stream, size);
    }

    Core::Sha1 sha;
    size_t offset = 0;
    while (offset < size) {
        size_t total = OggPageCodec::framedSize(stream + offset, size - offset);
        size_t header_size = Ogg::OGG_PAGE_HEADER_SIZE + stream[offset + 26];
        sha.update(stream + offset + header_size, total - header_size);
        offset += total;
    }
    return sha.finalize();
}

// ========== TafContainer ==========

TafContainer::TafContainer(std::vector<uint8_t> bytes)
    : m_bytes(std::move(bytes))
{
}

TafContainer TafContainer::parse(std::vector<uint8_t> bytes) {
    if (bytes.size() < TAF_HEADER_BLOCK_SIZE) {
        throw FormatError(ErrorCode::TruncatedHeader,
                          "container of " + std::to_string(bytes.size()) + " bytes is shorter than the header block");
    }
    return TafContainer(std::move(bytes));
}

TafHeader TafContainer::header() const {
    return TafHeaderCodec::decode(headerBlock(), TAF_HEADER_BLOCK_SIZE);
}

std::vector<OggPage> TafContainer::pages(bool verify_checksums) const {
    return OggPageCodec::parseStream(pageStream(), pageStreamSize(), verify_checksums);
}

std::vector<OggPacket> TafContainer::packets() const {
    Ogg::PacketReassembler reassembler(pages());
    return reassembler.drain();
}

std::vector<uint8_t> TafContainer::pageStreamBytes() const {
    return std::vector<uint8_t>(m_bytes.begin() + TAF_HEADER_BLOCK_SIZE, m_bytes.end());
}

void TafContainer::verify(HashScope scope) const {
    TafHeader stored = header();
    if (stored.length != pageStreamSize()) {
        throw IntegrityError(ErrorCode::ContentLengthMismatch,
                             "header declares " + std::to_string(stored.length) + " bytes of pages, container holds " +
                             std::to_string(pageStreamSize()));
    }
    Core::Sha1Digest actual = computeContentHash(pageStream(), pageStreamSize(), scope);
    if (actual != stored.hash) {
        throw IntegrityError(ErrorCode::ContentHashMismatch,
                             std::string("stored ") + hashScopeName(scope) + " hash " + Core::Sha1::toHex(stored.hash) +
                             ", computed " + Core::Sha1::toHex(actual));
    }
}

// ========== TimestampSource ==========

TimestampSource::TimestampSource(Kind kind, uint32_t value)
    : m_kind(kind)
    , m_value(value)
{
}

TimestampSource TimestampSource::fixed(uint32_t timestamp) {
    return TimestampSource(Kind::Fixed, timestamp);
}

TimestampSource TimestampSource::currentTime() {
    return TimestampSource(Kind::CurrentTime, 0);
}

TimestampSource TimestampSource::fromReference(const TafContainer& reference) {
    uint32_t timestamp = reference.header().timestamp;
    Debug::log("taf", "Using timestamp ", timestamp, " from reference container");
    return TimestampSource(Kind::Fixed, timestamp);
}

uint32_t TimestampSource::resolve() const {
    if (m_kind == Kind::CurrentTime) {
        return static_cast<uint32_t>(std::time(nullptr));
    }
    return m_value;
}

// ========== TafBuilder ==========

namespace {

struct TrackPackets {
    Opus::OpusHeader identification;
    std::vector<OggPacket> packets;
};

TrackPackets readTrack(const std::vector<uint8_t>& bytes, size_t track) {
    if (bytes.empty()) {
        throw InputError(ErrorCode::EmptyInput, "track " + std::to_string(track) + " is empty");
    }

    Ogg::PacketReassembler reassembler(OggPageCodec::parseStream(bytes), track);
    TrackPackets result;
    result.packets = reassembler.drain();

    if (result.packets.empty()) {
        throw StructuralError(ErrorCode::MissingStreamHeader,
                              "track " + std::to_string(track) + " has no identification packet");
    }

    Ogg::StreamIdentification id = Ogg::identifyStream(result.packets[0].data);
    if (!std::holds_alternative<Opus::OpusHeader>(id)) {
        throw StructuralError(ErrorCode::UnsupportedStreamFormat,
                              "track " + std::to_string(track) + " is " + Ogg::streamFormatName(id) +
                              ", only Opus can be stored");
    }
    result.identification = std::get<Opus::OpusHeader>(id);

    if (result.packets.size() < 2) {
        throw StructuralError(ErrorCode::MissingStreamHeader,
                              "track " + std::to_string(track) + " has no comment packet");
    }
    if (!Opus::OpusComments::hasSignature(result.packets[1].data)) {
        throw StructuralError(ErrorCode::InvalidCommentHeader,
                              "second packet of track " + std::to_string(track) + " is not OpusTags");
    }
    Opus::OpusComments::parseFromPacket(result.packets[1].data);

    if (result.packets.size() < 3) {
        throw InputError(ErrorCode::InvalidTrackBoundary,
                         "track " + std::to_string(track) + " has no audio packets");
    }
    return result;
}

// Drop trailing user comments until the packet fits one page body.
std::vector<uint8_t> fitComments(const std::vector<uint8_t>& packet, size_t max_packet) {
    Opus::OpusComments comments = Opus::OpusComments::parseFromPacket(packet);
    std::vector<uint8_t> fitted = comments.toPacket();
    while (fitted.size() > max_packet && !comments.user_comments.empty()) {
        Debug::log("taf", "TafBuilder: dropping comment ", comments.user_comments.back().first, " (",
                   comments.user_comments.back().second.size(), " bytes) from track 0");
        comments.user_comments.pop_back();
        fitted = comments.toPacket();
    }
    if (fitted.size() > max_packet) {
        throw CapacityError(ErrorCode::PacketTooLarge,
                            "vendor string of track 0 leaves a " + std::to_string(fitted.size()) +
                            " byte comment packet, a page holds at most " + std::to_string(max_packet));
    }
    Debug::log("taf", "TafBuilder: comment packet of track 0 cut from ", packet.size(), " to ", fitted.size(), " bytes");
    return fitted;
}

} // namespace

TafBuilder::TafBuilder(BuildOptions options)
    : m_options(std::move(options))
{
}

TafContainer TafBuilder::build(const std::vector<std::vector<uint8_t>>& tracks,
                               const TimestampSource& timestamp) const {
    if (tracks.empty()) {
        throw InputError(ErrorCode::EmptyInput, "no tracks supplied");
    }

    uint32_t serial = timestamp.resolve();
    Opus::OpusPacketTraits traits;
    Ogg::PageWriterOptions writer_options;
    writer_options.page_size = m_options.page_size;
    writer_options.serial_number = serial;
    Ogg::PageWriter writer(traits, writer_options);

    std::vector<OggPacket> combined;
    std::vector<size_t> track_starts;
    Opus::OpusHeader first_id;

    for (size_t t = 0; t < tracks.size(); ++t) {
        TrackPackets track = readTrack(tracks[t], t);

        if (t == 0) {
            first_id = track.identification;
            combined.push_back(std::move(track.packets[0]));
            combined.push_back(std::move(track.packets[1]));
        } else {
            if (track.identification.channel_count != first_id.channel_count ||
                track.identification.channel_mapping_family != first_id.channel_mapping_family) {
                throw StructuralError(ErrorCode::IncompatibleStreamParameters,
                                      "track " + std::to_string(t) + " has " +
                                      std::to_string(track.identification.channel_count) +
                                      " channels (mapping family " +
                                      std::to_string(track.identification.channel_mapping_family) +
                                      "), track 0 has " + std::to_string(first_id.channel_count) +
                                      " (mapping family " + std::to_string(first_id.channel_mapping_family) + ")");
            }
            track_starts.push_back(combined.size());
        }

        for (size_t i = 2; i < track.packets.size(); ++i) {
            combined.push_back(std::move(track.packets[i]));
        }
        Debug::log("taf", "TafBuilder: track ", t, " contributes ", track.packets.size() - 2, " audio packets");
    }

    size_t max_packet = writer.maxWholePacketSize();
    if (m_options.comment_source == CommentSource::Generated) {
        Opus::OpusComments comments;
        comments.vendor_string = m_options.vendor.empty() ? std::string("TafKit " TAFKIT_VERSION) : m_options.vendor;
        comments.user_comments = m_options.user_comments;
        combined[1].data = comments.toPacket();
    } else if (combined[1].data.size() > max_packet) {
        combined[1].data = fitComments(combined[1].data, max_packet);
    }

    for (size_t i = 0; i < combined.size(); ++i) {
        if (combined[i].data.size() > max_packet) {
            throw CapacityError(ErrorCode::PacketTooLarge,
                                "packet " + std::to_string(i) + " of track " + std::to_string(combined[i].track) +
                                " is " + std::to_string(combined[i].data.size()) + " bytes, a page holds at most " +
                                std::to_string(max_packet));
        }
    }

    Ogg::PageLayout layout = writer.write(combined, track_starts);

    std::vector<uint8_t> stream;
    stream.reserve(layout.pages.size() * m_options.page_size);
    for (const OggPage& page : layout.pages) {
        size_t before = stream.size();
        OggPageCodec::serializeTo(page, stream);
        if (stream.size() - before != m_options.page_size) {
            throw StructuralError(ErrorCode::PageSizeMismatch,
                                  "page " + std::to_string(page.sequence_number) + " is " +
                                  std::to_string(stream.size() - before) + " bytes");
        }
    }
    if (stream.size() > std::numeric_limits<uint32_t>::max()) {
        throw CapacityError(ErrorCode::HeaderOverflow,
                            "page stream of " + std::to_string(stream.size()) + " bytes does not fit the length field");
    }

    TafHeader header;
    header.hash = computeContentHash(stream.data(), stream.size(), m_options.hash_scope);
    header.length = static_cast<uint32_t>(stream.size());
    header.timestamp = serial;
    header.chapter_pages = layout.chapter_pages;

    std::vector<uint8_t> bytes = TafHeaderCodec::encode(header);
    bytes.insert(bytes.end(), stream.begin(), stream.end());

    DEBUG_LOG("taf", tracks.size(), " tracks, ", layout.pages.size(), " pages, ",
              bytes.size(), " bytes, timestamp ", serial, ", hash ", Core::Sha1::toHex(header.hash));
    return TafContainer::parse(std::move(bytes));
}

} // namespace Taf
} // namespace TafKit
