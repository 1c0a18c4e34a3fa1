/*
 * test_taf_container.cpp - Unit tests for building and parsing TAF containers
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"
#include "test_framework.h"
#include "taf_test_utils.h"
#include "ogg/StreamFormat.h"
#include "taf/TafContainer.h"

using namespace TafKit;
using namespace TafKit::Taf;
using namespace TestFramework;

namespace {

constexpr uint32_t TIMESTAMP = 1700000000;

std::vector<std::vector<uint8_t>> twoTracks() {
    return {
        TafTestUtils::opusTrack(8, 200, 1, 0x1111),
        TafTestUtils::opusTrack(5, 300, 2, 0x2222)
    };
}

std::vector<uint8_t> vorbisStream() {
    std::vector<uint8_t> id = { 0x01, 'v', 'o', 'r', 'b', 'i', 's' };
    Core::appendLE32(id, 0);
    id.push_back(2);
    Core::appendLE32(id, 44100);
    id.insert(id.end(), 12, 0);
    id.push_back(0xB8);
    id.push_back(0x01);
    std::vector<uint8_t> comment = { 0x03, 'v', 'o', 'r', 'b', 'i', 's', 0, 0, 0, 0, 0, 0, 0, 0, 1 };
    return TafTestUtils::oggStream({ id, comment }, 5);
}

} // namespace

class ContainerBuildLayoutTest : public TestCase {
public:
    ContainerBuildLayoutTest() : TestCase("Built container layout") {}

protected:
    void runTest() override {
        TafContainer container = TafBuilder().build(twoTracks(), TimestampSource::fixed(TIMESTAMP));

        ASSERT_EQUALS(0u, container.size() % Ogg::DEFAULT_PAGE_SIZE, "File is a whole number of blocks");
        TafHeader header = container.header();
        ASSERT_EQUALS(container.pageStreamSize(), static_cast<size_t>(header.length), "Stored length");
        ASSERT_EQUALS(TIMESTAMP, header.timestamp, "Stored timestamp");
        ASSERT_TRUE(header.hash == computeContentHash(container.pageStream(), container.pageStreamSize(),
                                                      HashScope::PageBodies),
                    "Stored hash covers the page bodies");
        ASSERT_EQUALS(1u, header.chapter_pages.size(), "One chapter mark for two tracks");

        std::vector<Ogg::OggPage> pages = container.pages();
        for (const Ogg::OggPage& page : pages) {
            ASSERT_EQUALS(TIMESTAMP, page.serial_number, "Serial number is the timestamp");
        }
        ASSERT_FALSE(pages[header.chapter_pages[0]].isContinued(), "Second track starts a page");

        std::vector<Ogg::OggPacket> packets = container.packets();
        ASSERT_EQUALS(2u + 8u + 5u, packets.size(), "Headers of the first track plus all audio");
        ASSERT_EQUALS(header.chapter_pages[0], packets[10].first_page, "Chapter page holds the first packet of track 2");

        std::vector<std::vector<uint8_t>> first_audio = TafTestUtils::audioPackets(8, 200, 1);
        std::vector<std::vector<uint8_t>> second_audio = TafTestUtils::audioPackets(5, 300, 2);
        for (size_t i = 0; i < first_audio.size(); ++i) {
            ASSERT_TRUE(Opus::OpusPacket::frames(packets[2 + i].data) == Opus::OpusPacket::frames(first_audio[i]),
                        "Track 1 packet " + std::to_string(i) + " frames");
        }
        for (size_t i = 0; i < second_audio.size(); ++i) {
            ASSERT_TRUE(Opus::OpusPacket::frames(packets[10 + i].data) == Opus::OpusPacket::frames(second_audio[i]),
                        "Track 2 packet " + std::to_string(i) + " frames");
        }
        ASSERT_EQUALS(13u * TafTestUtils::CELT_20MS_SAMPLES, pages.back().granule_position, "Final granule");
        ASSERT_TRUE(pages.back().isEndOfStream(), "EOS on the last page");
    }
};

class ContainerDeterminismTest : public TestCase {
public:
    ContainerDeterminismTest() : TestCase("Same input and timestamp build identical bytes") {}

protected:
    void runTest() override {
        TafBuilder builder;
        TafContainer first = builder.build(twoTracks(), TimestampSource::fixed(TIMESTAMP));
        TafContainer second = builder.build(twoTracks(), TimestampSource::fixed(TIMESTAMP));
        ByteTestUtils::assertBytesEqual(first.bytes(), second.bytes(), "Repeated build");

        TafContainer reference = TafContainer::parse(first.bytes());
        TafContainer third = builder.build(twoTracks(), TimestampSource::fromReference(reference));
        ByteTestUtils::assertBytesEqual(first.bytes(), third.bytes(), "Timestamp taken from a reference");
    }
};

class ContainerTimestampSourceTest : public TestCase {
public:
    ContainerTimestampSourceTest() : TestCase("Timestamp sources") {}

protected:
    void runTest() override {
        ASSERT_EQUALS(42u, TimestampSource::fixed(42).resolve(), "Fixed");

        uint32_t before = static_cast<uint32_t>(std::time(nullptr));
        uint32_t now = TimestampSource::currentTime().resolve();
        uint32_t after = static_cast<uint32_t>(std::time(nullptr));
        ASSERT_TRUE(now >= before && now <= after, "Current time");

        std::vector<uint8_t> garbage(Taf::TAF_HEADER_BLOCK_SIZE, 0xFF);
        TafTestUtils::assertThrowsCode<FormatError>([&]() {
            TimestampSource::fromReference(TafContainer::parse(garbage));
        }, ErrorCode::TruncatedHeader, "Reference with an unreadable header");
    }
};

class ContainerHashScopeTest : public TestCase {
public:
    ContainerHashScopeTest() : TestCase("Hash scopes") {}

protected:
    void runTest() override {
        BuildOptions options;
        options.hash_scope = HashScope::WholePages;
        TafContainer pages_scope = TafBuilder(options).build(twoTracks(), TimestampSource::fixed(TIMESTAMP));
        TafContainer bodies_scope = TafBuilder().build(twoTracks(), TimestampSource::fixed(TIMESTAMP));

        ASSERT_TRUE(pages_scope.header().hash == Core::Sha1::digest(pages_scope.pageStream(), pages_scope.pageStreamSize()),
                    "Whole page hash");
        ASSERT_TRUE(pages_scope.header().hash != bodies_scope.header().hash, "Scopes hash different bytes");
        ByteTestUtils::assertBytesEqual(
            std::vector<uint8_t>(pages_scope.pageStream(), pages_scope.pageStream() + pages_scope.pageStreamSize()),
            std::vector<uint8_t>(bodies_scope.pageStream(), bodies_scope.pageStream() + bodies_scope.pageStreamSize()),
            "Page streams do not depend on the hash scope");

        TafContainer other_time = TafBuilder().build(twoTracks(), TimestampSource::fixed(TIMESTAMP + 1));
        ASSERT_TRUE(other_time.header().hash == bodies_scope.header().hash,
                    "Body hash ignores the serial number");

        HashScope scope = HashScope::PageBodies;
        ASSERT_TRUE(parseHashScope("pages", scope), "Parse pages");
        ASSERT_TRUE(scope == HashScope::WholePages, "Parsed pages");
        ASSERT_FALSE(parseHashScope("everything", scope), "Reject unknown scope");
        ASSERT_EQUALS(std::string("bodies"), std::string(hashScopeName(HashScope::PageBodies)), "Scope name");
    }
};

class ContainerCommentSourceTest : public TestCase {
public:
    ContainerCommentSourceTest() : TestCase("Generated and first track comment packets") {}

protected:
    void runTest() override {
        TafContainer plain = TafBuilder().build(twoTracks(), TimestampSource::fixed(TIMESTAMP));
        Opus::OpusComments generated = Opus::OpusComments::parseFromPacket(plain.packets()[1].data);
        ASSERT_EQUALS(std::string("TafKit " TAFKIT_VERSION), generated.vendor_string, "Default vendor");
        ASSERT_TRUE(generated.user_comments.empty(), "No comments by default");

        BuildOptions options;
        options.vendor = "TafKit test";
        options.user_comments = { { "TITLE", "Bedtime" } };
        TafContainer tagged = TafBuilder(options).build(twoTracks(), TimestampSource::fixed(TIMESTAMP));
        Opus::OpusComments stored = Opus::OpusComments::parseFromPacket(tagged.packets()[1].data);
        ASSERT_EQUALS(std::string("TafKit test"), stored.vendor_string, "Vendor replaced");
        ASSERT_EQUALS(std::string("Bedtime"), stored.get("title"), "Comment added");

        std::vector<uint8_t> source_tags = TafTestUtils::opusTags("libopus 1.3.1", { { "ARTIST", "Sandman" } });
        std::vector<std::vector<uint8_t>> packets = { TafTestUtils::opusHead(), source_tags };
        for (auto& packet : TafTestUtils::audioPackets(4, 200, 9)) {
            packets.push_back(std::move(packet));
        }
        BuildOptions keep;
        keep.comment_source = CommentSource::FirstTrack;
        TafContainer kept = TafBuilder(keep).build({ TafTestUtils::oggStream(packets, 0x4444) },
                                                   TimestampSource::fixed(TIMESTAMP));
        std::vector<uint8_t> kept_tags = kept.packets()[1].data;
        ASSERT_TRUE(kept_tags.size() >= source_tags.size() &&
                    std::equal(source_tags.begin(), source_tags.end(), kept_tags.begin()),
                    "First track OpusTags kept byte for byte");
        ASSERT_EQUALS(std::string("Sandman"), Opus::OpusComments::parseFromPacket(kept_tags).get("artist"),
                      "Kept comment");
    }
};

class ContainerLargeCommentTest : public TestCase {
public:
    ContainerLargeCommentTest() : TestCase("Cover art in the first track's OpusTags") {}

protected:
    void runTest() override {
        // 6 KB of base64 picture data makes an OpusTags packet larger than a page
        std::string picture(6000, 'Q');
        std::vector<std::vector<uint8_t>> packets = {
            TafTestUtils::opusHead(),
            TafTestUtils::opusTags("libopus 1.3.1", { { "ARTIST", "Sandman" }, { "METADATA_BLOCK_PICTURE", picture } })
        };
        ASSERT_TRUE(packets[1].size() > 6000u, "Comment packet exceeds a page");
        for (auto& packet : TafTestUtils::audioPackets(10, 250, 3)) {
            packets.push_back(std::move(packet));
        }
        std::vector<uint8_t> track = TafTestUtils::oggStream(packets, 0x5151);
        TimestampSource timestamp = TimestampSource::fixed(TIMESTAMP);

        TafContainer generated = TafBuilder().build({ track }, timestamp);
        ASSERT_EQUALS(12u, generated.packets().size(), "Headers and ten audio packets");
        Opus::OpusComments fresh = Opus::OpusComments::parseFromPacket(generated.packets()[1].data);
        ASSERT_EQUALS(std::string("TafKit " TAFKIT_VERSION), fresh.vendor_string, "Generated vendor");
        ASSERT_TRUE(fresh.get("metadata_block_picture").empty(), "Picture not carried over");
        TestPatterns::assertNoThrow([&]() { generated.verify(); }, "Generated comments verify");

        BuildOptions keep;
        keep.comment_source = CommentSource::FirstTrack;
        TafContainer trimmed = TafBuilder(keep).build({ track }, timestamp);
        std::vector<uint8_t> stored = trimmed.packets()[1].data;
        ASSERT_TRUE(stored.size() <= 4053u, "Trimmed packet fits one page");
        Opus::OpusComments kept = Opus::OpusComments::parseFromPacket(stored);
        ASSERT_EQUALS(std::string("libopus 1.3.1"), kept.vendor_string, "Source vendor kept");
        ASSERT_EQUALS(std::string("Sandman"), kept.get("artist"), "Earlier comment kept");
        ASSERT_EQUALS(1u, kept.user_comments.size(), "Picture dropped");
        ASSERT_EQUALS(12u, trimmed.packets().size(), "Audio untouched");
        TestPatterns::assertNoThrow([&]() { trimmed.verify(); }, "Trimmed comments verify");

        std::vector<std::vector<uint8_t>> vendor_only = packets;
        vendor_only[1] = TafTestUtils::opusTags(std::string(5000, 'v'));
        TafTestUtils::assertThrowsCode<CapacityError>([&]() {
            TafBuilder(keep).build({ TafTestUtils::oggStream(vendor_only, 0x5151) }, timestamp);
        }, ErrorCode::PacketTooLarge, "Vendor string alone exceeds a page");

        BuildOptions huge_tag;
        huge_tag.user_comments = { { "DESCRIPTION", std::string(5000, 'd') } };
        TafTestUtils::assertThrowsCode<CapacityError>([&]() {
            TafBuilder(huge_tag).build({ track }, timestamp);
        }, ErrorCode::PacketTooLarge, "Generated comments exceed a page");
    }
};

class ContainerPacketLimitTest : public TestCase {
public:
    ContainerPacketLimitTest() : TestCase("Largest packet a page can hold") {}

protected:
    void runTest() override {
        // Code 3 CBR packet of four 1000 byte frames with `padding` bytes of Opus padding
        auto padded = [](uint8_t padding) {
            std::vector<uint8_t> packet = { 0xFF, 0x44, padding };
            packet.insert(packet.end(), 4 * 1000, 0x21);
            packet.insert(packet.end(), padding, 0);
            return packet;
        };
        TimestampSource timestamp = TimestampSource::fixed(TIMESTAMP);
        std::vector<uint8_t> largest = padded(50);
        ASSERT_EQUALS(4053u, largest.size(), "Packet fills a page body");

        TafContainer container = TafBuilder().build({ TafTestUtils::oggStream({
            TafTestUtils::opusHead(), TafTestUtils::opusTags(), TafTestUtils::audioPacket(300, 1), largest,
            TafTestUtils::audioPacket(300, 2)
        }, 3) }, timestamp);
        std::vector<Ogg::OggPacket> packets = container.packets();
        ASSERT_EQUALS(5u, packets.size(), "Every packet stored");
        std::vector<Ogg::OggPage> pages = container.pages();
        ASSERT_EQUALS(packets[3].first_page + 1, packets[4].first_page, "Largest packet fills its page");
        ASSERT_FALSE(pages[packets[4].first_page].isContinued(), "Largest packet is not split");
        ASSERT_TRUE(Opus::OpusPacket::frames(packets[3].data) == Opus::OpusPacket::frames(largest), "Frames intact");
        TestPatterns::assertNoThrow([&]() { container.verify(); }, "Container verifies");

        std::vector<uint8_t> one_more = padded(51);
        ASSERT_EQUALS(4054u, one_more.size(), "One byte over");
        try {
            TafBuilder().build({ TafTestUtils::oggStream({
                TafTestUtils::opusHead(), TafTestUtils::opusTags(), one_more
            }, 3) }, timestamp);
            throw AssertionFailure("4054 byte packet was accepted");
        } catch (const CapacityError& e) {
            ASSERT_TRUE(e.code() == ErrorCode::PacketTooLarge, "PacketTooLarge");
            std::string message = e.what();
            ASSERT_EQUALS(0u, message.find("PacketTooLarge: "), "Message starts with the code name once");
            ASSERT_TRUE(message.find("PacketTooLarge", 1) == std::string::npos, "Code name not repeated");
            ASSERT_TRUE(message.find("4054 bytes") != std::string::npos, "Message names the size");
            ASSERT_TRUE(message.find("4053") != std::string::npos, "Message names the limit");
        }
    }
};

class ContainerPageStreamTest : public TestCase {
public:
    ContainerPageStreamTest() : TestCase("Page stream without the header block") {}

protected:
    void runTest() override {
        TafContainer container = TafBuilder().build(twoTracks(), TimestampSource::fixed(TIMESTAMP));
        std::vector<uint8_t> stream = container.pageStreamBytes();

        ByteTestUtils::assertBytesEqual(
            std::vector<uint8_t>(container.pageStream(), container.pageStream() + container.pageStreamSize()),
            stream, "Page stream copy");
        ASSERT_EQUALS(container.size() - TAF_HEADER_BLOCK_SIZE, stream.size(), "Header block left out");
        ASSERT_TRUE(std::equal(stream.begin(), stream.begin() + 4, "OggS"), "Starts with a capture pattern");

        std::vector<Ogg::OggPacket> packets = Ogg::PacketReassembler(Ogg::OggPageCodec::parseStream(stream)).drain();
        ASSERT_EQUALS(container.packets().size(), packets.size(), "Plain Ogg stream holds every packet");
        ASSERT_TRUE(std::holds_alternative<Opus::OpusHeader>(Ogg::identifyStream(packets[0].data)),
                    "Plain Ogg Opus stream");
        ASSERT_EQUALS(0u, stream.size() % Ogg::DEFAULT_PAGE_SIZE, "Whole pages only");
    }
};

class ContainerVerifyTest : public TestCase {
public:
    ContainerVerifyTest() : TestCase("Stored length and hash verification") {}

protected:
    void runTest() override {
        TafContainer container = TafBuilder().build(twoTracks(), TimestampSource::fixed(TIMESTAMP));
        TestPatterns::assertNoThrow([&]() { container.verify(); }, "Fresh container");
        TafTestUtils::assertThrowsCode<IntegrityError>([&]() {
            container.verify(HashScope::WholePages);
        }, ErrorCode::ContentHashMismatch, "Verified with the other scope");

        std::vector<uint8_t> flipped = container.bytes();
        flipped[TAF_HEADER_BLOCK_SIZE + 2 * Ogg::DEFAULT_PAGE_SIZE + 300] ^= 0x10;
        TafTestUtils::assertThrowsCode<IntegrityError>([&]() {
            TafContainer::parse(flipped).verify();
        }, ErrorCode::ContentHashMismatch, "Body byte changed");

        TafHeader header = container.header();
        header.hash[19] ^= 0x01;
        std::vector<uint8_t> rehashed = TafHeaderCodec::encode(header);
        rehashed.insert(rehashed.end(), container.pageStream(), container.pageStream() + container.pageStreamSize());
        TafTestUtils::assertThrowsCode<IntegrityError>([&]() {
            TafContainer::parse(rehashed).verify();
        }, ErrorCode::ContentHashMismatch, "Stored hash changed");

        std::vector<uint8_t> truncated = container.bytes();
        truncated.resize(truncated.size() - Ogg::DEFAULT_PAGE_SIZE);
        TafTestUtils::assertThrowsCode<IntegrityError>([&]() {
            TafContainer::parse(truncated).verify();
        }, ErrorCode::ContentLengthMismatch, "Last page missing");
    }
};

class ContainerBuildErrorsTest : public TestCase {
public:
    ContainerBuildErrorsTest() : TestCase("Builder rejects unusable input") {}

protected:
    void runTest() override {
        TafBuilder builder;
        TimestampSource timestamp = TimestampSource::fixed(TIMESTAMP);

        TafTestUtils::assertThrowsCode<InputError>([&]() {
            builder.build({}, timestamp);
        }, ErrorCode::EmptyInput, "No tracks");

        TafTestUtils::assertThrowsCode<InputError>([&]() {
            builder.build({ std::vector<uint8_t>() }, timestamp);
        }, ErrorCode::EmptyInput, "Empty track");

        TafTestUtils::assertThrowsCode<StructuralError>([&]() {
            builder.build({ vorbisStream() }, timestamp);
        }, ErrorCode::UnsupportedStreamFormat, "Vorbis track");

        TafTestUtils::assertThrowsCode<StructuralError>([&]() {
            builder.build({ TafTestUtils::opusTrack(3, 100, 1, 1, 2), TafTestUtils::opusTrack(3, 100, 2, 2, 1) },
                          timestamp);
        }, ErrorCode::IncompatibleStreamParameters, "Stereo then mono");

        TafTestUtils::assertThrowsCode<StructuralError>([&]() {
            builder.build({ TafTestUtils::oggStream({ TafTestUtils::opusHead() }, 3) }, timestamp);
        }, ErrorCode::MissingStreamHeader, "No comment packet");

        TafTestUtils::assertThrowsCode<InputError>([&]() {
            builder.build({ TafTestUtils::oggStream({ TafTestUtils::opusHead(), TafTestUtils::opusTags() }, 3) },
                          timestamp);
        }, ErrorCode::InvalidTrackBoundary, "Track without audio");

        // Code 3 CBR packet of four 1249 byte frames, too large for one page
        std::vector<uint8_t> huge = { 0xFF, 0x04 };
        huge.insert(huge.end(), 4 * 1249, 0x33);
        TafTestUtils::assertThrowsCode<CapacityError>([&]() {
            builder.build({ TafTestUtils::oggStream({ TafTestUtils::opusHead(), TafTestUtils::opusTags(), huge }, 3) },
                          timestamp);
        }, ErrorCode::PacketTooLarge, "Packet larger than a page");

        std::vector<uint8_t> corrupt = TafTestUtils::opusTrack(3, 100, 1);
        corrupt[40] ^= 0x01;
        TafTestUtils::assertThrowsCode<FormatError>([&]() {
            builder.build({ corrupt }, timestamp);
        }, ErrorCode::ChecksumMismatch, "Corrupt input page");

        TafTestUtils::assertThrowsCode<FormatError>([]() {
            TafContainer::parse(std::vector<uint8_t>(100, 0));
        }, ErrorCode::TruncatedHeader, "Input shorter than the header block");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("TAF Container Tests");

    suite.addTest(std::make_unique<ContainerBuildLayoutTest>());
    suite.addTest(std::make_unique<ContainerDeterminismTest>());
    suite.addTest(std::make_unique<ContainerTimestampSourceTest>());
    suite.addTest(std::make_unique<ContainerHashScopeTest>());
    suite.addTest(std::make_unique<ContainerCommentSourceTest>());
    suite.addTest(std::make_unique<ContainerLargeCommentTest>());
    suite.addTest(std::make_unique<ContainerPacketLimitTest>());
    suite.addTest(std::make_unique<ContainerPageStreamTest>());
    suite.addTest(std::make_unique<ContainerVerifyTest>());
    suite.addTest(std::make_unique<ContainerBuildErrorsTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
