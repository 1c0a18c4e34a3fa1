/*
 * test_stream_headers.cpp - Unit tests for identification and comment headers
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
#include "opus/OpusHeaders.h"

using namespace TafKit;
using namespace TafKit::Ogg;
using namespace TafKit::Opus;
using namespace TestFramework;

namespace {

std::vector<uint8_t> vorbisIdentification(uint8_t channels, uint32_t rate) {
    std::vector<uint8_t> packet = { 0x01, 'v', 'o', 'r', 'b', 'i', 's' };
    Core::appendLE32(packet, 0);
    packet.push_back(channels);
    Core::appendLE32(packet, rate);
    packet.insert(packet.end(), 12, 0);
    packet.push_back(0xB8);
    packet.push_back(0x01);
    return packet;
}

std::vector<uint8_t> speexIdentification(uint32_t channels, uint32_t rate) {
    std::vector<uint8_t> packet(80, 0);
    std::memcpy(packet.data(), "Speex   ", 8);
    Core::writeLE32(packet.data() + 36, rate);
    Core::writeLE32(packet.data() + 48, channels);
    return packet;
}

std::vector<uint8_t> flacIdentification(uint8_t channels, uint32_t rate) {
    std::vector<uint8_t> packet = { 0x7F, 'F', 'L', 'A', 'C', 1, 0, 0, 1, 'f', 'L', 'a', 'C' };
    packet.push_back(0x80);  // last block, STREAMINFO
    packet.push_back(0);
    packet.push_back(0);
    packet.push_back(34);
    std::vector<uint8_t> streaminfo(34, 0);
    streaminfo[10] = static_cast<uint8_t>(rate >> 12);
    streaminfo[11] = static_cast<uint8_t>(rate >> 4);
    streaminfo[12] = static_cast<uint8_t>(((rate & 0x0F) << 4) | ((channels - 1) << 1));
    packet.insert(packet.end(), streaminfo.begin(), streaminfo.end());
    return packet;
}

} // namespace

class OpusHeadParseTest : public TestCase {
public:
    OpusHeadParseTest() : TestCase("OpusHead fields") {}

protected:
    void runTest() override {
        std::vector<uint8_t> packet = TafTestUtils::opusHead(2, 3840, 44100);
        ASSERT_EQUALS(OPUS_HEAD_MIN_SIZE, packet.size(), "Family 0 header is 19 bytes");

        OpusHeader head = OpusHeader::parseFromPacket(packet);
        ASSERT_EQUALS(1, head.version, "Version");
        ASSERT_EQUALS(2, head.channel_count, "Channels");
        ASSERT_EQUALS(3840, head.pre_skip, "Pre-skip");
        ASSERT_EQUALS(44100u, head.input_sample_rate, "Input sample rate");
        ASSERT_EQUALS(0, head.channel_mapping_family, "Mapping family");
        ASSERT_TRUE(head.toPacket() == packet, "Re-encoded header is identical");

        // Trailing zero fill from page padding is ignored
        std::vector<uint8_t> padded(packet);
        padded.insert(padded.end(), 3000, 0);
        ASSERT_EQUALS(2, OpusHeader::parseFromPacket(padded).channel_count, "Padded header parses");
    }
};

class OpusHeadMappingTableTest : public TestCase {
public:
    OpusHeadMappingTableTest() : TestCase("OpusHead with channel mapping table") {}

protected:
    void runTest() override {
        OpusHeader surround;
        surround.channel_count = 6;
        surround.channel_mapping_family = 1;
        surround.stream_count = 4;
        surround.coupled_stream_count = 2;
        surround.channel_mapping = { 0, 4, 1, 2, 3, 5 };

        OpusHeader parsed = OpusHeader::parseFromPacket(surround.toPacket());
        ASSERT_EQUALS(6, parsed.channel_count, "Channels");
        ASSERT_EQUALS(4, parsed.stream_count, "Streams");
        ASSERT_EQUALS(2, parsed.coupled_stream_count, "Coupled streams");
        ASSERT_TRUE(parsed.channel_mapping == surround.channel_mapping, "Mapping table");

        std::vector<uint8_t> truncated = surround.toPacket();
        truncated.resize(23);
        TafTestUtils::assertThrowsCode<StructuralError>([&]() {
            OpusHeader::parseFromPacket(truncated);
        }, ErrorCode::InvalidIdentificationHeader, "Truncated mapping table");
    }
};

class OpusHeadRejectsTest : public TestCase {
public:
    OpusHeadRejectsTest() : TestCase("OpusHead rejects invalid headers") {}

protected:
    void runTest() override {
        std::vector<uint8_t> good = TafTestUtils::opusHead();
        auto expectInvalid = [](const std::vector<uint8_t>& packet, const std::string& what) {
            TafTestUtils::assertThrowsCode<StructuralError>([&]() {
                OpusHeader::parseFromPacket(packet);
            }, ErrorCode::InvalidIdentificationHeader, what);
        };

        std::vector<uint8_t> signature(good);
        signature[4] = 'h';
        expectInvalid(signature, "Wrong signature");

        expectInvalid(std::vector<uint8_t>(good.begin(), good.begin() + 18), "Short header");

        std::vector<uint8_t> version(good);
        version[8] = 0x10;
        expectInvalid(version, "Incompatible major version");

        std::vector<uint8_t> no_channels(good);
        no_channels[9] = 0;
        expectInvalid(no_channels, "Zero channels");

        std::vector<uint8_t> family0_surround(good);
        family0_surround[9] = 3;
        expectInvalid(family0_surround, "Family 0 allows at most two channels");
    }
};

class OpusTagsTest : public TestCase {
public:
    OpusTagsTest() : TestCase("OpusTags parse and lookup") {}

protected:
    void runTest() override {
        std::vector<uint8_t> packet = TafTestUtils::opusTags("TafKit test", {
            { "TITLE", "Chapter One" }, { "artist", "Someone" }, { "EMPTY", "" }
        });
        packet.insert(packet.end(), 64, 0);

        OpusComments comments = OpusComments::parseFromPacket(packet);
        ASSERT_EQUALS(std::string("TafKit test"), comments.vendor_string, "Vendor");
        ASSERT_EQUALS(3u, comments.user_comments.size(), "Comment count");
        ASSERT_EQUALS(std::string("Chapter One"), comments.get("title"), "Case-insensitive lookup");
        ASSERT_EQUALS(std::string("Someone"), comments.get("ARTIST"), "Lower-case field");
        ASSERT_EQUALS(std::string(""), comments.get("ALBUM"), "Missing field");
        ASSERT_TRUE(OpusComments::hasSignature(packet), "Signature");

        std::vector<uint8_t> truncated = TafTestUtils::opusTags("vendor", { { "A", "B" } });
        truncated.resize(truncated.size() - 1);
        TafTestUtils::assertThrowsCode<StructuralError>([&]() {
            OpusComments::parseFromPacket(truncated);
        }, ErrorCode::InvalidCommentHeader, "Truncated comment");

        TafTestUtils::assertThrowsCode<StructuralError>([&]() {
            OpusComments::parseFromPacket(TafTestUtils::opusHead());
        }, ErrorCode::InvalidCommentHeader, "OpusHead is not OpusTags");
    }
};

class StreamIdentificationTest : public TestCase {
public:
    StreamIdentificationTest() : TestCase("Identification packets map to known formats") {}

protected:
    void runTest() override {
        StreamIdentification opus = identifyStream(TafTestUtils::opusHead(1));
        ASSERT_TRUE(std::holds_alternative<OpusHeader>(opus), "Opus");
        ASSERT_EQUALS(std::string("Opus"), streamFormatName(opus), "Opus name");
        ASSERT_EQUALS(1, std::get<OpusHeader>(opus).channel_count, "Opus channels");

        StreamIdentification vorbis = identifyStream(vorbisIdentification(2, 44100));
        ASSERT_TRUE(std::holds_alternative<VorbisIdentification>(vorbis), "Vorbis");
        ASSERT_EQUALS(44100u, std::get<VorbisIdentification>(vorbis).sample_rate, "Vorbis rate");
        ASSERT_EQUALS(std::string("Vorbis"), streamFormatName(vorbis), "Vorbis name");

        StreamIdentification speex = identifyStream(speexIdentification(1, 16000));
        ASSERT_TRUE(std::holds_alternative<SpeexIdentification>(speex), "Speex");
        ASSERT_EQUALS(16000u, std::get<SpeexIdentification>(speex).sample_rate, "Speex rate");

        StreamIdentification flac = identifyStream(flacIdentification(2, 96000));
        ASSERT_TRUE(std::holds_alternative<FLACIdentification>(flac), "FLAC");
        ASSERT_EQUALS(96000u, std::get<FLACIdentification>(flac).sample_rate, "FLAC rate");
        ASSERT_EQUALS(2, std::get<FLACIdentification>(flac).channels, "FLAC channels");
        ASSERT_EQUALS(std::string("FLAC"), streamFormatName(flac), "FLAC name");

        TafTestUtils::assertThrowsCode<StructuralError>([]() {
            identifyStream({ 0x80, 't', 'h', 'e', 'o', 'r', 'a', 0, 0, 0 });
        }, ErrorCode::UnsupportedStreamFormat, "Theora is not an audio format");

        TafTestUtils::assertThrowsCode<StructuralError>([]() {
            identifyStream(vorbisIdentification(0, 44100));
        }, ErrorCode::InvalidIdentificationHeader, "Vorbis with zero channels");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("Stream Header Tests");

    suite.addTest(std::make_unique<OpusHeadParseTest>());
    suite.addTest(std::make_unique<OpusHeadMappingTableTest>());
    suite.addTest(std::make_unique<OpusHeadRejectsTest>());
    suite.addTest(std::make_unique<OpusTagsTest>());
    suite.addTest(std::make_unique<StreamIdentificationTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
