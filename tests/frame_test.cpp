// Wire format: [0xAA][type][len][payload...][xor checksum]

#include <gtest/gtest.h>

#include <stdexcept>
#include "uartrx/frame.h"

using namespace uartrx;

namespace {

// Splits an encoded frame back into its fields and runs it through decode_frame.
FrameStatus decode_bytes(const std::vector<uint8_t>& bytes, Frame& out) {
    uint8_t type = bytes[1];
    uint8_t len = bytes[2];
    std::vector<uint8_t> payload(bytes.begin() + 3, bytes.end() - 1);
    return decode_frame(type, len, payload, bytes.back(), out);
}

} // namespace

TEST(FrameTest, AckAndCommitBytes) {
    EXPECT_EQ(std::vector<uint8_t>({0xAA, 0x04, 0x00, 0x04}), build_ack());
    EXPECT_EQ(std::vector<uint8_t>({0xAA, 0x05, 0x01, 0x00, 0x04}), build_commit(COMMIT_OK));
    EXPECT_EQ(std::vector<uint8_t>({0xAA, 0x05, 0x01, 0x01, 0x05}), build_commit(COMMIT_FAIL));
}

TEST(FrameTest, ChecksumExcludesStartByte) {
    std::vector<uint8_t> payload = {0x10, 0x20, 0x30};
    std::vector<uint8_t> bytes = encode_frame(TYPE_DATA, payload);
    ASSERT_EQ(7u, bytes.size());
    EXPECT_EQ(START_BYTE, bytes[0]);
    EXPECT_EQ(0x02 ^ 0x03 ^ 0x10 ^ 0x20 ^ 0x30, bytes.back());
}

TEST(FrameTest, RoundTripsEveryPayloadLength) {
    for (size_t len = 0; len <= MAX_PAYLOAD; len += 17) {
        std::vector<uint8_t> payload(len);
        for (size_t i = 0; i < len; i++) {
            payload[i] = (uint8_t)(i * 31 + 7);
        }
        Frame f;
        ASSERT_EQ(FRAME_OK, decode_bytes(encode_frame(TYPE_DATA, payload), f)) << "len " << len;
        EXPECT_EQ(TYPE_DATA, f.type);
        EXPECT_EQ(payload, f.payload);
    }

    Frame full;
    std::vector<uint8_t> max(MAX_PAYLOAD, START_BYTE);
    ASSERT_EQ(FRAME_OK, decode_bytes(encode_frame(TYPE_DATA, max), full));
    EXPECT_EQ(max, full.payload);
}

TEST(FrameTest, EncodeRejectsOversizedPayload) {
    std::vector<uint8_t> payload(MAX_PAYLOAD + 1, 0x00);
    EXPECT_THROW(encode_frame(TYPE_DATA, payload), std::length_error);
}

TEST(FrameTest, EverySingleBitFlipIsDetected) {
    std::vector<uint8_t> bytes = encode_frame(TYPE_DATA, {'1', '2', '3', ',', '4'});

    // Type, payload and checksum bytes; the length byte is covered separately
    // since changing it changes where the checksum sits.
    for (size_t pos = 1; pos < bytes.size(); pos++) {
        if (pos == 2) {
            continue;
        }
        for (int bit = 0; bit < 8; bit++) {
            std::vector<uint8_t> bad = bytes;
            bad[pos] ^= (uint8_t)(1 << bit);
            Frame f;
            EXPECT_NE(FRAME_OK, decode_bytes(bad, f)) << "byte " << pos << " bit " << bit;
        }
    }

    for (int bit = 0; bit < 8; bit++) {
        uint8_t len = bytes[2] ^ (uint8_t)(1 << bit);
        std::vector<uint8_t> payload(bytes.begin() + 3, bytes.end() - 1);
        Frame f;
        EXPECT_NE(FRAME_OK, decode_frame(bytes[1], len, payload, bytes.back(), f));
    }
}

TEST(FrameTest, DecodeReportsChecksumMismatch) {
    Frame f;
    f.type = 0x7F;
    EXPECT_EQ(FRAME_BAD_CHECKSUM, decode_frame(TYPE_END, 0, {}, 0x00, f));
    EXPECT_EQ(0x7F, f.type); // untouched on failure
    EXPECT_EQ(FRAME_OK, decode_frame(TYPE_END, 0, {}, TYPE_END, f));
    EXPECT_EQ(TYPE_END, f.type);
}

TEST(FrameTest, DecodeReportsLengthMismatch) {
    Frame f;
    EXPECT_EQ(FRAME_BAD_LENGTH, decode_frame(TYPE_DATA, 3, {0x01, 0x02}, 0x00, f));
}

TEST(FrameTest, StartSizeIsLittleEndian) {
    uint32_t size = 0;
    ASSERT_TRUE(parse_start_size({0x2A, 0x00, 0x00, 0x00}, size));
    EXPECT_EQ(42u, size);
    ASSERT_TRUE(parse_start_size({0x78, 0x56, 0x34, 0x12}, size));
    EXPECT_EQ(0x12345678u, size);
    EXPECT_EQ(std::vector<uint8_t>({0x78, 0x56, 0x34, 0x12}), start_payload(0x12345678u));
}

TEST(FrameTest, StartSizeNeedsFourBytes) {
    uint32_t size = 99;
    EXPECT_FALSE(parse_start_size({0x01, 0x02, 0x03}, size));
    EXPECT_EQ(99u, size);
}

TEST(FrameTest, TypeNames) {
    EXPECT_STREQ("START", frame_type_name(TYPE_START));
    EXPECT_STREQ("COMMIT", frame_type_name(TYPE_COMMIT));
    EXPECT_STREQ("UNKNOWN", frame_type_name(0x42));
}

TEST(FrameTest, HexByteIsTwoUpperDigits) {
    EXPECT_EQ("0x0A", hex_byte(0x0A));
    EXPECT_EQ("0xAA", hex_byte(START_BYTE));
    EXPECT_EQ("0x00", hex_byte(0));
}
