#include <gtest/gtest.h>
#include "frame.hpp"

using namespace netguard;

TEST(FrameTest, HeaderIsBigEndian) {
    auto header = encode_frame_header(0x01020304u);
    EXPECT_EQ(header[0], 0x01);
    EXPECT_EQ(header[1], 0x02);
    EXPECT_EQ(header[2], 0x03);
    EXPECT_EQ(header[3], 0x04);
    EXPECT_EQ(decode_frame_length(header.data()), 0x01020304u);

    auto max = encode_frame_header(0xFFFFFFFFu);
    EXPECT_EQ(decode_frame_length(max.data()), 0xFFFFFFFFu);
}

TEST(FrameTest, RoundTripEdgeSizes) {
    for (std::size_t n : {std::size_t{0}, std::size_t{1}, std::size_t{70000}}) {
        Bytes payload(n);
        for (std::size_t i = 0; i < n; ++i) payload[i] = static_cast<std::uint8_t>(i % 251);

        Bytes frame = encode_frame(payload);
        ASSERT_EQ(frame.size(), kFrameHeaderSize + n);
        EXPECT_EQ(decode_frame_length(frame.data()), n);

        auto decoded = decode_frame(frame);
        ASSERT_TRUE(decoded.has_value()) << "size " << n;
        EXPECT_EQ(*decoded, payload);
    }
}

TEST(FrameTest, SeventyThousandBytesUsesThreeLengthBytes) {
    Bytes frame = encode_frame(Bytes(70000, 0xAB));
    EXPECT_EQ(frame[0], 0x00);
    EXPECT_EQ(frame[1], 0x01);
    EXPECT_EQ(frame[2], 0x11);
    EXPECT_EQ(frame[3], 0x70);
}

TEST(FrameTest, IncompleteFrameRejected) {
    EXPECT_FALSE(decode_frame(Bytes{}).has_value());
    EXPECT_FALSE(decode_frame(Bytes{0, 0, 0}).has_value());

    Bytes frame = encode_frame(Bytes{1, 2, 3});
    frame.pop_back();
    EXPECT_FALSE(decode_frame(frame).has_value());
}

TEST(FrameTest, TrailingBytesRejected) {
    Bytes frame = encode_frame(Bytes{1, 2, 3});
    frame.push_back(4);
    EXPECT_FALSE(decode_frame(frame).has_value());
}
