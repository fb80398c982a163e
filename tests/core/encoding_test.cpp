#include "docsync/core/encoding.hpp"

#include <gtest/gtest.h>

#include <set>

using docsync::Bytes;

TEST(EncodingTest, Fnv1aKnownVectors) {
    EXPECT_EQ(docsync::fnv1a_hex(Bytes{}), "cbf29ce484222325");
    EXPECT_EQ(docsync::fnv1a_hex(docsync::to_bytes("a")), "af63dc4c8601ec8c");
    EXPECT_EQ(docsync::fnv1a_hex(docsync::to_bytes("k1")).size(), 16u);
}

TEST(EncodingTest, HexEncodeAndDecode) {
    Bytes raw{0x00, 0x7f, 0xab, 0xff};
    EXPECT_EQ(docsync::hex_encode(raw), "007fabff");

    auto decoded = docsync::hex_decode("007FABff");
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), raw);
}

TEST(EncodingTest, HexDecodeRejectsMalformedInput) {
    auto odd = docsync::hex_decode("abc");
    ASSERT_TRUE(odd.is_error());
    EXPECT_EQ(odd.error().code, docsync::ErrorCode::DecodeFailed);

    EXPECT_TRUE(docsync::hex_decode("zz").is_error());
}

TEST(EncodingTest, Utf8Validation) {
    EXPECT_TRUE(docsync::is_valid_utf8(docsync::to_bytes("plain ascii")));
    EXPECT_TRUE(docsync::is_valid_utf8(docsync::to_bytes("caf\xc3\xa9")));
    EXPECT_TRUE(docsync::is_valid_utf8(docsync::to_bytes("\xf0\x9f\x93\x81")));
    EXPECT_TRUE(docsync::is_valid_utf8(Bytes{}));

    EXPECT_FALSE(docsync::is_valid_utf8(Bytes{0xff}));
    EXPECT_FALSE(docsync::is_valid_utf8(Bytes{0xc3}));              // truncated
    EXPECT_FALSE(docsync::is_valid_utf8(Bytes{0xc0, 0xaf}));        // overlong '/'
    EXPECT_FALSE(docsync::is_valid_utf8(Bytes{0xed, 0xa0, 0x80}));  // surrogate
    EXPECT_FALSE(docsync::is_valid_utf8(Bytes{0xf4, 0x90, 0x80, 0x80}));
}

TEST(EncodingTest, UuidV4Format) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto id = docsync::make_uuid_v4();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[13], '-');
        EXPECT_EQ(id[14], '4');
        EXPECT_EQ(id[18], '-');
        EXPECT_TRUE(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
        EXPECT_EQ(id[23], '-');
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}
