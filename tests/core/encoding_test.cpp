#include <gtest/gtest.h>
#include "orca/core/encoding.hpp"

using namespace orca;

TEST(Base64, EncodesWithPadding) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
}

TEST(Base64, DecodesWhatItEncodes) {
    const std::string token = "3f1c2a9e-1b7d-4c55-9a0e-2d7f0c6b8e11";
    auto decoded = base64_decode(base64_encode(token));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, token);
}

TEST(Base64, RejectsMalformedInput) {
    EXPECT_FALSE(base64_decode("abc").has_value());       // length not a multiple of 4
    EXPECT_FALSE(base64_decode("ab!d").has_value());      // outside the alphabet
    EXPECT_FALSE(base64_decode("a===").has_value());      // too much padding
    EXPECT_FALSE(base64_decode("Zg==Zm9v").has_value());  // padding before the end
    EXPECT_FALSE(base64_decode("Z=g=").has_value());
}

TEST(UrlEncoding, EscapesReservedCharacters) {
    EXPECT_EQ(url_encode("abc-_.~"), "abc-_.~");
    EXPECT_EQ(url_encode("a+b/c="), "a%2Bb%2Fc%3D");
    EXPECT_EQ(url_encode("a b"), "a%20b");
}

TEST(UrlEncoding, DecodeReversesEncode) {
    const std::string raw = "Zm9v+YmFy/==";
    EXPECT_EQ(url_decode(url_encode(raw)), raw);
}

TEST(UrlEncoding, DecodeKeepsPlusAndBrokenEscapes) {
    EXPECT_EQ(url_decode("a+b"), "a+b");
    EXPECT_EQ(url_decode("100%"), "100%");
    EXPECT_EQ(url_decode("%zz"), "%zz");
    EXPECT_EQ(url_decode("%41%42"), "AB");
}
