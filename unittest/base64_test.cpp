// ============================================================================
// BASE64 CODEC UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <pumpevents/core/codec/base64.hpp>
#include <pumpevents/core/events/errors.hpp>
#include <string>

using namespace PumpEvents;

namespace {
std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}
}

TEST(Base64, Rfc4648Vectors) {
    EXPECT_EQ(Base64::decode(""), bytes(""));
    EXPECT_EQ(Base64::decode("Zg=="), bytes("f"));
    EXPECT_EQ(Base64::decode("Zm8="), bytes("fo"));
    EXPECT_EQ(Base64::decode("Zm9v"), bytes("foo"));
    EXPECT_EQ(Base64::decode("Zm9vYg=="), bytes("foob"));
    EXPECT_EQ(Base64::decode("Zm9vYmE="), bytes("fooba"));
    EXPECT_EQ(Base64::decode("Zm9vYmFy"), bytes("foobar"));

    EXPECT_EQ(Base64::encode(bytes("f")), "Zg==");
    EXPECT_EQ(Base64::encode(bytes("fo")), "Zm8=");
    EXPECT_EQ(Base64::encode(bytes("foobar")), "Zm9vYmFy");
}

TEST(Base64, BinaryBytesSurvive) {
    std::vector<uint8_t> data;
    for (int i = 0; i < 256; ++i) data.push_back(static_cast<uint8_t>(i));
    EXPECT_EQ(Base64::decode(Base64::encode(data)), data);
}

TEST(Base64, WhitespaceIsIgnored) {
    EXPECT_EQ(Base64::decode("Zm9v\r\nYmFy\n"), bytes("foobar"));
    EXPECT_EQ(Base64::decode("  Zm 9v "), bytes("foo"));
}

TEST(Base64, RejectsInvalidCharacters) {
    EXPECT_THROW(Base64::decode("Zm9v!mFy"), InvalidEncodingError);
    EXPECT_THROW(Base64::decode("Zm9v-_Fy"), InvalidEncodingError);   // url-safe alphabet
}

TEST(Base64, RejectsBadLength) {
    EXPECT_THROW(Base64::decode("Zm9"), InvalidEncodingError);
    EXPECT_THROW(Base64::decode("Z"), InvalidEncodingError);
}

TEST(Base64, RejectsMisplacedPadding) {
    EXPECT_THROW(Base64::decode("Z==="), InvalidEncodingError);
    EXPECT_THROW(Base64::decode("=Zm9"), InvalidEncodingError);
    EXPECT_THROW(Base64::decode("Zm=v"), InvalidEncodingError);
    EXPECT_THROW(Base64::decode("Zg==Zm9v"), InvalidEncodingError);
}

TEST(Base64, InvalidEncodingIsADecodeError) {
    EXPECT_THROW(Base64::decode("***"), DecodeError);
}
