/**
 * @file TokenCodecTest.cpp
 * @brief Unit-тесты для TokenCodec
 */

#include <gtest/gtest.h>

#include "utils/TokenCodec.hpp"

#include <set>

using namespace catalog;
using catalog::utils::TokenCodec;

namespace {

std::string encode(const std::string& s) {
    return TokenCodec::base32Encode(reinterpret_cast<const unsigned char*>(s.data()), s.size());
}

} // namespace

TEST(TokenCodecTest, Issue_PlaintextIs26Base32Chars) {
    auto issued = TokenCodec::issue(42, std::chrono::hours(24), domain::TokenScope::AUTHENTICATION);

    EXPECT_EQ(issued.plaintext.size(), TokenCodec::kPlaintextLength);
    EXPECT_TRUE(TokenCodec::isWellFormed(issued.plaintext));
    EXPECT_EQ(issued.plaintext.find('='), std::string::npos);
    for (char c : issued.plaintext) {
        EXPECT_TRUE((c >= 'A' && c <= 'Z') || (c >= '2' && c <= '7')) << "unexpected char " << c;
    }
}

TEST(TokenCodecTest, Issue_FillsStoredPart) {
    auto before = std::chrono::system_clock::now();
    auto issued = TokenCodec::issue(7, std::chrono::hours(72), domain::TokenScope::ACTIVATION);

    EXPECT_EQ(issued.token.userId, 7);
    EXPECT_EQ(issued.token.scope, domain::TokenScope::ACTIVATION);
    EXPECT_EQ(issued.token.hash, TokenCodec::hash(issued.plaintext));
    EXPECT_GE(issued.token.expiry, before + std::chrono::hours(72));
    EXPECT_FALSE(issued.token.isExpired());
}

TEST(TokenCodecTest, Issue_HashIsNotPlaintext) {
    auto issued = TokenCodec::issue(1, std::chrono::hours(1), domain::TokenScope::AUTHENTICATION);
    EXPECT_EQ(issued.token.hash.size(), 64u);
    EXPECT_EQ(issued.token.hash.find(issued.plaintext), std::string::npos);
}

TEST(TokenCodecTest, Issue_Unique) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        auto issued = TokenCodec::issue(1, std::chrono::hours(1), domain::TokenScope::AUTHENTICATION);
        EXPECT_TRUE(seen.insert(issued.plaintext).second);
    }
}

TEST(TokenCodecTest, NegativeTtl_AlreadyExpired) {
    auto issued = TokenCodec::issue(1, std::chrono::seconds(-10), domain::TokenScope::AUTHENTICATION);
    EXPECT_TRUE(issued.token.isExpired());
}

TEST(TokenCodecTest, Hash_KnownSha256Vectors) {
    EXPECT_EQ(TokenCodec::hash(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(TokenCodec::hash("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(TokenCodecTest, Hash_Deterministic) {
    EXPECT_EQ(TokenCodec::hash("Y3QMGX3PJ3WLRL2YRTQGQ6KRHU"), TokenCodec::hash("Y3QMGX3PJ3WLRL2YRTQGQ6KRHU"));
    EXPECT_NE(TokenCodec::hash("Y3QMGX3PJ3WLRL2YRTQGQ6KRHU"), TokenCodec::hash("Y3QMGX3PJ3WLRL2YRTQGQ6KRHV"));
}

TEST(TokenCodecTest, Base32_Rfc4648Vectors) {
    EXPECT_EQ(encode(""), "");
    EXPECT_EQ(encode("f"), "MY");
    EXPECT_EQ(encode("fo"), "MZXQ");
    EXPECT_EQ(encode("foo"), "MZXW6");
    EXPECT_EQ(encode("foob"), "MZXW6YQ");
    EXPECT_EQ(encode("fooba"), "MZXW6YTB");
    EXPECT_EQ(encode("foobar"), "MZXW6YTBOI");
}

TEST(TokenCodecTest, IsWellFormed) {
    EXPECT_TRUE(TokenCodec::isWellFormed(std::string(26, 'A')));
    EXPECT_FALSE(TokenCodec::isWellFormed(std::string(25, 'A')));
    EXPECT_FALSE(TokenCodec::isWellFormed(std::string(27, 'A')));
    EXPECT_FALSE(TokenCodec::isWellFormed(""));
}
