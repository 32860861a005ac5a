#include <gtest/gtest.h>

#include "domain/Validator.hpp"
#include "domain/enums/TokenScope.hpp"

using namespace catalog::domain;

TEST(ValidatorTest, EmptyIsValid) {
    Validator v;
    EXPECT_TRUE(v.valid());
    EXPECT_NO_THROW(v.throwIfInvalid());
}

TEST(ValidatorTest, FirstErrorPerFieldWins) {
    Validator v;
    v.check(false, "email", "must be provided");
    v.check(false, "email", "must be a valid email address");

    EXPECT_FALSE(v.valid());
    EXPECT_EQ(v.errors().at("email"), "must be provided");
}

TEST(ValidatorTest, ThrowIfInvalid_CarriesFields) {
    Validator v;
    v.addError("name", "must be provided");
    v.addError("password", "must be at least 8 bytes long");

    try {
        v.throwIfInvalid();
        FAIL() << "Expected DomainError";
    } catch (const DomainError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::VALIDATION);
        EXPECT_STREQ(e.what(), "failed validation");
        EXPECT_EQ(e.fields().size(), 2u);
    }
}

TEST(ValidatorTest, MatchesEmail) {
    EXPECT_TRUE(Validator::matchesEmail("alice@example.com"));
    EXPECT_TRUE(Validator::matchesEmail("a.b+tag@sub.example.org"));
    EXPECT_FALSE(Validator::matchesEmail("not-an-email"));
    EXPECT_FALSE(Validator::matchesEmail("@example.com"));
    EXPECT_FALSE(Validator::matchesEmail(""));
}

TEST(TokenScopeTest, ColumnNames) {
    EXPECT_EQ(toString(TokenScope::ACTIVATION), "activation");
    EXPECT_EQ(toString(TokenScope::AUTHENTICATION), "authentication");
}
