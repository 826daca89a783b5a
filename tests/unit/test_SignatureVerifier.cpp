#include <gtest/gtest.h>
#include "auth/SignatureVerifier.hpp"

#include <chrono>

using namespace sg::auth;

namespace {
SignatureVerifier::clock::time_point at(const int64_t seconds) {
    return SignatureVerifier::clock::time_point(std::chrono::seconds(seconds));
}
}

class SignatureVerifierTest : public ::testing::Test {
protected:
    SignatureVerifier verifier{"s"};
    const SignatureVerifier::clock::time_point now = at(1'700'000'000);
};

TEST_F(SignatureVerifierTest, SignProducesKnownToken) {
    EXPECT_EQ(verifier.sign("/a/b.txt", 9999999999), "jK_MzXrHi22d-ILtLASqG4hhsdUkS_N6bjRehFXy8vU=:9999999999");
    EXPECT_EQ(verifier.sign("/a/b.txt", 0), "nKfrFXPAzyaW5mfuzKye8cagps8xggmUlLULRwBucUo=:0");
}

TEST_F(SignatureVerifierTest, AcceptsValidFutureToken) {
    EXPECT_EQ(verifier.verify("/a/b.txt", "jK_MzXrHi22d-ILtLASqG4hhsdUkS_N6bjRehFXy8vU=:9999999999", now), std::nullopt);
}

TEST_F(SignatureVerifierTest, ZeroExpiryNeverExpires) {
    EXPECT_EQ(verifier.verify("/a/b.txt", "nKfrFXPAzyaW5mfuzKye8cagps8xggmUlLULRwBucUo=:0", at(4'000'000'000)), std::nullopt);
}

TEST_F(SignatureVerifierTest, EmptyTokenIsMissingExpiry) {
    EXPECT_EQ(verifier.verify("/a/b.txt", "", now), SignatureError::MissingExpiry);
}

TEST_F(SignatureVerifierTest, TrailingColonIsMissingExpiry) {
    EXPECT_EQ(verifier.verify("/a/b.txt", "abc:", now), SignatureError::MissingExpiry);
}

TEST_F(SignatureVerifierTest, NonNumericExpiryIsInvalid) {
    EXPECT_EQ(verifier.verify("/a/b.txt", "abc:soon", now), SignatureError::InvalidExpiry);
}

TEST_F(SignatureVerifierTest, PastExpiryIsExpired) {
    EXPECT_EQ(verifier.verify("/a/b.txt", verifier.sign("/a/b.txt", 1000), now), SignatureError::Expired);
}

TEST_F(SignatureVerifierTest, ExpiresDuringItsLastSecond) {
    const auto token = verifier.sign("/a/b.txt", 1'700'000'000);
    EXPECT_EQ(verifier.verify("/a/b.txt", token, at(1'700'000'000)), std::nullopt);
    EXPECT_EQ(verifier.verify("/a/b.txt", token, at(1'700'000'000) + std::chrono::milliseconds(500)),
              SignatureError::Expired);
}

TEST_F(SignatureVerifierTest, ExpiryIsCheckedBeforeSignature) {
    EXPECT_EQ(verifier.verify("/a/b.txt", "garbage:1000", now), SignatureError::Expired);
}

TEST_F(SignatureVerifierTest, TokenForAnotherPathIsMismatch) {
    EXPECT_EQ(verifier.verify("/a/c.txt", verifier.sign("/a/b.txt", 0), now), SignatureError::SignatureMismatch);
}

TEST_F(SignatureVerifierTest, TokenFromAnotherSecretIsMismatch) {
    const SignatureVerifier other("not-s");
    EXPECT_EQ(verifier.verify("/a/b.txt", other.sign("/a/b.txt", 0), now), SignatureError::SignatureMismatch);
}

TEST_F(SignatureVerifierTest, StandardBase64AlphabetIsRejected) {
    // same digest, '+' and '/' instead of '-' and '_'
    EXPECT_EQ(verifier.verify("/a/b.txt", "jK/MzXrHi22d+ILtLASqG4hhsdUkS/N6bjRehFXy8vU=:9999999999", now),
              SignatureError::SignatureMismatch);
}

TEST_F(SignatureVerifierTest, TokenWithoutColonUsesWholeTokenAsExpiry) {
    EXPECT_EQ(verifier.verify("/a/b.txt", "1000", now), SignatureError::Expired);
    EXPECT_EQ(verifier.verify("/a/b.txt", "0", now), SignatureError::SignatureMismatch);
}

TEST_F(SignatureVerifierTest, ReasonsMatchClientMessages) {
    EXPECT_EQ(toString(SignatureError::MissingExpiry), "expire missing");
    EXPECT_EQ(toString(SignatureError::InvalidExpiry), "expire invalid");
    EXPECT_EQ(toString(SignatureError::Expired), "expire expired");
    EXPECT_EQ(toString(SignatureError::SignatureMismatch), "sign mismatch");
}

TEST(SignatureVerifierParseTest, ParsesLeadingInteger) {
    EXPECT_EQ(SignatureVerifier::parseExpiry("123"), 123);
    EXPECT_EQ(SignatureVerifier::parseExpiry("123abc"), 123);
    EXPECT_EQ(SignatureVerifier::parseExpiry("-5"), -5);
    EXPECT_EQ(SignatureVerifier::parseExpiry("abc"), std::nullopt);
    EXPECT_EQ(SignatureVerifier::parseExpiry("-"), std::nullopt);
    EXPECT_EQ(SignatureVerifier::parseExpiry("99999999999999999999999"), std::nullopt);
}
