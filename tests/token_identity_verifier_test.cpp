// =============================================================================
// token_identity_verifier_test.cpp
// =============================================================================
// Unit tests for relay::TokenIdentityVerifier and anonymousPeerId().
// =============================================================================

#include "relay/identity/token_identity_verifier.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>

class TokenIdentityVerifierTest : public ::testing::Test {
 protected:
  TokenIdentityVerifierTest()
      : verifier(std::map<std::string, std::string>{{"tok-alice", "alice"},
                                                    {"tok-bob", "bob"}}) {}

  relay::TokenIdentityVerifier verifier;
};

TEST_F(TokenIdentityVerifierTest, KnownTokenResolvesToPeer) {
  auto peer = verifier.verifyCaller("tok-bob");
  ASSERT_TRUE(peer.ok());
  EXPECT_EQ(peer.value(), "bob");
}

TEST_F(TokenIdentityVerifierTest, UnknownTokenIsUnauthorized) {
  auto peer = verifier.verifyCaller("tok-mallory");
  ASSERT_FALSE(peer.ok());
  EXPECT_EQ(peer.code(), relay::ErrorCode::Unauthorized);
  EXPECT_FALSE(relay::isRetryable(peer.code()));
}

TEST_F(TokenIdentityVerifierTest, EmptyCredentialIsUnauthorized) {
  EXPECT_EQ(verifier.verifyCaller("").code(), relay::ErrorCode::Unauthorized);
}

TEST(AnonymousPeerIdTest, DerivedFromConnectionId) {
  EXPECT_EQ(relay::anonymousPeerId("c-17"), "anon-c-17");
}
