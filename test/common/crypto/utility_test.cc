#include <string>

#include "source/common/crypto/utility.h"

#include "gtest/gtest.h"

namespace Corral {
namespace Common {
namespace Crypto {
namespace {

TEST(UtilityTest, DigestLength) {
  EXPECT_EQ(20U, Utility::digestLength(DigestAlgorithm::Sha1));
  EXPECT_EQ(32U, Utility::digestLength(DigestAlgorithm::Sha256));
}

TEST(UtilityTest, Sha1HexDigest) {
  EXPECT_EQ("da39a3ee5e6b4b0d3255bfef95601890afd80709",
            Utility::getHexDigest(DigestAlgorithm::Sha1, ""));
  EXPECT_EQ("a9993e364706816aba3e25717850c26c9cd0d89d",
            Utility::getHexDigest(DigestAlgorithm::Sha1, "abc"));
}

TEST(UtilityTest, Sha256HexDigest) {
  EXPECT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
            Utility::getHexDigest(DigestAlgorithm::Sha256, ""));
  EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
            Utility::getHexDigest(DigestAlgorithm::Sha256, "abc"));
}

TEST(UtilityTest, DigestMatchesHexDigest) {
  const auto digest = Utility::getDigest(DigestAlgorithm::Sha256, "abc");
  ASSERT_EQ(32U, digest.size());
  EXPECT_EQ(0xba, digest[0]);
  EXPECT_EQ(0xad, digest[31]);
}

TEST(UtilityTest, EmbeddedNulIsHashed) {
  const std::string with_nul("a\0b", 3);
  EXPECT_NE(Utility::getHexDigest(DigestAlgorithm::Sha1, with_nul),
            Utility::getHexDigest(DigestAlgorithm::Sha1, "a"));
}

} // namespace
} // namespace Crypto
} // namespace Common
} // namespace Corral
