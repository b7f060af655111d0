#include "source/common/crypto/utility.h"

#include <memory>

#include "source/common/common/assert.h"
#include "source/common/common/hex.h"

#include "openssl/evp.h"
#include "openssl/sha.h"

namespace Corral {
namespace Common {
namespace Crypto {

namespace {

using ScopedEvpMdCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

const EVP_MD* getHashFunction(DigestAlgorithm algorithm) {
  switch (algorithm) {
  case DigestAlgorithm::Sha1:
    return EVP_sha1();
  case DigestAlgorithm::Sha256:
    return EVP_sha256();
  }
  PANIC("corrupted enum");
}

} // namespace

size_t Utility::digestLength(DigestAlgorithm algorithm) {
  switch (algorithm) {
  case DigestAlgorithm::Sha1:
    return SHA_DIGEST_LENGTH;
  case DigestAlgorithm::Sha256:
    return SHA256_DIGEST_LENGTH;
  }
  PANIC("corrupted enum");
}

std::vector<uint8_t> Utility::getDigest(DigestAlgorithm algorithm, absl::string_view input) {
  std::vector<uint8_t> digest(digestLength(algorithm));
  ScopedEvpMdCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  RELEASE_ASSERT(ctx != nullptr, "Failed to allocate digest context");
  auto rc = EVP_DigestInit(ctx.get(), getHashFunction(algorithm));
  RELEASE_ASSERT(rc == 1, "Failed to init digest context");
  rc = EVP_DigestUpdate(ctx.get(), input.data(), input.size());
  RELEASE_ASSERT(rc == 1, "Failed to update digest");
  unsigned int len = 0;
  rc = EVP_DigestFinal(ctx.get(), digest.data(), &len);
  RELEASE_ASSERT(rc == 1, "Failed to finalize digest");
  RELEASE_ASSERT(len == digest.size(), "digest length mismatch");
  return digest;
}

std::string Utility::getHexDigest(DigestAlgorithm algorithm, absl::string_view input) {
  return Hex::encode(getDigest(algorithm, input));
}

} // namespace Crypto
} // namespace Common
} // namespace Corral
