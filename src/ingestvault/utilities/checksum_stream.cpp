#include "ingestvault/utilities/checksum_stream.hpp"
#include "ingestvault/utilities/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace ingestvault {

std::string algorithmToString(ChecksumAlgorithm algo) {
  switch (algo) {
  case ChecksumAlgorithm::MD5:
    return "md5";
  case ChecksumAlgorithm::SHA256:
    return "sha256";
  }
  return "unknown";
}

ChecksumAlgorithm parseAlgorithm(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "md5")
    return ChecksumAlgorithm::MD5;
  if (lower == "sha256" || lower == "sha-256")
    return ChecksumAlgorithm::SHA256;
  throw OffloadException(ErrorKind::ChecksumAlgorithmUnsupported,
                         "Unsupported checksum algorithm: " + name +
                             ". Use 'md5' or 'sha256'");
}

bool ChecksumDigest::matches(const ChecksumDigest &other) const {
  if (algorithm != other.algorithm) {
    throw InvalidUseError("Cannot compare a " + algorithmToString(algorithm) +
                          " digest with a " +
                          algorithmToString(other.algorithm) + " digest");
  }
  return hex == other.hex;
}

ChecksumStream::ChecksumStream(ChecksumAlgorithm algo) : algo_(algo) {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  if (algo_ == ChecksumAlgorithm::SHA256) {
    crypto_hash_sha256_init(&sha_state_);
    return;
  }
  md5_ctx_ = EVP_MD_CTX_new();
  if (!md5_ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(md5_ctx_, EVP_md5(), nullptr) != 1) {
    EVP_MD_CTX_free(md5_ctx_);
    md5_ctx_ = nullptr;
    // FIPS providers reject MD5.
    throw OffloadException(ErrorKind::ChecksumAlgorithmUnsupported,
                           "MD5 is not available from the crypto provider");
  }
}

ChecksumStream::~ChecksumStream() {
  if (md5_ctx_) {
    EVP_MD_CTX_free(md5_ctx_);
  }
}

void ChecksumStream::feed(const std::byte *data, std::size_t size) {
  if (finalized_) {
    throw InvalidUseError("Cannot feed a ChecksumStream after finalize()");
  }
  if (!data || size == 0) {
    return;
  }
  const auto *bytes = reinterpret_cast<const unsigned char *>(data);
  if (algo_ == ChecksumAlgorithm::SHA256) {
    crypto_hash_sha256_update(&sha_state_, bytes, size);
  } else if (EVP_DigestUpdate(md5_ctx_, bytes, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  bytes_ += size;
}

void ChecksumStream::feed(std::string_view text) {
  feed(reinterpret_cast<const std::byte *>(text.data()), text.size());
}

ChecksumDigest ChecksumStream::finalize() {
  if (finalized_) {
    throw InvalidUseError("finalize() already called");
  }

  std::array<unsigned char, SHA256_DIGEST_SIZE> raw{};
  std::size_t rawLen = 0;
  if (algo_ == ChecksumAlgorithm::SHA256) {
    crypto_hash_sha256_final(&sha_state_, raw.data());
    rawLen = SHA256_DIGEST_SIZE;
  } else {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(md5_ctx_, raw.data(), &len) != 1) {
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    rawLen = len;
  }
  finalized_ = true;

  std::string hex(rawLen * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), raw.data(), rawLen);
  hex.resize(rawLen * 2);

  ChecksumDigest result;
  result.algorithm = algo_;
  result.hex = std::move(hex);
  result.bytesHashed = bytes_;
  return result;
}

ChecksumDigest ChecksumStream::digestOf(ChecksumAlgorithm algo,
                                        std::string_view text) {
  ChecksumStream stream(algo);
  stream.feed(text);
  return stream.finalize();
}

} // namespace ingestvault
