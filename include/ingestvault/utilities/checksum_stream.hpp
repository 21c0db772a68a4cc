#ifndef INGESTVAULT_CHECKSUM_STREAM_HPP
#define INGESTVAULT_CHECKSUM_STREAM_HPP

#include "ingestvault/utilities/digest.hpp"
#include <cstddef>
#include <openssl/evp.h>
#include <sodium.h>
#include <span>
#include <string_view>

namespace ingestvault {

/**
 * @brief Incremental hasher fed chunk by chunk while a file is streamed.
 *
 * SHA-256 runs on libsodium, MD5 on OpenSSL's EVP interface. Nothing is
 * buffered: every chunk is folded into the digest state as it arrives.
 * After finalize() the stream is frozen.
 */
class ChecksumStream {
public:
  /**
   * @param algo Algorithm for this stream.
   * @throw std::runtime_error if libsodium cannot be initialized.
   * @throw OffloadException (ChecksumAlgorithmUnsupported) if the crypto
   *        provider refuses the algorithm.
   */
  explicit ChecksumStream(ChecksumAlgorithm algo);
  ~ChecksumStream();

  ChecksumStream(const ChecksumStream &) = delete;
  ChecksumStream &operator=(const ChecksumStream &) = delete;

  /**
   * @brief Fold a chunk into the digest.
   * @throw InvalidUseError if the stream was already finalized.
   */
  void feed(const std::byte *data, std::size_t size);
  void feed(std::span<const std::byte> chunk) { feed(chunk.data(), chunk.size()); }
  void feed(std::string_view text);

  /**
   * @brief Produce the digest and freeze the stream.
   * @throw InvalidUseError if called twice.
   */
  ChecksumDigest finalize();

  bool finalized() const { return finalized_; }
  ChecksumAlgorithm algorithm() const { return algo_; }
  std::uint64_t bytesHashed() const { return bytes_; }

  /** One-shot digest of an in-memory buffer. */
  static ChecksumDigest digestOf(ChecksumAlgorithm algo, std::string_view text);

private:
  ChecksumAlgorithm algo_;
  crypto_hash_sha256_state sha_state_;
  EVP_MD_CTX *md5_ctx_ = nullptr;
  std::uint64_t bytes_ = 0;
  bool finalized_ = false;
};

} // namespace ingestvault

#endif // INGESTVAULT_CHECKSUM_STREAM_HPP
