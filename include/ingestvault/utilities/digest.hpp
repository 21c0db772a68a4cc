#ifndef INGESTVAULT_DIGEST_HPP
#define INGESTVAULT_DIGEST_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace ingestvault {

/// Supported checksum algorithms. One algorithm is used for a whole run.
enum class ChecksumAlgorithm { MD5, SHA256 };

/// Raw digest sizes for the supported algorithms.
inline constexpr std::size_t MD5_DIGEST_SIZE = 16;
inline constexpr std::size_t SHA256_DIGEST_SIZE = 32;

/** Lower-case algorithm name ("md5", "sha256"). */
std::string algorithmToString(ChecksumAlgorithm algo);

/**
 * @brief Parse an algorithm name, case-insensitively.
 * @throw OffloadException with ErrorKind::ChecksumAlgorithmUnsupported.
 */
ChecksumAlgorithm parseAlgorithm(const std::string &name);

/**
 * @brief Finalized checksum of a byte stream.
 */
struct ChecksumDigest {
  ChecksumAlgorithm algorithm = ChecksumAlgorithm::SHA256;
  std::string hex;             ///< Lower-case hex digest
  std::uint64_t bytesHashed = 0;

  /**
   * @brief Compare against a digest of the same algorithm.
   * @throw InvalidUseError if the algorithms differ.
   */
  bool matches(const ChecksumDigest &other) const;
};

} // namespace ingestvault

#endif // INGESTVAULT_DIGEST_HPP
