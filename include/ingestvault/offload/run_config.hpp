#ifndef INGESTVAULT_RUN_CONFIG_HPP
#define INGESTVAULT_RUN_CONFIG_HPP

#include "ingestvault/utilities/digest.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ingestvault {

/**
 * @brief What to do when a destination file already exists.
 */
enum class OverwritePolicy {
  Fail,         ///< Record the pair as failed, leave the file untouched
  SkipVerified, ///< Re-hash both sides; reuse on match, rewrite on mismatch
  Overwrite     ///< Always rewrite
};

std::string overwritePolicyToString(OverwritePolicy policy);

/** @throw std::invalid_argument for an unknown name. */
OverwritePolicy parseOverwritePolicy(const std::string &name);

inline constexpr std::size_t DEFAULT_CHUNK_SIZE = 4 * 1024 * 1024;

/**
 * @brief Every option an offload run recognizes.
 */
struct RunConfig {
  std::string sourceRoot;
  std::vector<std::string> destinationRoots;
  ChecksumAlgorithm algorithm = ChecksumAlgorithm::SHA256;
  std::vector<std::string> includePatterns;
  std::vector<std::string> excludePatterns;
  /// Deliberately unset by default: callers must choose.
  std::optional<OverwritePolicy> overwritePolicy;
  std::size_t concurrency = defaultConcurrency();
  std::size_t chunkSizeBytes = DEFAULT_CHUNK_SIZE;
  /// Zero disables the per-file timeout.
  std::chrono::seconds perFileTimeout{0};
  /// Empty selects defaultLedgerPath(projectId).
  std::string auditLogPath;
  std::string projectId;
  std::string shootDay;
  std::string reportPath;

  /** Two workers per hardware thread, at least one. */
  static std::size_t defaultConcurrency();

  /**
   * @brief Load a YAML run description.
   * @throw std::runtime_error if the file cannot be read or parsed.
   * @throw OffloadException (ChecksumAlgorithmUnsupported) on a bad algorithm.
   */
  static RunConfig fromYamlFile(const std::string &path);
  static RunConfig fromYamlString(const std::string &yaml);

  /** Apply INGESTVAULT_CONCURRENCY, INGESTVAULT_ALGORITHM, INGESTVAULT_AUDIT_LOG. */
  void applyEnvironment();

  /** Resolved ledger path. */
  std::string ledgerPath() const;

  /** @throw std::invalid_argument describing the first problem found. */
  void validate() const;
};

} // namespace ingestvault

#endif // INGESTVAULT_RUN_CONFIG_HPP
