#ifndef INGESTVAULT_TRANSFER_RECORD_HPP
#define INGESTVAULT_TRANSFER_RECORD_HPP

#include "ingestvault/utilities/digest.hpp"
#include "ingestvault/utilities/errors.hpp"
#include "ingestvault/utilities/timestamp.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ingestvault {

/**
 * @brief A file found under the source root. Immutable once discovered.
 */
struct SourceFile {
  std::string relativePath; ///< '/' separated, relative to the source root
  std::string absolutePath;
  std::uint64_t sizeBytes = 0;
  TimePoint discoveredAt{};
};

/**
 * @brief Where one SourceFile goes on one destination drive.
 */
struct DestinationTarget {
  std::string root;
  std::string path;                  ///< root + relative path
  std::uint64_t freeSpaceAtStart = 0; ///< Pre-flight snapshot for the root
};

enum class TransferStatus {
  Pending,
  Copying,
  Verifying,
  Verified,
  VerificationMismatch,
  Failed
};

std::string transferStatusToString(TransferStatus status);
bool isTerminal(TransferStatus status);

/**
 * @brief Outcome of copying one SourceFile to one DestinationTarget.
 *
 * Status only moves forward (pending, copying, verifying, terminal); the
 * skip-verified probe may jump from pending to verifying and refusals or
 * cancellations from pending straight to failed. Any other move, and any
 * mutation after a terminal state, throws InvalidUseError.
 */
class TransferRecord {
public:
  TransferRecord() = default;
  TransferRecord(SourceFile source, DestinationTarget destination);

  const SourceFile &source() const { return source_; }
  const DestinationTarget &destination() const { return destination_; }
  TransferStatus status() const { return status_; }
  bool terminal() const { return isTerminal(status_); }

  const std::optional<ChecksumDigest> &sourceDigest() const { return sourceDigest_; }
  const std::optional<ChecksumDigest> &destinationDigest() const { return destinationDigest_; }
  std::uint64_t bytesCopied() const { return bytesCopied_; }
  TimePoint startedAt() const { return startedAt_; }
  TimePoint finishedAt() const { return finishedAt_; }
  const std::optional<ErrorKind> &errorKind() const { return errorKind_; }
  const std::string &errorDetail() const { return errorDetail_; }
  bool reusedExisting() const { return reusedExisting_; }

  /** Wall-clock seconds from start to terminal state. */
  double elapsedSeconds() const;
  /** Throughput in MiB/s of the bytes actually written, if any. */
  std::optional<double> throughputMiBps() const;

  void markStarted(TimePoint when);
  void advance(TransferStatus next);
  void setSourceDigest(ChecksumDigest digest);
  void setDestinationDigest(ChecksumDigest digest);
  void addBytesCopied(std::uint64_t bytes);
  void setReusedExisting(bool reused);

  /** Terminal transitions stamp the finish time. */
  void complete(TransferStatus terminalStatus, TimePoint when);
  void fail(ErrorKind kind, const std::string &detail, TimePoint when);
  void mismatch(const std::string &detail, TimePoint when);

  nlohmann::json toJson() const;

private:
  void requireMutable(const char *what) const;

  SourceFile source_;
  DestinationTarget destination_;
  TransferStatus status_ = TransferStatus::Pending;
  std::optional<ChecksumDigest> sourceDigest_;
  std::optional<ChecksumDigest> destinationDigest_;
  std::uint64_t bytesCopied_ = 0;
  TimePoint startedAt_{};
  TimePoint finishedAt_{};
  std::optional<ErrorKind> errorKind_;
  std::string errorDetail_;
  bool reusedExisting_ = false;
};

} // namespace ingestvault

#endif // INGESTVAULT_TRANSFER_RECORD_HPP
