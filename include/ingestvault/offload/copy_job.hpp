#ifndef INGESTVAULT_COPY_JOB_HPP
#define INGESTVAULT_COPY_JOB_HPP

#include "ingestvault/offload/run_config.hpp"
#include "ingestvault/offload/transfer_observer.hpp"
#include "ingestvault/offload/transfer_record.hpp"
#include "ingestvault/utilities/storage.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace ingestvault {

struct CopyJobOptions {
  ChecksumAlgorithm algorithm = ChecksumAlgorithm::SHA256;
  OverwritePolicy overwrite = OverwritePolicy::Fail;
  std::size_t chunkSize = DEFAULT_CHUNK_SIZE;
  std::chrono::milliseconds timeout{0}; ///< 0 = no per-file timeout
};

/**
 * @brief Copies one SourceFile to one DestinationTarget and verifies it.
 *
 * The source is streamed in chunks into both the destination and a
 * ChecksumStream. After the destination is synced and closed it is opened
 * again and read back into a second ChecksumStream; only equal digests yield
 * Verified. Any I/O error removes the partially written destination and
 * yields Failed. The job runs its steps sequentially on the calling thread;
 * run() may be called once and hands the terminal record to the caller.
 */
class CopyJob {
public:
  CopyJob(SourceFile source, DestinationTarget target, CopyJobOptions options,
          Storage &storage, TransferObserver *observer = nullptr);

  /** @throw InvalidUseError if called twice. */
  TransferRecord run();

  /** Safe to read from another thread while run() is in progress. */
  bool destinationTouched() const { return destinationTouched_.load(); }

private:
  using Deadline = std::optional<std::chrono::steady_clock::time_point>;

  void notify();
  bool handleExistingDestination();
  void copyAndHash();
  ChecksumDigest hashFile(const std::string &path);
  void checkDeadline(const char *stage) const;
  void failAndCleanup(ErrorKind kind, const std::string &detail,
                      bool removeDestination);

  TransferRecord record_;
  CopyJobOptions options_;
  Storage &storage_;
  TransferObserver *observer_;
  std::vector<std::byte> buffer_;
  Deadline deadline_;
  /// Kind recorded if the next I/O call throws.
  ErrorKind failureSide_ = ErrorKind::SourceUnreadable;
  bool exclusive_ = true;
  /// Set once this job created or truncated the destination file.
  std::atomic<bool> destinationTouched_{false};
  bool ran_ = false;
};

} // namespace ingestvault

#endif // INGESTVAULT_COPY_JOB_HPP
