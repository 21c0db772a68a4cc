#ifndef INGESTVAULT_OFFLOAD_SCHEDULER_HPP
#define INGESTVAULT_OFFLOAD_SCHEDULER_HPP

#include "ingestvault/audit/audit_ledger.hpp"
#include "ingestvault/offload/copy_job.hpp"
#include "ingestvault/offload/run_config.hpp"
#include "ingestvault/offload/transfer_observer.hpp"
#include "ingestvault/report/ingestion_report.hpp"
#include "ingestvault/utilities/host_identity.hpp"
#include "ingestvault/utilities/storage.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <vector>

namespace ingestvault {

/**
 * @brief Drives one offload run from discovery to the final report.
 *
 * Files are discovered in lexical order, capacity is checked on every
 * destination before anything is written, then one CopyJob per
 * (file, destination) pair runs on a bounded WorkerPool. Each finished
 * record is posted to the ledger by the worker that produced it; the ledger
 * orders those entries on its own writer thread.
 *
 * Per-file failures end up in the report. Run-level problems throw
 * OffloadException: InsufficientSpace or SourceUnreadable before any copy,
 * LedgerWriteFailed whenever the ledger cannot persist.
 *
 * With a per-file timeout configured, each CopyJob runs on its own thread and
 * is abandoned once it overruns the timeout by STALL_GRACE, so an I/O call
 * that never returns cannot hang the run. The abandoned thread keeps using
 * the Storage, which must therefore outlive it.
 */
class OffloadScheduler {
public:
  /// Extra time a job gets past its own deadline before it is abandoned.
  static constexpr std::chrono::milliseconds STALL_GRACE{500};

  OffloadScheduler(RunConfig config, AuditLedger &ledger, Storage &storage,
                   TransferObserver *observer = nullptr);

  /**
   * @brief Walk the source root in lexical path order through the filters.
   * @throw OffloadException (SourceUnreadable) if the source cannot be read.
   */
  std::vector<SourceFile> discover() const;

  /**
   * @brief Execute the run. May be called once.
   * @throw std::invalid_argument if the configuration is invalid.
   * @throw OffloadException for run-level failures.
   */
  IngestionReport run();

  /**
   * @brief Stop submitting new pairs. Safe from any thread or a signal
   * relay; in-flight jobs still finish normally.
   */
  void cancel() { cancelled_.store(true); }
  bool cancelled() const { return cancelled_.load(); }

private:
  struct Completed {
    TransferRecord record;
    std::future<AuditEntry> ledgerEntry;
  };

  void preflight(const std::vector<SourceFile> &files);
  void runPair(const SourceFile &file, const DestinationTarget &target,
               const CopyJobOptions &options);
  [[noreturn]] void abortRun(const OffloadException &error);
  DestinationTarget targetFor(const SourceFile &file,
                              const std::string &root) const;
  TransferRecord runWatched(const SourceFile &file,
                            const DestinationTarget &target,
                            const CopyJobOptions &options);
  TransferRecord notStartedRecord(const SourceFile &file,
                                  const DestinationTarget &target) const;
  void recordMetrics(const TransferRecord &record) const;
  nlohmann::json runStartPayload(const std::vector<SourceFile> &files) const;

  RunConfig config_;
  AuditLedger &ledger_;
  Storage &storage_;
  TransferObserver *observer_;
  HostIdentity identity_;
  std::atomic<bool> cancelled_{false};
  bool ran_ = false;

  std::mutex completedMutex_;
  std::vector<Completed> completed_;
  std::vector<TransferRecord> skipped_;
  std::map<std::string, std::uint64_t> freeSpace_;
  std::uint64_t totalBytes_ = 0;
};

} // namespace ingestvault

#endif // INGESTVAULT_OFFLOAD_SCHEDULER_HPP
