#include "ingestvault/offload/offload_scheduler.hpp"
#include "ingestvault/utilities/checksum_stream.hpp"
#include "ingestvault/utilities/errors.hpp"
#include "ingestvault/utilities/glob_filter.hpp"
#include "ingestvault/utilities/logger.h"
#include "ingestvault/utilities/metrics.h"
#include "ingestvault/utilities/worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <filesystem>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace ingestvault {

namespace {

/**
 * Hand-off point between the scheduler and one watched CopyJob thread.
 * Whichever of deliver() and abandon() comes first wins; after abandon() the
 * job's progress no longer reaches the caller's observer.
 */
class StallWatch : public TransferObserver {
public:
  explicit StallWatch(TransferObserver *observer) : observer_(observer) {}

  void onTransferUpdate(const TransferRecord &record) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!abandoned_ && observer_)
      observer_->onTransferUpdate(record);
  }

  std::future<TransferRecord> result() { return promise_.get_future(); }

  /** False if the scheduler already gave up on the job. */
  bool deliver(const TransferRecord &record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (abandoned_)
      return false;
    delivered_ = true;
    promise_.set_value(record);
    return true;
  }

  void deliverError(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (abandoned_)
      return;
    delivered_ = true;
    promise_.set_exception(error);
  }

  /** False if the result arrived in the meantime. */
  bool abandon() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (delivered_)
      return false;
    abandoned_ = true;
    return true;
  }

private:
  std::mutex mutex_;
  TransferObserver *observer_;
  std::promise<TransferRecord> promise_;
  bool delivered_ = false;
  bool abandoned_ = false;
};

} // namespace

OffloadScheduler::OffloadScheduler(RunConfig config, AuditLedger &ledger,
                                   Storage &storage,
                                   TransferObserver *observer)
    : config_(std::move(config)), ledger_(ledger), storage_(storage),
      observer_(observer), identity_(HostIdentity::current()) {}

std::vector<SourceFile> OffloadScheduler::discover() const {
  GlobFilter filter(config_.includePatterns, config_.excludePatterns);
  const fs::path root(config_.sourceRoot);
  const TimePoint now = SystemClock::now();
  std::vector<SourceFile> files;

  std::error_code ec;
  auto rootStatus = fs::status(root, ec);
  if (ec || !fs::exists(rootStatus)) {
    throw OffloadException(ErrorKind::SourceUnreadable,
                           "Source " + config_.sourceRoot +
                               " is not accessible" +
                               (ec ? ": " + ec.message() : std::string()));
  }

  auto addFile = [&](const fs::path &absolute, const std::string &relative) {
    std::error_code sizeEc;
    auto size = fs::file_size(absolute, sizeEc);
    if (sizeEc) {
      throw OffloadException(ErrorKind::SourceUnreadable,
                             "Cannot stat " + absolute.string() + ": " +
                                 sizeEc.message());
    }
    files.push_back(SourceFile{relative, absolute.string(), size, now});
  };

  if (fs::is_regular_file(rootStatus)) {
    std::string name = root.filename().string();
    if (filter.admits(name))
      addFile(root, name);
    return files;
  }
  if (!fs::is_directory(rootStatus)) {
    throw OffloadException(ErrorKind::SourceUnreadable,
                           "Source " + config_.sourceRoot +
                               " is neither a file nor a directory");
  }

  fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
  for (fs::recursive_directory_iterator end; !ec && it != end;
       it.increment(ec)) {
    std::error_code typeEc;
    if (!it->is_regular_file(typeEc))
      continue;
    std::string relative =
        it->path().lexically_relative(root).generic_string();
    if (filter.admits(relative))
      addFile(it->path(), relative);
  }
  // A directory we cannot list would silently drop files from the offload.
  if (ec) {
    throw OffloadException(ErrorKind::SourceUnreadable,
                           "Cannot enumerate " + config_.sourceRoot + ": " +
                               ec.message());
  }

  std::sort(files.begin(), files.end(),
            [](const SourceFile &a, const SourceFile &b) {
              return a.relativePath < b.relativePath;
            });
  return files;
}

void OffloadScheduler::preflight(const std::vector<SourceFile> &files) {
  // Fails here, before any copy, if the crypto provider refuses the
  // algorithm.
  ChecksumStream probe(config_.algorithm);

  totalBytes_ = 0;
  for (const auto &f : files)
    totalBytes_ += f.sizeBytes;

  for (const auto &root : config_.destinationRoots) {
    std::uint64_t free = 0;
    try {
      free = storage_.freeSpace(root);
    } catch (const std::system_error &e) {
      throw OffloadException(ErrorKind::DestinationUnwritable,
                             "Cannot query free space on " + root + ": " +
                                 e.what());
    }
    freeSpace_[root] = free;
    if (free < totalBytes_) {
      throw OffloadException(ErrorKind::InsufficientSpace,
                             "Destination " + root + " has " +
                                 std::to_string(free) + " bytes free, needs " +
                                 std::to_string(totalBytes_));
    }
  }
}

void OffloadScheduler::abortRun(const OffloadException &error) {
  Logger::getInstance().log(LogLevel::ERROR, "Offload aborted",
                            {{"error_kind", errorKindToString(error.kind())},
                             {"detail", error.what()}});
  try {
    ledger_.append(AuditOperation::RunAborted,
                   {{"reason", errorKindToString(error.kind())},
                    {"detail", error.what()},
                    {"source", config_.sourceRoot},
                    {"destinations", config_.destinationRoots},
                    {"user", identity_.user},
                    {"hostname", identity_.hostname},
                    {"working_directory", identity_.workingDirectory}});
  } catch (const OffloadException &ledgerError) {
    Logger::getInstance().log(LogLevel::FATAL,
                              "Could not record aborted run in the ledger",
                              {{"ledger", ledger_.path()},
                               {"detail", ledgerError.what()}});
  }
  throw error;
}

DestinationTarget OffloadScheduler::targetFor(const SourceFile &file,
                                              const std::string &root) const {
  DestinationTarget target;
  target.root = root;
  target.path = (fs::path(root) / file.relativePath).string();
  auto it = freeSpace_.find(root);
  target.freeSpaceAtStart = it == freeSpace_.end() ? 0 : it->second;
  return target;
}

TransferRecord
OffloadScheduler::notStartedRecord(const SourceFile &file,
                                   const DestinationTarget &target) const {
  TransferRecord record(file, target);
  if (cancelled()) {
    record.fail(ErrorKind::Cancelled,
                "Run stopped before this transfer started", SystemClock::now());
  } else {
    record.fail(ErrorKind::LedgerWriteFailed,
                "Audit ledger failed before this transfer started",
                SystemClock::now());
  }
  return record;
}

void OffloadScheduler::recordMetrics(const TransferRecord &record) const {
  auto &metrics = MetricsRegistry::instance();
  metrics.incrementCounter("ingestvault_transfers_total", 1.0,
                           {{"status", transferStatusToString(record.status())}});
  metrics.incrementCounter("ingestvault_bytes_copied_total",
                           static_cast<double>(record.bytesCopied()));
  metrics.observe("ingestvault_transfer_seconds", record.elapsedSeconds());
}

nlohmann::json
OffloadScheduler::runStartPayload(const std::vector<SourceFile> &files) const {
  return {{"source", config_.sourceRoot},
          {"destinations", config_.destinationRoots},
          {"algorithm", algorithmToString(config_.algorithm)},
          {"overwrite_policy", overwritePolicyToString(*config_.overwritePolicy)},
          {"file_count", files.size()},
          {"total_bytes", totalBytes_},
          {"concurrency", config_.concurrency},
          {"project_id", config_.projectId},
          {"shoot_day", config_.shootDay},
          {"ledger_status", ledgerOpenStatusToString(ledger_.openStatus())},
          {"ledger_notice", ledger_.openNotice()},
          {"user", identity_.user},
          {"hostname", identity_.hostname},
          {"working_directory", identity_.workingDirectory}};
}

void OffloadScheduler::runPair(const SourceFile &file,
                               const DestinationTarget &target,
                               const CopyJobOptions &options) {
  TransferRecord record;
  std::future<AuditEntry> entry;
  if (cancelled() || !ledger_.healthy()) {
    // Queued before the run was stopped but never started.
    record = notStartedRecord(file, target);
    if (observer_)
      observer_->onTransferUpdate(record);
  } else {
    if (options.timeout.count() > 0) {
      record = runWatched(file, target, options);
    } else {
      CopyJob job(file, target, options, storage_, observer_);
      record = job.run();
    }
    entry = ledger_.post(AuditOperation::TransferComplete, record.toJson());
  }
  recordMetrics(record);

  std::lock_guard<std::mutex> lock(completedMutex_);
  completed_.push_back(Completed{std::move(record), std::move(entry)});
}

TransferRecord OffloadScheduler::runWatched(const SourceFile &file,
                                           const DestinationTarget &target,
                                           const CopyJobOptions &options) {
  const TimePoint started = SystemClock::now();
  auto watch = std::make_shared<StallWatch>(observer_);
  auto job = std::make_shared<CopyJob>(file, target, options, storage_,
                                       watch.get());
  std::future<TransferRecord> result = watch->result();
  Storage &storage = storage_;

  std::thread worker([job, watch, &storage]() {
    TransferRecord record;
    try {
      record = job->run();
    } catch (const std::exception &) {
      watch->deliverError(std::current_exception());
      return;
    }
    if (watch->deliver(record))
      return;
    // Already reported as timed out; a late copy must not look usable.
    const std::string &dest = record.destination().path;
    bool wrote = (record.status() == TransferStatus::Verified ||
                  record.status() == TransferStatus::VerificationMismatch) &&
                 !record.reusedExisting();
    bool removed = wrote && storage.remove(dest);
    Logger::getInstance().log(wrote && !removed ? LogLevel::ERROR
                                                : LogLevel::WARN,
                              "Abandoned transfer finished late",
                              {{"destination", dest},
                               {"status", transferStatusToString(record.status())},
                               {"removed", removed}});
  });

  if (result.wait_for(options.timeout + STALL_GRACE) ==
          std::future_status::ready ||
      !watch->abandon()) {
    worker.join();
    return result.get();
  }
  // The job is stuck inside an I/O call that may never return.
  worker.detach();

  TransferRecord record(file, target);
  record.markStarted(started);
  std::string detail = "No progress within " +
                       std::to_string(options.timeout.count()) +
                       " ms; transfer abandoned";
  if (job->destinationTouched() && !storage_.remove(target.path))
    detail += " (partial destination could not be removed)";
  record.fail(ErrorKind::TimedOut, detail, SystemClock::now());
  Logger::getInstance().log(LogLevel::ERROR, "Transfer stalled",
                            {{"source", file.relativePath},
                             {"destination", target.path},
                             {"timeout_ms", options.timeout.count()}});
  if (observer_)
    observer_->onTransferUpdate(record);
  return record;
}

IngestionReport OffloadScheduler::run() {
  if (ran_)
    throw InvalidUseError("OffloadScheduler::run() called twice");
  ran_ = true;
  config_.validate();

  const TimePoint started = SystemClock::now();
  std::vector<SourceFile> files;
  try {
    files = discover();
    preflight(files);
  } catch (const OffloadException &e) {
    abortRun(e);
  }

  AuditEntry startEntry =
      ledger_.append(AuditOperation::RunStart, runStartPayload(files));
  Logger::getInstance().log(LogLevel::INFO, "Offload started",
                            {{"source", config_.sourceRoot},
                             {"files", files.size()},
                             {"destinations", config_.destinationRoots.size()},
                             {"total_bytes", totalBytes_}});

  CopyJobOptions options;
  options.algorithm = config_.algorithm;
  options.overwrite = *config_.overwritePolicy;
  options.chunkSize = config_.chunkSizeBytes;
  options.timeout =
      std::chrono::duration_cast<std::chrono::milliseconds>(config_.perFileTimeout);

  std::vector<std::future<void>> jobs;
  {
    WorkerPool pool(config_.concurrency, config_.concurrency);
    for (const auto &file : files) {
      for (const auto &root : config_.destinationRoots) {
        DestinationTarget target = targetFor(file, root);
        if (cancelled() || !ledger_.healthy()) {
          TransferRecord record = notStartedRecord(file, target);
          if (observer_)
            observer_->onTransferUpdate(record);
          recordMetrics(record);
          skipped_.push_back(std::move(record));
          continue;
        }
        jobs.push_back(pool.submit(
            [this, file, target, options]() { runPair(file, target, options); }));
      }
    }
    pool.waitIdle();
  }
  for (auto &job : jobs)
    job.get();

  IngestionReport report;
  std::string ledgerFailure;
  for (auto &c : completed_) {
    if (c.ledgerEntry.valid()) {
      try {
        c.ledgerEntry.get();
      } catch (const OffloadException &e) {
        if (ledgerFailure.empty())
          ledgerFailure = e.what();
      }
    }
    report.addRecord(std::move(c.record));
  }
  completed_.clear();
  for (auto &r : skipped_)
    report.addRecord(std::move(r));
  skipped_.clear();

  if (!ledgerFailure.empty()) {
    Logger::getInstance().log(LogLevel::FATAL,
                              "Audit ledger failed; offload cannot be trusted",
                              {{"ledger", ledger_.path()},
                               {"detail", ledgerFailure}});
    throw OffloadException(ErrorKind::LedgerWriteFailed, ledgerFailure);
  }

  report.setProjectId(config_.projectId);
  report.setShootDay(config_.shootDay);
  report.setSourceRoot(config_.sourceRoot);
  report.setDestinationRoots(config_.destinationRoots);
  report.setAlgorithm(config_.algorithm);
  report.setOverwritePolicy(*config_.overwritePolicy);
  report.setCancelled(cancelled());

  FormatStatus status = report.formatStatus();
  nlohmann::json endPayload = {{"summary", report.toJson()["summary"]},
                               {"status", status.toJson()}};
  AuditOperation endOp = AuditOperation::RunEnd;
  if (cancelled()) {
    endOp = AuditOperation::RunAborted;
    endPayload["reason"] = errorKindToString(ErrorKind::Cancelled);
    endPayload["user"] = identity_.user;
    endPayload["hostname"] = identity_.hostname;
    endPayload["working_directory"] = identity_.workingDirectory;
  }
  AuditEntry lastEntry = ledger_.append(endOp, endPayload);
  report.setTimes(started, SystemClock::now());

  LedgerSummary summary;
  summary.path = ledger_.path();
  summary.openStatus = ledger_.openStatus();
  summary.notice = ledger_.openNotice();
  summary.firstSequence = startEntry.sequence;
  summary.lastSequence = lastEntry.sequence;
  summary.entriesAppended =
      static_cast<std::size_t>(lastEntry.sequence - startEntry.sequence + 1);
  summary.headDigest = lastEntry.digest;
  report.setLedgerSummary(std::move(summary));

  MetricsRegistry::instance().setGauge("ingestvault_safe_to_format",
                                       status.safe ? 1.0 : 0.0);
  Logger::getInstance().log(status.safe ? LogLevel::INFO : LogLevel::WARN,
                            "Offload finished",
                            {{"badge", status.badge},
                             {"reason", status.reason},
                             {"verified", status.verifiedCount},
                             {"failed", status.failedCount},
                             {"mismatched", status.mismatchCount}});
  return report;
}

} // namespace ingestvault
