#ifndef INGESTVAULT_INGESTION_REPORT_HPP
#define INGESTVAULT_INGESTION_REPORT_HPP

#include "ingestvault/audit/audit_ledger.hpp"
#include "ingestvault/offload/run_config.hpp"
#include "ingestvault/offload/transfer_record.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ingestvault {

/**
 * @brief What the run did to the audit ledger.
 */
struct LedgerSummary {
  std::string path;
  LedgerOpenStatus openStatus = LedgerOpenStatus::InMemory;
  std::string notice;
  std::optional<std::uint64_t> firstSequence; ///< First entry this run wrote
  std::optional<std::uint64_t> lastSequence;
  std::size_t entriesAppended = 0;
  std::string headDigest;

  bool carriedOver() const { return openStatus == LedgerOpenStatus::Loaded; }
  nlohmann::json toJson() const;
};

struct FormatStatus {
  bool safe = false;
  std::string badge;
  std::string reason;
  std::size_t verifiedCount = 0;
  std::size_t failedCount = 0;
  std::size_t mismatchCount = 0;

  nlohmann::json toJson() const;
};

/// Throughput over verified copies that actually wrote bytes.
struct ThroughputStats {
  std::uint64_t totalBytesCopied = 0;
  std::optional<double> averageMiBps;
  std::optional<double> minimumMiBps;
  std::optional<double> maximumMiBps;
};

inline const char *const SAFE_TO_FORMAT_BADGE = "SAFE TO FORMAT";
inline const char *const DO_NOT_FORMAT_BADGE = "DO NOT FORMAT";

/**
 * @brief Aggregate result of one offload run.
 *
 * Owns the terminal TransferRecords handed over by the scheduler and keeps
 * them ordered by (source path, destination path) no matter in which order
 * they arrived.
 */
class IngestionReport {
public:
  IngestionReport() = default;

  void setProjectId(std::string id) { projectId_ = std::move(id); }
  void setShootDay(std::string day) { shootDay_ = std::move(day); }
  void setSourceRoot(std::string root) { sourceRoot_ = std::move(root); }
  void setDestinationRoots(std::vector<std::string> roots) {
    destinationRoots_ = std::move(roots);
  }
  void setAlgorithm(ChecksumAlgorithm algo) { algorithm_ = algo; }
  void setOverwritePolicy(OverwritePolicy policy) { policy_ = policy; }
  void setTimes(TimePoint started, TimePoint finished);
  void setCancelled(bool cancelled) { cancelled_ = cancelled; }
  void setLedgerSummary(LedgerSummary summary) { ledger_ = std::move(summary); }

  /**
   * @brief Take ownership of a finished record.
   * @throw InvalidUseError if the record is not terminal.
   */
  void addRecord(TransferRecord record);

  const std::vector<TransferRecord> &records() const { return records_; }
  const std::string &projectId() const { return projectId_; }
  const std::string &shootDay() const { return shootDay_; }
  const LedgerSummary &ledger() const { return ledger_; }
  bool cancelled() const { return cancelled_; }
  double elapsedSeconds() const;

  /** True iff every record is verified; vacuously true for no records. */
  bool safeToFormat() const;
  std::size_t verifiedCount() const;
  std::size_t mismatchCount() const;
  std::size_t failedCount() const;
  std::size_t reusedCount() const;

  ThroughputStats throughput() const;
  FormatStatus formatStatus() const;
  /** One line per record that blocks formatting. */
  std::vector<std::string> doNotFormatReasons() const;

  nlohmann::json toJson() const;
  /** @throw std::runtime_error if the file cannot be written. */
  void save(const std::string &path) const;
  std::string renderSummary() const;

private:
  std::size_t countStatus(TransferStatus status) const;

  std::string projectId_;
  std::string shootDay_;
  std::string sourceRoot_;
  std::vector<std::string> destinationRoots_;
  ChecksumAlgorithm algorithm_ = ChecksumAlgorithm::SHA256;
  std::optional<OverwritePolicy> policy_;
  TimePoint startedAt_{};
  TimePoint finishedAt_{};
  bool cancelled_ = false;
  LedgerSummary ledger_;
  std::vector<TransferRecord> records_;
};

} // namespace ingestvault

#endif // INGESTVAULT_INGESTION_REPORT_HPP
