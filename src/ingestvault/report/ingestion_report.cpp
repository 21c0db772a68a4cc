#include "ingestvault/report/ingestion_report.hpp"
#include "ingestvault/utilities/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ingestvault {

namespace {

nlohmann::json optionalNumber(const std::optional<double> &v) {
  return v ? nlohmann::json(*v) : nlohmann::json();
}

nlohmann::json optionalSequence(const std::optional<std::uint64_t> &v) {
  return v ? nlohmann::json(*v) : nlohmann::json();
}

bool recordLess(const TransferRecord &a, const TransferRecord &b) {
  if (a.source().relativePath != b.source().relativePath)
    return a.source().relativePath < b.source().relativePath;
  return a.destination().path < b.destination().path;
}

std::string formatMiBps(const std::optional<double> &v) {
  if (!v)
    return "n/a";
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << *v << " MiB/s";
  return out.str();
}

} // namespace

nlohmann::json LedgerSummary::toJson() const {
  return nlohmann::json{{"path", path},
                        {"open_status", ledgerOpenStatusToString(openStatus)},
                        {"carried_over", carriedOver()},
                        {"notice", notice},
                        {"first_sequence", optionalSequence(firstSequence)},
                        {"last_sequence", optionalSequence(lastSequence)},
                        {"entries_appended", entriesAppended},
                        {"head_digest", headDigest}};
}

nlohmann::json FormatStatus::toJson() const {
  return nlohmann::json{{"safe_to_format", safe},
                        {"badge", badge},
                        {"reason", reason},
                        {"verified_count", verifiedCount},
                        {"failed_count", failedCount},
                        {"mismatch_count", mismatchCount}};
}

void IngestionReport::setTimes(TimePoint started, TimePoint finished) {
  startedAt_ = started;
  finishedAt_ = finished;
}

void IngestionReport::addRecord(TransferRecord record) {
  if (!record.terminal())
    throw InvalidUseError("IngestionReport accepts terminal records only, got " +
                          transferStatusToString(record.status()));
  auto pos = std::upper_bound(records_.begin(), records_.end(), record,
                              recordLess);
  records_.insert(pos, std::move(record));
}

double IngestionReport::elapsedSeconds() const {
  return secondsBetween(startedAt_, finishedAt_);
}

std::size_t IngestionReport::countStatus(TransferStatus status) const {
  return static_cast<std::size_t>(
      std::count_if(records_.begin(), records_.end(),
                    [status](const TransferRecord &r) {
                      return r.status() == status;
                    }));
}

bool IngestionReport::safeToFormat() const {
  return std::all_of(records_.begin(), records_.end(),
                     [](const TransferRecord &r) {
                       return r.status() == TransferStatus::Verified;
                     });
}

std::size_t IngestionReport::verifiedCount() const {
  return countStatus(TransferStatus::Verified);
}

std::size_t IngestionReport::mismatchCount() const {
  return countStatus(TransferStatus::VerificationMismatch);
}

std::size_t IngestionReport::failedCount() const {
  return countStatus(TransferStatus::Failed);
}

std::size_t IngestionReport::reusedCount() const {
  return static_cast<std::size_t>(
      std::count_if(records_.begin(), records_.end(),
                    [](const TransferRecord &r) { return r.reusedExisting(); }));
}

ThroughputStats IngestionReport::throughput() const {
  ThroughputStats stats;
  double sum = 0;
  std::size_t n = 0;
  for (const auto &r : records_) {
    stats.totalBytesCopied += r.bytesCopied();
    if (r.status() != TransferStatus::Verified)
      continue;
    auto rate = r.throughputMiBps();
    if (!rate)
      continue;
    sum += *rate;
    ++n;
    stats.minimumMiBps =
        stats.minimumMiBps ? std::min(*stats.minimumMiBps, *rate) : *rate;
    stats.maximumMiBps =
        stats.maximumMiBps ? std::max(*stats.maximumMiBps, *rate) : *rate;
  }
  if (n > 0)
    stats.averageMiBps = sum / static_cast<double>(n);
  return stats;
}

FormatStatus IngestionReport::formatStatus() const {
  FormatStatus status;
  status.safe = safeToFormat();
  status.verifiedCount = verifiedCount();
  status.failedCount = failedCount();
  status.mismatchCount = mismatchCount();
  status.badge = status.safe ? SAFE_TO_FORMAT_BADGE : DO_NOT_FORMAT_BADGE;

  if (records_.empty()) {
    status.reason = "No files matched; nothing to offload";
  } else if (status.safe) {
    status.reason = "All " + std::to_string(records_.size()) +
                    " transfers copied and verified with " +
                    algorithmToString(algorithm_);
  } else {
    std::size_t bad = records_.size() - status.verifiedCount;
    status.reason =
        std::to_string(bad) + " transfer(s) failed or did not verify";
    if (cancelled_)
      status.reason += " (run cancelled)";
  }
  return status;
}

std::vector<std::string> IngestionReport::doNotFormatReasons() const {
  std::vector<std::string> reasons;
  for (const auto &r : records_) {
    if (r.status() == TransferStatus::Verified)
      continue;
    std::string line = r.source().relativePath + " -> " +
                       r.destination().path + ": " +
                       transferStatusToString(r.status());
    if (!r.errorDetail().empty())
      line += ": " + r.errorDetail();
    reasons.push_back(std::move(line));
  }
  return reasons;
}

nlohmann::json IngestionReport::toJson() const {
  nlohmann::json j;
  j["project_id"] = projectId_.empty() ? nlohmann::json() : nlohmann::json(projectId_);
  j["shoot_day"] = shootDay_.empty() ? nlohmann::json() : nlohmann::json(shootDay_);
  j["source"] = sourceRoot_;
  j["destinations"] = destinationRoots_;
  j["algorithm"] = algorithmToString(algorithm_);
  j["overwrite_policy"] = policy_ ? nlohmann::json(overwritePolicyToString(*policy_))
                                  : nlohmann::json();
  j["started_at"] = formatIso8601(startedAt_);
  j["finished_at"] = formatIso8601(finishedAt_);
  j["elapsed_seconds"] = elapsedSeconds();

  j["records"] = nlohmann::json::array();
  for (const auto &r : records_)
    j["records"].push_back(r.toJson());

  auto stats = throughput();
  j["summary"] = {{"total", records_.size()},
                  {"verified", verifiedCount()},
                  {"mismatched", mismatchCount()},
                  {"failed", failedCount()},
                  {"reused_existing", reusedCount()},
                  {"total_bytes_copied", stats.totalBytesCopied},
                  {"avg_mib_s", optionalNumber(stats.averageMiBps)},
                  {"min_mib_s", optionalNumber(stats.minimumMiBps)},
                  {"max_mib_s", optionalNumber(stats.maximumMiBps)}};

  auto status = formatStatus().toJson();
  status["do_not_format_reasons"] = doNotFormatReasons();
  j["status"] = std::move(status);
  j["ledger"] = ledger_.toJson();
  j["cancelled"] = cancelled_;
  return j;
}

void IngestionReport::save(const std::string &path) const {
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open())
    throw std::runtime_error("Cannot write report " + path);
  out << toJson().dump(2) << "\n";
  if (!out)
    throw std::runtime_error("Failed writing report " + path);
}

std::string IngestionReport::renderSummary() const {
  auto status = formatStatus();
  auto stats = throughput();
  std::ostringstream out;
  out << "Offload " << sourceRoot_ << "\n";
  for (const auto &d : destinationRoots_)
    out << "  -> " << d << "\n";
  if (!projectId_.empty())
    out << "Project: " << projectId_ << "\n";
  if (!shootDay_.empty())
    out << "Shoot day: " << shootDay_ << "\n";
  out << "Transfers: " << records_.size() << " (verified " << status.verifiedCount
      << ", mismatched " << status.mismatchCount << ", failed "
      << status.failedCount << ", reused " << reusedCount() << ")\n";
  out << "Copied: " << stats.totalBytesCopied << " bytes in " << std::fixed
      << std::setprecision(1) << elapsedSeconds() << " s\n";
  out << "Speed: avg " << formatMiBps(stats.averageMiBps) << ", min "
      << formatMiBps(stats.minimumMiBps) << ", max "
      << formatMiBps(stats.maximumMiBps) << "\n";
  if (!ledger_.path.empty()) {
    out << "Audit ledger: " << ledger_.path << " ("
        << ledgerOpenStatusToString(ledger_.openStatus) << ")\n";
    if (ledger_.openStatus == LedgerOpenStatus::Reset)
      out << "  WARNING: " << ledger_.notice << "\n";
  }
  out << "\n" << status.badge << ": " << status.reason << "\n";
  for (const auto &line : doNotFormatReasons())
    out << "  - " << line << "\n";
  return out.str();
}

} // namespace ingestvault
