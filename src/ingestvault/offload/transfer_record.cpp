#include "ingestvault/offload/transfer_record.hpp"

namespace ingestvault {

std::string transferStatusToString(TransferStatus status) {
  switch (status) {
  case TransferStatus::Pending:
    return "pending";
  case TransferStatus::Copying:
    return "copying";
  case TransferStatus::Verifying:
    return "verifying";
  case TransferStatus::Verified:
    return "verified";
  case TransferStatus::VerificationMismatch:
    return "verification_mismatch";
  case TransferStatus::Failed:
    return "failed";
  }
  return "unknown";
}

bool isTerminal(TransferStatus status) {
  return status == TransferStatus::Verified ||
         status == TransferStatus::VerificationMismatch ||
         status == TransferStatus::Failed;
}

static int statusRank(TransferStatus status) {
  switch (status) {
  case TransferStatus::Pending:
    return 0;
  case TransferStatus::Copying:
    return 1;
  case TransferStatus::Verifying:
    return 2;
  default:
    return 3;
  }
}

TransferRecord::TransferRecord(SourceFile source, DestinationTarget destination)
    : source_(std::move(source)), destination_(std::move(destination)) {}

double TransferRecord::elapsedSeconds() const {
  if (startedAt_ == TimePoint{} || finishedAt_ == TimePoint{})
    return 0.0;
  return secondsBetween(startedAt_, finishedAt_);
}

std::optional<double> TransferRecord::throughputMiBps() const {
  double seconds = elapsedSeconds();
  if (bytesCopied_ == 0 || seconds <= 0.0)
    return std::nullopt;
  return (static_cast<double>(bytesCopied_) / (1024.0 * 1024.0)) / seconds;
}

void TransferRecord::requireMutable(const char *what) const {
  if (terminal()) {
    throw InvalidUseError(std::string(what) + " on terminal transfer " +
                          source_.relativePath + " -> " + destination_.path);
  }
}

void TransferRecord::markStarted(TimePoint when) {
  requireMutable("markStarted");
  startedAt_ = when;
}

void TransferRecord::advance(TransferStatus next) {
  requireMutable("advance");
  if (statusRank(next) <= statusRank(status_)) {
    throw InvalidUseError("Transfer status cannot move from " +
                          transferStatusToString(status_) + " to " +
                          transferStatusToString(next));
  }
  status_ = next;
}

void TransferRecord::setSourceDigest(ChecksumDigest digest) {
  requireMutable("setSourceDigest");
  sourceDigest_ = std::move(digest);
}

void TransferRecord::setDestinationDigest(ChecksumDigest digest) {
  requireMutable("setDestinationDigest");
  destinationDigest_ = std::move(digest);
}

void TransferRecord::addBytesCopied(std::uint64_t bytes) {
  requireMutable("addBytesCopied");
  bytesCopied_ += bytes;
}

void TransferRecord::setReusedExisting(bool reused) {
  requireMutable("setReusedExisting");
  reusedExisting_ = reused;
}

void TransferRecord::complete(TransferStatus terminalStatus, TimePoint when) {
  if (!isTerminal(terminalStatus)) {
    throw InvalidUseError("complete() needs a terminal status, got " +
                          transferStatusToString(terminalStatus));
  }
  advance(terminalStatus);
  finishedAt_ = when;
}

void TransferRecord::fail(ErrorKind kind, const std::string &detail,
                          TimePoint when) {
  requireMutable("fail");
  errorKind_ = kind;
  errorDetail_ = detail;
  complete(TransferStatus::Failed, when);
}

void TransferRecord::mismatch(const std::string &detail, TimePoint when) {
  requireMutable("mismatch");
  errorKind_ = ErrorKind::VerificationMismatch;
  errorDetail_ = detail;
  complete(TransferStatus::VerificationMismatch, when);
}

nlohmann::json TransferRecord::toJson() const {
  nlohmann::json j;
  j["source"] = source_.relativePath;
  j["size_bytes"] = source_.sizeBytes;
  j["destination_root"] = destination_.root;
  j["destination"] = destination_.path;
  j["status"] = transferStatusToString(status_);
  j["algorithm"] = sourceDigest_
                       ? nlohmann::json(algorithmToString(sourceDigest_->algorithm))
                       : nlohmann::json();
  j["source_digest"] = sourceDigest_ ? nlohmann::json(sourceDigest_->hex)
                                     : nlohmann::json();
  j["destination_digest"] = destinationDigest_
                                ? nlohmann::json(destinationDigest_->hex)
                                : nlohmann::json();
  j["bytes_copied"] = bytesCopied_;
  j["started_at"] = startedAt_ == TimePoint{} ? nlohmann::json()
                                              : nlohmann::json(formatIso8601(startedAt_));
  j["finished_at"] = finishedAt_ == TimePoint{}
                         ? nlohmann::json()
                         : nlohmann::json(formatIso8601(finishedAt_));
  j["elapsed_seconds"] = elapsedSeconds();
  auto speed = throughputMiBps();
  j["throughput_mib_s"] = speed ? nlohmann::json(*speed) : nlohmann::json();
  j["error_kind"] = errorKind_ ? nlohmann::json(errorKindToString(*errorKind_))
                               : nlohmann::json();
  j["error"] = errorDetail_.empty() ? nlohmann::json() : nlohmann::json(errorDetail_);
  j["reused_existing"] = reusedExisting_;
  return j;
}

} // namespace ingestvault
