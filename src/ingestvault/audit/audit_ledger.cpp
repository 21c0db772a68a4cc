#include "ingestvault/audit/audit_ledger.hpp"
#include "ingestvault/utilities/checksum_stream.hpp"
#include "ingestvault/utilities/errors.hpp"
#include "ingestvault/utilities/logger.h"
#include "ingestvault/utilities/timestamp.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace ingestvault {

const std::string AuditLedger::GENESIS_DIGEST(64, '0');

std::string auditOperationToString(AuditOperation op) {
  switch (op) {
  case AuditOperation::RunStart:
    return "run_start";
  case AuditOperation::TransferComplete:
    return "transfer_complete";
  case AuditOperation::RunEnd:
    return "run_end";
  case AuditOperation::RunAborted:
    return "run_aborted";
  }
  return "unknown";
}

std::optional<AuditOperation> parseAuditOperation(const std::string &name) {
  if (name == "run_start")
    return AuditOperation::RunStart;
  if (name == "transfer_complete")
    return AuditOperation::TransferComplete;
  if (name == "run_end")
    return AuditOperation::RunEnd;
  if (name == "run_aborted")
    return AuditOperation::RunAborted;
  return std::nullopt;
}

std::string ledgerOpenStatusToString(LedgerOpenStatus status) {
  switch (status) {
  case LedgerOpenStatus::InMemory:
    return "in_memory";
  case LedgerOpenStatus::Created:
    return "created";
  case LedgerOpenStatus::Loaded:
    return "loaded";
  case LedgerOpenStatus::Reset:
    return "reset";
  }
  return "unknown";
}

nlohmann::json AuditEntry::toJson() const {
  return nlohmann::json{{"sequence", sequence},
                        {"timestamp", timestamp},
                        {"operation", operation},
                        {"payload", payload},
                        {"previous_digest", previousDigest},
                        {"digest", digest}};
}

AuditEntry AuditEntry::fromJson(const nlohmann::json &j) {
  try {
    AuditEntry e;
    e.sequence = j.at("sequence").get<std::uint64_t>();
    e.timestamp = j.at("timestamp").get<std::string>();
    e.operation = j.at("operation").get<std::string>();
    e.payload = j.at("payload").get<std::string>();
    e.previousDigest = j.at("previous_digest").get<std::string>();
    e.digest = j.at("digest").get<std::string>();
    return e;
  } catch (const nlohmann::json::exception &ex) {
    throw OffloadException(ErrorKind::LedgerCorrupt,
                           std::string("Malformed ledger entry: ") + ex.what());
  }
}

nlohmann::json AuditEntry::payloadJson() const {
  return nlohmann::json::parse(payload, nullptr, false);
}

AuditLedger::AuditLedger(std::string path) : path_(std::move(path)) {
  openExisting();
}

AuditLedger::~AuditLedger() {
  stop();
  if (fd_ >= 0)
    ::close(fd_);
}

void AuditLedger::openExisting() {
  if (path_.empty()) {
    openStatus_ = LedgerOpenStatus::InMemory;
    return;
  }

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec) && !ec) {
    openStatus_ = LedgerOpenStatus::Created;
    openNotice_ = "No ledger at " + path_ + "; starting a new chain";
    return;
  }

  std::string reason;
  try {
    auto loaded = loadFile(path_);
    auto result = verifyEntries(loaded);
    if (result.intact) {
      entries_ = std::move(loaded);
      openStatus_ = LedgerOpenStatus::Loaded;
      openNotice_ = "Carried over " + std::to_string(entries_.size()) +
                    " entries from " + path_;
      Logger::getInstance().log(LogLevel::INFO, openNotice_);
      return;
    }
    reason = "chain broken at sequence " +
             std::to_string(*result.firstDivergence) + ": " + result.detail;
  } catch (const OffloadException &e) {
    reason = e.what();
  } catch (const std::runtime_error &e) {
    reason = e.what();
  }

  openStatus_ = LedgerOpenStatus::Reset;
  std::string aside =
      path_ + ".unreadable-" + formatCompactUtc(SystemClock::now());
  if (std::rename(path_.c_str(), aside.c_str()) == 0) {
    openNotice_ = "Ledger " + path_ + " could not be carried over (" + reason +
                  "); moved to " + aside + " and started a new chain";
  } else {
    openNotice_ = "Ledger " + path_ + " could not be carried over (" + reason +
                  ") and could not be moved aside (" + std::strerror(errno) +
                  "); appends will fail";
  }
  Logger::getInstance().log(LogLevel::WARN, openNotice_);
}

void AuditLedger::openBackingFile() {
  auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
  int flags = O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC;
  // Never append a fresh chain onto a file that failed to replay.
  if (openStatus_ == LedgerOpenStatus::Reset)
    flags |= O_EXCL;
  fd_ = ::open(path_.c_str(), flags, 0644);
  if (fd_ < 0) {
    failed_ = true;
    failure_ = "Cannot open ledger " + path_ + ": " + std::strerror(errno);
    Logger::getInstance().log(LogLevel::ERROR, failure_);
  }
}

void AuditLedger::start() {
  std::lock_guard<std::mutex> life(lifecycleMutex_);
  startWriter();
}

void AuditLedger::startWriter() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_)
    return;
  if (!path_.empty() && fd_ < 0 && !failed_)
    openBackingFile();
  stopping_ = false;
  running_ = true;
  writer_ = std::thread(&AuditLedger::writerLoop, this);
}

void AuditLedger::stop() {
  std::lock_guard<std::mutex> life(lifecycleMutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_)
      return;
    stopping_ = true;
  }
  queueCv_.notify_all();
  if (writer_.joinable())
    writer_.join();
  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
}

std::future<AuditEntry> AuditLedger::post(AuditOperation op,
                                          nlohmann::json payload) {
  // Held until the item is queued: stop() cannot retire the writer between
  // the start check and the push.
  std::lock_guard<std::mutex> life(lifecycleMutex_);
  startWriter();

  PendingAppend pending;
  pending.op = op;
  pending.payload = payload.dump(-1, ' ', false,
                                 nlohmann::json::error_handler_t::replace);
  auto future = pending.promise.get_future();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failed_) {
      pending.promise.set_exception(std::make_exception_ptr(
          OffloadException(ErrorKind::LedgerWriteFailed, failure_)));
      return future;
    }
    queue_.push_back(std::move(pending));
  }
  queueCv_.notify_one();
  return future;
}

AuditEntry AuditLedger::append(AuditOperation op, nlohmann::json payload) {
  return post(op, std::move(payload)).get();
}

void AuditLedger::writerLoop() {
  for (;;) {
    PendingAppend item;
    AuditEntry entry;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      queueCv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (queue_.empty())
        return;
      item = std::move(queue_.front());
      queue_.pop_front();
      if (failed_) {
        item.promise.set_exception(std::make_exception_ptr(
            OffloadException(ErrorKind::LedgerWriteFailed, failure_)));
        continue;
      }
      entry.sequence = entries_.size();
      entry.previousDigest =
          entries_.empty() ? GENESIS_DIGEST : entries_.back().digest;
    }

    entry.timestamp = formatIso8601(SystemClock::now());
    entry.operation = auditOperationToString(item.op);
    entry.payload = std::move(item.payload);
    entry.digest = computeDigest(entry);

    try {
      persist(entry);
    } catch (const std::system_error &e) {
      std::string message = std::string("Ledger append failed: ") + e.what();
      {
        std::lock_guard<std::mutex> lock(mutex_);
        failed_ = true;
        failure_ = message;
      }
      Logger::getInstance().log(LogLevel::FATAL, message,
                                {{"sequence", entry.sequence}});
      item.promise.set_exception(std::make_exception_ptr(
          OffloadException(ErrorKind::LedgerWriteFailed, message)));
      continue;
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      entries_.push_back(entry);
    }
    item.promise.set_value(std::move(entry));
  }
}

void AuditLedger::persist(const AuditEntry &entry) {
  if (path_.empty())
    return;
  if (fd_ < 0)
    throw std::system_error(EBADF, std::generic_category(),
                            "ledger " + path_ + " is not open");
  std::string line = entry.toJson().dump() + "\n";
  std::size_t done = 0;
  while (done < line.size()) {
    ssize_t n = ::write(fd_, line.data() + done, line.size() - done);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(),
                              "write " + path_);
    }
    done += static_cast<std::size_t>(n);
  }
  if (::fdatasync(fd_) != 0)
    throw std::system_error(errno, std::generic_category(), "sync " + path_);
}

bool AuditLedger::healthy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !failed_;
}

std::vector<AuditEntry> AuditLedger::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

std::size_t AuditLedger::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::string AuditLedger::headDigest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.empty() ? GENESIS_DIGEST : entries_.back().digest;
}

LedgerVerifyResult AuditLedger::verify() const {
  return verifyEntries(entries());
}

std::vector<AuditEntry>
AuditLedger::entriesByOperation(AuditOperation op) const {
  std::string name = auditOperationToString(op);
  std::vector<AuditEntry> out;
  for (const auto &e : entries()) {
    if (e.operation == name)
      out.push_back(e);
  }
  return out;
}

std::vector<AuditEntry>
AuditLedger::entriesForPath(const std::string &path) const {
  std::vector<AuditEntry> out;
  for (const auto &e : entries()) {
    auto payload = e.payloadJson();
    if (!payload.is_object())
      continue;
    for (const char *key : {"source", "destination"}) {
      auto it = payload.find(key);
      if (it != payload.end() && it->is_string() &&
          it->get<std::string>() == path) {
        out.push_back(e);
        break;
      }
    }
  }
  return out;
}

std::string AuditLedger::computeDigest(const AuditEntry &entry) {
  static const std::string sep(1, '\x1f');
  ChecksumStream hasher(ChecksumAlgorithm::SHA256);
  hasher.feed(std::to_string(entry.sequence));
  hasher.feed(sep);
  hasher.feed(entry.timestamp);
  hasher.feed(sep);
  hasher.feed(entry.operation);
  hasher.feed(sep);
  hasher.feed(entry.payload);
  hasher.feed(sep);
  hasher.feed(entry.previousDigest);
  return hasher.finalize().hex;
}

LedgerVerifyResult
AuditLedger::verifyEntries(const std::vector<AuditEntry> &entries) {
  LedgerVerifyResult result;
  std::string prev = GENESIS_DIGEST;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const auto &e = entries[i];
    result.entriesChecked = i + 1;

    std::string problem;
    if (e.sequence != i) {
      problem = "sequence field is " + std::to_string(e.sequence) +
                ", expected " + std::to_string(i);
    } else if (e.previousDigest != prev) {
      problem = "previous digest does not match the preceding entry";
    } else if (computeDigest(e) != e.digest) {
      problem = "stored digest does not match recomputed digest";
    }

    if (!problem.empty()) {
      result.intact = false;
      result.firstDivergence = i;
      result.detail = problem;
      return result;
    }
    prev = e.digest;
  }
  return result;
}

std::vector<AuditEntry> AuditLedger::loadFile(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throw std::runtime_error("Cannot open ledger " + path + ": " +
                             std::strerror(errno));

  std::vector<AuditEntry> out;
  std::string line;
  std::size_t lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    if (line.empty())
      continue;
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      throw OffloadException(ErrorKind::LedgerCorrupt,
                             "Ledger " + path + " line " +
                                 std::to_string(lineNo) + " is not valid JSON");
    }
    out.push_back(AuditEntry::fromJson(j));
  }
  if (in.bad())
    throw std::runtime_error("Read error on ledger " + path);
  return out;
}

nlohmann::json
AuditLedger::exportEntries(const std::vector<AuditEntry> &entries) {
  auto check = verifyEntries(entries);
  nlohmann::json out;
  out["log_version"] = "1.0";
  out["exported_at"] = formatIso8601(SystemClock::now());
  out["entry_count"] = entries.size();
  out["head_digest"] = entries.empty() ? GENESIS_DIGEST : entries.back().digest;
  out["chain_intact"] = check.intact;
  out["first_divergence"] = check.firstDivergence
                                ? nlohmann::json(*check.firstDivergence)
                                : nlohmann::json();
  out["entries"] = nlohmann::json::array();
  for (const auto &e : entries) {
    auto j = e.toJson();
    j["event"] = e.payloadJson();
    out["entries"].push_back(std::move(j));
  }
  return out;
}

nlohmann::json AuditLedger::exportJson() const {
  return exportEntries(entries());
}

std::string
AuditLedger::renderCustodyReport(const std::vector<AuditEntry> &entries) {
  auto check = verifyEntries(entries);
  const std::string rule(80, '=');
  std::ostringstream out;
  out << rule << "\nCHAIN-OF-CUSTODY AUDIT REPORT\n" << rule << "\n\n";
  out << "Generated: " << formatIso8601(SystemClock::now()) << "\n";
  out << "Total Entries: " << entries.size() << "\n";
  if (check.intact) {
    out << "Chain Integrity: VALID\n";
  } else {
    out << "Chain Integrity: COMPROMISED at sequence " << *check.firstDivergence
        << " (" << check.detail << ")\n";
  }
  out << "\n" << rule << "\nAUDIT ENTRIES\n" << rule << "\n\n";

  for (const auto &e : entries) {
    out << "Sequence: " << e.sequence << "\n";
    out << "Timestamp: " << e.timestamp << "\n";
    out << "Operation: " << e.operation << "\n";
    auto payload = e.payloadJson();
    if (payload.is_object()) {
      for (const char *key :
           {"user", "hostname", "working_directory", "source", "destination",
            "status", "source_digest", "destination_digest", "error"}) {
        auto it = payload.find(key);
        if (it != payload.end() && !it->is_null())
          out << "  " << key << ": "
              << (it->is_string() ? it->get<std::string>() : it->dump())
              << "\n";
      }
    } else {
      out << "  payload: " << e.payload << "\n";
    }
    out << "Previous Digest: " << e.previousDigest << "\n";
    out << "Entry Digest: " << e.digest << "\n\n";
  }
  out << rule << "\nEND OF REPORT\n" << rule << "\n";
  return out.str();
}

std::string AuditLedger::renderCustodyReport() const {
  return renderCustodyReport(entries());
}

} // namespace ingestvault
