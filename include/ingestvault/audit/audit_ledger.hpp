#ifndef INGESTVAULT_AUDIT_LEDGER_HPP
#define INGESTVAULT_AUDIT_LEDGER_HPP

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ingestvault {

enum class AuditOperation { RunStart, TransferComplete, RunEnd, RunAborted };

std::string auditOperationToString(AuditOperation op);
std::optional<AuditOperation> parseAuditOperation(const std::string &name);

/**
 * @brief One link of the audit chain.
 *
 * digest = SHA-256(sequence 0x1f timestamp 0x1f operation 0x1f payload 0x1f
 * previousDigest). The payload is kept as the exact JSON text that was
 * hashed.
 */
struct AuditEntry {
  std::uint64_t sequence = 0;
  std::string timestamp;
  std::string operation;
  std::string payload;
  std::string previousDigest;
  std::string digest;

  nlohmann::json toJson() const;
  /** @throw OffloadException (LedgerCorrupt) on missing or mistyped fields. */
  static AuditEntry fromJson(const nlohmann::json &j);
  /** Parsed payload, or null if it is not valid JSON. */
  nlohmann::json payloadJson() const;
};

/**
 * @brief Outcome of a read-only replay of the chain.
 */
struct LedgerVerifyResult {
  bool intact = true;
  /// Position of the first entry whose link or digest does not hold.
  std::optional<std::uint64_t> firstDivergence;
  std::size_t entriesChecked = 0;
  std::string detail;
};

enum class LedgerOpenStatus {
  InMemory, ///< No backing file
  Created,  ///< No file existed; a new chain starts at genesis
  Loaded,   ///< Existing file replayed and verified; appends continue it
  Reset     ///< Existing file unreadable or broken; new chain at genesis
};

std::string ledgerOpenStatusToString(LedgerOpenStatus status);

/**
 * @brief Append-only, hash-chained record of offload lifecycle events.
 *
 * Many workers may post() concurrently; one writer thread drains the queue,
 * assigns sequence numbers, links each entry to its predecessor and persists
 * it as one JSON line before fulfilling the caller's future. A persistence
 * failure poisons the ledger: that append and every later one fail with
 * LedgerWriteFailed.
 */
class AuditLedger {
public:
  static const std::string GENESIS_DIGEST;

  /**
   * @brief Open (or create) a ledger.
   *
   * An existing file is replayed and verified. A file that cannot be read,
   * parsed or verified is moved aside and the chain restarts at genesis;
   * openStatus() then reports Reset and openNotice() says why.
   *
   * @param path Backing JSON Lines file; empty keeps the ledger in memory.
   */
  explicit AuditLedger(std::string path = "");
  virtual ~AuditLedger();

  AuditLedger(const AuditLedger &) = delete;
  AuditLedger &operator=(const AuditLedger &) = delete;

  /** Start the writer thread. Idempotent. */
  void start();
  /** Drain pending appends and stop the writer thread. */
  void stop();

  /**
   * @brief Queue an entry for the writer thread.
   *
   * Starts the writer if needed. The future yields the stored entry or
   * throws OffloadException (LedgerWriteFailed).
   */
  std::future<AuditEntry> post(AuditOperation op, nlohmann::json payload);

  /** post() and wait. */
  AuditEntry append(AuditOperation op, nlohmann::json payload);

  /** False once any append failed to persist. */
  bool healthy() const;

  std::vector<AuditEntry> entries() const;
  std::size_t size() const;
  std::string headDigest() const;
  LedgerVerifyResult verify() const;

  std::vector<AuditEntry> entriesByOperation(AuditOperation op) const;
  /** Entries whose payload names path as "source" or "destination". */
  std::vector<AuditEntry> entriesForPath(const std::string &path) const;

  const std::string &path() const { return path_; }
  LedgerOpenStatus openStatus() const { return openStatus_; }
  const std::string &openNotice() const { return openNotice_; }

  static std::string computeDigest(const AuditEntry &entry);
  static LedgerVerifyResult verifyEntries(const std::vector<AuditEntry> &entries);

  /**
   * @brief Replay a ledger file without modifying it.
   * @throw std::runtime_error if the file cannot be opened.
   * @throw OffloadException (LedgerCorrupt) on a malformed line.
   */
  static std::vector<AuditEntry> loadFile(const std::string &path);

  /** Structured export for handoff packages. */
  static nlohmann::json exportEntries(const std::vector<AuditEntry> &entries);
  nlohmann::json exportJson() const;

  /** Human-readable chain-of-custody report. */
  static std::string renderCustodyReport(const std::vector<AuditEntry> &entries);
  std::string renderCustodyReport() const;

protected:
  /**
   * @brief Write one entry to the backing file and sync it.
   *
   * Runs on the writer thread. A subclass overriding it must call stop() in
   * its own destructor.
   * @throw std::system_error on any I/O failure.
   */
  virtual void persist(const AuditEntry &entry);

private:
  struct PendingAppend {
    AuditOperation op = AuditOperation::RunStart;
    std::string payload;
    std::promise<AuditEntry> promise;
  };

  void openExisting();
  void openBackingFile();
  void startWriter();
  void writerLoop();

  std::string path_;
  LedgerOpenStatus openStatus_ = LedgerOpenStatus::InMemory;
  std::string openNotice_;
  int fd_ = -1;

  /// Serializes start/stop against post so nothing is queued on a writer
  /// that is shutting down.
  std::mutex lifecycleMutex_;
  mutable std::mutex mutex_;
  std::condition_variable queueCv_;
  std::deque<PendingAppend> queue_;
  std::vector<AuditEntry> entries_;
  bool running_ = false;
  bool stopping_ = false;
  bool failed_ = false;
  std::string failure_;
  std::thread writer_;
};

} // namespace ingestvault

#endif // INGESTVAULT_AUDIT_LEDGER_HPP
