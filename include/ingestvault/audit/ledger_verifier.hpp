#ifndef INGESTVAULT_LEDGER_VERIFIER_HPP
#define INGESTVAULT_LEDGER_VERIFIER_HPP

#include "ingestvault/audit/audit_ledger.hpp"
#include <string>

namespace ingestvault {

/**
 * @brief Read-only verification of a ledger file on disk.
 *
 * Never opens the file for writing and never repairs it. A file that cannot
 * be parsed is reported as not intact at the position of the first bad line.
 */
class LedgerVerifier {
public:
  explicit LedgerVerifier(std::string path);

  /** Replay and verify the whole file once. */
  LedgerVerifyResult verifyOnce();

  /** Result of the most recent verifyOnce(). */
  const LedgerVerifyResult &lastResult() const { return last_; }
  const std::string &path() const { return path_; }

private:
  std::string path_;
  LedgerVerifyResult last_;
};

/**
 * @brief Convenience wrapper around LedgerVerifier::verifyOnce().
 * @throw std::runtime_error if the file cannot be opened.
 */
LedgerVerifyResult verifyLedgerFile(const std::string &path);

} // namespace ingestvault

#endif // INGESTVAULT_LEDGER_VERIFIER_HPP
