#ifndef INGESTVAULT_ERRORS_HPP
#define INGESTVAULT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ingestvault {

/**
 * @brief Classification of every failure the offload core can report.
 *
 * Per-file kinds end up inside a TransferRecord; run-level kinds escape
 * OffloadScheduler::run() as an OffloadException.
 */
enum class ErrorKind {
  SourceUnreadable,
  DestinationUnwritable,
  ChecksumAlgorithmUnsupported,
  VerificationMismatch,
  InsufficientSpace,
  LedgerCorrupt,
  LedgerWriteFailed,
  Cancelled,
  TimedOut
};

/** Stable snake_case name used in reports and ledger payloads. */
std::string errorKindToString(ErrorKind kind);

/**
 * @brief Exception carrying an ErrorKind.
 */
class OffloadException : public std::runtime_error {
public:
  OffloadException(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

/** Thrown on API misuse (feeding a finalized stream, status regression). */
class InvalidUseError : public std::logic_error {
public:
  explicit InvalidUseError(const std::string &message)
      : std::logic_error(message) {}
};

} // namespace ingestvault

#endif // INGESTVAULT_ERRORS_HPP
