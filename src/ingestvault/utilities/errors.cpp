#include "ingestvault/utilities/errors.hpp"

namespace ingestvault {

std::string errorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::SourceUnreadable:
    return "source_unreadable";
  case ErrorKind::DestinationUnwritable:
    return "destination_unwritable";
  case ErrorKind::ChecksumAlgorithmUnsupported:
    return "checksum_algorithm_unsupported";
  case ErrorKind::VerificationMismatch:
    return "verification_mismatch";
  case ErrorKind::InsufficientSpace:
    return "insufficient_space";
  case ErrorKind::LedgerCorrupt:
    return "ledger_corrupt";
  case ErrorKind::LedgerWriteFailed:
    return "ledger_write_failed";
  case ErrorKind::Cancelled:
    return "cancelled";
  case ErrorKind::TimedOut:
    return "timed_out";
  }
  return "unknown";
}

} // namespace ingestvault
