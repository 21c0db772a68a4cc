#include "ingestvault/audit/ledger_verifier.hpp"
#include "ingestvault/utilities/errors.hpp"
#include "ingestvault/utilities/logger.h"
#include "ingestvault/utilities/metrics.h"

#include <fstream>
#include <stdexcept>

namespace ingestvault {

LedgerVerifier::LedgerVerifier(std::string path) : path_(std::move(path)) {}

LedgerVerifyResult LedgerVerifier::verifyOnce() {
  std::ifstream in(path_);
  if (!in.is_open())
    throw std::runtime_error("Cannot open ledger " + path_);

  std::vector<AuditEntry> entries;
  std::string line;
  std::string parseError;
  while (std::getline(in, line)) {
    if (line.empty())
      continue;
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      parseError = "entry is not valid JSON";
      break;
    }
    try {
      entries.push_back(AuditEntry::fromJson(j));
    } catch (const OffloadException &e) {
      parseError = e.what();
      break;
    }
  }

  LedgerVerifyResult result = AuditLedger::verifyEntries(entries);
  // An unparseable entry cannot be trusted; it diverges where replay stopped.
  if (result.intact && !parseError.empty()) {
    result.intact = false;
    result.firstDivergence = entries.size();
    result.entriesChecked = entries.size() + 1;
    result.detail = parseError;
  }

  MetricsRegistry::instance().setGauge("ingestvault_ledger_intact",
                                       result.intact ? 1.0 : 0.0,
                                       {{"path", path_}});
  if (result.intact) {
    Logger::getInstance().log(LogLevel::INFO, "Ledger chain intact",
                              {{"path", path_},
                               {"entries", result.entriesChecked}});
  } else {
    Logger::getInstance().log(LogLevel::ERROR, "Ledger chain broken",
                              {{"path", path_},
                               {"sequence", *result.firstDivergence},
                               {"detail", result.detail}});
  }
  last_ = result;
  return result;
}

LedgerVerifyResult verifyLedgerFile(const std::string &path) {
  LedgerVerifier verifier(path);
  return verifier.verifyOnce();
}

} // namespace ingestvault
