#include "ingestvault/audit/ledger_verifier.hpp"
#include "ingestvault/utilities/metrics.h"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace ingestvault;
using testsupport::TempDir;

namespace {

std::string writeLedger(const TempDir &dir, int entries) {
  std::string path = dir / "ledger.jsonl";
  AuditLedger ledger(path);
  for (int i = 0; i < entries; ++i)
    ledger.append(AuditOperation::TransferComplete, {{"i", i}});
  return path;
}

void rewrite(const std::string &path, const std::vector<AuditEntry> &entries) {
  std::string text;
  for (const auto &e : entries)
    text += e.toJson().dump() + "\n";
  testsupport::writeFile(path, text);
}

} // namespace

TEST(LedgerVerifier, IntactFileVerifies) {
  TempDir dir;
  auto path = writeLedger(dir, 5);
  MetricsRegistry::instance().reset();

  LedgerVerifier verifier(path);
  auto result = verifier.verifyOnce();
  EXPECT_TRUE(result.intact);
  EXPECT_EQ(result.entriesChecked, 5u);
  EXPECT_TRUE(verifier.lastResult().intact);
  EXPECT_DOUBLE_EQ(MetricsRegistry::instance().gaugeValue(
                       "ingestvault_ledger_intact", {{"path", path}}),
                   1.0);
}

TEST(LedgerVerifier, ReportsFirstTamperedSequence) {
  TempDir dir;
  auto path = writeLedger(dir, 6);
  auto entries = AuditLedger::loadFile(path);
  entries[4].payload = "{\"i\":40}";
  rewrite(path, entries);

  auto result = verifyLedgerFile(path);
  EXPECT_FALSE(result.intact);
  ASSERT_TRUE(result.firstDivergence.has_value());
  EXPECT_EQ(*result.firstDivergence, 4u);
}

TEST(LedgerVerifier, VerificationNeverModifiesTheFile) {
  TempDir dir;
  auto path = writeLedger(dir, 3);
  auto entries = AuditLedger::loadFile(path);
  entries[1].timestamp = "2000-01-01T00:00:00.000Z";
  rewrite(path, entries);
  const std::string before = testsupport::readFile(path);

  EXPECT_FALSE(verifyLedgerFile(path).intact);
  EXPECT_EQ(testsupport::readFile(path), before);
}

TEST(LedgerVerifier, UnparseableLineDivergesWhereReplayStopped) {
  TempDir dir;
  auto path = writeLedger(dir, 3);
  std::string text = testsupport::readFile(path);
  testsupport::writeFile(path, text + "{truncated\n");

  auto result = verifyLedgerFile(path);
  EXPECT_FALSE(result.intact);
  ASSERT_TRUE(result.firstDivergence.has_value());
  EXPECT_EQ(*result.firstDivergence, 3u);
}

TEST(LedgerVerifier, MissingFileThrows) {
  EXPECT_THROW(verifyLedgerFile("/nonexistent/ledger.jsonl"), std::runtime_error);
}
