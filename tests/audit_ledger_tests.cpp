#include "ingestvault/audit/audit_ledger.hpp"
#include "ingestvault/utilities/errors.hpp"
#include "test_support.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <gtest/gtest.h>
#include <set>
#include <thread>
#include <vector>

using namespace ingestvault;
using testsupport::TempDir;

namespace fs = std::filesystem;

namespace {

void appendSampleRun(AuditLedger &ledger) {
  ledger.append(AuditOperation::RunStart, {{"source", "/card"}});
  ledger.append(AuditOperation::TransferComplete,
                {{"source", "a.mov"}, {"destination", "/d1/a.mov"},
                 {"status", "verified"}});
  ledger.append(AuditOperation::TransferComplete,
                {{"source", "b.wav"}, {"destination", "/d1/b.wav"},
                 {"status", "verified"}});
  ledger.append(AuditOperation::RunEnd, {{"safe_to_format", true}});
}

} // namespace

TEST(AuditLedger, FirstEntryChainsFromGenesis) {
  AuditLedger ledger;
  auto e = ledger.append(AuditOperation::RunStart, {{"k", "v"}});
  EXPECT_EQ(e.sequence, 0u);
  EXPECT_EQ(e.previousDigest, AuditLedger::GENESIS_DIGEST);
  EXPECT_EQ(e.previousDigest, std::string(64, '0'));
  EXPECT_EQ(e.operation, "run_start");
  EXPECT_EQ(e.digest.size(), 64u);
  EXPECT_EQ(e.digest, AuditLedger::computeDigest(e));
  EXPECT_EQ(ledger.openStatus(), LedgerOpenStatus::InMemory);
}

TEST(AuditLedger, EntriesLinkToPredecessor) {
  AuditLedger ledger;
  appendSampleRun(ledger);
  auto entries = ledger.entries();
  ASSERT_EQ(entries.size(), 4u);
  for (std::size_t i = 1; i < entries.size(); ++i) {
    EXPECT_EQ(entries[i].sequence, i);
    EXPECT_EQ(entries[i].previousDigest, entries[i - 1].digest);
  }
  EXPECT_EQ(ledger.headDigest(), entries.back().digest);
  EXPECT_TRUE(ledger.verify().intact);
}

TEST(AuditLedger, ConcurrentPostsGetUniqueSequentialNumbers) {
  AuditLedger ledger;
  const int threads = 8;
  const int perThread = 50;
  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([&ledger, t]() {
      std::vector<std::future<AuditEntry>> pending;
      for (int i = 0; i < perThread; ++i)
        pending.push_back(ledger.post(AuditOperation::TransferComplete,
                                      {{"worker", t}, {"i", i}}));
      for (auto &f : pending)
        f.get();
    });
  }
  for (auto &w : workers)
    w.join();

  auto entries = ledger.entries();
  ASSERT_EQ(entries.size(), static_cast<std::size_t>(threads * perThread));
  std::set<std::uint64_t> seen;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    EXPECT_EQ(entries[i].sequence, i);
    seen.insert(entries[i].sequence);
  }
  EXPECT_EQ(seen.size(), entries.size());
  EXPECT_TRUE(ledger.verify().intact);
}

TEST(AuditLedger, PostRacingStopAlwaysResolves) {
  AuditLedger ledger;
  std::atomic<bool> done{false};
  std::thread stopper([&]() {
    while (!done.load()) {
      ledger.stop();
      std::this_thread::yield();
    }
  });

  std::vector<std::future<AuditEntry>> pending;
  for (int i = 0; i < 500; ++i)
    pending.push_back(ledger.post(AuditOperation::TransferComplete, {{"i", i}}));
  std::size_t resolved = 0;
  for (auto &f : pending) {
    if (f.wait_for(std::chrono::seconds(5)) == std::future_status::ready)
      ++resolved;
  }
  done.store(true);
  stopper.join();

  EXPECT_EQ(resolved, pending.size());
  EXPECT_EQ(ledger.size(), 500u);
  EXPECT_TRUE(ledger.verify().intact);
}

TEST(AuditLedger, UnmodifiedLedgerVerifiesIntact) {
  AuditLedger ledger;
  appendSampleRun(ledger);
  auto result = AuditLedger::verifyEntries(ledger.entries());
  EXPECT_TRUE(result.intact);
  EXPECT_FALSE(result.firstDivergence.has_value());
  EXPECT_EQ(result.entriesChecked, 4u);
}

TEST(AuditLedger, TamperingAnyFieldIsReportedAtThatEntry) {
  AuditLedger ledger;
  appendSampleRun(ledger);
  const auto original = ledger.entries();

  using Mutator = void (*)(AuditEntry &);
  const std::vector<std::pair<const char *, Mutator>> mutators = {
      {"sequence", [](AuditEntry &e) { e.sequence += 7; }},
      {"timestamp", [](AuditEntry &e) { e.timestamp[0] = e.timestamp[0] == '1' ? '2' : '1'; }},
      {"operation", [](AuditEntry &e) { e.operation += "x"; }},
      {"payload", [](AuditEntry &e) { e.payload.back() = ' '; }},
      {"previous_digest", [](AuditEntry &e) { e.previousDigest[5] = e.previousDigest[5] == 'a' ? 'b' : 'a'; }},
      {"digest", [](AuditEntry &e) { e.digest[0] = e.digest[0] == 'f' ? 'e' : 'f'; }},
  };

  for (std::size_t k = 0; k < original.size(); ++k) {
    for (const auto &m : mutators) {
      auto copy = original;
      m.second(copy[k]);
      auto result = AuditLedger::verifyEntries(copy);
      EXPECT_FALSE(result.intact) << m.first << " at " << k;
      ASSERT_TRUE(result.firstDivergence.has_value());
      EXPECT_EQ(*result.firstDivergence, k) << m.first;
    }
  }
}

TEST(AuditLedger, PersistsOneJsonLinePerEntry) {
  TempDir dir;
  const std::string path = dir / "audit/ledger.jsonl";
  {
    AuditLedger ledger(path);
    EXPECT_EQ(ledger.openStatus(), LedgerOpenStatus::Created);
    appendSampleRun(ledger);
  }
  auto loaded = AuditLedger::loadFile(path);
  ASSERT_EQ(loaded.size(), 4u);
  EXPECT_EQ(loaded[1].payloadJson()["source"], "a.mov");
  EXPECT_TRUE(AuditLedger::verifyEntries(loaded).intact);
}

TEST(AuditLedger, ExistingLedgerIsCarriedOver) {
  TempDir dir;
  const std::string path = dir / "ledger.jsonl";
  std::string oldHead;
  {
    AuditLedger first(path);
    appendSampleRun(first);
    oldHead = first.headDigest();
  }
  AuditLedger second(path);
  EXPECT_EQ(second.openStatus(), LedgerOpenStatus::Loaded);
  EXPECT_EQ(second.size(), 4u);
  auto next = second.append(AuditOperation::RunStart, {{"source", "/card2"}});
  EXPECT_EQ(next.sequence, 4u);
  EXPECT_EQ(next.previousDigest, oldHead);
  second.stop();

  auto all = AuditLedger::loadFile(path);
  EXPECT_EQ(all.size(), 5u);
  EXPECT_TRUE(AuditLedger::verifyEntries(all).intact);
}

TEST(AuditLedger, UnreadableLedgerIsMovedAsideAndChainRestarts) {
  TempDir dir;
  const std::string path = dir / "ledger.jsonl";
  testsupport::writeFile(path, "this is not json\n");

  AuditLedger ledger(path);
  EXPECT_EQ(ledger.openStatus(), LedgerOpenStatus::Reset);
  EXPECT_NE(ledger.openNotice().find("moved to"), std::string::npos);
  EXPECT_EQ(ledger.size(), 0u);

  auto e = ledger.append(AuditOperation::RunStart, {{"source", "/card"}});
  EXPECT_EQ(e.sequence, 0u);
  EXPECT_EQ(e.previousDigest, AuditLedger::GENESIS_DIGEST);
  ledger.stop();

  int asideCount = 0;
  for (const auto &entry : fs::directory_iterator(dir.path())) {
    if (entry.path().filename().string().rfind("ledger.jsonl.unreadable-", 0) == 0) {
      ++asideCount;
      EXPECT_EQ(testsupport::readFile(entry.path().string()), "this is not json\n");
    }
  }
  EXPECT_EQ(asideCount, 1);
  EXPECT_EQ(AuditLedger::loadFile(path).size(), 1u);
}

TEST(AuditLedger, TamperedLedgerIsNotContinued) {
  TempDir dir;
  const std::string path = dir / "ledger.jsonl";
  {
    AuditLedger first(path);
    appendSampleRun(first);
  }
  auto entries = AuditLedger::loadFile(path);
  entries[2].payload = "{\"source\":\"forged.mov\"}";
  {
    std::string text;
    for (const auto &e : entries)
      text += e.toJson().dump() + "\n";
    testsupport::writeFile(path, text);
  }

  AuditLedger reopened(path);
  EXPECT_EQ(reopened.openStatus(), LedgerOpenStatus::Reset);
  EXPECT_NE(reopened.openNotice().find("sequence 2"), std::string::npos);
}

TEST(AuditLedger, MalformedEntryIsLedgerCorrupt) {
  TempDir dir;
  testsupport::writeFile(dir / "bad.jsonl", "{\"sequence\": 0}\n");
  try {
    AuditLedger::loadFile(dir / "bad.jsonl");
    FAIL() << "expected OffloadException";
  } catch (const OffloadException &e) {
    EXPECT_EQ(e.kind(), ErrorKind::LedgerCorrupt);
  }
  EXPECT_THROW(AuditLedger::loadFile(dir / "missing.jsonl"), std::runtime_error);
}

TEST(AuditLedger, PersistenceFailurePoisonsLedger) {
  TempDir dir;
  testsupport::writeFile(dir / "not_a_dir", "x");
  AuditLedger ledger(dir / "not_a_dir/ledger.jsonl");

  try {
    ledger.append(AuditOperation::RunStart, {{"source", "/card"}});
    FAIL() << "expected OffloadException";
  } catch (const OffloadException &e) {
    EXPECT_EQ(e.kind(), ErrorKind::LedgerWriteFailed);
  }
  EXPECT_FALSE(ledger.healthy());
  auto later = ledger.post(AuditOperation::RunEnd, {{"k", 1}});
  EXPECT_THROW(later.get(), OffloadException);
  EXPECT_EQ(ledger.size(), 0u);
}

TEST(AuditLedger, QueriesByOperationAndPath) {
  AuditLedger ledger;
  appendSampleRun(ledger);
  EXPECT_EQ(ledger.entriesByOperation(AuditOperation::TransferComplete).size(), 2u);
  EXPECT_EQ(ledger.entriesByOperation(AuditOperation::RunAborted).size(), 0u);

  auto forA = ledger.entriesForPath("a.mov");
  ASSERT_EQ(forA.size(), 1u);
  EXPECT_EQ(forA[0].sequence, 1u);
  EXPECT_EQ(ledger.entriesForPath("/d1/b.wav").size(), 1u);
  EXPECT_TRUE(ledger.entriesForPath("nothing").empty());
}

TEST(AuditLedger, StructuredExport) {
  AuditLedger ledger;
  appendSampleRun(ledger);
  auto j = ledger.exportJson();
  EXPECT_EQ(j["log_version"], "1.0");
  EXPECT_EQ(j["entry_count"], 4);
  EXPECT_EQ(j["head_digest"], ledger.headDigest());
  EXPECT_TRUE(j["chain_intact"].get<bool>());
  ASSERT_EQ(j["entries"].size(), 4u);
  EXPECT_EQ(j["entries"][1]["event"]["status"], "verified");

  // Exported entries replay to the same chain.
  std::vector<AuditEntry> replay;
  for (const auto &e : j["entries"])
    replay.push_back(AuditEntry::fromJson(e));
  EXPECT_TRUE(AuditLedger::verifyEntries(replay).intact);
}

TEST(AuditLedger, CustodyReportShowsIntegrity) {
  AuditLedger ledger;
  appendSampleRun(ledger);
  std::string report = ledger.renderCustodyReport();
  EXPECT_NE(report.find("CHAIN-OF-CUSTODY AUDIT REPORT"), std::string::npos);
  EXPECT_NE(report.find("Chain Integrity: VALID"), std::string::npos);
  EXPECT_NE(report.find("Operation: transfer_complete"), std::string::npos);

  auto entries = ledger.entries();
  entries[3].timestamp = "1999-01-01T00:00:00.000Z";
  std::string broken = AuditLedger::renderCustodyReport(entries);
  EXPECT_NE(broken.find("COMPROMISED at sequence 3"), std::string::npos);
}

TEST(AuditLedger, CustodyReportNamesOperatorAndHost) {
  AuditLedger ledger;
  ledger.append(AuditOperation::RunStart,
                {{"source", "/card"},
                 {"user", "dit"},
                 {"hostname", "cart-01"},
                 {"working_directory", "/shows/ep101"}});
  std::string report = ledger.renderCustodyReport();
  EXPECT_NE(report.find("user: dit"), std::string::npos);
  EXPECT_NE(report.find("hostname: cart-01"), std::string::npos);
  EXPECT_NE(report.find("working_directory: /shows/ep101"), std::string::npos);
}

TEST(AuditOperationNames, RoundTrip) {
  for (auto op : {AuditOperation::RunStart, AuditOperation::TransferComplete,
                  AuditOperation::RunEnd, AuditOperation::RunAborted}) {
    ASSERT_TRUE(parseAuditOperation(auditOperationToString(op)).has_value());
    EXPECT_EQ(*parseAuditOperation(auditOperationToString(op)), op);
  }
  EXPECT_FALSE(parseAuditOperation("bogus").has_value());
}
