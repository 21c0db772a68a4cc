#include "ingestvault/report/ingestion_report.hpp"
#include "ingestvault/utilities/checksum_stream.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace ingestvault;

namespace {

TransferRecord record(const std::string &rel, const std::string &root,
                      TransferStatus outcome, std::uint64_t bytes = 1024 * 1024,
                      double seconds = 1.0) {
  SourceFile src{rel, "/card/" + rel, bytes, SystemClock::now()};
  DestinationTarget dst{root, root + "/" + rel, 0};
  TransferRecord r(src, dst);
  auto t0 = SystemClock::now();
  r.markStarted(t0);
  auto t1 = t0 + std::chrono::duration_cast<SystemClock::duration>(
                     std::chrono::duration<double>(seconds));
  if (outcome == TransferStatus::Failed) {
    r.fail(ErrorKind::DestinationUnwritable, "write: No space left on device", t1);
    return r;
  }
  r.advance(TransferStatus::Copying);
  r.addBytesCopied(bytes);
  r.advance(TransferStatus::Verifying);
  auto d = ChecksumStream::digestOf(ChecksumAlgorithm::SHA256, rel);
  r.setSourceDigest(d);
  if (outcome == TransferStatus::Verified) {
    r.setDestinationDigest(d);
    r.complete(TransferStatus::Verified, t1);
  } else {
    r.setDestinationDigest(ChecksumStream::digestOf(ChecksumAlgorithm::SHA256, "x"));
    r.mismatch("digests differ", t1);
  }
  return r;
}

} // namespace

TEST(IngestionReport, EmptyReportIsSafeToFormat) {
  IngestionReport report;
  EXPECT_TRUE(report.records().empty());
  EXPECT_TRUE(report.safeToFormat());
  auto status = report.formatStatus();
  EXPECT_TRUE(status.safe);
  EXPECT_EQ(status.badge, "SAFE TO FORMAT");
  EXPECT_TRUE(report.doNotFormatReasons().empty());
}

TEST(IngestionReport, AllVerifiedIsSafe) {
  IngestionReport report;
  report.addRecord(record("a.mov", "/d1", TransferStatus::Verified));
  report.addRecord(record("a.mov", "/d2", TransferStatus::Verified));
  EXPECT_TRUE(report.safeToFormat());
  auto status = report.formatStatus();
  EXPECT_EQ(status.verifiedCount, 2u);
  EXPECT_EQ(status.reason, "All 2 transfers copied and verified with sha256");
}

TEST(IngestionReport, OneMismatchForcesDoNotFormat) {
  IngestionReport report;
  report.addRecord(record("a.mov", "/d1", TransferStatus::Verified));
  report.addRecord(record("b.wav", "/d1", TransferStatus::VerificationMismatch));
  report.addRecord(record("c.wav", "/d1", TransferStatus::Verified));
  EXPECT_FALSE(report.safeToFormat());

  auto status = report.formatStatus();
  EXPECT_EQ(status.badge, "DO NOT FORMAT");
  EXPECT_EQ(status.mismatchCount, 1u);
  EXPECT_EQ(status.reason, "1 transfer(s) failed or did not verify");

  auto reasons = report.doNotFormatReasons();
  ASSERT_EQ(reasons.size(), 1u);
  EXPECT_EQ(reasons[0], "b.wav -> /d1/b.wav: verification_mismatch: digests differ");
}

TEST(IngestionReport, RecordsAreSortedRegardlessOfArrivalOrder) {
  IngestionReport report;
  report.addRecord(record("b.wav", "/d2", TransferStatus::Verified));
  report.addRecord(record("a.mov", "/d2", TransferStatus::Verified));
  report.addRecord(record("b.wav", "/d1", TransferStatus::Verified));
  report.addRecord(record("a.mov", "/d1", TransferStatus::Verified));

  const auto &r = report.records();
  ASSERT_EQ(r.size(), 4u);
  EXPECT_EQ(r[0].destination().path, "/d1/a.mov");
  EXPECT_EQ(r[1].destination().path, "/d2/a.mov");
  EXPECT_EQ(r[2].destination().path, "/d1/b.wav");
  EXPECT_EQ(r[3].destination().path, "/d2/b.wav");
}

TEST(IngestionReport, RejectsNonTerminalRecords) {
  IngestionReport report;
  SourceFile src{"a.mov", "/card/a.mov", 1, SystemClock::now()};
  TransferRecord pending(src, DestinationTarget{"/d1", "/d1/a.mov", 0});
  EXPECT_THROW(report.addRecord(pending), InvalidUseError);
}

TEST(IngestionReport, ThroughputStatsCoverVerifiedCopies) {
  IngestionReport report;
  report.addRecord(record("a.mov", "/d1", TransferStatus::Verified, 4 * 1024 * 1024, 2.0));
  report.addRecord(record("b.mov", "/d1", TransferStatus::Verified, 6 * 1024 * 1024, 1.0));
  report.addRecord(record("c.mov", "/d1", TransferStatus::Failed, 0));

  auto stats = report.throughput();
  EXPECT_EQ(stats.totalBytesCopied, 10u * 1024 * 1024);
  ASSERT_TRUE(stats.averageMiBps.has_value());
  EXPECT_NEAR(*stats.averageMiBps, 4.0, 1e-6);
  EXPECT_NEAR(*stats.minimumMiBps, 2.0, 1e-6);
  EXPECT_NEAR(*stats.maximumMiBps, 6.0, 1e-6);
}

TEST(IngestionReport, JsonCarriesSummaryStatusAndLedger) {
  IngestionReport report;
  report.setProjectId("feature01");
  report.setShootDay("day03");
  report.setSourceRoot("/card");
  report.setDestinationRoots({"/d1"});
  report.setOverwritePolicy(OverwritePolicy::SkipVerified);
  report.addRecord(record("a.mov", "/d1", TransferStatus::Verified));
  report.addRecord(record("b.wav", "/d1", TransferStatus::Failed, 0));

  LedgerSummary ledger;
  ledger.path = "/tmp/ledger.jsonl";
  ledger.openStatus = LedgerOpenStatus::Loaded;
  ledger.firstSequence = 10;
  ledger.lastSequence = 13;
  ledger.entriesAppended = 4;
  ledger.headDigest = std::string(64, 'a');
  report.setLedgerSummary(ledger);

  auto j = report.toJson();
  EXPECT_EQ(j["project_id"], "feature01");
  EXPECT_EQ(j["shoot_day"], "day03");
  EXPECT_EQ(j["overwrite_policy"], "skip-verified");
  EXPECT_EQ(j["records"].size(), 2u);
  EXPECT_EQ(j["summary"]["total"], 2);
  EXPECT_EQ(j["summary"]["verified"], 1);
  EXPECT_EQ(j["summary"]["failed"], 1);
  EXPECT_FALSE(j["status"]["safe_to_format"].get<bool>());
  EXPECT_EQ(j["status"]["badge"], "DO NOT FORMAT");
  EXPECT_EQ(j["status"]["do_not_format_reasons"].size(), 1u);
  EXPECT_TRUE(j["ledger"]["carried_over"].get<bool>());
  EXPECT_EQ(j["ledger"]["first_sequence"], 10);
  EXPECT_FALSE(j["cancelled"].get<bool>());
}

TEST(IngestionReport, SaveWritesParseableJson) {
  testsupport::TempDir dir;
  IngestionReport report;
  report.addRecord(record("a.mov", "/d1", TransferStatus::Verified));
  report.save(dir / "reports/run.json");
  auto j = nlohmann::json::parse(testsupport::readFile(dir / "reports/run.json"));
  EXPECT_TRUE(j["status"]["safe_to_format"].get<bool>());
}

TEST(IngestionReport, SummaryTextNamesBadgeAndOffenders) {
  IngestionReport report;
  report.setSourceRoot("/card");
  report.setDestinationRoots({"/d1"});
  report.addRecord(record("b.wav", "/d1", TransferStatus::Failed, 0));
  std::string text = report.renderSummary();
  EXPECT_NE(text.find("DO NOT FORMAT"), std::string::npos);
  EXPECT_NE(text.find("b.wav -> /d1/b.wav: failed"), std::string::npos);
}
