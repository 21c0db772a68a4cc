#include "ingestvault/offload/transfer_record.hpp"
#include "ingestvault/utilities/checksum_stream.hpp"
#include <gtest/gtest.h>

using namespace ingestvault;

namespace {

TransferRecord makeRecord() {
  SourceFile src{"A001/clip.mov", "/card/A001/clip.mov", 2 * 1024 * 1024,
                 SystemClock::now()};
  DestinationTarget dst{"/d1", "/d1/A001/clip.mov", 1ull << 30};
  return TransferRecord(src, dst);
}

} // namespace

TEST(TransferRecord, StartsPending) {
  auto r = makeRecord();
  EXPECT_EQ(r.status(), TransferStatus::Pending);
  EXPECT_FALSE(r.terminal());
  EXPECT_EQ(r.bytesCopied(), 0u);
  EXPECT_FALSE(r.sourceDigest().has_value());
}

TEST(TransferRecord, FullForwardPathToVerified) {
  auto r = makeRecord();
  auto t0 = SystemClock::now();
  r.markStarted(t0);
  r.advance(TransferStatus::Copying);
  r.addBytesCopied(2 * 1024 * 1024);
  r.advance(TransferStatus::Verifying);
  auto d = ChecksumStream::digestOf(ChecksumAlgorithm::SHA256, "x");
  r.setSourceDigest(d);
  r.setDestinationDigest(d);
  r.complete(TransferStatus::Verified, t0 + std::chrono::seconds(2));

  EXPECT_EQ(r.status(), TransferStatus::Verified);
  EXPECT_TRUE(r.terminal());
  EXPECT_DOUBLE_EQ(r.elapsedSeconds(), 2.0);
  ASSERT_TRUE(r.throughputMiBps().has_value());
  EXPECT_DOUBLE_EQ(*r.throughputMiBps(), 1.0);
}

TEST(TransferRecord, StatusNeverRegresses) {
  auto r = makeRecord();
  r.advance(TransferStatus::Verifying);
  EXPECT_THROW(r.advance(TransferStatus::Copying), InvalidUseError);
  EXPECT_THROW(r.advance(TransferStatus::Verifying), InvalidUseError);
  EXPECT_EQ(r.status(), TransferStatus::Verifying);
}

TEST(TransferRecord, TerminalRecordIsImmutable) {
  auto r = makeRecord();
  r.fail(ErrorKind::SourceUnreadable, "card removed", SystemClock::now());
  EXPECT_EQ(r.status(), TransferStatus::Failed);
  EXPECT_EQ(*r.errorKind(), ErrorKind::SourceUnreadable);
  EXPECT_EQ(r.errorDetail(), "card removed");

  EXPECT_THROW(r.addBytesCopied(1), InvalidUseError);
  EXPECT_THROW(r.advance(TransferStatus::Verified), InvalidUseError);
  EXPECT_THROW(r.mismatch("late", SystemClock::now()), InvalidUseError);
  EXPECT_THROW(r.setReusedExisting(true), InvalidUseError);
}

TEST(TransferRecord, CompleteRequiresTerminalStatus) {
  auto r = makeRecord();
  EXPECT_THROW(r.complete(TransferStatus::Copying, SystemClock::now()),
               InvalidUseError);
}

TEST(TransferRecord, MismatchCarriesErrorKind) {
  auto r = makeRecord();
  r.advance(TransferStatus::Copying);
  r.advance(TransferStatus::Verifying);
  r.mismatch("digests differ", SystemClock::now());
  EXPECT_EQ(r.status(), TransferStatus::VerificationMismatch);
  EXPECT_EQ(*r.errorKind(), ErrorKind::VerificationMismatch);
}

TEST(TransferRecord, JsonCarriesStatusAndDigests) {
  auto r = makeRecord();
  r.markStarted(SystemClock::now());
  r.advance(TransferStatus::Copying);
  r.advance(TransferStatus::Verifying);
  auto d = ChecksumStream::digestOf(ChecksumAlgorithm::MD5, "abc");
  r.setSourceDigest(d);
  r.setDestinationDigest(d);
  r.complete(TransferStatus::Verified, SystemClock::now());

  auto j = r.toJson();
  EXPECT_EQ(j["source"], "A001/clip.mov");
  EXPECT_EQ(j["destination"], "/d1/A001/clip.mov");
  EXPECT_EQ(j["destination_root"], "/d1");
  EXPECT_EQ(j["status"], "verified");
  EXPECT_EQ(j["algorithm"], "md5");
  EXPECT_EQ(j["source_digest"], "900150983cd24fb0d6963f7d28e17f72");
  EXPECT_TRUE(j["error_kind"].is_null());
  EXPECT_FALSE(j["reused_existing"].get<bool>());
}

TEST(TransferStatusNames, SnakeCase) {
  EXPECT_EQ(transferStatusToString(TransferStatus::VerificationMismatch),
            "verification_mismatch");
  EXPECT_TRUE(isTerminal(TransferStatus::Failed));
  EXPECT_FALSE(isTerminal(TransferStatus::Verifying));
}
