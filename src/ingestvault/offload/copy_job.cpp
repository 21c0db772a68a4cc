#include "ingestvault/offload/copy_job.hpp"
#include "ingestvault/utilities/checksum_stream.hpp"
#include "ingestvault/utilities/logger.h"

#include <filesystem>
#include <new>
#include <system_error>

namespace ingestvault {

CopyJob::CopyJob(SourceFile source, DestinationTarget target,
                 CopyJobOptions options, Storage &storage,
                 TransferObserver *observer)
    : record_(std::move(source), std::move(target)), options_(options),
      storage_(storage), observer_(observer) {
  if (options_.chunkSize == 0)
    options_.chunkSize = DEFAULT_CHUNK_SIZE;
}

void CopyJob::notify() {
  if (observer_)
    observer_->onTransferUpdate(record_);
}

void CopyJob::checkDeadline(const char *stage) const {
  if (deadline_ && std::chrono::steady_clock::now() > *deadline_) {
    throw OffloadException(
        ErrorKind::TimedOut,
        std::string("Timed out during ") + stage + " after " +
            std::to_string(options_.timeout.count()) + " ms");
  }
}

TransferRecord CopyJob::run() {
  if (ran_)
    throw InvalidUseError("CopyJob::run() called twice");
  ran_ = true;

  if (options_.timeout.count() > 0)
    deadline_ = std::chrono::steady_clock::now() + options_.timeout;
  record_.markStarted(SystemClock::now());
  notify();

  const std::string &dest = record_.destination().path;
  try {
    buffer_.resize(options_.chunkSize);

    if (handleExistingDestination()) {
      notify();
      return std::move(record_);
    }

    record_.advance(TransferStatus::Copying);
    notify();
    copyAndHash();

    record_.advance(TransferStatus::Verifying);
    notify();
    // Read back through a fresh handle so anything lost in the write path
    // shows up as a digest difference.
    failureSide_ = ErrorKind::DestinationUnwritable;
    ChecksumDigest readBack = hashFile(dest);
    record_.setDestinationDigest(readBack);

    const ChecksumDigest &expected = *record_.sourceDigest();
    if (expected.matches(readBack)) {
      record_.complete(TransferStatus::Verified, SystemClock::now());
      Logger::getInstance().log(
          LogLevel::INFO, "Transfer verified",
          {{"source", record_.source().relativePath},
           {"destination", dest},
           {"digest", readBack.hex}});
    } else {
      std::string detail = "source " + algorithmToString(expected.algorithm) +
                           " " + expected.hex + " != destination " +
                           readBack.hex;
      record_.mismatch(detail, SystemClock::now());
      Logger::getInstance().log(LogLevel::ERROR, "Verification mismatch",
                                {{"source", record_.source().relativePath},
                                 {"destination", dest},
                                 {"detail", detail}});
    }
  } catch (const OffloadException &e) {
    failAndCleanup(e.kind(), e.what(), destinationTouched_);
  } catch (const std::runtime_error &e) {
    failAndCleanup(failureSide_, e.what(), destinationTouched_);
  } catch (const std::bad_alloc &e) {
    failAndCleanup(failureSide_, std::string("out of memory: ") + e.what(),
                   destinationTouched_);
  }

  notify();
  return std::move(record_);
}

bool CopyJob::handleExistingDestination() {
  const std::string &dest = record_.destination().path;
  failureSide_ = ErrorKind::DestinationUnwritable;
  if (!storage_.exists(dest)) {
    exclusive_ = true;
    return false;
  }

  switch (options_.overwrite) {
  case OverwritePolicy::Fail:
    record_.fail(ErrorKind::DestinationUnwritable,
                 "Destination already exists (policy: fail)",
                 SystemClock::now());
    Logger::getInstance().log(LogLevel::WARN,
                              "Destination exists; refusing to overwrite",
                              {{"destination", dest}});
    return true;

  case OverwritePolicy::Overwrite:
    exclusive_ = false;
    return false;

  case OverwritePolicy::SkipVerified: {
    failureSide_ = ErrorKind::SourceUnreadable;
    ChecksumDigest src = hashFile(record_.source().absolutePath);
    failureSide_ = ErrorKind::DestinationUnwritable;
    ChecksumDigest existing = hashFile(dest);
    if (src.matches(existing)) {
      record_.advance(TransferStatus::Verifying);
      record_.setSourceDigest(src);
      record_.setDestinationDigest(existing);
      record_.setReusedExisting(true);
      record_.complete(TransferStatus::Verified, SystemClock::now());
      Logger::getInstance().log(LogLevel::INFO,
                                "Existing destination verified; not rewritten",
                                {{"destination", dest}, {"digest", src.hex}});
      return true;
    }
    Logger::getInstance().log(LogLevel::WARN,
                              "Existing destination differs from source; "
                              "rewriting",
                              {{"destination", dest},
                               {"source_digest", src.hex},
                               {"destination_digest", existing.hex}});
    exclusive_ = false;
    return false;
  }
  }
  return false;
}

void CopyJob::copyAndHash() {
  const std::string &dest = record_.destination().path;

  failureSide_ = ErrorKind::DestinationUnwritable;
  auto parent = std::filesystem::path(dest).parent_path();
  if (!parent.empty())
    storage_.createDirectories(parent.string());

  failureSide_ = ErrorKind::SourceUnreadable;
  auto in = storage_.openRead(record_.source().absolutePath);

  failureSide_ = ErrorKind::DestinationUnwritable;
  auto out = storage_.openWrite(dest, exclusive_);
  destinationTouched_ = true;

  ChecksumStream hasher(options_.algorithm);
  for (;;) {
    checkDeadline("copy");
    failureSide_ = ErrorKind::SourceUnreadable;
    std::size_t n = in->read(buffer_.data(), buffer_.size());
    if (n == 0)
      break;
    hasher.feed(buffer_.data(), n);

    failureSide_ = ErrorKind::DestinationUnwritable;
    out->write(buffer_.data(), n);
    record_.addBytesCopied(n);
  }

  failureSide_ = ErrorKind::DestinationUnwritable;
  out->sync();
  out->close();

  ChecksumDigest digest = hasher.finalize();
  if (digest.bytesHashed != record_.source().sizeBytes) {
    Logger::getInstance().log(
        LogLevel::WARN, "Source size changed since discovery",
        {{"source", record_.source().relativePath},
         {"discovered_bytes", record_.source().sizeBytes},
         {"copied_bytes", digest.bytesHashed}});
  }
  record_.setSourceDigest(std::move(digest));
}

ChecksumDigest CopyJob::hashFile(const std::string &path) {
  auto in = storage_.openRead(path);
  ChecksumStream hasher(options_.algorithm);
  for (;;) {
    checkDeadline("verification");
    std::size_t n = in->read(buffer_.data(), buffer_.size());
    if (n == 0)
      break;
    hasher.feed(buffer_.data(), n);
  }
  return hasher.finalize();
}

void CopyJob::failAndCleanup(ErrorKind kind, const std::string &detail,
                             bool removeDestination) {
  const std::string &dest = record_.destination().path;
  std::string fullDetail = detail;
  if (removeDestination && !storage_.remove(dest)) {
    fullDetail += " (partial destination could not be removed)";
    Logger::getInstance().log(LogLevel::ERROR,
                              "Could not remove partial destination",
                              {{"destination", dest}});
  }
  record_.fail(kind, fullDetail, SystemClock::now());
  Logger::getInstance().log(LogLevel::ERROR, "Transfer failed",
                            {{"source", record_.source().relativePath},
                             {"destination", dest},
                             {"error_kind", errorKindToString(kind)},
                             {"detail", fullDetail}});
}

} // namespace ingestvault
