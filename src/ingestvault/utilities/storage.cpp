#include "ingestvault/utilities/storage.hpp"

#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <system_error>
#include <unistd.h>

namespace ingestvault {

namespace {

[[noreturn]] void throwErrno(int err, const std::string &what) {
  throw std::system_error(err, std::generic_category(), what);
}

class PosixInputFile : public InputFile {
public:
  PosixInputFile(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}
  ~PosixInputFile() override { ::close(fd_); }

  std::size_t read(std::byte *buffer, std::size_t length) override {
    for (;;) {
      ssize_t n = ::read(fd_, buffer, length);
      if (n >= 0)
        return static_cast<std::size_t>(n);
      if (errno != EINTR)
        throwErrno(errno, "read " + path_);
    }
  }

private:
  int fd_;
  std::string path_;
};

class PosixOutputFile : public OutputFile {
public:
  PosixOutputFile(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}
  ~PosixOutputFile() override {
    if (fd_ >= 0)
      ::close(fd_);
  }

  void write(const std::byte *data, std::size_t length) override {
    std::size_t done = 0;
    while (done < length) {
      ssize_t n = ::write(fd_, data + done, length - done);
      if (n < 0) {
        if (errno == EINTR)
          continue;
        throwErrno(errno, "write " + path_);
      }
      done += static_cast<std::size_t>(n);
    }
  }

  void sync() override {
    if (::fsync(fd_) != 0)
      throwErrno(errno, "fsync " + path_);
  }

  void close() override {
    if (fd_ < 0)
      return;
    int fd = fd_;
    fd_ = -1;
    // close() may surface a deferred write error (NFS, some USB bridges).
    if (::close(fd) != 0)
      throwErrno(errno, "close " + path_);
  }

private:
  int fd_;
  std::string path_;
};

} // namespace

std::unique_ptr<InputFile> LocalStorage::openRead(const std::string &path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0)
    throwErrno(errno, "open " + path);
  return std::make_unique<PosixInputFile>(fd, path);
}

std::unique_ptr<OutputFile> LocalStorage::openWrite(const std::string &path,
                                                    bool exclusive) {
  int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (exclusive ? O_EXCL : O_TRUNC);
  int fd = ::open(path.c_str(), flags, 0644);
  if (fd < 0)
    throwErrno(errno, "create " + path);
  return std::make_unique<PosixOutputFile>(fd, path);
}

bool LocalStorage::exists(const std::string &path) {
  struct stat st {};
  return ::lstat(path.c_str(), &st) == 0;
}

bool LocalStorage::remove(const std::string &path) {
  return ::unlink(path.c_str()) == 0 || errno == ENOENT;
}

void LocalStorage::createDirectories(const std::string &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec)
    throw std::system_error(ec, "create directories " + dir);
}

std::uint64_t LocalStorage::freeSpace(const std::string &root) {
  std::filesystem::path probe(root);
  std::error_code ec;
  while (!probe.empty() && !std::filesystem::exists(probe, ec)) {
    if (probe == probe.parent_path())
      break;
    probe = probe.parent_path();
  }
  if (probe.empty())
    probe = ".";

  struct statvfs vfs {};
  if (::statvfs(probe.c_str(), &vfs) != 0)
    throwErrno(errno, "statvfs " + probe.string());
  return static_cast<std::uint64_t>(vfs.f_bavail) *
         static_cast<std::uint64_t>(vfs.f_frsize);
}

} // namespace ingestvault
