#ifndef INGESTVAULT_STORAGE_HPP
#define INGESTVAULT_STORAGE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace ingestvault {

/**
 * @brief Sequential reader. read() returns 0 at end of file.
 *
 * All failures are reported as std::system_error carrying errno.
 */
class InputFile {
public:
  virtual ~InputFile() = default;
  virtual std::size_t read(std::byte *buffer, std::size_t length) = 0;
};

/**
 * @brief Sequential writer. write() either writes every byte or throws.
 */
class OutputFile {
public:
  virtual ~OutputFile() = default;
  virtual void write(const std::byte *data, std::size_t length) = 0;
  /** Flush file data to stable storage. */
  virtual void sync() = 0;
  virtual void close() = 0;
};

/**
 * @brief File-system operations used by the offload core.
 *
 * Implementations must be safe to call from several worker threads at once.
 */
class Storage {
public:
  virtual ~Storage() = default;

  virtual std::unique_ptr<InputFile> openRead(const std::string &path) = 0;

  /**
   * @brief Open a destination for writing.
   * @param exclusive Fail with EEXIST instead of truncating an existing file.
   */
  virtual std::unique_ptr<OutputFile> openWrite(const std::string &path,
                                                bool exclusive) = 0;

  virtual bool exists(const std::string &path) = 0;

  /** Remove a file; returns false if it could not be removed. */
  virtual bool remove(const std::string &path) = 0;

  virtual void createDirectories(const std::string &dir) = 0;

  /**
   * @brief Bytes available to an unprivileged writer under root.
   *
   * A root that does not exist yet is measured on its nearest existing
   * ancestor.
   */
  virtual std::uint64_t freeSpace(const std::string &root) = 0;
};

/**
 * @brief Storage on the local POSIX file system.
 */
class LocalStorage : public Storage {
public:
  std::unique_ptr<InputFile> openRead(const std::string &path) override;
  std::unique_ptr<OutputFile> openWrite(const std::string &path,
                                        bool exclusive) override;
  bool exists(const std::string &path) override;
  bool remove(const std::string &path) override;
  void createDirectories(const std::string &dir) override;
  std::uint64_t freeSpace(const std::string &root) override;
};

} // namespace ingestvault

#endif // INGESTVAULT_STORAGE_HPP
