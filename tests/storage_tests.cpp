#include "ingestvault/utilities/storage.hpp"
#include "test_support.hpp"
#include <cerrno>
#include <gtest/gtest.h>
#include <system_error>

using ingestvault::LocalStorage;
using testsupport::TempDir;

TEST(LocalStorage, WriteThenReadBack) {
  TempDir dir;
  LocalStorage fs;
  const std::string data = testsupport::patternBytes(70000, 3);
  {
    auto out = fs.openWrite(dir / "f.bin", true);
    out->write(reinterpret_cast<const std::byte *>(data.data()), data.size());
    out->sync();
    out->close();
  }
  EXPECT_TRUE(fs.exists(dir / "f.bin"));

  auto in = fs.openRead(dir / "f.bin");
  std::string back;
  std::byte buf[4096];
  std::size_t n;
  while ((n = in->read(buf, sizeof(buf))) > 0)
    back.append(reinterpret_cast<const char *>(buf), n);
  EXPECT_EQ(back, data);
}

TEST(LocalStorage, ExclusiveOpenRefusesExistingFile) {
  TempDir dir;
  LocalStorage fs;
  testsupport::writeFile(dir / "taken", "x");
  try {
    fs.openWrite(dir / "taken", true);
    FAIL() << "expected system_error";
  } catch (const std::system_error &e) {
    EXPECT_EQ(e.code().value(), EEXIST);
  }
  EXPECT_NO_THROW(fs.openWrite(dir / "taken", false));
  EXPECT_EQ(testsupport::readFile(dir / "taken"), "");
}

TEST(LocalStorage, OpenReadMissingFileThrows) {
  LocalStorage fs;
  EXPECT_THROW(fs.openRead("/nonexistent/ingestvault/file"), std::system_error);
}

TEST(LocalStorage, RemoveTreatsMissingFileAsRemoved) {
  TempDir dir;
  LocalStorage fs;
  testsupport::writeFile(dir / "gone", "x");
  EXPECT_TRUE(fs.remove(dir / "gone"));
  EXPECT_FALSE(fs.exists(dir / "gone"));
  EXPECT_TRUE(fs.remove(dir / "gone"));
}

TEST(LocalStorage, FreeSpaceOfMissingRootUsesAncestor) {
  TempDir dir;
  LocalStorage fs;
  auto existing = fs.freeSpace(dir.str());
  auto missing = fs.freeSpace(dir / "not/yet/created");
  EXPECT_GT(existing, 0u);
  EXPECT_GT(missing, 0u);
}

TEST(LocalStorage, CreateDirectoriesIsRecursive) {
  TempDir dir;
  LocalStorage fs;
  fs.createDirectories(dir / "a/b/c");
  EXPECT_TRUE(std::filesystem::is_directory(dir / "a/b/c"));
}
