#include <gtest/gtest.h>

#include "pxid/util/filesystem.hpp"
#include "test_helpers.hpp"

using namespace pxid::util;
using namespace pxid::test;
using pxid::ErrorCode;

class FileSystemTest : public TempDirTest {};

TEST_F(FileSystemTest, AtomicWriteCreatesParentsAndReplaces) {
  auto path = temp_dir_ / "a" / "b" / "file.txt";

  ASSERT_OK(FileSystem::writeFileAtomic(path, "first"));
  ASSERT_OK(FileSystem::writeFileAtomic(path, "second"));

  auto content = FileSystem::readFile(path);
  ASSERT_OK(content);
  EXPECT_EQ(*content, "second");

  // No temporary files left behind
  size_t entries = 0;
  for (const auto& entry : std::filesystem::directory_iterator(path.parent_path())) {
    (void)entry;
    ++entries;
  }
  EXPECT_EQ(entries, 1u);
}

TEST_F(FileSystemTest, ReadMissingFile) {
  EXPECT_ERROR(FileSystem::readFile(temp_dir_ / "missing"), ErrorCode::kFileNotFound);
}
