/*******************************************************************************
The MIT License (MIT)

Copyright (c) 2026 The Cordon Authors

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*******************************************************************************/


#include <string>
#include <vector>

#include "file.h"

#include "../dflags/dflags.h"
#include "../dflags/gtest_main_with_dflags.h"

using cordon::FileSystem;
using cordon::FileException;
using cordon::CannotReadFileException;
using cordon::DirDoesNotExistException;
using cordon::PathNotDirException;

DEFINE_string(file_test_tmpdir, ".cordon_file_test", "Local path for the test to create temporary files in.");

TEST(File, JoinPath) {
  EXPECT_EQ("foo/bar", FileSystem::JoinPath("foo", "bar"));
  EXPECT_EQ("foo/bar", FileSystem::JoinPath("foo/", "bar"));
  EXPECT_EQ("/foo/bar", FileSystem::JoinPath("/foo", "bar"));
  EXPECT_EQ("/bar", FileSystem::JoinPath("foo", "/bar"));
  EXPECT_EQ("bar", FileSystem::JoinPath("", "bar"));
  ASSERT_THROW(FileSystem::JoinPath("/foo/", ""), FileException);
}

TEST(File, WriteAndRead) {
  const FileSystem::ScopedTmpDir dir(FLAGS_file_test_tmpdir);
  const std::string fn = FileSystem::JoinPath(dir.Path(), "file");

  FileSystem::WriteStringToFile("PASSED", fn.c_str());
  EXPECT_EQ("PASSED", FileSystem::ReadFileAsString(fn));

  const std::string large(200000, 'x');
  FileSystem::WriteStringToFile(large, fn.c_str());
  EXPECT_EQ(large, FileSystem::ReadFileAsString(fn));

  FileSystem::WriteStringToFile("", fn.c_str());
  EXPECT_EQ("", FileSystem::ReadFileAsString(fn));
}

TEST(File, MissingFileThrows) {
  const FileSystem::ScopedTmpDir dir(FLAGS_file_test_tmpdir);
  const std::string fn = FileSystem::JoinPath(dir.Path(), "does_not_exist");
  EXPECT_FALSE(FileSystem::Exists(fn));
  ASSERT_THROW(FileSystem::ReadFileAsString(fn), CannotReadFileException);
  ASSERT_THROW(FileSystem::RmFile(fn), FileException);
  FileSystem::RmFile(fn, FileSystem::RmFileParameters::Silent);
}

TEST(File, AtomicWriteLeavesNoTemporaryFile) {
  const FileSystem::ScopedTmpDir dir(FLAGS_file_test_tmpdir);
  const std::string fn = FileSystem::JoinPath(dir.Path(), "table.jsonl");
  FileSystem::WriteStringToFile("old", fn.c_str());
  FileSystem::WriteStringToFileAtomically("new", fn);
  EXPECT_EQ("new", FileSystem::ReadFileAsString(fn));
  EXPECT_FALSE(FileSystem::Exists(fn + ".tmp"));
  EXPECT_EQ(std::vector<std::string>({"table.jsonl"}), FileSystem::ListFilesSorted(dir.Path()));
}

TEST(File, ListFilesSortedSkipsDirectories) {
  const FileSystem::ScopedTmpDir dir(FLAGS_file_test_tmpdir);
  FileSystem::WriteStringToFile("", FileSystem::JoinPath(dir.Path(), "b").c_str());
  FileSystem::WriteStringToFile("", FileSystem::JoinPath(dir.Path(), "c").c_str());
  FileSystem::WriteStringToFile("", FileSystem::JoinPath(dir.Path(), "a").c_str());
  const std::string subdir = FileSystem::JoinPath(dir.Path(), "subdir");
  FileSystem::MkDir(subdir);
  EXPECT_TRUE(FileSystem::IsDir(subdir));
  EXPECT_EQ(std::vector<std::string>({"a", "b", "c"}), FileSystem::ListFilesSorted(dir.Path()));
  FileSystem::RmDir(subdir);
  ASSERT_THROW(FileSystem::ListFilesSorted(subdir), DirDoesNotExistException);
  ASSERT_THROW(FileSystem::ListFilesSorted(FileSystem::JoinPath(dir.Path(), "a")), PathNotDirException);
}

TEST(File, RecursiveRmDir) {
  const FileSystem::ScopedTmpDir dir(FLAGS_file_test_tmpdir);
  const std::string subdir = FileSystem::JoinPath(dir.Path(), "subdir");
  FileSystem::MkDir(subdir);
  FileSystem::WriteStringToFile("1", FileSystem::JoinPath(subdir, "one").c_str());
  FileSystem::WriteStringToFile("2", FileSystem::JoinPath(subdir, "two").c_str());
  ASSERT_THROW(FileSystem::RmDir(subdir), FileException);
  FileSystem::RmDir(subdir, FileSystem::RmDirParameters::ThrowExceptionOnError, FileSystem::RmDirRecursive::Yes);
  EXPECT_FALSE(FileSystem::Exists(subdir));
  ASSERT_THROW(
      FileSystem::RmDir(subdir, FileSystem::RmDirParameters::ThrowExceptionOnError, FileSystem::RmDirRecursive::Yes),
      FileException);
  FileSystem::RmDir(subdir, FileSystem::RmDirParameters::Silent, FileSystem::RmDirRecursive::Yes);
}

TEST(File, ScopedTmpDirCleanupNeverThrows) {
  const std::string path = FLAGS_file_test_tmpdir + "_scoped";
  {
    const FileSystem::ScopedTmpDir dir(path);
    EXPECT_TRUE(FileSystem::IsDir(path));
    FileSystem::WriteStringToFile("data", FileSystem::JoinPath(path, "file").c_str());
    FileSystem::RmDir(path, FileSystem::RmDirParameters::ThrowExceptionOnError, FileSystem::RmDirRecursive::Yes);
    // Leave a regular file where the directory was: the cleanup can neither list nor remove it.
    FileSystem::WriteStringToFile("not a directory", path.c_str());
  }
  EXPECT_TRUE(FileSystem::Exists(path));
  EXPECT_FALSE(FileSystem::IsDir(path));
  FileSystem::RmFile(path);
}
