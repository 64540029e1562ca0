/*
 * Copyright (C) 2023 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "common/libs/utils/files.h"

#include <sys/stat.h>

#include <string>
#include <vector>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/result_matchers.h"

namespace tdx {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace {

std::string Contents(const std::string& path) {
  std::string contents;
  EXPECT_TRUE(android::base::ReadFileToString(path, &contents)) << path;
  return contents;
}

}  // namespace

TEST(FilesTest, WriteNewFileAndReadBack) {
  TemporaryDir dir;
  auto path = std::string(dir.path) + "/file";
  ASSERT_THAT(WriteNewFile(path, "contents"), IsOk());
  ASSERT_TRUE(FileExists(path));
  ASSERT_EQ(Contents(path), "contents");

  ASSERT_THAT(WriteNewFile(path, "new"), IsOk());
  ASSERT_EQ(Contents(path), "new");
}

TEST(FilesTest, CopyPreservesContents) {
  TemporaryDir dir;
  auto from = std::string(dir.path) + "/from";
  auto to = std::string(dir.path) + "/to";
  std::string contents(100000, 'x');
  ASSERT_THAT(WriteNewFile(from, contents), IsOk());
  ASSERT_TRUE(Copy(from, to));
  ASSERT_EQ(Contents(to), contents);
}

TEST(FilesTest, MoveFileRemovesSource) {
  TemporaryDir dir;
  auto from = std::string(dir.path) + "/from";
  auto to = std::string(dir.path) + "/to";
  ASSERT_THAT(WriteNewFile(from, "image"), IsOk());
  ASSERT_THAT(MoveFile(from, to), IsOk());
  ASSERT_FALSE(FileExists(from));
  ASSERT_EQ(Contents(to), "image");
  ASSERT_THAT(MoveFile(from, to), IsError());
}

TEST(FilesTest, FileModes) {
  TemporaryDir dir;
  auto path = std::string(dir.path) + "/file";
  ASSERT_THAT(WriteNewFile(path, ""), IsOk());
  ASSERT_THAT(SetFileMode(path, 0600), IsOk());
  ASSERT_TRUE(MakeFileExecutable(path));
  struct stat st;
  ASSERT_EQ(stat(path.c_str(), &st), 0);
  ASSERT_EQ(st.st_mode & 0777, 0711);
  ASSERT_THAT(SetFileMode(std::string(dir.path) + "/missing", 0600),
              IsError());
}

TEST(FilesTest, FilesMatching) {
  TemporaryDir dir;
  std::string base = dir.path;
  ASSERT_THAT(WriteNewFile(base + "/tdx-guest-b.log", ""), IsOk());
  ASSERT_THAT(WriteNewFile(base + "/tdx-guest-a.log", ""), IsOk());
  ASSERT_THAT(WriteNewFile(base + "/other.log", ""), IsOk());
  ASSERT_THAT(FilesMatching(base + "/tdx-guest-*.log"),
              IsOkAndValue(ElementsAre(base + "/tdx-guest-a.log",
                                       base + "/tdx-guest-b.log")));
  ASSERT_THAT(FilesMatching(base + "/nothing-*"), IsOkAndValue(IsEmpty()));
}

TEST(FilesTest, DirectoryHandling) {
  TemporaryDir dir;
  auto nested = std::string(dir.path) + "/a/b";
  ASSERT_THAT(EnsureDirectoryExists(nested), IsOk());
  ASSERT_TRUE(DirectoryExists(nested));
  ASSERT_THAT(WriteNewFile(nested + "/file", "x"), IsOk());
  ASSERT_TRUE(RecursivelyRemoveDirectory(std::string(dir.path) + "/a"));
  ASSERT_FALSE(DirectoryExists(nested));
}

TEST(FilesTest, PathComponents) {
  ASSERT_EQ(cpp_basename("/tmp/guest.qcow2"), "guest.qcow2");
  ASSERT_EQ(cpp_basename("./binaries"), "binaries");
  ASSERT_EQ(cpp_dirname("/tmp/guest.qcow2"), "/tmp");
  ASSERT_EQ(AbsolutePath("/already/absolute"), "/already/absolute");
}

}  // namespace tdx
