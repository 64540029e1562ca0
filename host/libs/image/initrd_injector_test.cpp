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

#include "host/libs/image/initrd_injector.h"

#include <sys/stat.h>

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"

namespace tdx {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(InitrdInjectorTest, ShellQuote) {
  EXPECT_EQ(ShellQuote("/boot/initrd.img"), "'/boot/initrd.img'");
  EXPECT_EQ(ShellQuote("it's"), "'it'\\''s'");
  EXPECT_EQ(ShellQuote(""), "''");
}

TEST(InitrdInjectorTest, GzipDetection) {
  TemporaryDir dir;
  std::string gzip = std::string(dir.path) + "/gzip";
  std::string cpio = std::string(dir.path) + "/cpio";
  std::string tiny = std::string(dir.path) + "/tiny";
  ASSERT_THAT(WriteNewFile(gzip, std::string("\x1f\x8b\x08\x00", 4)), IsOk());
  ASSERT_THAT(WriteNewFile(cpio, "070701"), IsOk());
  ASSERT_THAT(WriteNewFile(tiny, "\x1f"), IsOk());
  EXPECT_THAT(IsGzipCompressed(gzip), IsOkAndValue(true));
  EXPECT_THAT(IsGzipCompressed(cpio), IsOkAndValue(false));
  EXPECT_THAT(IsGzipCompressed(tiny), IsOkAndValue(false));
  EXPECT_THAT(IsGzipCompressed(std::string(dir.path) + "/missing"), IsError());
}

TEST(InitrdInjectorTest, Partitions) {
  EXPECT_THAT(Partitions("nbd0   disk\nnbd0p1 part\nnbd0p14 part\n"
                         "nbd0p15 part\nnbd0p16 part\n"),
              ElementsAre("nbd0p1", "nbd0p14", "nbd0p15", "nbd0p16"));
  EXPECT_THAT(Partitions("nbd0 disk\n"), IsEmpty());
  EXPECT_THAT(Partitions(""), IsEmpty());
}

TEST(InitrdInjectorTest, Scripts) {
  EXPECT_EQ(InitrdUnpackScript("/mnt/boot/initrd.img-6.8", true),
            "gzip -dc < '/mnt/boot/initrd.img-6.8' | cpio -idm");
  EXPECT_EQ(InitrdUnpackScript("/mnt/boot/initrd.img-6.8", false),
            "cpio -idm < '/mnt/boot/initrd.img-6.8'");
  EXPECT_EQ(InitrdRepackScript("/mnt/boot/initrd.img-6.8", true),
            "find . | cpio -o -H newc | gzip > '/mnt/boot/initrd.img-6.8'");
  EXPECT_EQ(InitrdRepackScript("/mnt/guest/boot/myinitrd.img", false),
            "find . | cpio -o -H newc > '/mnt/guest/boot/myinitrd.img'");
}

TEST(InitrdInjectorTest, InstallIntoDestinationDirectory) {
  TemporaryDir tree;
  TemporaryDir host;
  std::string binary = std::string(host.path) + "/agent";
  ASSERT_THAT(WriteNewFile(binary, "binary", 0644), IsOk());
  ASSERT_THAT(WriteNewFile(std::string(tree.path) + "/init", "#!/bin/sh\n"),
              IsOk());

  EXPECT_THAT(InstallIntoInitrdTree(tree.path, binary, "/usr/bin"),
              IsOkAndValue(std::string("/usr/bin/agent")));

  std::string installed = std::string(tree.path) + "/usr/bin/agent";
  std::string contents;
  ASSERT_TRUE(android::base::ReadFileToString(installed, &contents));
  EXPECT_EQ(contents, "binary");
  struct stat st {};
  ASSERT_EQ(stat(installed.c_str(), &st), 0);
  EXPECT_NE(st.st_mode & S_IXUSR, 0);

  ASSERT_TRUE(android::base::ReadFileToString(std::string(tree.path) + "/init",
                                              &contents));
  EXPECT_EQ(contents, "#!/bin/sh\n/usr/bin/agent\n");
}

TEST(InitrdInjectorTest, InstallIntoRoot) {
  TemporaryDir tree;
  TemporaryDir host;
  ASSERT_THAT(WriteNewFile(std::string(host.path) + "/a", "a"), IsOk());
  ASSERT_THAT(WriteNewFile(std::string(host.path) + "/b", "b"), IsOk());

  EXPECT_THAT(InstallIntoInitrdTree(tree.path, std::string(host.path) + "/a", "."),
              IsOkAndValue(std::string("./a")));
  EXPECT_THAT(InstallIntoInitrdTree(tree.path, std::string(host.path) + "/b", "."),
              IsOkAndValue(std::string("./b")));
  EXPECT_TRUE(FileExists(std::string(tree.path) + "/a"));
  std::string init;
  ASSERT_TRUE(android::base::ReadFileToString(std::string(tree.path) + "/init",
                                              &init));
  EXPECT_EQ(init, "./a\n./b\n");
}

TEST(InitrdInjectorTest, InstallMissingBinary) {
  TemporaryDir tree;
  EXPECT_THAT(InstallIntoInitrdTree(tree.path, "/nonexistent/agent", "/bin"),
              IsError());
}

TEST(InitrdInjectorTest, FindInitrdPicksLast) {
  TemporaryDir boot;
  std::string dir = boot.path;
  ASSERT_THAT(WriteNewFile(dir + "/initrd.img-6.8.0-31-generic", ""), IsOk());
  ASSERT_THAT(WriteNewFile(dir + "/initrd.img-6.8.0-45-generic", ""), IsOk());
  ASSERT_THAT(WriteNewFile(dir + "/vmlinuz-6.8.0-45-generic", ""), IsOk());
  EXPECT_THAT(FindInitrd(dir),
              IsOkAndValue(dir + "/initrd.img-6.8.0-45-generic"));
}

TEST(InitrdInjectorTest, FindInitrdNone) {
  TemporaryDir boot;
  EXPECT_THAT(FindInitrd(boot.path), IsError());
}

TEST(InitrdInjectorTest, InitrdOnRootPartition) {
  TemporaryDir root;
  std::string dir = root.path;
  ASSERT_THAT(EnsureDirectoryExists(dir + "/boot"), IsOk());
  ASSERT_THAT(WriteNewFile(dir + "/boot/initrd.img-6.8.0-45-generic", ""),
              IsOk());
  EXPECT_THAT(FindInitrdInPartition(dir),
              IsOkAndValue(dir + "/boot/initrd.img-6.8.0-45-generic"));
}

TEST(InitrdInjectorTest, InitrdOnSeparateBootPartition) {
  TemporaryDir boot;
  std::string dir = boot.path;
  ASSERT_THAT(WriteNewFile(dir + "/initrd.img-6.8.0-45-generic", ""), IsOk());
  EXPECT_THAT(FindInitrdInPartition(dir),
              IsOkAndValue(dir + "/initrd.img-6.8.0-45-generic"));
}

TEST(InitrdInjectorTest, RootPartitionWithEmptyBootMountPoint) {
  TemporaryDir root;
  std::string dir = root.path;
  ASSERT_THAT(EnsureDirectoryExists(dir + "/boot"), IsOk());
  ASSERT_THAT(EnsureDirectoryExists(dir + "/etc"), IsOk());
  EXPECT_THAT(FindInitrdInPartition(dir), IsError());
}

}  // namespace tdx
