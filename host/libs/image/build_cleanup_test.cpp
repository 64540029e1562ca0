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
#include "host/libs/image/build_cleanup.h"

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"

namespace tdx {
namespace {

class BuildCleanupTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::string root = dir_.path;
    files_.checksum_manifest = root + "/SHA256SUMS";
    files_.guest_mount_dir = root + "/guest";
    files_.initrd_work_dir = root + "/initrd";
    files_.nbd_device = root + "/nbd0";
    files_.nbd_mount_dir = root + "/mnt";
    files_.cloud_init_domain = "tdx-build-cleanup-test";
  }

  TemporaryDir dir_;
  BuildSideFiles files_;
};

TEST_F(BuildCleanupTest, RemovesManifestAndInitrdWorkDir) {
  ASSERT_THAT(WriteNewFile(files_.checksum_manifest, "digest *base.img\n"),
              IsOk());
  ASSERT_THAT(EnsureDirectoryExists(files_.initrd_work_dir + "/bin"), IsOk());
  ASSERT_THAT(WriteNewFile(files_.initrd_work_dir + "/init", "#!/bin/sh\n"),
              IsOk());

  BuildCleanup cleanup(files_);
  cleanup.Run();

  EXPECT_FALSE(FileExists(files_.checksum_manifest));
  EXPECT_FALSE(DirectoryExists(files_.initrd_work_dir));
  EXPECT_TRUE(DirectoryExists(dir_.path));
}

TEST_F(BuildCleanupTest, RemovesGuestMountDir) {
  ASSERT_THAT(EnsureDirectoryExists(files_.guest_mount_dir), IsOk());

  BuildCleanup cleanup(files_);
  cleanup.Run();

  EXPECT_FALSE(DirectoryExists(files_.guest_mount_dir));
}

TEST_F(BuildCleanupTest, SecondRunIsNoOp) {
  ASSERT_THAT(WriteNewFile(files_.checksum_manifest, "digest *base.img\n"),
              IsOk());
  ASSERT_THAT(EnsureDirectoryExists(files_.initrd_work_dir), IsOk());

  BuildCleanup cleanup(files_);
  cleanup.Run();
  cleanup.Run();

  EXPECT_FALSE(FileExists(files_.checksum_manifest));
  EXPECT_FALSE(DirectoryExists(files_.initrd_work_dir));
  EXPECT_TRUE(DirectoryExists(dir_.path));
}

TEST_F(BuildCleanupTest, NothingToUndo) {
  BuildCleanup cleanup(files_);
  cleanup.Run();
  EXPECT_TRUE(DirectoryExists(dir_.path));
}

TEST_F(BuildCleanupTest, ReleasesNbdOnce) {
  ASSERT_THAT(EnsureDirectoryExists(files_.nbd_mount_dir), IsOk());

  BuildCleanup cleanup(files_);
  cleanup.NbdConnected(true);
  cleanup.NbdMounted(true);
  cleanup.Run();

  EXPECT_FALSE(cleanup.NbdConnected());
  EXPECT_FALSE(cleanup.NbdMounted());
  // The mount point belongs to the host and is only unmounted.
  EXPECT_TRUE(DirectoryExists(files_.nbd_mount_dir));

  cleanup.Run();
  EXPECT_FALSE(cleanup.NbdConnected());
}

TEST(BuildSideFilesTest, ManifestFollowsAssetsDir) {
  ImageBuildConfig config;
  config.assets_dir = "/srv/assets";
  auto files = BuildSideFilesFor(config);
  EXPECT_EQ(files.checksum_manifest, "/srv/assets/SHA256SUMS");
  EXPECT_EQ(files.guest_mount_dir, kGuestMountDir);
  EXPECT_EQ(files.initrd_work_dir, kRamInitrdWorkDir);
  EXPECT_EQ(files.nbd_device, kNbdDevice);
  EXPECT_EQ(files.nbd_mount_dir, kNbdMountDir);
  EXPECT_EQ(files.cloud_init_domain, kCloudInitDomain);
}

}  // namespace
}  // namespace tdx
