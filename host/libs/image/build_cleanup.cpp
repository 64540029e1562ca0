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
#include <utility>

#include <android-base/logging.h>

#include "common/libs/utils/files.h"
#include "host/libs/config/logging.h"
#include "host/libs/image/cloud_init.h"
#include "host/libs/image/tool_runner.h"

namespace tdx {

BuildSideFiles BuildSideFilesFor(const ImageBuildConfig& config) {
  BuildSideFiles files;
  files.checksum_manifest = config.ChecksumManifestPath();
  return files;
}

BuildCleanup::BuildCleanup(BuildSideFiles files) : files_(std::move(files)) {}

void BuildCleanup::RemoveChecksumManifest() {
  const auto& manifest = files_.checksum_manifest;
  if (FileExists(manifest) && !RemoveFile(manifest)) {
    LOG(WARNING) << "Failed to remove \"" << manifest << "\"";
  }
}

void BuildCleanup::ReleaseGuestMount() {
  const auto& mount_dir = files_.guest_mount_dir;
  if (!DirectoryExists(mount_dir)) {
    return;
  }
  auto guestunmount = HostToolCommand("guestunmount");
  if (guestunmount.ok()) {
    RunIgnoringFailure(std::move(guestunmount->AddParameter(mount_dir)));
  } else {
    LOG(DEBUG) << guestunmount.error().Message();
  }
  if (!RecursivelyRemoveDirectory(mount_dir)) {
    LOG(WARNING) << "Failed to remove \"" << mount_dir << "\"";
  }
}

void BuildCleanup::RemoveInitrdWorkDir() {
  const auto& work_dir = files_.initrd_work_dir;
  if (DirectoryExists(work_dir) && !RecursivelyRemoveDirectory(work_dir)) {
    LOG(WARNING) << "Failed to remove \"" << work_dir << "\"";
  }
}

void BuildCleanup::ReleaseNbd() {
  if (nbd_mounted_) {
    auto umount = HostToolCommand("umount");
    if (umount.ok()) {
      RunIgnoringFailure(std::move(umount->AddParameter(files_.nbd_mount_dir)));
    }
    nbd_mounted_ = false;
  }
  if (nbd_connected_) {
    auto qemu_nbd = HostToolCommand("qemu-nbd");
    if (qemu_nbd.ok()) {
      RunIgnoringFailure(std::move(
          qemu_nbd->AddParameter("-d").AddParameter(files_.nbd_device)));
    }
    nbd_connected_ = false;
  }
}

void BuildCleanup::Run() {
  RemoveChecksumManifest();
  ReleaseGuestMount();
  RemoveInitrdWorkDir();
  ReleaseNbd();
  TeardownCloudInitVm(files_.cloud_init_domain);
  ReportSuccess("Cleanup!");
}

}  // namespace tdx
