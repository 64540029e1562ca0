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
#pragma once

#include <string>

#include "host/libs/config/image_build_config.h"
#include "host/libs/config/known_paths.h"

namespace tdx {

// What an image build may leave behind on the host.
struct BuildSideFiles {
  std::string checksum_manifest;
  std::string guest_mount_dir = kGuestMountDir;
  std::string initrd_work_dir = kRamInitrdWorkDir;
  std::string nbd_device = kNbdDevice;
  std::string nbd_mount_dir = kNbdMountDir;
  std::string cloud_init_domain = kCloudInitDomain;
};

BuildSideFiles BuildSideFilesFor(const ImageBuildConfig& config);

/**
 * Undoes the side effects of an image build: the downloaded manifest, guest
 * mounts, the unpacked initrd, the nbd connection and the transient cloud-init
 * domain. Every step checks whether there is anything to undo, so Run() may
 * be called any number of times.
 *
 * The work image is left in place.
 */
class BuildCleanup {
 public:
  explicit BuildCleanup(BuildSideFiles files);

  // Set by the initrd injector while it holds the nbd device.
  void NbdConnected(bool connected) { nbd_connected_ = connected; }
  void NbdMounted(bool mounted) { nbd_mounted_ = mounted; }
  bool NbdConnected() const { return nbd_connected_; }
  bool NbdMounted() const { return nbd_mounted_; }

  void Run();

 private:
  void RemoveChecksumManifest();
  void ReleaseGuestMount();
  void RemoveInitrdWorkDir();
  void ReleaseNbd();

  BuildSideFiles files_;
  bool nbd_connected_ = false;
  bool nbd_mounted_ = false;
};

}  // namespace tdx
