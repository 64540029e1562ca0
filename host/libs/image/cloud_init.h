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

#include <cstdint>
#include <string>

#include "common/libs/utils/result.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/config/image_build_config.h"
#include "host/libs/config/known_paths.h"

namespace tdx {

struct CloudInitData {
  std::string user_data;
  std::string meta_data;
};

// Appends the guest account and hostname to the templates found in
// `template_dir`.
Result<CloudInitData> RenderCloudInitData(const std::string& template_dir,
                                          const ImageBuildConfig& config);

// Writes `user-data` and `meta-data` into `directory`.
Result<void> WriteCloudInitData(const CloudInitData& data,
                                const std::string& directory);

Command GenisoimageCommand(const std::string& genisoimage,
                           const std::string& data_dir,
                           const std::string& iso_path);
Command VirtInstallCommand(const std::string& virt_install,
                           const std::string& image,
                           const std::string& iso_path,
                           std::int32_t wait_minutes);

// Renders the data and packs it into the `cidata` ISO.
Result<void> CreateCloudInitIso(const ImageBuildConfig& config);

// Boots the work image once so that cloud-init applies the ISO.
Result<void> RunCloudInit(const ImageBuildConfig& config);

// Shuts down and removes the transient cloud-init domain. Safe to call when
// there is no such domain.
void TeardownCloudInitVm(const std::string& domain = kCloudInitDomain);

}  // namespace tdx
