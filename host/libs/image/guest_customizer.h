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
#include <vector>

#include "common/libs/utils/result.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/config/image_build_config.h"

namespace tdx {

inline constexpr char kGuestStagingDir[] = "/tmp/tdx";
inline constexpr char kGuestStagingBinDir[] = "/tmp/tdx/bin";

struct GuestCopyIn {
  std::string host_path;
  std::string guest_dir;
  bool required;
};

// Host files copied into the guest staging directory, in copy order.
std::vector<GuestCopyIn> GuestCopyIns(const ImageBuildConfig& config);

/**
 * Builds the virt-customize invocation that stages the setup files in the
 * guest, moves the extra binaries into /bin and runs the setup script.
 *
 * Optional sources missing on the host are left out with a warning. A missing
 * setup script is an error.
 */
Result<Command> GuestCustomizeCommand(const std::string& virt_customize,
                                      const ImageBuildConfig& config);

Result<void> CustomizeGuestImage(const ImageBuildConfig& config);

}  // namespace tdx
