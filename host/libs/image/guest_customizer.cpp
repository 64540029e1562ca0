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

#include "host/libs/image/guest_customizer.h"

#include <string>
#include <vector>

#include <android-base/logging.h>

#include "common/libs/utils/files.h"
#include "host/libs/config/known_paths.h"
#include "host/libs/config/logging.h"
#include "host/libs/image/tool_runner.h"

namespace tdx {

std::vector<GuestCopyIn> GuestCopyIns(const ImageBuildConfig& config) {
  return {
      {config.assets_dir + "/setup.sh", kGuestStagingDir, true},
      {config.repo_root + "/setup-tdx-guest.sh", kGuestStagingDir, false},
      {config.repo_root + "/setup-tdx-common", kGuestStagingDir, false},
      {config.repo_root + "/setup-tdx-config", kGuestStagingDir, false},
      {config.repo_root + "/attestation/", kGuestStagingDir, false},
      {config.binaries_path, kGuestStagingBinDir, false},
  };
}

Result<Command> GuestCustomizeCommand(const std::string& virt_customize,
                                      const ImageBuildConfig& config) {
  Command command(virt_customize);
  command.AddParameter("-a");
  command.AddParameter(config.WorkImage());
  command.AddParameter("--mkdir");
  command.AddParameter(kGuestStagingDir, "/");
  command.AddParameter("--mkdir");
  command.AddParameter(kGuestStagingBinDir);

  bool copied_binaries = false;
  for (const auto& copy_in : GuestCopyIns(config)) {
    if (!FileExists(copy_in.host_path)) {
      TDX_EXPECT(!copy_in.required,
                 "\"" << copy_in.host_path << "\" does not exist");
      ReportWarning("Skipping missing \"" + copy_in.host_path + "\"");
      continue;
    }
    command.AddParameter("--copy-in");
    command.AddParameter(copy_in.host_path, ":", copy_in.guest_dir);
    if (copy_in.host_path == config.binaries_path) {
      copied_binaries = true;
    }
  }

  if (copied_binaries) {
    // virt-customize keeps the last path component when copying in.
    auto staged = std::string(kGuestStagingBinDir) + "/" +
                  cpp_basename(config.binaries_path);
    command.AddParameter("--run-command");
    if (DirectoryExists(config.binaries_path)) {
      command.AddParameter("mv ", staged, "/* /bin/");
    } else {
      command.AddParameter("mv ", staged, " /bin/");
    }
  }

  command.AddParameter("--run-command");
  command.AddParameter(kGuestStagingDir, "/setup.sh");
  return command;
}

Result<void> CustomizeGuestImage(const ImageBuildConfig& config) {
  auto virt_customize = TDX_EXPECT(HostToolPath("virt-customize"));
  auto command = TDX_EXPECT(GuestCustomizeCommand(virt_customize, config));
  TDX_EXPECT(RunWithOutputToSetupLog(std::move(command)),
             "Failed to setup guest image");
  ReportSuccess("Setup guest image...");
  return {};
}

}  // namespace tdx
