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

#include "host/libs/image/host_setup.h"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <android-base/logging.h>

#include "common/libs/utils/users.h"
#include "host/libs/config/known_paths.h"
#include "host/libs/config/logging.h"
#include "host/libs/image/tool_runner.h"

namespace tdx {

std::vector<std::string> HostToolPackages() {
  // isc-dhcp-client gives the virt-customize appliance name resolution.
  return {"qemu-utils",  "libguestfs-tools",      "virtinst",
          "genisoimage", "libvirt-daemon-system", "isc-dhcp-client"};
}

Command AptInstallCommand(const std::string& apt) {
  Command command(apt);
  command.AddParameter("install");
  command.AddParameter("--yes");
  for (const auto& package : HostToolPackages()) {
    command.AddParameter(package);
  }
  return command;
}

void InstallHostTools() {
  auto apt = HostToolPath("apt");
  if (!apt.ok()) {
    ReportWarning("Cannot install the required tools: " +
                  apt.error().Message());
    return;
  }
  auto installed = RunWithOutputToSetupLog(AptInstallCommand(*apt));
  if (!installed.ok()) {
    ReportWarning("Failed to install the required tools, see " +
                  std::string(kSetupLogPath));
    LOG(DEBUG) << installed.error().Trace();
  }
}

Result<void> CheckRequiredTools() {
  for (const auto& tool : RequiredImageBuildTools()) {
    TDX_EXPECT(HostToolPath(tool));
  }
  ReportSuccess("Installation of required tools");
  return {};
}

void WarnIfNotRoot() {
  if (IsRunningAsRoot()) {
    return;
  }
  ReportWarning(
      "Current user is not root, please use root permission via \"sudo\" or "
      "make sure current user has correct permission by configuring "
      "/etc/libvirt/qemu.conf");
  ReportWarning(
      "Please refer https://libvirt.org/drvqemu.html#posix-users-groups");
  std::this_thread::sleep_for(std::chrono::seconds(5));
}

}  // namespace tdx
