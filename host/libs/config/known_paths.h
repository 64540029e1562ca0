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

namespace tdx {

// Build side files.
inline constexpr char kSetupLogPath[] = "/tmp/tdx-guest-setup.txt";
inline constexpr char kCloudInitIsoPath[] = "/tmp/ciiso.iso";
inline constexpr char kCloudInitDomain[] = "tdx-config-cloud-init";
inline constexpr char kGuestMountDir[] = "/mnt/guest";
inline constexpr char kRamInitrdWorkDir[] = "/tmp/initrd";
inline constexpr char kNbdDevice[] = "/dev/nbd0";
inline constexpr char kNbdMountDir[] = "/mnt";
inline constexpr char kChecksumManifestName[] = "SHA256SUMS";

// Launch side files.
inline constexpr char kTdPidFile[] = "/tmp/tdx-demo-td-pid.pid";
inline constexpr char kTdLaunchRecord[] = "/tmp/tdx-demo-td-launch.json";
inline constexpr char kQemuLogPath[] = "/tmp/tdx-guest-vm.log";
inline constexpr char kGuestLogPattern[] = "/tmp/tdx-guest-*.log";
inline constexpr char kMonitorSocketPattern[] = "/tmp/tdx-demo-*-monitor.sock";

inline constexpr char kBashBinary[] = "/bin/bash";

// Where the image is built before being moved to the working directory.
std::string WorkImagePath(const std::string& output_name);
std::string MonitorSocketPath(const std::string& process_name);

// Resolves `name` through $PATH. Names containing a slash are only checked
// for being executable.
Result<std::string> HostToolPath(const std::string& name);

// The external tools an image build cannot do without.
std::vector<std::string> RequiredImageBuildTools();

}  // namespace tdx
