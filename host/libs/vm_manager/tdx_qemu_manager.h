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

#include <chrono>
#include <string>
#include <vector>

#include "common/libs/utils/result.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/config/launch_config.h"

namespace tdx {

// Starts the guest image as a daemonized trust domain with qemu directly.
class TdQemuManager {
 public:
  explicit TdQemuManager(const TdLaunchConfig& config);

  // The qemu arguments after the binary, in command line order.
  std::vector<std::string> Arguments() const;

  Command LaunchCommand(const std::string& qemu_binary) const;

  // Runs qemu until it daemonizes and records the launch in `record_path`.
  Result<void> Launch(const std::string& record_path) const;

 private:
  const TdLaunchConfig& config_;
};

// Asks qemu to quit through the QMP socket. Fails when nothing listens on it,
// or when qemu neither answers nor closes the socket within `reply_timeout`.
Result<void> QuitThroughMonitor(
    const std::string& monitor_socket,
    std::chrono::milliseconds reply_timeout = std::chrono::seconds(5));

}  // namespace tdx
