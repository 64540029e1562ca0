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
#include <vector>

#include <json/json.h>

#include "common/libs/utils/result.h"
#include "host/libs/config/image_build_config.h"

namespace tdx {

struct TdLaunchConfig {
  std::string vm_img;
  std::string firmware;
  std::int32_t ssh_port = 10022;
  std::string process_name;
  std::vector<std::string> device_args;
  bool qmp_monitor = false;
  std::string qemu_binary;
  std::string pid_file;
  std::string qemu_log;

  // Empty unless qmp_monitor is set.
  std::string MonitorSocket() const;
};

/**
 * Reads VM_IMG, FIRMWARE, SSH_PORT, PROCESS_NAME and DEVICE_ARGS from `env`
 * and lets the flags in `args` override them. `args` excludes the program
 * name.
 */
Result<TdLaunchConfig> ParseTdLaunchConfig(std::vector<std::string> args,
                                           const EnvLookup& env,
                                           bool& help_requested);

// What run_td leaves behind for stop_td and td_status.
struct TdLaunchRecord {
  std::string vm_img;
  std::string firmware;
  std::int32_t ssh_port = 0;
  std::string process_name;
  std::string pid_file;
  std::string monitor_socket;
};

TdLaunchRecord LaunchRecordFor(const TdLaunchConfig& config);
Json::Value LaunchRecordToJson(const TdLaunchRecord& record);
Result<TdLaunchRecord> LaunchRecordFromJson(const Json::Value& json);

Result<void> WriteLaunchRecord(const std::string& path,
                               const TdLaunchRecord& record);
Result<TdLaunchRecord> ReadLaunchRecord(const std::string& path);

}  // namespace tdx
