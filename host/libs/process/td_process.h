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

#include <sys/types.h>

#include <chrono>
#include <string>
#include <vector>

#include <json/json.h>

#include "common/libs/utils/result.h"
#include "host/libs/config/known_paths.h"

namespace tdx {

// Files a launched TD leaves on the host.
struct TdHostFiles {
  std::string pid_file = kTdPidFile;
  std::string launch_record = kTdLaunchRecord;
  // Logs and sockets, as shell wildcard patterns.
  std::vector<std::string> side_files = {kGuestLogPattern,
                                         kMonitorSocketPattern, kSetupLogPath};
};

Result<pid_t> ParsePid(const std::string& contents);
Result<pid_t> ReadPidFile(const std::string& path);

bool ProcessExists(pid_t pid);

// Removes every file matching `pattern`, logging failures.
void RemoveFilesMatching(const std::string& pattern);

/**
 * Terminates the TD and removes its host files. Each step tolerates the TD
 * or its files being already gone, so this can run any number of times.
 *
 * When the launch record names a live QMP socket qemu is asked to quit
 * through it before the SIGTERM.
 */
void StopTd(const TdHostFiles& files, std::chrono::seconds grace_period);

// The launch record fields together with `pid` and `running`.
Result<Json::Value> TdStatus(const TdHostFiles& files);

}  // namespace tdx
