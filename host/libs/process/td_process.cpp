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

#include "host/libs/process/td_process.h"

#include <signal.h>
#include <string.h>

#include <string>
#include <thread>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/parseint.h>
#include <android-base/strings.h>

#include "common/libs/utils/files.h"
#include "host/libs/config/launch_config.h"
#include "host/libs/vm_manager/tdx_qemu_manager.h"

namespace tdx {
namespace {

constexpr char kProcDir[] = "/proc";

void RemoveIfPresent(const std::string& path) {
  if (FileExists(path, /* follow_symlinks */ false) && !RemoveFile(path)) {
    LOG(WARNING) << "Failed to remove \"" << path << "\"";
  }
}

}  // namespace

Result<pid_t> ParsePid(const std::string& contents) {
  auto trimmed = android::base::Trim(contents);
  TDX_EXPECT(!trimmed.empty(), "No pid");
  pid_t pid;
  TDX_EXPECT(android::base::ParseInt(trimmed, &pid, 1),
             "\"" << trimmed << "\" is not a pid");
  return pid;
}

Result<pid_t> ReadPidFile(const std::string& path) {
  std::string contents;
  TDX_EXPECT(android::base::ReadFileToString(path, &contents),
             "Failed to read \"" << path << "\"");
  return TDX_EXPECT(ParsePid(contents), "In \"" << path << "\"");
}

bool ProcessExists(pid_t pid) {
  return DirectoryExists(std::string(kProcDir) + "/" + std::to_string(pid));
}

void RemoveFilesMatching(const std::string& pattern) {
  auto matches = FilesMatching(pattern);
  if (!matches.ok()) {
    LOG(WARNING) << matches.error().Message();
    return;
  }
  for (const auto& path : *matches) {
    RemoveIfPresent(path);
  }
}

void StopTd(const TdHostFiles& files, std::chrono::seconds grace_period) {
  if (FileExists(files.launch_record)) {
    auto record = ReadLaunchRecord(files.launch_record);
    if (!record.ok()) {
      LOG(WARNING) << "Ignoring launch record: " << record.error().Message();
    } else if (!record->monitor_socket.empty() &&
               FileIsSocket(record->monitor_socket)) {
      auto quit = QuitThroughMonitor(record->monitor_socket);
      if (!quit.ok()) {
        LOG(DEBUG) << quit.error().Message();
      }
    }
  }

  for (const auto& pattern : files.side_files) {
    RemoveFilesMatching(pattern);
  }

  if (FileExists(files.pid_file)) {
    auto pid = ReadPidFile(files.pid_file);
    if (pid.ok()) {
      LOG(INFO) << "Cleanup, kill TD with PID: " << *pid;
      if (kill(*pid, SIGTERM) != 0) {
        LOG(DEBUG) << "kill(" << *pid << ") failed: " << strerror(errno);
      }
    } else {
      LOG(DEBUG) << pid.error().Message();
    }
  }

  std::this_thread::sleep_for(grace_period);
  RemoveIfPresent(files.pid_file);
  RemoveIfPresent(files.launch_record);
}

Result<Json::Value> TdStatus(const TdHostFiles& files) {
  Json::Value status(Json::objectValue);
  if (FileExists(files.launch_record)) {
    auto record = TDX_EXPECT(ReadLaunchRecord(files.launch_record));
    status = LaunchRecordToJson(record);
  }
  bool running = false;
  if (FileExists(files.pid_file)) {
    auto pid = TDX_EXPECT(ReadPidFile(files.pid_file));
    status["pid"] = pid;
    running = ProcessExists(pid);
  } else {
    status["pid"] = Json::Value::null;
  }
  status["running"] = running;
  return status;
}

}  // namespace tdx
