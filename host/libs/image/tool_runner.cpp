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

#include "host/libs/image/tool_runner.h"

#include <string>

#include <android-base/logging.h>
#include <android-base/strings.h>

#include "host/libs/config/known_paths.h"
#include "host/libs/config/logging.h"

namespace tdx {

Result<Command> HostToolCommand(const std::string& tool) {
  return Command(TDX_EXPECT(HostToolPath(tool)));
}

Result<void> RunWithOutputToSetupLog(Command command,
                                     const std::string& log_path) {
  auto description = command.ToString();
  LOG(DEBUG) << "Running `" << description << "`";
  auto log = OpenSetupLogForAppend(log_path);
  if (log.ok()) {
    command.RedirectStdIO(Subprocess::StdIOChannel::kStdOut, *log);
    command.RedirectStdIO(Subprocess::StdIOChannel::kStdErr, *log);
  } else {
    LOG(WARNING) << "Output of `" << description
                 << "` is not logged: " << log.error().Message();
  }
  int exit_code = command.Start().Wait();
  TDX_EXPECT(exit_code == 0,
             "`" << description << "` exited with " << exit_code
                 << (log.ok() ? ", see " + log_path : std::string()));
  return {};
}

Result<std::string> RunAndCaptureStdout(Command command) {
  auto description = command.ToString();
  LOG(DEBUG) << "Running `" << description << "`";
  std::string stdout_str;
  std::string stderr_str;
  int exit_code = RunWithManagedStdio(std::move(command), nullptr, &stdout_str,
                                      &stderr_str);
  if (!stdout_str.empty()) {
    LOG(DEBUG) << "stdout: " << stdout_str;
  }
  TDX_EXPECT(exit_code == 0, "`" << description << "` exited with "
                                 << exit_code << ": "
                                 << android::base::Trim(stderr_str));
  return stdout_str;
}

void RunIgnoringFailure(Command command) {
  auto description = command.ToString();
  std::string stdout_str;
  std::string stderr_str;
  int exit_code = RunWithManagedStdio(std::move(command), nullptr, &stdout_str,
                                      &stderr_str);
  if (exit_code != 0) {
    LOG(DEBUG) << "`" << description << "` exited with " << exit_code
               << ", ignoring";
  }
}

}  // namespace tdx
