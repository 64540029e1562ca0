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

#include "host/libs/config/logging.h"

#include <fcntl.h>
#include <sys/stat.h>

#include <android-base/logging.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/tee_logging.h"
#include "host/libs/config/known_paths.h"

using android::base::SetLogger;

namespace tdx {
namespace {

constexpr char kGreenColor[] = "\033[1;32m";
constexpr char kYellowColor[] = "\033[1;33m";
constexpr char kRedColor[] = "\033[1;31m";
constexpr char kResetColor[] = "\033[0m";

constexpr char kSetupLogHeader[] = "=== tdx guest image generation ===\n";

}  // namespace

void DefaultToolLogging(char* argv[]) {
  ::android::base::InitLogging(argv, android::base::StderrLogger);
  SetLogger(LogToStderrAndFiles({}));
}

Result<void> ImageBuildLogging(char* argv[]) {
  ::android::base::InitLogging(argv, android::base::StderrLogger);
  TDX_EXPECT(WriteNewFile(kSetupLogPath, kSetupLogHeader,
                          S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH),
             "Could not start the setup log");
  SetLogger(LogToStderrAndFiles({kSetupLogPath}));
  return {};
}

Result<SharedFD> OpenSetupLogForAppend(const std::string& path) {
  auto fd = SharedFD::Open(path, O_CREAT | O_WRONLY | O_APPEND,
                           S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH);
  TDX_EXPECT(fd->IsOpen(),
             "Failed to open \"" << path << "\": " << fd->StrError());
  return fd;
}

void ReportSuccess(const std::string& message) {
  LOG(INFO) << kGreenColor << "SUCCESS: " << message << kResetColor;
}

void ReportWarning(const std::string& message) {
  LOG(WARNING) << kYellowColor << "WARN: " << message << kResetColor;
}

void ReportError(const std::string& message) {
  LOG(ERROR) << kRedColor << "ERROR: " << message << kResetColor;
}

}  // namespace tdx
