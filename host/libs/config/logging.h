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

#include "common/libs/fs/shared_fd.h"
#include "common/libs/utils/result.h"
#include "host/libs/config/known_paths.h"

namespace tdx {

// Logs to stderr only, for the launch side tools.
void DefaultToolLogging(char* argv[]);

// Truncates the setup log, writes its header and tees every log line to it
// as well as to stderr.
Result<void> ImageBuildLogging(char* argv[]);

// The setup log opened for appending, so that external tools can write their
// output into it.
Result<SharedFD> OpenSetupLogForAppend(
    const std::string& path = kSetupLogPath);

// User facing outcome lines.
void ReportSuccess(const std::string& message);
void ReportWarning(const std::string& message);
void ReportError(const std::string& message);

}  // namespace tdx
