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

#include "common/libs/utils/result.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/config/known_paths.h"

namespace tdx {

// A command for `tool`, resolved through $PATH.
Result<Command> HostToolCommand(const std::string& tool);

// Runs the command to completion with its stdout and stderr appended to the
// setup log. When the log can't be opened the command inherits the tool's
// stdio instead.
Result<void> RunWithOutputToSetupLog(
    Command command, const std::string& log_path = kSetupLogPath);

// Runs the command to completion and returns its stdout. A non-zero exit is an
// error carrying the captured stderr.
Result<std::string> RunAndCaptureStdout(Command command);

// For teardown steps, where nothing can be done about a failure.
void RunIgnoringFailure(Command command);

}  // namespace tdx
