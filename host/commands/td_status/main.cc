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

#include <iostream>
#include <string>
#include <vector>

#include <android-base/logging.h>

#include "common/libs/utils/flag_parser.h"
#include "common/libs/utils/json.h"
#include "common/libs/utils/result.h"
#include "host/libs/config/logging.h"
#include "host/libs/process/td_process.h"

namespace tdx {
namespace {

constexpr char kTdStatusHelp[] =
    "td_status: prints the state of the TD started by run_td as JSON. Exits "
    "with 0 only when the TD is running.";

int TdStatusMain(int argc, char** argv) {
  DefaultToolLogging(argv);

  bool help_requested = false;
  std::vector<Flag> flags;
  flags.emplace_back(HelpFlag(flags, help_requested, kTdStatusHelp));
  flags.emplace_back(UnexpectedArgumentGuard());
  auto parsed = ParseFlags(flags, ArgsToVec(argc - 1, argv + 1));
  if (help_requested) {
    return 0;
  }
  if (!parsed.ok()) {
    LOG(ERROR) << parsed.error().Message();
    return 1;
  }

  auto status = TdStatus(TdHostFiles());
  if (!status.ok()) {
    LOG(ERROR) << status.error().Message();
    LOG(DEBUG) << status.error().Trace();
    return 1;
  }
  std::cout << SerializeJson(*status);
  return (*status)["running"].asBool() ? 0 : 1;
}

}  // namespace
}  // namespace tdx

int main(int argc, char** argv) { return tdx::TdStatusMain(argc, argv); }
