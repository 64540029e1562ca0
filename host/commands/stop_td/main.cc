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

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <android-base/logging.h>

#include "common/libs/utils/flag_parser.h"
#include "common/libs/utils/result.h"
#include "host/libs/config/logging.h"
#include "host/libs/process/td_process.h"

namespace tdx {
namespace {

constexpr char kStopTdHelp[] =
    "stop_td: terminates the TD started by run_td and removes its files.";

Result<std::int32_t> ParseGracePeriod(std::vector<std::string> args,
                                      bool& help_requested) {
  std::int32_t grace_period = 3;
  std::vector<Flag> flags;
  flags.emplace_back(
      GflagsCompatFlag("grace_period", grace_period)
          .Help("Seconds to wait for the TD to exit before removing the pid "
                "file."));
  flags.emplace_back(HelpFlag(flags, help_requested, kStopTdHelp));
  flags.emplace_back(UnexpectedArgumentGuard());
  TDX_EXPECT(ParseFlags(flags, args));
  TDX_EXPECT(grace_period >= 0, "--grace_period must not be negative");
  return grace_period;
}

int StopTdMain(int argc, char** argv) {
  DefaultToolLogging(argv);

  bool help_requested = false;
  auto grace_period =
      ParseGracePeriod(ArgsToVec(argc - 1, argv + 1), help_requested);
  if (help_requested) {
    return 0;
  }
  if (!grace_period.ok()) {
    LOG(ERROR) << grace_period.error().Message();
    return 1;
  }

  StopTd(TdHostFiles(), std::chrono::seconds(*grace_period));
  return 0;
}

}  // namespace
}  // namespace tdx

int main(int argc, char** argv) { return tdx::StopTdMain(argc, argv); }
