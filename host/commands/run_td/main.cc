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

#include <string>

#include <android-base/logging.h>

#include "common/libs/utils/flag_parser.h"
#include "common/libs/utils/result.h"
#include "common/libs/utils/users.h"
#include "host/libs/config/known_paths.h"
#include "host/libs/config/launch_config.h"
#include "host/libs/config/logging.h"
#include "host/libs/vm_manager/tdx_qemu_manager.h"

namespace tdx {
namespace {

constexpr char kKvmGroup[] = "kvm";

int RunTdMain(int argc, char** argv) {
  DefaultToolLogging(argv);

  bool help_requested = false;
  auto config = ParseTdLaunchConfig(ArgsToVec(argc - 1, argv + 1),
                                    ProcessEnvironment(), help_requested);
  if (help_requested) {
    return 0;
  }
  if (!config.ok()) {
    LOG(ERROR) << config.error().Message();
    LOG(DEBUG) << config.error().Trace();
    return 1;
  }

  if (!InGroup(kKvmGroup)) {
    auto user = CurrentUserName();
    LOG(ERROR) << "Please add user " << user
               << " to kvm group to run this script (usermod -aG kvm " << user
               << " and then log in again).";
    return 1;
  }

  TdQemuManager qemu_manager(*config);
  auto launched = qemu_manager.Launch(kTdLaunchRecord);
  if (!launched.ok()) {
    LOG(ERROR) << launched.error().Message();
    LOG(DEBUG) << launched.error().Trace();
    return 1;
  }
  LOG(INFO) << "TD is running, connect with: ssh -p " << config->ssh_port
            << " root@localhost";
  return 0;
}

}  // namespace
}  // namespace tdx

int main(int argc, char** argv) { return tdx::RunTdMain(argc, argv); }
