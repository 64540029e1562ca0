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

#include "host/libs/config/known_paths.h"

#include <unistd.h>

#include <android-base/strings.h>

#include "common/libs/utils/environment.h"
#include "common/libs/utils/files.h"

namespace tdx {

std::string WorkImagePath(const std::string& output_name) {
  return "/tmp/" + output_name;
}

std::string MonitorSocketPath(const std::string& process_name) {
  return "/tmp/tdx-demo-" + process_name + "-monitor.sock";
}

static bool IsExecutableFile(const std::string& path) {
  return FileExists(path) && !DirectoryExists(path) &&
         access(path.c_str(), X_OK) == 0;
}

Result<std::string> HostToolPath(const std::string& name) {
  TDX_EXPECT(!name.empty(), "Empty tool name");
  if (name.find('/') != std::string::npos) {
    TDX_EXPECT(IsExecutableFile(name), name << " is not installed");
    return name;
  }
  auto path = StringFromEnv("PATH", "/usr/local/bin:/usr/bin:/bin");
  for (const auto& dir : android::base::Split(path, ":")) {
    if (dir.empty()) {
      continue;
    }
    auto candidate = dir + "/" + name;
    if (IsExecutableFile(candidate)) {
      return candidate;
    }
  }
  return TDX_ERR(name << " is not installed");
}

std::vector<std::string> RequiredImageBuildTools() {
  return {"qemu-img", "virt-customize", "virt-install", "genisoimage",
          "virsh"};
}

}  // namespace tdx
