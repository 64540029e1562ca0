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

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "common/libs/utils/result.h"

namespace tdx {

enum class InitrdMode {
  kNone,
  kBinary,  // Single binary injected through nbd, see binaries_path.
  kRam,     // Directory of binaries injected through guestmount.
};

std::ostream& operator<<(std::ostream&, InitrdMode);
Result<InitrdMode> ParseInitrdMode(const std::string& mode);

using EnvLookup =
    std::function<std::optional<std::string>(const std::string& name)>;

// Reads the process environment.
EnvLookup ProcessEnvironment();

struct ImageBuildConfig {
  std::string output_name;
  std::int32_t size_gb = 50;
  std::string hostname;
  std::string user;
  std::string password;
  std::string binaries_path;
  std::string initrd_dest_dir;
  std::string ram_binaries_path;
  bool force_recreate = false;
  std::string image_url;
  std::string cloud_image;
  std::string assets_dir;
  std::string repo_root;
  std::string config_file;
  InitrdMode initrd_mode = InitrdMode::kNone;
  bool install_tools = true;
  std::int32_t download_attempts = 3;
  std::int32_t cloud_init_wait = 12;
  // Directory the finished image is moved to.
  std::string work_dir;

  std::string WorkImage() const;
  std::string CloudImagePath() const;
  std::string ChecksumManifestPath() const;
  std::string CloudImageUrl() const;
  std::string ChecksumManifestUrl() const;
};

std::string ImageBuildUsage(const std::string& program_name);

/**
 * Builds the configuration out of, from lowest to highest precedence, the
 * built in defaults, `env`, the `setup-tdx-config` file and `args`.
 *
 * `args` excludes the program name. When `-h` is among them the returned
 * error is preceded by setting `help_requested`.
 */
Result<ImageBuildConfig> ParseImageBuildConfig(std::vector<std::string> args,
                                               const EnvLookup& env,
                                               bool& help_requested);

Result<void> ValidateImageBuildConfig(const ImageBuildConfig& config);

}  // namespace tdx
