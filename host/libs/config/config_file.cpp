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

#include "host/libs/config/config_file.h"

#include <cctype>
#include <optional>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/strings.h>

#include "common/libs/utils/files.h"

namespace tdx {
namespace {

bool IsValidKey(const std::string& key) {
  if (key.empty() || std::isdigit(static_cast<unsigned char>(key[0]))) {
    return false;
  }
  for (char c : key) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
      return false;
    }
  }
  return true;
}

std::optional<std::string> ParseValue(const std::string& raw) {
  if (raw.empty()) {
    return "";
  }
  char quote = raw[0];
  if (quote == '"' || quote == '\'') {
    auto closing = raw.find(quote, 1);
    if (closing == std::string::npos) {
      return {};
    }
    auto rest = android::base::Trim(raw.substr(closing + 1));
    if (!rest.empty() && rest[0] != '#') {
      return {};
    }
    auto value = raw.substr(1, closing - 1);
    if (quote == '"' && value.find('$') != std::string::npos) {
      return {};
    }
    return value;
  }
  auto end = raw.find_first_of(" \t");
  auto value = raw.substr(0, end);
  if (end != std::string::npos) {
    auto rest = android::base::Trim(raw.substr(end));
    if (!rest.empty() && rest[0] != '#') {
      return {};
    }
  }
  if (value.find_first_of("$`;|&()<>") != std::string::npos) {
    return {};
  }
  return value;
}

}  // namespace

ConfigFileValues ParseConfigFile(const std::string& contents) {
  ConfigFileValues values;
  int line_number = 0;
  for (const auto& raw_line : android::base::Split(contents, "\n")) {
    line_number++;
    auto line = android::base::Trim(raw_line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    if (android::base::StartsWith(line, "export ")) {
      line = android::base::Trim(line.substr(7));
    }
    auto equals = line.find('=');
    if (equals == std::string::npos) {
      LOG(DEBUG) << "Skipping config line " << line_number << ": \"" << line
                 << "\"";
      continue;
    }
    auto key = line.substr(0, equals);
    if (!IsValidKey(key)) {
      LOG(DEBUG) << "Skipping config line " << line_number << ": \"" << line
                 << "\"";
      continue;
    }
    auto value = ParseValue(line.substr(equals + 1));
    if (!value) {
      LOG(DEBUG) << "Skipping unsupported value on config line "
                 << line_number << ": \"" << line << "\"";
      continue;
    }
    values[key] = *value;
  }
  return values;
}

Result<ConfigFileValues> LoadConfigFile(const std::string& path) {
  if (!FileExists(path)) {
    LOG(DEBUG) << "No config file at \"" << path << "\"";
    return ConfigFileValues{};
  }
  std::string contents;
  TDX_EXPECT(android::base::ReadFileToString(path, &contents),
             "Failed to read config file \"" << path << "\"");
  return ParseConfigFile(contents);
}

}  // namespace tdx
