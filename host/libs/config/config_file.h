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

#include <map>
#include <string>

#include "common/libs/utils/result.h"

namespace tdx {

using ConfigFileValues = std::map<std::string, std::string>;

/**
 * Reads the assignments out of a `setup-tdx-config` shell fragment.
 *
 * Accepted lines are `KEY=VALUE` and `export KEY=VALUE`. The value may be
 * wrapped in single or double quotes, and an unquoted value ends at the first
 * whitespace. Blank lines and `#` comments are ignored. Anything else, like
 * conditionals or variable expansions, is skipped and logged at DEBUG.
 * Later assignments win over earlier ones.
 */
ConfigFileValues ParseConfigFile(const std::string& contents);

// A missing file yields no values. An unreadable one is an error.
Result<ConfigFileValues> LoadConfigFile(const std::string& path);

}  // namespace tdx
