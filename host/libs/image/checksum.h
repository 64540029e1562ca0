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

#include <optional>
#include <string>
#include <vector>

#include "common/libs/utils/result.h"

namespace tdx {

struct ChecksumEntry {
  std::string digest;  // lowercase hex
  std::string file_name;
};

/**
 * Parses a `sha256sum` style manifest. Each line holds a digest, whitespace
 * and a file name, optionally prefixed with `*` for binary mode. Blank lines
 * and lines that are not digest entries are ignored.
 */
std::vector<ChecksumEntry> ParseChecksumManifest(const std::string& contents);

// Digest listed for exactly `file_name`.
std::optional<std::string> ExpectedDigest(
    const std::vector<ChecksumEntry>& entries, const std::string& file_name);

Result<std::string> Sha256OfFile(const std::string& path);

}  // namespace tdx
