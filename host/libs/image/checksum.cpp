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

#include "host/libs/image/checksum.h"

#include <fcntl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/strings.h>
#include <openssl/evp.h>

#include "common/libs/fs/shared_fd.h"

namespace tdx {
namespace {

constexpr size_t kSha256HexLength = 64;
constexpr size_t kReadChunkSize = 1 << 20;

bool IsHexDigest(const std::string& str) {
  return str.size() == kSha256HexLength &&
         std::all_of(str.begin(), str.end(),
                     [](unsigned char c) { return std::isxdigit(c); });
}

std::string ToHex(const unsigned char* data, unsigned int size) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(size * 2);
  for (unsigned int i = 0; i < size; i++) {
    hex.push_back(kDigits[data[i] >> 4]);
    hex.push_back(kDigits[data[i] & 0xf]);
  }
  return hex;
}

}  // namespace

std::vector<ChecksumEntry> ParseChecksumManifest(const std::string& contents) {
  std::vector<ChecksumEntry> entries;
  for (const auto& raw_line : android::base::Split(contents, "\n")) {
    auto line = android::base::Trim(raw_line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    auto separator = line.find_first_of(" \t");
    if (separator == std::string::npos) {
      LOG(DEBUG) << "Ignoring manifest line without file name: \"" << line
                 << "\"";
      continue;
    }
    auto digest = line.substr(0, separator);
    if (!IsHexDigest(digest)) {
      LOG(DEBUG) << "Ignoring manifest line without digest: \"" << line << "\"";
      continue;
    }
    auto name = android::base::Trim(line.substr(separator));
    if (android::base::StartsWith(name, "*")) {
      name = name.substr(1);
    }
    if (name.empty()) {
      continue;
    }
    std::transform(digest.begin(), digest.end(), digest.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    entries.push_back(ChecksumEntry{digest, name});
  }
  return entries;
}

std::optional<std::string> ExpectedDigest(
    const std::vector<ChecksumEntry>& entries, const std::string& file_name) {
  for (const auto& entry : entries) {
    if (entry.file_name == file_name) {
      return entry.digest;
    }
  }
  return {};
}

Result<std::string> Sha256OfFile(const std::string& path) {
  auto fd = SharedFD::Open(path, O_RDONLY);
  TDX_EXPECT(fd->IsOpen(),
             "Could not open \"" << path << "\": " << fd->StrError());

  std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)> md_ctx(EVP_MD_CTX_new(),
                                                           EVP_MD_CTX_free);
  TDX_EXPECT(md_ctx != nullptr, "Failed to allocate digest context");
  TDX_EXPECT(EVP_DigestInit_ex(md_ctx.get(), EVP_sha256(), nullptr) == 1);

  std::vector<char> buffer(kReadChunkSize);
  while (true) {
    auto read = fd->Read(buffer.data(), buffer.size());
    TDX_EXPECT(read >= 0,
               "Failed to read \"" << path << "\": " << fd->StrError());
    if (read == 0) {
      break;
    }
    TDX_EXPECT(EVP_DigestUpdate(md_ctx.get(), buffer.data(), read) == 1);
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_size = 0;
  TDX_EXPECT(EVP_DigestFinal_ex(md_ctx.get(), digest, &digest_size) == 1);
  return ToHex(digest, digest_size);
}

}  // namespace tdx
