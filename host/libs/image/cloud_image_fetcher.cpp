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

#include "host/libs/image/cloud_image_fetcher.h"

#include <optional>
#include <string>

#include <android-base/file.h>
#include <android-base/logging.h>

#include "common/libs/utils/files.h"
#include "host/libs/config/logging.h"
#include "host/libs/image/checksum.h"

namespace tdx {

std::ostream& operator<<(std::ostream& out, CloudImageStatus status) {
  switch (status) {
    case CloudImageStatus::kVerified:
      return out << "verified";
    case CloudImageStatus::kChecksumMismatch:
      return out << "checksum mismatch";
    case CloudImageStatus::kNotInManifest:
      return out << "not in manifest";
  }
  return out << "unknown";
}

CloudImageFetcher::CloudImageFetcher(HttpClient& http_client,
                                     const ImageBuildConfig& config)
    : http_client_(http_client), config_(config) {}

Result<void> CloudImageFetcher::DownloadChecksumManifest() {
  auto path = config_.ChecksumManifestPath();
  if (FileExists(path)) {
    TDX_EXPECT(RemoveFile(path), "Failed to remove old \"" << path << "\"");
  }
  auto url = config_.ChecksumManifestUrl();
  auto response = TDX_EXPECT(http_client_.DownloadToFile(url, path));
  if (!response.HttpSuccess()) {
    RemoveFile(path);
    return TDX_ERR("Failed to download \"" << url << "\": HTTP code "
                                           << response.http_code);
  }
  return {};
}

Result<void> CloudImageFetcher::DownloadCloudImage() {
  auto url = config_.CloudImageUrl();
  auto path = config_.CloudImagePath();
  LOG(INFO) << "Downloading " << url;
  auto response = TDX_EXPECT(http_client_.DownloadToFile(url, path));
  if (!response.HttpSuccess()) {
    RemoveFile(path);
    return TDX_ERR("Failed to download \"" << url << "\": HTTP code "
                                           << response.http_code);
  }
  return {};
}

Result<CloudImageStatus> CloudImageFetcher::Fetch() {
  auto image_path = config_.CloudImagePath();
  if (config_.force_recreate && FileExists(image_path)) {
    LOG(INFO) << "Removing cached \"" << image_path << "\"";
    TDX_EXPECT(RemoveFile(image_path),
               "Failed to remove \"" << image_path << "\"");
  }

  TDX_EXPECT(DownloadChecksumManifest());
  std::string manifest;
  TDX_EXPECT(android::base::ReadFileToString(config_.ChecksumManifestPath(),
                                             &manifest),
             "Failed to read \"" << config_.ChecksumManifestPath() << "\"");
  auto expected =
      ExpectedDigest(ParseChecksumManifest(manifest), config_.cloud_image);
  if (!expected) {
    LOG(DEBUG) << "No entry for " << config_.cloud_image << " in "
               << config_.ChecksumManifestPath();
    return CloudImageStatus::kNotInManifest;
  }

  int downloads = 0;
  while (true) {
    if (!FileExists(image_path)) {
      TDX_EXPECT(DownloadCloudImage());
      downloads++;
    }
    auto digest = TDX_EXPECT(Sha256OfFile(image_path));
    if (digest == *expected) {
      ReportSuccess("Verify the checksum for Ubuntu cloud image.");
      return CloudImageStatus::kVerified;
    }
    LOG(WARNING) << "Invalid download file according to sha256sum, "
                 << "re-download";
    LOG(DEBUG) << "Expected " << *expected << ", got " << digest;
    TDX_EXPECT(RemoveFile(image_path),
               "Failed to remove \"" << image_path << "\"");
    if (downloads >= config_.download_attempts) {
      return CloudImageStatus::kChecksumMismatch;
    }
  }
}

}  // namespace tdx
