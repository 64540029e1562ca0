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

#include <ostream>

#include "common/libs/utils/result.h"
#include "host/libs/config/image_build_config.h"
#include "host/libs/web/http_client.h"

namespace tdx {

enum class CloudImageStatus {
  kVerified,
  // Every allowed download produced a file with the wrong digest.
  kChecksumMismatch,
  // The manifest has no entry for the cloud image.
  kNotInManifest,
};

std::ostream& operator<<(std::ostream&, CloudImageStatus);

/**
 * Fetches the checksum manifest and, unless a verified copy is already
 * cached in the assets directory, the cloud image.
 *
 * Transport failures and non-2xx responses are returned as errors. A cached
 * image is deleted first when `force_recreate` is set, and an image with the
 * wrong digest is deleted and downloaded again up to `download_attempts`
 * times.
 */
class CloudImageFetcher {
 public:
  CloudImageFetcher(HttpClient& http_client, const ImageBuildConfig& config);

  Result<CloudImageStatus> Fetch();

 private:
  Result<void> DownloadChecksumManifest();
  Result<void> DownloadCloudImage();

  HttpClient& http_client_;
  const ImageBuildConfig& config_;
};

}  // namespace tdx
