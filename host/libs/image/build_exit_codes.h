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

#include "common/libs/utils/result.h"
#include "host/libs/config/image_build_config.h"
#include "host/libs/image/build_cleanup.h"
#include "host/libs/image/cloud_image_fetcher.h"

namespace tdx {

// Exit status of create_td_image, one per pipeline step that can fail.
enum class BuildExitCode : int {
  kSuccess = 0,
  kArgumentError = 1,
  kMissingTool = 2,
  kDownloadFailure = 3,
  kChecksumMismatch = 4,
  kImageCopyFailure = 5,
  kResizeFailure = 6,
  kCloudInitFailure = 7,
  kCustomizationFailure = 8,
  kInitrdInjectionFailure = 9,
  kFinalizationFailure = 10,
};

// kSuccess only for a verified cloud image.
BuildExitCode ExitCodeForFetch(const Result<CloudImageStatus>& fetched);

// Why the fetch did not produce a verified cloud image. Only meaningful when
// ExitCodeForFetch() is not kSuccess.
StackTraceError FetchFailure(const Result<CloudImageStatus>& fetched,
                             const ImageBuildConfig& config);

// Reports the error, runs the cleanup if there is one and returns the process
// exit status for `code`.
int FailBuild(BuildExitCode code, const StackTraceError& error,
              BuildCleanup* cleanup);

}  // namespace tdx
