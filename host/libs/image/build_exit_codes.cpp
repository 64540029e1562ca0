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
#include "host/libs/image/build_exit_codes.h"

#include <android-base/logging.h>

#include "host/libs/config/logging.h"

namespace tdx {

BuildExitCode ExitCodeForFetch(const Result<CloudImageStatus>& fetched) {
  if (!fetched.ok()) {
    return BuildExitCode::kDownloadFailure;
  }
  switch (*fetched) {
    case CloudImageStatus::kVerified:
      return BuildExitCode::kSuccess;
    case CloudImageStatus::kChecksumMismatch:
    case CloudImageStatus::kNotInManifest:
      return BuildExitCode::kChecksumMismatch;
  }
  return BuildExitCode::kChecksumMismatch;
}

StackTraceError FetchFailure(const Result<CloudImageStatus>& fetched,
                             const ImageBuildConfig& config) {
  if (!fetched.ok()) {
    return fetched.error();
  }
  if (*fetched == CloudImageStatus::kNotInManifest) {
    return TDX_ERR("Invalid SHA256SUM file, no entry for "
                   << config.cloud_image);
  }
  return TDX_ERR(config.cloud_image << " does not match its sha256sum after "
                                    << config.download_attempts
                                    << " downloads");
}

int FailBuild(BuildExitCode code, const StackTraceError& error,
              BuildCleanup* cleanup) {
  ReportError(error.Message());
  LOG(DEBUG) << error.Trace();
  if (cleanup) {
    cleanup->Run();
  }
  return static_cast<int>(code);
}

}  // namespace tdx
