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

#include <string.h>
#include <sys/stat.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <android-base/logging.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/flag_parser.h"
#include "common/libs/utils/result.h"
#include "host/libs/config/image_build_config.h"
#include "host/libs/config/known_paths.h"
#include "host/libs/config/logging.h"
#include "host/libs/image/build_cleanup.h"
#include "host/libs/image/build_exit_codes.h"
#include "host/libs/image/cloud_image_fetcher.h"
#include "host/libs/image/cloud_init.h"
#include "host/libs/image/guest_customizer.h"
#include "host/libs/image/guest_disk.h"
#include "host/libs/image/host_setup.h"
#include "host/libs/image/initrd_injector.h"
#include "host/libs/web/http_client.h"

namespace tdx {
namespace {

constexpr int kServerErrorRetries = 3;
constexpr std::chrono::seconds kServerErrorRetryDelay(5);

int Exit(BuildExitCode code) { return static_cast<int>(code); }

// Moves the finished image out of /tmp and opens it up for the invoking user.
Result<std::string> FinalizeImage(const ImageBuildConfig& config) {
  auto destination = config.work_dir + "/" + config.output_name;
  TDX_EXPECT(MoveFile(config.WorkImage(), destination));
  struct stat st;
  TDX_EXPECT(stat(destination.c_str(), &st) == 0,
             "stat(\"" << destination << "\") failed: " << strerror(errno));
  TDX_EXPECT(SetFileMode(destination, (st.st_mode & 07777) | 0666));
  return destination;
}

int CreateTdImageMain(int argc, char** argv) {
  auto logging = ImageBuildLogging(argv);
  if (!logging.ok()) {
    DefaultToolLogging(argv);
    LOG(WARNING) << "Not writing " << kSetupLogPath << ": "
                 << logging.error().Message();
  }

  bool help_requested = false;
  auto parsed = ParseImageBuildConfig(ArgsToVec(argc - 1, argv + 1),
                                      ProcessEnvironment(), help_requested);
  if (help_requested) {
    return Exit(BuildExitCode::kSuccess);
  }
  if (!parsed.ok()) {
    std::cerr << ImageBuildUsage(cpp_basename(argv[0]));
    return FailBuild(BuildExitCode::kArgumentError, parsed.error(), nullptr);
  }
  const ImageBuildConfig& config = *parsed;

  BuildCleanup cleanup(BuildSideFilesFor(config));

  // A previous run may have left the cloud-init domain defined.
  TeardownCloudInitVm();
  if (config.install_tools) {
    InstallHostTools();
  }
  auto tools = CheckRequiredTools();
  if (!tools.ok()) {
    return FailBuild(BuildExitCode::kMissingTool, tools.error(), &cleanup);
  }
  WarnIfNotRoot();

  auto curl = HttpClient::CurlClient();
  auto http_client = HttpClient::ServerErrorRetryClient(
      *curl, kServerErrorRetries,
      std::chrono::duration_cast<std::chrono::milliseconds>(
          kServerErrorRetryDelay));
  CloudImageFetcher fetcher(*http_client, config);
  auto fetched = fetcher.Fetch();
  auto fetch_code = ExitCodeForFetch(fetched);
  if (fetch_code != BuildExitCode::kSuccess) {
    return FailBuild(fetch_code, FetchFailure(fetched, config), &cleanup);
  }

  auto copied = CopyCloudImage(config);
  if (!copied.ok()) {
    return FailBuild(BuildExitCode::kImageCopyFailure, copied.error(),
                     &cleanup);
  }
  auto resized = ResizeWorkImage(config);
  if (!resized.ok()) {
    return FailBuild(BuildExitCode::kResizeFailure, resized.error(), &cleanup);
  }
  auto grown = GrowRootFilesystem(config);
  if (!grown.ok()) {
    ReportWarning("Failed to resize guest image to " +
                  std::to_string(config.size_gb) + "G");
    LOG(DEBUG) << grown.error().Trace();
  }

  auto iso = CreateCloudInitIso(config);
  if (!iso.ok()) {
    return FailBuild(BuildExitCode::kCloudInitFailure, iso.error(), &cleanup);
  }
  auto cloud_init = RunCloudInit(config);
  if (!cloud_init.ok()) {
    return FailBuild(BuildExitCode::kCloudInitFailure, cloud_init.error(),
                     &cleanup);
  }

  auto customized = CustomizeGuestImage(config);
  if (!customized.ok()) {
    return FailBuild(BuildExitCode::kCustomizationFailure, customized.error(),
                     &cleanup);
  }

  auto injected = InjectIntoInitrd(config, cleanup);
  if (!injected.ok()) {
    return FailBuild(BuildExitCode::kInitrdInjectionFailure, injected.error(),
                     &cleanup);
  }

  cleanup.Run();

  auto image = FinalizeImage(config);
  if (!image.ok()) {
    return FailBuild(BuildExitCode::kFinalizationFailure, image.error(),
                     nullptr);
  }
  ReportSuccess("TDX guest image : " + *image);
  return Exit(BuildExitCode::kSuccess);
}

}  // namespace
}  // namespace tdx

int main(int argc, char** argv) {
  return tdx::CreateTdImageMain(argc, argv);
}
