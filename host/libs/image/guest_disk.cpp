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

#include "host/libs/image/guest_disk.h"

#include <string>

#include <android-base/logging.h>

#include "common/libs/utils/files.h"
#include "host/libs/config/known_paths.h"
#include "host/libs/config/logging.h"
#include "host/libs/image/tool_runner.h"

namespace tdx {

Command QemuImgResizeCommand(const std::string& qemu_img,
                             const std::string& image, std::int32_t size_gb) {
  Command command(qemu_img);
  command.AddParameter("resize");
  command.AddParameter(image);
  command.AddParameter("+", size_gb, "G");
  return command;
}

Command GrowRootFilesystemCommand(const std::string& virt_customize,
                                  const std::string& image) {
  Command command(virt_customize);
  command.AddParameter("-a");
  command.AddParameter(image);
  for (const auto& guest_command :
       {"growpart /dev/sda 1", "resize2fs /dev/sda1",
        "systemctl mask pollinate.service"}) {
    command.AddParameter("--run-command");
    command.AddParameter(guest_command);
  }
  return command;
}

Result<void> CopyCloudImage(const ImageBuildConfig& config) {
  auto source = config.CloudImagePath();
  auto destination = config.WorkImage();
  if (FileExists(destination, /* follow_symlinks */ false)) {
    TDX_EXPECT(RemoveFile(destination),
               "Failed to remove stale \"" << destination << "\"");
  }
  TDX_EXPECT(Copy(source, destination),
             "Failed to copy " << config.cloud_image << " to "
                               << cpp_dirname(destination));
  TDX_EXPECT(SetFileMode(destination, 0777));
  ReportSuccess("Copy the " + config.cloud_image + " => " + destination);
  return {};
}

Result<void> ResizeWorkImage(const ImageBuildConfig& config) {
  auto qemu_img = TDX_EXPECT(HostToolPath("qemu-img"));
  TDX_EXPECT(RunAndCaptureStdout(
                 QemuImgResizeCommand(qemu_img, config.WorkImage(),
                                      config.size_gb)),
             "Failed to resize \"" << config.WorkImage() << "\"");
  return {};
}

Result<void> GrowRootFilesystem(const ImageBuildConfig& config) {
  auto virt_customize = TDX_EXPECT(HostToolPath("virt-customize"));
  TDX_EXPECT(RunWithOutputToSetupLog(
      GrowRootFilesystemCommand(virt_customize, config.WorkImage())));
  ReportSuccess("Resize the guest image to " +
                std::to_string(config.size_gb) + "G");
  return {};
}

}  // namespace tdx
