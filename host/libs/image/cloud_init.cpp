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

#include "host/libs/image/cloud_init.h"

#include <chrono>
#include <string>
#include <thread>

#include <android-base/file.h>
#include <android-base/logging.h>

#include "common/libs/utils/files.h"
#include "host/libs/config/known_paths.h"
#include "host/libs/config/logging.h"
#include "host/libs/image/tool_runner.h"

namespace tdx {
namespace {

constexpr char kUserDataTemplate[] = "user-data.template";
constexpr char kMetaDataTemplate[] = "meta-data.template";
constexpr char kUserData[] = "user-data";
constexpr char kMetaData[] = "meta-data";

}  // namespace

Result<CloudInitData> RenderCloudInitData(const std::string& template_dir,
                                          const ImageBuildConfig& config) {
  CloudInitData data;
  auto user_template = template_dir + "/" + kUserDataTemplate;
  TDX_EXPECT(android::base::ReadFileToString(user_template, &data.user_data),
             "Failed to read \"" << user_template << "\"");
  auto meta_template = template_dir + "/" + kMetaDataTemplate;
  TDX_EXPECT(android::base::ReadFileToString(meta_template, &data.meta_data),
             "Failed to read \"" << meta_template << "\"");

  data.user_data += "\nuser: " + config.user + "\n";
  data.user_data += "password: " + config.password + "\n";
  data.user_data += "chpasswd: { expire: False }\n";
  data.meta_data += "\nlocal-hostname: " + config.hostname + "\n";
  return data;
}

Result<void> WriteCloudInitData(const CloudInitData& data,
                                const std::string& directory) {
  TDX_EXPECT(WriteNewFile(directory + "/" + kUserData, data.user_data));
  TDX_EXPECT(WriteNewFile(directory + "/" + kMetaData, data.meta_data));
  return {};
}

Command GenisoimageCommand(const std::string& genisoimage,
                           const std::string& data_dir,
                           const std::string& iso_path) {
  return Command(genisoimage)
      .AddParameter("-output")
      .AddParameter(iso_path)
      .AddParameter("-volid")
      .AddParameter("cidata")
      .AddParameter("-joliet")
      .AddParameter("-rock")
      .AddParameter(kUserData)
      .AddParameter(kMetaData)
      .SetWorkingDirectory(data_dir);
}

Command VirtInstallCommand(const std::string& virt_install,
                           const std::string& image,
                           const std::string& iso_path,
                           std::int32_t wait_minutes) {
  Command command(virt_install);
  command.AddParameter("--debug");
  command.AddParameter("--memory");
  command.AddParameter("4096");
  command.AddParameter("--vcpus");
  command.AddParameter("4");
  command.AddParameter("--name");
  command.AddParameter(kCloudInitDomain);
  command.AddParameter("--disk");
  command.AddParameter(image);
  command.AddParameter("--disk");
  command.AddParameter(iso_path, ",device=cdrom");
  command.AddParameter("--os-variant");
  command.AddParameter("ubuntu24.04");
  command.AddParameter("--virt-type");
  command.AddParameter("kvm");
  command.AddParameter("--graphics");
  command.AddParameter("none");
  command.AddParameter("--import");
  command.AddParameter("--wait=", wait_minutes);
  return command;
}

Result<void> CreateCloudInitIso(const ImageBuildConfig& config) {
  if (FileExists(kCloudInitIsoPath)) {
    TDX_EXPECT(RemoveFile(kCloudInitIsoPath),
               "Failed to remove old \"" << kCloudInitIsoPath << "\"");
  }
  auto data = TDX_EXPECT(
      RenderCloudInitData(config.assets_dir + "/cloud-init-data", config));

  TemporaryDir scratch;
  std::string scratch_dir = scratch.path;
  TDX_EXPECT(WriteCloudInitData(data, scratch_dir));
  ReportSuccess("Generate configuration for cloud-init...");

  auto genisoimage = TDX_EXPECT(HostToolPath("genisoimage"));
  auto packed = RunAndCaptureStdout(
      GenisoimageCommand(genisoimage, scratch_dir, kCloudInitIsoPath));
  RemoveFile(scratch_dir + "/" + kUserData);
  RemoveFile(scratch_dir + "/" + kMetaData);
  TDX_EXPECT(std::move(packed), "Failed to generate the cloud-init ISO");
  ReportSuccess("Generate the cloud-init ISO image...");
  return {};
}

Result<void> RunCloudInit(const ImageBuildConfig& config) {
  auto virt_install = TDX_EXPECT(HostToolPath("virt-install"));
  auto run = RunWithOutputToSetupLog(
      VirtInstallCommand(virt_install, config.WorkImage(), kCloudInitIsoPath,
                         config.cloud_init_wait));
  if (!run.ok()) {
    ReportWarning("Please increase wait time(--wait=" +
                  std::to_string(config.cloud_init_wait) +
                  ") above and try again...");
    return TDX_ERR("Failed to configure cloud init: "
                   << run.error().Message());
  }
  ReportSuccess("Complete cloud-init...");
  std::this_thread::sleep_for(std::chrono::seconds(1));
  TeardownCloudInitVm();
  return {};
}

void TeardownCloudInitVm(const std::string& domain) {
  auto virsh = HostToolPath("virsh");
  if (!virsh.ok()) {
    LOG(DEBUG) << "Skipping cloud-init domain teardown: "
               << virsh.error().Message();
    return;
  }
  RunIgnoringFailure(
      Command(*virsh).AddParameter("shutdown").AddParameter(domain));
  std::this_thread::sleep_for(std::chrono::seconds(1));
  RunIgnoringFailure(
      Command(*virsh).AddParameter("destroy").AddParameter(domain));
  RunIgnoringFailure(
      Command(*virsh).AddParameter("undefine").AddParameter(domain));
}

}  // namespace tdx
