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

#include "host/libs/config/launch_config.h"

#include <android-base/parseint.h>
#include <android-base/strings.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/flag_parser.h"
#include "common/libs/utils/json.h"
#include "host/libs/config/known_paths.h"

namespace tdx {
namespace {

constexpr char kDefaultFirmware[] = "/usr/share/ovmf/OVMF.fd";
constexpr char kDefaultImageName[] =
    "image/tdx-guest-ubuntu-24.04-generic.qcow2";
constexpr char kDefaultDeviceArgs[] = "-device vhost-vsock-pci,guest-cid=3";

constexpr char kVmImgKey[] = "vm_img";
constexpr char kFirmwareKey[] = "firmware";
constexpr char kSshPortKey[] = "ssh_port";
constexpr char kProcessNameKey[] = "process_name";
constexpr char kPidFileKey[] = "pid_file";
constexpr char kMonitorSocketKey[] = "monitor_socket";

std::vector<std::string> SplitDeviceArgs(const std::string& device_args) {
  std::vector<std::string> args;
  for (const auto& arg : android::base::Tokenize(device_args, " \t\n")) {
    args.push_back(arg);
  }
  return args;
}

}  // namespace

std::string TdLaunchConfig::MonitorSocket() const {
  return qmp_monitor ? MonitorSocketPath(process_name) : "";
}

Result<TdLaunchConfig> ParseTdLaunchConfig(std::vector<std::string> args,
                                           const EnvLookup& env,
                                           bool& help_requested) {
  TdLaunchConfig config;
  config.vm_img =
      env("VM_IMG").value_or(CurrentDirectory() + "/" + kDefaultImageName);
  config.firmware = env("FIRMWARE").value_or(kDefaultFirmware);
  std::string ssh_port = env("SSH_PORT").value_or("10022");
  config.process_name = env("PROCESS_NAME").value_or("td");
  std::string device_args = env("DEVICE_ARGS").value_or(kDefaultDeviceArgs);
  config.qemu_binary = "qemu-system-x86_64";
  config.pid_file = kTdPidFile;
  config.qemu_log = kQemuLogPath;

  std::vector<Flag> flags = {
      GflagsCompatFlag("vm_img", config.vm_img).Help("Guest image to boot"),
      GflagsCompatFlag("firmware", config.firmware).Help("OVMF firmware"),
      GflagsCompatFlag("ssh_port", ssh_port)
          .Help("Host port forwarded to the guest ssh port"),
      GflagsCompatFlag("process_name", config.process_name),
      GflagsCompatFlag("device_args", device_args)
          .Help("Extra qemu arguments, split on whitespace"),
      GflagsCompatFlag("qmp_monitor", config.qmp_monitor)
          .Help("Expose a QMP control socket for stop_td"),
      GflagsCompatFlag("qemu_binary", config.qemu_binary),
  };
  flags.emplace_back(HelpFlag(flags, help_requested));
  flags.emplace_back(UnexpectedArgumentGuard());
  TDX_EXPECT(ParseFlags(flags, args), "Invalid arguments");

  TDX_EXPECTF(android::base::ParseInt(ssh_port, &config.ssh_port, 1, 65535),
              "Invalid ssh port \"{}\"", ssh_port);
  TDX_EXPECT(!config.process_name.empty(), "The process name is empty");
  TDX_EXPECT(config.process_name.find_first_of(",/ ") == std::string::npos,
             "Invalid process name \"" << config.process_name << "\"");
  config.device_args = SplitDeviceArgs(device_args);
  config.vm_img = AbsolutePath(config.vm_img);
  return config;
}

TdLaunchRecord LaunchRecordFor(const TdLaunchConfig& config) {
  TdLaunchRecord record;
  record.vm_img = config.vm_img;
  record.firmware = config.firmware;
  record.ssh_port = config.ssh_port;
  record.process_name = config.process_name;
  record.pid_file = config.pid_file;
  record.monitor_socket = config.MonitorSocket();
  return record;
}

Json::Value LaunchRecordToJson(const TdLaunchRecord& record) {
  Json::Value json(Json::objectValue);
  json[kVmImgKey] = record.vm_img;
  json[kFirmwareKey] = record.firmware;
  json[kSshPortKey] = record.ssh_port;
  json[kProcessNameKey] = record.process_name;
  json[kPidFileKey] = record.pid_file;
  json[kMonitorSocketKey] = record.monitor_socket;
  return json;
}

Result<TdLaunchRecord> LaunchRecordFromJson(const Json::Value& json) {
  TDX_EXPECT(json.isObject(), "The launch record is not a JSON object");
  TdLaunchRecord record;
  record.vm_img = TDX_EXPECT(GetValue<std::string>(json, {kVmImgKey}));
  record.firmware = TDX_EXPECT(GetValue<std::string>(json, {kFirmwareKey}));
  record.ssh_port = TDX_EXPECT(GetValue<int>(json, {kSshPortKey}));
  record.process_name =
      TDX_EXPECT(GetValue<std::string>(json, {kProcessNameKey}));
  record.pid_file = TDX_EXPECT(GetValue<std::string>(json, {kPidFileKey}));
  if (json.isMember(kMonitorSocketKey)) {
    record.monitor_socket = json[kMonitorSocketKey].asString();
  }
  return record;
}

Result<void> WriteLaunchRecord(const std::string& path,
                               const TdLaunchRecord& record) {
  TDX_EXPECT(WriteNewFile(path, SerializeJson(LaunchRecordToJson(record))),
             "Failed to write the launch record");
  return {};
}

Result<TdLaunchRecord> ReadLaunchRecord(const std::string& path) {
  auto json = TDX_EXPECT(LoadFromFile(path));
  return TDX_EXPECT(LaunchRecordFromJson(json),
                    "Invalid launch record \"" << path << "\"");
}

}  // namespace tdx
