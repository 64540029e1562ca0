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

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"
#include "host/libs/config/known_paths.h"

namespace tdx {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

class TdLaunchConfigTest : public ::testing::Test {
 protected:
  Result<TdLaunchConfig> Parse(std::vector<std::string> args) {
    auto env = [this](const std::string& name) -> std::optional<std::string> {
      auto it = env_.find(name);
      if (it == env_.end()) {
        return {};
      }
      return it->second;
    };
    return ParseTdLaunchConfig(std::move(args), env, help_requested_);
  }

  std::map<std::string, std::string> env_;
  bool help_requested_ = false;
};

TEST_F(TdLaunchConfigTest, Defaults) {
  auto config = Parse({});
  ASSERT_THAT(config, IsOk());
  EXPECT_EQ(config->vm_img, CurrentDirectory() +
                                "/image/tdx-guest-ubuntu-24.04-generic.qcow2");
  EXPECT_EQ(config->firmware, "/usr/share/ovmf/OVMF.fd");
  EXPECT_EQ(config->ssh_port, 10022);
  EXPECT_EQ(config->process_name, "td");
  EXPECT_THAT(config->device_args,
              ElementsAre("-device", "vhost-vsock-pci,guest-cid=3"));
  EXPECT_FALSE(config->qmp_monitor);
  EXPECT_EQ(config->MonitorSocket(), "");
  EXPECT_EQ(config->pid_file, kTdPidFile);
  EXPECT_EQ(config->qemu_log, kQemuLogPath);
}

TEST_F(TdLaunchConfigTest, EnvironmentOverridesDefaults) {
  env_["VM_IMG"] = "/images/guest.qcow2";
  env_["FIRMWARE"] = "/fw/OVMF.fd";
  env_["SSH_PORT"] = "2222";
  env_["PROCESS_NAME"] = "guest";
  env_["DEVICE_ARGS"] = "";
  auto config = Parse({});
  ASSERT_THAT(config, IsOk());
  EXPECT_EQ(config->vm_img, "/images/guest.qcow2");
  EXPECT_EQ(config->firmware, "/fw/OVMF.fd");
  EXPECT_EQ(config->ssh_port, 2222);
  EXPECT_EQ(config->process_name, "guest");
  EXPECT_TRUE(config->device_args.empty());
}

TEST_F(TdLaunchConfigTest, FlagsOverrideEnvironment) {
  env_["SSH_PORT"] = "2222";
  env_["PROCESS_NAME"] = "guest";
  auto config = Parse({"--ssh_port=3333", "--process_name=other",
                       "--device_args=-device  virtio-rng-pci\t-s",
                       "--qmp_monitor"});
  ASSERT_THAT(config, IsOk());
  EXPECT_EQ(config->ssh_port, 3333);
  EXPECT_EQ(config->process_name, "other");
  EXPECT_THAT(config->device_args,
              ElementsAre("-device", "virtio-rng-pci", "-s"));
  EXPECT_EQ(config->MonitorSocket(), "/tmp/tdx-demo-other-monitor.sock");
}

TEST_F(TdLaunchConfigTest, RelativeImageIsMadeAbsolute) {
  auto config = Parse({"--vm_img=guest.qcow2"});
  ASSERT_THAT(config, IsOk());
  EXPECT_EQ(config->vm_img, CurrentDirectory() + "/guest.qcow2");
}

TEST_F(TdLaunchConfigTest, RejectsInvalidPort) {
  EXPECT_THAT(Parse({"--ssh_port=0"}), IsError());
  EXPECT_THAT(Parse({"--ssh_port=65536"}), IsError());
  EXPECT_THAT(Parse({"--ssh_port=ssh"}),
              IsErrorAndMessage(HasSubstr("Invalid ssh port")));
  env_["SSH_PORT"] = "-1";
  EXPECT_THAT(Parse({}), IsError());
}

TEST_F(TdLaunchConfigTest, RejectsInvalidProcessName) {
  EXPECT_THAT(Parse({"--process_name="}), IsError());
  EXPECT_THAT(Parse({"--process_name=a,b"}), IsError());
  EXPECT_THAT(Parse({"--process_name=a/b"}), IsError());
}

TEST_F(TdLaunchConfigTest, RejectsUnknownArguments) {
  EXPECT_THAT(Parse({"--memory=4G"}), IsError());
  EXPECT_THAT(Parse({"run"}), IsError());
}

TEST_F(TdLaunchConfigTest, Help) {
  EXPECT_THAT(Parse({"--help"}), IsError());
  EXPECT_TRUE(help_requested_);
}

TEST(TdLaunchRecordTest, WriteAndRead) {
  TdLaunchConfig config;
  config.vm_img = "/images/guest.qcow2";
  config.firmware = "/fw/OVMF.fd";
  config.ssh_port = 2222;
  config.process_name = "td";
  config.pid_file = "/tmp/pid";
  config.qmp_monitor = true;

  TemporaryDir dir;
  auto path = std::string(dir.path) + "/launch.json";
  ASSERT_THAT(WriteLaunchRecord(path, LaunchRecordFor(config)), IsOk());

  auto record = ReadLaunchRecord(path);
  ASSERT_THAT(record, IsOk());
  EXPECT_EQ(record->vm_img, "/images/guest.qcow2");
  EXPECT_EQ(record->firmware, "/fw/OVMF.fd");
  EXPECT_EQ(record->ssh_port, 2222);
  EXPECT_EQ(record->process_name, "td");
  EXPECT_EQ(record->pid_file, "/tmp/pid");
  EXPECT_EQ(record->monitor_socket, "/tmp/tdx-demo-td-monitor.sock");
}

TEST(TdLaunchRecordTest, MonitorSocketIsOptional) {
  Json::Value json(Json::objectValue);
  json["vm_img"] = "/images/guest.qcow2";
  json["firmware"] = "/fw/OVMF.fd";
  json["ssh_port"] = 10022;
  json["process_name"] = "td";
  json["pid_file"] = "/tmp/pid";
  auto record = LaunchRecordFromJson(json);
  ASSERT_THAT(record, IsOk());
  EXPECT_EQ(record->monitor_socket, "");
}

TEST(TdLaunchRecordTest, RejectsIncompleteRecords) {
  Json::Value json(Json::objectValue);
  json["vm_img"] = "/images/guest.qcow2";
  EXPECT_THAT(LaunchRecordFromJson(json), IsError());
  EXPECT_THAT(LaunchRecordFromJson(Json::Value("text")), IsError());

  TemporaryDir dir;
  auto path = std::string(dir.path) + "/launch.json";
  ASSERT_THAT(WriteNewFile(path, "not json"), IsOk());
  EXPECT_THAT(ReadLaunchRecord(path), IsError());
}

}  // namespace
}  // namespace tdx
