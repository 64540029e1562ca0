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

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"

namespace tdx {

using ::testing::ElementsAre;
using ::testing::EndsWith;
using ::testing::StartsWith;

TEST(CloudInitTest, RenderAppendsAccountAndHostname) {
  TemporaryDir templates;
  std::string dir = templates.path;
  ASSERT_THAT(WriteNewFile(dir + "/user-data.template",
                           "#cloud-config\nssh_pwauth: true"),
              IsOk());
  ASSERT_THAT(WriteNewFile(dir + "/meta-data.template", "instance-id: guest"),
              IsOk());

  ImageBuildConfig config;
  config.user = "alice";
  config.password = "secret";
  config.hostname = "tdx-host";
  auto data = RenderCloudInitData(dir, config);
  ASSERT_THAT(data, IsOk());
  EXPECT_THAT(data->user_data, StartsWith("#cloud-config\n"));
  EXPECT_THAT(data->user_data,
              EndsWith("\nuser: alice\npassword: secret\n"
                       "chpasswd: { expire: False }\n"));
  EXPECT_EQ(data->meta_data, "instance-id: guest\nlocal-hostname: tdx-host\n");
}

TEST(CloudInitTest, RenderFailsWithoutTemplates) {
  TemporaryDir templates;
  EXPECT_THAT(RenderCloudInitData(templates.path, ImageBuildConfig()),
              IsError());
}

TEST(CloudInitTest, WriteData) {
  TemporaryDir out;
  std::string dir = out.path;
  ASSERT_THAT(WriteCloudInitData({"user", "meta"}, dir), IsOk());
  std::string contents;
  ASSERT_TRUE(android::base::ReadFileToString(dir + "/user-data", &contents));
  EXPECT_EQ(contents, "user");
  ASSERT_TRUE(android::base::ReadFileToString(dir + "/meta-data", &contents));
  EXPECT_EQ(contents, "meta");
}

TEST(CloudInitTest, GenisoimageArguments) {
  auto command = GenisoimageCommand("/usr/bin/genisoimage", "/tmp/data",
                                    "/tmp/ci.iso");
  EXPECT_THAT(command.Arguments(),
              ElementsAre("/usr/bin/genisoimage", "-output", "/tmp/ci.iso",
                          "-volid", "cidata", "-joliet", "-rock", "user-data",
                          "meta-data"));
}

TEST(CloudInitTest, VirtInstallArguments) {
  auto command = VirtInstallCommand("/usr/bin/virt-install", "/tmp/td.qcow2",
                                    "/tmp/ci.iso", 12);
  EXPECT_THAT(
      command.Arguments(),
      ElementsAre("/usr/bin/virt-install", "--debug", "--memory", "4096",
                  "--vcpus", "4", "--name", "tdx-config-cloud-init", "--disk",
                  "/tmp/td.qcow2", "--disk", "/tmp/ci.iso,device=cdrom",
                  "--os-variant", "ubuntu24.04", "--virt-type", "kvm",
                  "--graphics", "none", "--import", "--wait=12"));
}

}  // namespace tdx
