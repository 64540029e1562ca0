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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace tdx {

using ::testing::ElementsAre;

TEST(GuestDiskTest, ResizeArguments) {
  auto command = QemuImgResizeCommand("/usr/bin/qemu-img", "/tmp/td.qcow2", 50);
  EXPECT_THAT(command.Arguments(),
              ElementsAre("/usr/bin/qemu-img", "resize", "/tmp/td.qcow2",
                          "+50G"));
}

TEST(GuestDiskTest, GrowRootFilesystemArguments) {
  auto command =
      GrowRootFilesystemCommand("/usr/bin/virt-customize", "/tmp/td.qcow2");
  EXPECT_THAT(command.Arguments(),
              ElementsAre("/usr/bin/virt-customize", "-a", "/tmp/td.qcow2",
                          "--run-command", "growpart /dev/sda 1",
                          "--run-command", "resize2fs /dev/sda1",
                          "--run-command", "systemctl mask pollinate.service"));
}

}  // namespace tdx
