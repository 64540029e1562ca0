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

#include "common/libs/utils/subprocess.h"

#include <signal.h>

#include <string>
#include <vector>

#include <android-base/file.h>
#include <gtest/gtest.h>

namespace tdx {

TEST(SubprocessTest, CapturesStdout) {
  Command command("/bin/echo");
  command.AddParameter("hello");
  std::string out;
  ASSERT_EQ(RunWithManagedStdio(std::move(command), nullptr, &out, nullptr),
            0);
  ASSERT_EQ(out, "hello\n");
}

TEST(SubprocessTest, FeedsStdin) {
  std::string in = "piped";
  std::string out;
  ASSERT_EQ(RunWithManagedStdio(Command("/bin/cat"), &in, &out, nullptr), 0);
  ASSERT_EQ(out, "piped");
}

TEST(SubprocessTest, ReportsExitCode) {
  Command command("/bin/sh");
  command.AddParameter("-c");
  command.AddParameter("echo oops >&2; exit 3");
  std::string err;
  ASSERT_EQ(RunWithManagedStdio(std::move(command), nullptr, nullptr, &err),
            3);
  ASSERT_EQ(err, "oops\n");
}

TEST(SubprocessTest, WaitReportsSignal) {
  Command command("/bin/sleep");
  command.AddParameter("100");
  auto subprocess = command.Start();
  ASSERT_TRUE(subprocess.Started());
  ASSERT_EQ(kill(subprocess.pid(), SIGTERM), 0);
  ASSERT_LT(subprocess.Wait(), 0);
}

TEST(SubprocessTest, MissingExecutable) {
  Command command("/nonexistent/tool");
  auto subprocess = command.Start();
  ASSERT_TRUE(subprocess.Started());
  ASSERT_NE(subprocess.Wait(), 0);
}

TEST(SubprocessTest, EnvironmentAndWorkingDirectory) {
  TemporaryDir dir;
  Command command("/bin/sh");
  command.AddParameter("-c");
  command.AddParameter("echo \"$TDX_TEST_VALUE\"; pwd -P");
  command.AddEnvironmentVariable("TDX_TEST_VALUE", "first");
  command.AddEnvironmentVariable("TDX_TEST_VALUE", "second");
  command.SetWorkingDirectory(dir.path);
  std::string out;
  ASSERT_EQ(RunWithManagedStdio(std::move(command), nullptr, &out, nullptr),
            0);
  std::string real_dir;
  ASSERT_TRUE(android::base::Realpath(dir.path, &real_dir));
  ASSERT_EQ(out, "second\n" + real_dir + "\n");
}

TEST(SubprocessTest, ArgumentsAndToString) {
  Command command("/usr/bin/qemu-img");
  command.AddParameter("resize");
  command.AddParameter("+", 50, "G");
  ASSERT_EQ(command.Arguments(),
            (std::vector<std::string>{"/usr/bin/qemu-img", "resize", "+50G"}));
  ASSERT_EQ(command.ToString(), "/usr/bin/qemu-img resize +50G");
}

}  // namespace tdx
