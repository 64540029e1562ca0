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

#include "host/libs/config/config_file.h"

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"

namespace tdx {

using ::testing::IsEmpty;
using ::testing::Pair;
using ::testing::UnorderedElementsAre;

TEST(ConfigFileTest, PlainAndExportedAssignments) {
  auto values = ParseConfigFile(
      "# comment\n"
      "\n"
      "GUEST_USER=alice\n"
      "export GUEST_PASSWORD=secret\n"
      "  GUEST_HOSTNAME=guest  # trailing comment\n");
  EXPECT_THAT(values, UnorderedElementsAre(Pair("GUEST_USER", "alice"),
                                           Pair("GUEST_PASSWORD", "secret"),
                                           Pair("GUEST_HOSTNAME", "guest")));
}

TEST(ConfigFileTest, QuotedValues) {
  auto values = ParseConfigFile(
      "CLOUD_IMG=\"noble image.img\"\n"
      "OFFICIAL_UBUNTU_IMAGE='https://example.com/$release/'\n"
      "EMPTY=\n");
  EXPECT_THAT(values,
              UnorderedElementsAre(
                  Pair("CLOUD_IMG", "noble image.img"),
                  Pair("OFFICIAL_UBUNTU_IMAGE", "https://example.com/$release/"),
                  Pair("EMPTY", "")));
}

TEST(ConfigFileTest, SkipsUnsupportedLines) {
  auto values = ParseConfigFile(
      "if [ -f foo ]; then\n"
      "A=$(whoami)\n"
      "B=\"$HOME/x\"\n"
      "C=a b\n"
      "D=\"unterminated\n"
      "1BAD=x\n"
      "fi\n");
  EXPECT_THAT(values, IsEmpty());
}

TEST(ConfigFileTest, LaterAssignmentWins) {
  auto values = ParseConfigFile("GUEST_USER=a\nGUEST_USER=b\n");
  EXPECT_THAT(values, UnorderedElementsAre(Pair("GUEST_USER", "b")));
}

TEST(ConfigFileTest, MissingFileIsEmpty) {
  TemporaryDir dir;
  EXPECT_THAT(LoadConfigFile(std::string(dir.path) + "/setup-tdx-config"),
              IsOkAndValue(IsEmpty()));
}

TEST(ConfigFileTest, LoadsFile) {
  TemporaryDir dir;
  auto path = std::string(dir.path) + "/setup-tdx-config";
  ASSERT_THAT(WriteNewFile(path, "TDX_SETUP_INTEL_KERNEL=1\n"), IsOk());
  EXPECT_THAT(LoadConfigFile(path),
              IsOkAndValue(UnorderedElementsAre(
                  Pair("TDX_SETUP_INTEL_KERNEL", "1"))));
}

}  // namespace tdx
