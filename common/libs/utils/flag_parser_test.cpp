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

#include "common/libs/utils/flag_parser.h"

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/result_matchers.h"

namespace tdx {

TEST(FlagParser, StringFlag) {
  std::string value;
  auto flag = GflagsCompatFlag("myflag", value);
  ASSERT_THAT(flag.Parse({"-myflag=a"}), IsOk());
  ASSERT_EQ(value, "a");
  ASSERT_THAT(flag.Parse({"--myflag=b"}), IsOk());
  ASSERT_EQ(value, "b");
  ASSERT_THAT(flag.Parse({"-myflag", "c"}), IsOk());
  ASSERT_EQ(value, "c");
  ASSERT_THAT(flag.Parse({"--myflag", "d"}), IsOk());
  ASSERT_EQ(value, "d");
  ASSERT_THAT(flag.Parse({"--myflag="}), IsOk());
  ASSERT_EQ(value, "");
}

TEST(FlagParser, RepeatedStringFlag) {
  std::string value;
  auto flag = GflagsCompatFlag("myflag", value);
  ASSERT_THAT(flag.Parse({"-myflag=a", "--myflag", "b"}), IsOk());
  ASSERT_EQ(value, "b");
}

TEST(FlagParser, RepeatedListFlag) {
  std::vector<std::string> elems;
  auto flag = GflagsCompatFlag("myflag");
  flag.Setter([&elems](const FlagMatch& match) -> Result<void> {
    elems.push_back(match.value);
    return {};
  });
  ASSERT_THAT(flag.Parse({"-myflag=a", "--myflag", "b"}), IsOk());
  ASSERT_EQ(elems, (std::vector<std::string>{"a", "b"}));
}

TEST(FlagParser, FlagRemoval) {
  std::string value;
  auto flag = GflagsCompatFlag("myflag", value);
  std::vector<std::string> flags = {"-myflag=a", "-otherflag=c"};
  ASSERT_THAT(flag.Parse(flags), IsOk());
  ASSERT_EQ(value, "a");
  ASSERT_EQ(flags, std::vector<std::string>{"-otherflag=c"});
  flags = {"-otherflag=a", "-myflag=c"};
  ASSERT_THAT(flag.Parse(flags), IsOk());
  ASSERT_EQ(value, "c");
  ASSERT_EQ(flags, std::vector<std::string>{"-otherflag=a"});
}

TEST(FlagParser, IntFlag) {
  std::int32_t value = 0;
  auto flag = GflagsCompatFlag("myflag", value);
  ASSERT_THAT(flag.Parse({"-myflag=5"}), IsOk());
  ASSERT_EQ(value, 5);
  ASSERT_THAT(flag.Parse({"--myflag=6"}), IsOk());
  ASSERT_EQ(value, 6);
  ASSERT_THAT(flag.Parse({"-myflag", "7"}), IsOk());
  ASSERT_EQ(value, 7);
  ASSERT_THAT(flag.Parse({"--myflag", "8"}), IsOk());
  ASSERT_EQ(value, 8);
}

TEST(FlagParser, BoolFlag) {
  bool value = false;
  auto flag = GflagsCompatFlag("myflag", value);
  ASSERT_THAT(flag.Parse({"-myflag"}), IsOk());
  ASSERT_TRUE(value);

  value = false;
  ASSERT_THAT(flag.Parse({"--myflag=true"}), IsOk());
  ASSERT_TRUE(value);

  value = true;
  ASSERT_THAT(flag.Parse({"-nomyflag"}), IsOk());
  ASSERT_FALSE(value);

  value = true;
  ASSERT_THAT(flag.Parse({"--myflag=false"}), IsOk());
  ASSERT_FALSE(value);

  ASSERT_THAT(flag.Parse({"--myflag=nonsense"}), IsError());
}

TEST(FlagParser, ShortBoolSwitch) {
  bool value = false;
  auto flag = GflagsCompatFlag("force", value).Alias(
      {FlagAliasMode::kFlagExact, "-f"});
  std::vector<std::string> args = {"-f", "rest"};
  ASSERT_THAT(flag.Parse(args), IsOk());
  ASSERT_TRUE(value);
  ASSERT_EQ(args, std::vector<std::string>{"rest"});
}

TEST(FlagParser, ShortValueFlag) {
  std::string value;
  auto flag = GflagsCompatFlag("output", value).Alias(
      {FlagAliasMode::kFlagConsumesFollowing, "-o"});
  ASSERT_THAT(flag.Parse({"-o", "guest.qcow2"}), IsOk());
  ASSERT_EQ(value, "guest.qcow2");
  ASSERT_THAT(flag.Parse({"-o"}), IsError());
}

TEST(FlagParser, StringIntFlag) {
  std::int32_t int_value = 0;
  std::string string_value;
  auto int_flag = GflagsCompatFlag("int", int_value);
  auto string_flag = GflagsCompatFlag("string", string_value);
  std::vector<Flag> flags = {int_flag, string_flag};
  ASSERT_THAT(ParseFlags(flags, {"-int=5", "-string=a"}), IsOk());
  ASSERT_EQ(int_value, 5);
  ASSERT_EQ(string_value, "a");
  ASSERT_THAT(ParseFlags(flags, {"--int", "8", "--string", "d"}), IsOk());
  ASSERT_EQ(int_value, 8);
  ASSERT_EQ(string_value, "d");
}

TEST(FlagParser, InvalidStringFlag) {
  std::string value;
  auto flag = GflagsCompatFlag("myflag", value);
  ASSERT_THAT(flag.Parse({"-myflag"}), IsError());
  ASSERT_THAT(flag.Parse({"--myflag"}), IsError());
}

TEST(FlagParser, InvalidIntFlag) {
  std::int32_t value;
  auto flag = GflagsCompatFlag("myflag", value);
  ASSERT_THAT(flag.Parse({"-myflag"}), IsError());
  ASSERT_THAT(flag.Parse({"-myflag=abc"}), IsError());
  ASSERT_THAT(flag.Parse({"--myflag", "def"}), IsError());
  ASSERT_THAT(flag.Parse({"--myflag=99999999999"}), IsError());
}

TEST(FlagParser, UnexpectedArgumentGuard) {
  auto flag = UnexpectedArgumentGuard();
  ASSERT_THAT(flag.Parse({}), IsOk());
  ASSERT_THAT(flag.Parse({"positional"}), IsError());
  ASSERT_THAT(flag.Parse({"positional", "positional2"}), IsError());
  ASSERT_THAT(flag.Parse({"-flag"}), IsError());
  ASSERT_THAT(flag.Parse({"-"}), IsError());
}

TEST(FlagParser, HelpFlag) {
  std::string value;
  bool help_requested = false;
  std::vector<Flag> flags;
  flags.emplace_back(GflagsCompatFlag("myflag", value));
  flags.emplace_back(HelpFlag(flags, help_requested, "usage"));
  ASSERT_THAT(ParseFlags(flags, {"-myflag=a"}), IsOk());
  ASSERT_FALSE(help_requested);
  ASSERT_THAT(ParseFlags(flags, {"-h"}), IsError());
  ASSERT_TRUE(help_requested);
}

}  // namespace tdx
