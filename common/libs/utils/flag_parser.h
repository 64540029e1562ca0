/*
 * Copyright (C) 2021 The Android Open Source Project
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

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <android-base/logging.h>

#include "common/libs/utils/result.h"

namespace tdx {

/* Data structure describing one way a flag can appear on the command line. */
enum class FlagAliasMode {
  /* Match arguments of the form `<name><value>`. In practice, <name> usually
   * looks like "-flag=" or "--flag=", where the "-" and "=" are included in
   * parsing. */
  kFlagPrefix,
  /* Match arguments of the form `<name>` exactly. Short switches such as
   * "-f" use this mode. */
  kFlagExact,
  /* Match a pair of arguments of the form `<name>` `<value>`. In practice,
   * <name> looks like "-flag", "--flag" or "-o". */
  kFlagConsumesFollowing,
};

struct FlagAlias {
  FlagAliasMode mode;
  std::string name;
};

std::ostream& operator<<(std::ostream&, const FlagAlias&);

/* A successful match of a flag alias against the argument list. */
struct FlagMatch {
  std::string key;
  std::string value;
};

class Flag {
 public:
  /* Add an alias that triggers matches and calls to the `Setter` function. */
  Flag& Alias(const FlagAlias& alias) &;
  Flag Alias(const FlagAlias& alias) &&;
  /* Set help text, visible in the class ostream writer method. */
  Flag& Help(const std::string&) &;
  Flag Help(const std::string&) &&;
  /* Set a loader that displays the current value in help text. */
  Flag& Getter(std::function<std::string()>) &;
  Flag Getter(std::function<std::string()>) &&;
  /* Set the callback for matches. The callback may be invoked multiple
   * times. */
  Flag& Setter(std::function<Result<void>(const FlagMatch&)>) &;
  Flag Setter(std::function<Result<void>(const FlagMatch&)>) &&;

  /* Examines a list of arguments, removing any matches from the list and
   * invoking the `Setter` for every match. Returns an error if the setter
   * fails. */
  Result<void> Parse(std::vector<std::string>& flags) const;
  Result<void> Parse(std::vector<std::string>&& flags) const;

 private:
  /* Reports whether `Process` wants to consume zero, one, or two arguments. */
  enum class FlagProcessResult {
    /* Error in handling a flag, exit flag handling with an error result. */
    kFlagError,
    kFlagConsumed,
    kFlagConsumedWithFollowing,
    kFlagSkip,
  };

  void ValidateAlias(const FlagAlias& alias);
  Flag& UnvalidatedAlias(const FlagAlias& alias) &;
  Flag UnvalidatedAlias(const FlagAlias& alias) &&;

  /* Attempt to match a single argument. */
  Result<FlagProcessResult> Process(
      const std::string& argument,
      const std::optional<std::string>& next_arg) const;

  bool HasAlias(const FlagAlias&) const;

  friend std::ostream& operator<<(std::ostream&, const Flag&);
  friend Flag UnexpectedArgumentGuard();

  std::vector<FlagAlias> aliases_;
  std::optional<std::string> help_;
  std::optional<std::function<std::string()>> getter_;
  std::optional<std::function<Result<void>(const FlagMatch&)>> setter_;
};

std::ostream& operator<<(std::ostream&, const Flag&);

std::vector<std::string> ArgsToVec(int argc, char** argv);

/* Handles a list of flags. Flags are matched in the order given in case two
 * flags match the same argument. Matched flags are removed, leaving only
 * unmatched arguments. */
Result<void> ParseFlags(const std::vector<Flag>& flags,
                        std::vector<std::string>& args);
Result<void> ParseFlags(const std::vector<Flag>& flags,
                        std::vector<std::string>&& args);

/* If -help or -h is present, sets `help_requested`, writes the help text of
 * every flag in `flags` to the log, and fails the parse so the caller stops
 * before acting on the other arguments. */
Flag HelpFlag(const std::vector<Flag>& flags, bool& help_requested,
              std::string text = "");

/* Catches all remaining arguments, positional or flag-like, and fails. */
Flag UnexpectedArgumentGuard();

/* Creates a flag that requires a value, accepting "-name=value",
 * "--name=value", "-name value" and "--name value". */
Flag GflagsCompatFlag(const std::string& name);
Flag GflagsCompatFlag(const std::string& name, std::string& value);
Flag GflagsCompatFlag(const std::string& name, std::int32_t& value);
/* Boolean flags also accept "-name", "--name", "-noname" and "--noname".
 * Exact aliases added later, like "-f", set the value to true. */
Flag GflagsCompatFlag(const std::string& name, bool& value);

}  // namespace tdx
