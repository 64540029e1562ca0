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

#include "host/libs/config/image_build_config.h"

#include <android-base/logging.h>
#include <android-base/parseint.h>
#include <android-base/strings.h>

#include "common/libs/utils/environment.h"
#include "common/libs/utils/files.h"
#include "common/libs/utils/flag_parser.h"
#include "host/libs/config/config_file.h"
#include "host/libs/config/known_paths.h"

namespace tdx {
namespace {

constexpr char kDefaultImageUrl[] =
    "https://cloud-images.ubuntu.com/releases/noble/release/";
constexpr char kDefaultCloudImage[] = "ubuntu-24.04-server-cloudimg-amd64.img";
constexpr char kGenericGuestImage[] = "tdx-guest-ubuntu-24.04-generic.qcow2";
constexpr char kIntelGuestImage[] = "tdx-guest-ubuntu-24.04-intel.qcow2";

// Flags that have no value until the command line provides one.
struct ImageBuildFlags {
  std::optional<std::string> output_name;
  std::optional<std::string> size_gb;
  std::optional<std::string> hostname;
  std::optional<std::string> user;
  std::optional<std::string> password;
  std::optional<std::string> binaries_path;
  std::optional<std::string> initrd_dest_dir;
  std::optional<std::string> ram_binaries_path;
  std::optional<std::string> image_url;
  std::optional<std::string> cloud_image;
  std::optional<std::string> assets_dir;
  std::optional<std::string> repo_root;
  std::optional<std::string> config_file;
  std::optional<std::string> initrd_mode;
  std::optional<std::string> download_attempts;
  std::optional<std::string> cloud_init_wait;
};

Flag OptionalFlag(const std::string& name, std::optional<std::string>& value) {
  return GflagsCompatFlag(name)
      .Getter([&value]() { return value.value_or(""); })
      .Setter([&value](const FlagMatch& match) -> Result<void> {
        value = match.value;
        return {};
      });
}

Flag ShortOptionalFlag(const std::string& name, const std::string& short_name,
                       std::optional<std::string>& value) {
  return OptionalFlag(name, value).Alias(
      {FlagAliasMode::kFlagConsumesFollowing, "-" + short_name});
}

Result<std::int32_t> ParsePositive(const std::string& name,
                                   const std::string& value) {
  std::int32_t parsed = 0;
  TDX_EXPECTF(android::base::ParseInt(value, &parsed),
              "Invalid {} \"{}\", expected an integer", name, value);
  TDX_EXPECTF(parsed > 0, "Invalid {} \"{}\", expected a positive integer",
              name, value);
  return parsed;
}

}  // namespace

std::ostream& operator<<(std::ostream& out, InitrdMode mode) {
  switch (mode) {
    case InitrdMode::kNone:
      return out << "none";
    case InitrdMode::kBinary:
      return out << "binary";
    case InitrdMode::kRam:
      return out << "ram";
  }
  return out << "unknown";
}

Result<InitrdMode> ParseInitrdMode(const std::string& mode) {
  if (mode == "none") {
    return InitrdMode::kNone;
  } else if (mode == "binary") {
    return InitrdMode::kBinary;
  } else if (mode == "ram") {
    return InitrdMode::kRam;
  }
  return TDX_ERR("Unknown initrd mode \"" << mode
                                          << "\", expected none|binary|ram");
}

EnvLookup ProcessEnvironment() {
  return [](const std::string& name) { return OptionalStringFromEnv(name); };
}

std::string ImageBuildConfig::WorkImage() const {
  return WorkImagePath(output_name);
}

std::string ImageBuildConfig::CloudImagePath() const {
  return assets_dir + "/" + cloud_image;
}

std::string ImageBuildConfig::ChecksumManifestPath() const {
  return assets_dir + "/" + kChecksumManifestName;
}

static std::string JoinUrl(const std::string& base, const std::string& name) {
  if (android::base::EndsWith(base, "/")) {
    return base + name;
  }
  return base + "/" + name;
}

std::string ImageBuildConfig::CloudImageUrl() const {
  return JoinUrl(image_url, cloud_image);
}

std::string ImageBuildConfig::ChecksumManifestUrl() const {
  return JoinUrl(image_url, kChecksumManifestName);
}

std::string ImageBuildUsage(const std::string& program_name) {
  return "Usage: " + program_name + R"( [OPTION]...
  -h                        Show this help
  -f                        Force to recreate the output image
  -n                        Guest host name, default is "tdx-guest"
  -u                        Guest user name, default is "tdx"
  -p                        Guest password, default is "123456"
  -s                        Specify the size of guest image
  -o <output file>          Specify the output file, default is tdx-guest-ubuntu-24.04-generic.qcow2.
                            Please make sure the suffix is qcow2. Due to permission consideration,
                            the output file will be put into /tmp/<output file>, so it must be a
                            file name rather than a path.
  -b <binary path>          Path to the binary to be added to the initrd
  -d <binary destination>   Destination directory within initrd, default is /bin
  -r <ram binaries path>    Directory of binaries to be added to a RAM initrd)";
}

Result<ImageBuildConfig> ParseImageBuildConfig(std::vector<std::string> args,
                                               const EnvLookup& env,
                                               bool& help_requested) {
  ImageBuildFlags flags;
  ImageBuildConfig config;

  std::vector<Flag> flag_list = {
      ShortOptionalFlag("output", "o", flags.output_name)
          .Help("Output image name, must end in .qcow2"),
      ShortOptionalFlag("size", "s", flags.size_gb)
          .Help("Size increase of the guest image, in GB"),
      ShortOptionalFlag("hostname", "n", flags.hostname),
      ShortOptionalFlag("user", "u", flags.user),
      ShortOptionalFlag("password", "p", flags.password),
      ShortOptionalFlag("binaries_path", "b", flags.binaries_path),
      ShortOptionalFlag("initrd_dest_dir", "d", flags.initrd_dest_dir),
      ShortOptionalFlag("ram_binaries_path", "r", flags.ram_binaries_path),
      GflagsCompatFlag("force_recreate", config.force_recreate)
          .Alias({FlagAliasMode::kFlagExact, "-f"})
          .Help("Delete the cached cloud image before fetching it"),
      OptionalFlag("image_url", flags.image_url),
      OptionalFlag("cloud_image", flags.cloud_image),
      OptionalFlag("assets_dir", flags.assets_dir)
          .Help("Directory holding setup.sh and cloud-init-data"),
      OptionalFlag("repo_root", flags.repo_root),
      OptionalFlag("config_file", flags.config_file),
      OptionalFlag("initrd_mode", flags.initrd_mode)
          .Help("none, binary or ram"),
      GflagsCompatFlag("install_tools", config.install_tools)
          .Help("Install the host packages with apt first"),
      OptionalFlag("download_attempts", flags.download_attempts),
      OptionalFlag("cloud_init_wait", flags.cloud_init_wait)
          .Help("Minutes virt-install waits for cloud-init"),
  };
  flag_list.emplace_back(
      HelpFlag(flag_list, help_requested, ImageBuildUsage("create_td_image")));
  flag_list.emplace_back(UnexpectedArgumentGuard());
  TDX_EXPECT(ParseFlags(flag_list, args), "Invalid arguments");

  config.assets_dir = AbsolutePath(flags.assets_dir.value_or(CurrentDirectory()));
  config.repo_root = flags.repo_root.value_or(config.assets_dir + "/../..");
  config.work_dir = CurrentDirectory();

  auto config_file_path = flags.config_file;
  if (!config_file_path) {
    config_file_path = env("TDX_SETUP_CONFIG");
  }
  config.config_file =
      config_file_path.value_or(config.repo_root + "/setup-tdx-config");
  auto file_values = TDX_EXPECT(LoadConfigFile(config.config_file));

  // The config file is sourced after the environment is read, so it wins.
  auto lookup = [&env, &file_values](const std::string& key,
                                     const std::string& default_value) {
    auto it = file_values.find(key);
    if (it != file_values.end()) {
      return it->second;
    }
    return env(key).value_or(default_value);
  };

  config.image_url = lookup("OFFICIAL_UBUNTU_IMAGE", kDefaultImageUrl);
  config.cloud_image = lookup("CLOUD_IMG", kDefaultCloudImage);
  config.output_name = lookup("TDX_SETUP_INTEL_KERNEL", "") == "1"
                           ? kIntelGuestImage
                           : kGenericGuestImage;
  config.user = lookup("GUEST_USER", "tdx");
  config.password = lookup("GUEST_PASSWORD", "123456");
  config.hostname = lookup("GUEST_HOSTNAME", "tdx-guest");
  config.binaries_path = lookup("BINARIES_PATH", "./binaries");
  config.ram_binaries_path =
      lookup("RAM_BINARIES_PATH", config.assets_dir + "/ram-binaries");
  config.initrd_dest_dir = "/bin";

  config.output_name = flags.output_name.value_or(config.output_name);
  config.hostname = flags.hostname.value_or(config.hostname);
  config.user = flags.user.value_or(config.user);
  config.password = flags.password.value_or(config.password);
  config.binaries_path = flags.binaries_path.value_or(config.binaries_path);
  config.initrd_dest_dir =
      flags.initrd_dest_dir.value_or(config.initrd_dest_dir);
  config.ram_binaries_path =
      flags.ram_binaries_path.value_or(config.ram_binaries_path);
  config.image_url = flags.image_url.value_or(config.image_url);
  config.cloud_image = flags.cloud_image.value_or(config.cloud_image);
  if (flags.size_gb) {
    config.size_gb = TDX_EXPECT(ParsePositive("size", *flags.size_gb));
  }
  if (flags.initrd_mode) {
    config.initrd_mode = TDX_EXPECT(ParseInitrdMode(*flags.initrd_mode));
  }
  if (flags.download_attempts) {
    config.download_attempts =
        TDX_EXPECT(ParsePositive("download_attempts", *flags.download_attempts));
  }
  if (flags.cloud_init_wait) {
    config.cloud_init_wait =
        TDX_EXPECT(ParsePositive("cloud_init_wait", *flags.cloud_init_wait));
  }

  TDX_EXPECT(ValidateImageBuildConfig(config));
  return config;
}

Result<void> ValidateImageBuildConfig(const ImageBuildConfig& config) {
  TDX_EXPECT(config.cloud_image != config.output_name,
             "Please specify a different name for guest image via -o");
  TDX_EXPECT(android::base::EndsWith(config.output_name, ".qcow2"),
             "The output file should be qcow2 format with the suffix .qcow2.");
  TDX_EXPECT(config.output_name.find('/') == std::string::npos,
             "The output file should be a file name, not a path: "
                 << config.output_name);
  TDX_EXPECT_GT(config.size_gb, 0, "The image size must be positive");
  TDX_EXPECT_GT(config.download_attempts, 0);
  TDX_EXPECT_GT(config.cloud_init_wait, 0);
  TDX_EXPECT(!config.initrd_dest_dir.empty() && config.initrd_dest_dir[0] == '/',
             "The initrd destination must be an absolute directory: \""
                 << config.initrd_dest_dir << "\"");
  return {};
}

}  // namespace tdx
