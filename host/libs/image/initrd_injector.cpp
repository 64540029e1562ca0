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

#include "host/libs/image/initrd_injector.h"

#include <fcntl.h>

#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/strings.h>

#include "common/libs/fs/shared_buf.h"
#include "common/libs/fs/shared_fd.h"
#include "common/libs/utils/files.h"
#include "common/libs/utils/users.h"
#include "host/libs/config/known_paths.h"
#include "host/libs/config/logging.h"
#include "host/libs/image/tool_runner.h"

namespace tdx {
namespace {

constexpr unsigned char kGzipMagic[] = {0x1f, 0x8b};
constexpr char kRamInitrdName[] = "myinitrd.img";

Result<void> RunShellScript(const std::string& script,
                            const std::string& working_dir) {
  Command command(kBashBinary);
  command.AddParameter("-c");
  command.AddParameter("set -o pipefail; " + script);
  command.SetWorkingDirectory(working_dir);
  TDX_EXPECT(RunAndCaptureStdout(std::move(command)));
  return {};
}

Result<void> RunTool(const std::string& tool,
                     const std::vector<std::string>& args) {
  auto command = TDX_EXPECT(HostToolCommand(tool));
  for (const auto& arg : args) {
    command.AddParameter(arg);
  }
  TDX_EXPECT(RunAndCaptureStdout(std::move(command)));
  return {};
}

Result<void> FreshDirectory(const std::string& path) {
  if (DirectoryExists(path)) {
    TDX_EXPECT(RecursivelyRemoveDirectory(path),
               "Failed to remove \"" << path << "\"");
  }
  TDX_EXPECT(EnsureDirectoryExists(path));
  return {};
}

Result<void> AppendLine(const std::string& path, const std::string& line) {
  auto fd = SharedFD::Open(path, O_WRONLY | O_APPEND | O_CREAT, 0755);
  TDX_EXPECT(fd->IsOpen(),
             "Failed to open \"" << path << "\": " << fd->StrError());
  auto text = line + "\n";
  TDX_EXPECT(WriteAll(fd, text) == static_cast<ssize_t>(text.size()),
             "Failed to append to \"" << path << "\": " << fd->StrError());
  return {};
}

}  // namespace

std::string ShellQuote(const std::string& str) {
  std::string quoted = "'";
  for (char c : str) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  return quoted + "'";
}

Result<bool> IsGzipCompressed(const std::string& path) {
  auto fd = SharedFD::Open(path, O_RDONLY);
  TDX_EXPECT(fd->IsOpen(),
             "Failed to open \"" << path << "\": " << fd->StrError());
  unsigned char header[sizeof(kGzipMagic)] = {};
  auto read = fd->Read(header, sizeof(header));
  TDX_EXPECT(read >= 0,
             "Failed to read \"" << path << "\": " << fd->StrError());
  return read == static_cast<ssize_t>(sizeof(header)) &&
         header[0] == kGzipMagic[0] &&
         header[1] == kGzipMagic[1];
}

std::vector<std::string> Partitions(const std::string& lsblk_output) {
  std::vector<std::string> partitions;
  for (const auto& line : android::base::Split(lsblk_output, "\n")) {
    auto fields = android::base::Tokenize(line, " \t");
    if (fields.size() >= 2 && fields[1] == "part") {
      partitions.push_back(fields[0]);
    }
  }
  return partitions;
}

std::string InitrdUnpackScript(const std::string& initrd, bool compressed) {
  if (compressed) {
    return "gzip -dc < " + ShellQuote(initrd) + " | cpio -idm";
  }
  return "cpio -idm < " + ShellQuote(initrd);
}

std::string InitrdRepackScript(const std::string& destination, bool compress) {
  std::string script = "find . | cpio -o -H newc";
  if (compress) {
    script += " | gzip";
  }
  return script + " > " + ShellQuote(destination);
}

Result<std::string> InstallIntoInitrdTree(const std::string& tree,
                                          const std::string& binary,
                                          const std::string& dest_dir) {
  auto name = cpp_basename(binary);
  TDX_EXPECT(!name.empty(), "No file name in \"" << binary << "\"");
  std::string target_dir = tree;
  if (dest_dir != ".") {
    target_dir += "/" + dest_dir;
    TDX_EXPECT(EnsureDirectoryExists(target_dir));
  }
  auto target = target_dir + "/" + name;
  TDX_EXPECT(Copy(binary, target),
             "Failed to copy \"" << binary << "\" to \"" << target << "\"");
  TDX_EXPECT(MakeFileExecutable(target),
             "Failed to make \"" << target << "\" executable");

  std::string init_line = dest_dir == "." ? "./" + name : dest_dir + "/" + name;
  TDX_EXPECT(AppendLine(tree + "/init", init_line));
  return init_line;
}

Result<std::string> FindInitrd(const std::string& boot_dir) {
  auto initrds = TDX_EXPECT(FilesMatching(boot_dir + "/initrd.img-*"));
  TDX_EXPECT(!initrds.empty(), "No initrd.img-* in \"" << boot_dir << "\"");
  return initrds.back();
}

Result<std::string> FindInitrdInPartition(const std::string& mount_dir) {
  auto boot_dir = mount_dir + "/boot";
  if (DirectoryExists(boot_dir)) {
    auto initrd = FindInitrd(boot_dir);
    if (initrd.ok()) {
      return initrd;
    }
  }
  return TDX_EXPECT(FindInitrd(mount_dir));
}

Result<void> InjectBinaryIntoInitrd(const ImageBuildConfig& config,
                                    BuildCleanup& cleanup) {
  TDX_EXPECT(FileExists(config.binaries_path) &&
                 !DirectoryExists(config.binaries_path),
             "\"" << config.binaries_path << "\" is not a binary");

  TDX_EXPECT(RunTool("modprobe", {"nbd", "max_part=8"}));
  TDX_EXPECT(RunTool("qemu-nbd", {"-c", kNbdDevice, config.WorkImage()}));
  cleanup.NbdConnected(true);
  TDX_EXPECT(RunTool("partprobe", {kNbdDevice}));

  auto lsblk = TDX_EXPECT(HostToolCommand("lsblk"));
  lsblk.AddParameter("-lno");
  lsblk.AddParameter("NAME,TYPE");
  lsblk.AddParameter(kNbdDevice);
  auto partitions =
      Partitions(TDX_EXPECT(RunAndCaptureStdout(std::move(lsblk))));
  TDX_EXPECT(!partitions.empty(), "No partition found on " << kNbdDevice);

  // Cloud images may keep /boot on its own partition, so look at each one.
  std::string initrd;
  for (const auto& partition : partitions) {
    auto mounted = RunTool("mount", {"/dev/" + partition, kNbdMountDir});
    if (!mounted.ok()) {
      LOG(DEBUG) << "Skipping " << partition << ": "
                 << mounted.error().Message();
      continue;
    }
    cleanup.NbdMounted(true);
    auto found = FindInitrdInPartition(kNbdMountDir);
    if (found.ok()) {
      LOG(DEBUG) << "Using the initrd on " << partition;
      initrd = *found;
      break;
    }
    TDX_EXPECT(RunTool("umount", {kNbdMountDir}));
    cleanup.NbdMounted(false);
  }
  TDX_EXPECT(!initrd.empty(),
             "No partition of " << kNbdDevice << " holds an initrd.img-*");
  auto compressed = TDX_EXPECT(IsGzipCompressed(initrd));
  TDX_EXPECT(FreshDirectory(kRamInitrdWorkDir));
  TDX_EXPECT(RunShellScript(InitrdUnpackScript(initrd, compressed),
                            kRamInitrdWorkDir),
             "Failed to unpack \"" << initrd << "\"");

  auto init_line =
      TDX_EXPECT(InstallIntoInitrdTree(kRamInitrdWorkDir, config.binaries_path,
                                       config.initrd_dest_dir));
  LOG(INFO) << "Added " << init_line << " to init";

  TDX_EXPECT(RunShellScript(InitrdRepackScript(initrd, true), kRamInitrdWorkDir),
             "Failed to repack \"" << initrd << "\"");

  TDX_EXPECT(RunTool("umount", {kNbdMountDir}));
  cleanup.NbdMounted(false);
  TDX_EXPECT(RunTool("qemu-nbd", {"-d", kNbdDevice}));
  cleanup.NbdConnected(false);
  ReportSuccess("Inject " + cpp_basename(config.binaries_path) +
                " into the initrd");
  return {};
}

Result<void> InjectRamBinariesIntoInitrd(const ImageBuildConfig& config) {
  TDX_EXPECT(DirectoryExists(config.ram_binaries_path),
             "\"" << config.ram_binaries_path << "\" is not a directory");
  std::vector<std::string> binaries;
  for (const auto& entry :
       TDX_EXPECT(DirectoryContents(config.ram_binaries_path))) {
    auto path = config.ram_binaries_path + "/" + entry;
    if (entry == "." || entry == ".." || DirectoryExists(path)) {
      continue;
    }
    binaries.push_back(path);
  }
  TDX_EXPECT(!binaries.empty(),
             "No binaries in \"" << config.ram_binaries_path << "\"");

  TDX_EXPECT(EnsureDirectoryExists(kGuestMountDir));
  TDX_EXPECT(
      RunTool("guestmount", {"-a", config.WorkImage(), "-i", kGuestMountDir}));

  auto boot_dir = std::string(kGuestMountDir) + "/boot";
  auto initrd = TDX_EXPECT(FindInitrd(boot_dir));
  auto compressed = TDX_EXPECT(IsGzipCompressed(initrd));
  TDX_EXPECT(FreshDirectory(kRamInitrdWorkDir));
  TDX_EXPECT(RunShellScript(InitrdUnpackScript(initrd, compressed),
                            kRamInitrdWorkDir),
             "Failed to unpack \"" << initrd << "\"");

  for (const auto& binary : binaries) {
    LOG(INFO) << "Adding " << cpp_basename(binary) << " to initrd";
    TDX_EXPECT(InstallIntoInitrdTree(kRamInitrdWorkDir, binary, "."));
  }

  auto destination = boot_dir + "/" + kRamInitrdName;
  TDX_EXPECT(RunShellScript(InitrdRepackScript(destination, compressed),
                            kRamInitrdWorkDir),
             "Failed to repack into \"" << destination << "\"");
  TDX_EXPECT(RunTool("guestunmount", {kGuestMountDir}));
  ReportSuccess("Inject RAM binaries into " + destination);
  return {};
}

Result<void> InjectIntoInitrd(const ImageBuildConfig& config,
                              BuildCleanup& cleanup) {
  if (config.initrd_mode == InitrdMode::kNone) {
    return {};
  }
  TDX_EXPECT(IsRunningAsRoot(), "Injecting into the initrd requires root");
  switch (config.initrd_mode) {
    case InitrdMode::kBinary:
      TDX_EXPECT(InjectBinaryIntoInitrd(config, cleanup));
      break;
    case InitrdMode::kRam:
      TDX_EXPECT(InjectRamBinariesIntoInitrd(config));
      break;
    case InitrdMode::kNone:
      break;
  }
  return {};
}

}  // namespace tdx
