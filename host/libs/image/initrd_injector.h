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
#pragma once

#include <string>
#include <vector>

#include "common/libs/utils/result.h"
#include "host/libs/config/image_build_config.h"
#include "host/libs/image/build_cleanup.h"

namespace tdx {

// Single quotes `str` for /bin/sh.
std::string ShellQuote(const std::string& str);

// Whether the file starts with the gzip magic bytes.
Result<bool> IsGzipCompressed(const std::string& path);

// Partitions named in the output of `lsblk -lno NAME,TYPE`, in order.
std::vector<std::string> Partitions(const std::string& lsblk_output);

// Shell pipelines run from inside the unpacked tree.
std::string InitrdUnpackScript(const std::string& initrd, bool compressed);
std::string InitrdRepackScript(const std::string& destination, bool compress);

/**
 * Copies `binary` into `dest_dir` of the unpacked initrd at `tree`, marks it
 * executable and appends it to the tree's `init` script. `dest_dir` is
 * relative to the initrd root, "." meaning the root itself.
 *
 * Returns the line added to `init`.
 */
Result<std::string> InstallIntoInitrdTree(const std::string& tree,
                                          const std::string& binary,
                                          const std::string& dest_dir);

// Most recent `initrd.img-*` under `boot_dir`.
Result<std::string> FindInitrd(const std::string& boot_dir);

// The initrd of a mounted partition, which is either the root filesystem
// with a `boot` directory or a separate boot filesystem.
Result<std::string> FindInitrdInPartition(const std::string& mount_dir);

/**
 * Injects `binaries_path` into the guest's initrd through the nbd device,
 * overwriting the original initrd.
 */
Result<void> InjectBinaryIntoInitrd(const ImageBuildConfig& config,
                                    BuildCleanup& cleanup);

/**
 * Injects every file of `ram_binaries_path` into the root of the guest's
 * initrd through guestmount, writing the result to `boot/myinitrd.img`.
 */
Result<void> InjectRamBinariesIntoInitrd(const ImageBuildConfig& config);

// Dispatches on `initrd_mode`. Nothing happens for InitrdMode::kNone.
Result<void> InjectIntoInitrd(const ImageBuildConfig& config,
                              BuildCleanup& cleanup);

}  // namespace tdx
