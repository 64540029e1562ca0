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

#include <cstdint>
#include <string>

#include "common/libs/utils/result.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/config/image_build_config.h"

namespace tdx {

Command QemuImgResizeCommand(const std::string& qemu_img,
                             const std::string& image, std::int32_t size_gb);
Command GrowRootFilesystemCommand(const std::string& virt_customize,
                                  const std::string& image);

// Copies the verified cloud image to the work image, world writable so that
// a libvirt running as a normal user can modify it.
Result<void> CopyCloudImage(const ImageBuildConfig& config);

Result<void> ResizeWorkImage(const ImageBuildConfig& config);

// Grows the root partition and filesystem into the space added by
// ResizeWorkImage.
Result<void> GrowRootFilesystem(const ImageBuildConfig& config);

}  // namespace tdx
