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
#include "common/libs/utils/subprocess.h"

namespace tdx {

// Packages providing the image build tools.
std::vector<std::string> HostToolPackages();

Command AptInstallCommand(const std::string& apt);

// Installs the host packages, logging to the setup log. A failure only
// produces a warning since the tools may already be present.
void InstallHostTools();

// Fails on the first required tool missing from $PATH.
Result<void> CheckRequiredTools();

// libvirt run by a normal user needs its qemu.conf adjusted.
void WarnIfNotRoot();

}  // namespace tdx
