/*
 * Copyright (C) 2017 The Android Open Source Project
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

#include <sys/stat.h>
#include <sys/types.h>

#include <string>
#include <vector>

#include "common/libs/utils/result.h"

namespace tdx {
bool FileExists(const std::string& path, bool follow_symlinks = true);
Result<std::vector<std::string>> DirectoryContents(const std::string& path);
bool DirectoryExists(const std::string& path, bool follow_symlinks = true);
Result<void> EnsureDirectoryExists(const std::string& directory_path);
bool RecursivelyRemoveDirectory(const std::string& path);
bool Copy(const std::string& from, const std::string& to);
bool RemoveFile(const std::string& file);
Result<void> WriteNewFile(const std::string& path, const std::string& content,
                          mode_t mode = S_IRUSR | S_IWUSR | S_IRGRP |
                                        S_IROTH);
bool MakeFileExecutable(const std::string& path);
Result<void> SetFileMode(const std::string& path, mode_t mode);
// Renames the file, falling back to copy and delete when the destination is
// on another filesystem.
Result<void> MoveFile(const std::string& from, const std::string& to);
// Paths matching a shell wildcard pattern, sorted. No match is not an error.
Result<std::vector<std::string>> FilesMatching(const std::string& pattern);

// The returned value may contain .. or . if these are present in the path
// argument.
// path must not contain ~
std::string AbsolutePath(const std::string& path);

std::string CurrentDirectory();

// Ensures that the returned string doesn't end with a slash.
std::string cpp_basename(const std::string& str);
std::string cpp_dirname(const std::string& str);

bool FileIsSocket(const std::string& path);
}  // namespace tdx
