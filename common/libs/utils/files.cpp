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

#include "common/libs/utils/files.h"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <glob.h>
#include <libgen.h>
#include <sys/sendfile.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/unique_fd.h>

#include "common/libs/fs/shared_buf.h"
#include "common/libs/fs/shared_fd.h"

namespace tdx {

bool FileExists(const std::string& path, bool follow_symlinks) {
  struct stat st {};
  return (follow_symlinks ? stat : lstat)(path.c_str(), &st) == 0;
}

Result<std::vector<std::string>> DirectoryContents(const std::string& path) {
  std::vector<std::string> ret;
  std::unique_ptr<DIR, int (*)(DIR*)> dir(opendir(path.c_str()), closedir);
  TDX_EXPECT(dir != nullptr, "Could not read from dir \"" << path << "\"");
  struct dirent* ent{};
  while ((ent = readdir(dir.get()))) {
    ret.push_back(ent->d_name);
  }
  return ret;
}

bool DirectoryExists(const std::string& path, bool follow_symlinks) {
  struct stat st {};
  if ((follow_symlinks ? stat : lstat)(path.c_str(), &st) == -1) {
    return false;
  }
  if ((st.st_mode & S_IFMT) != S_IFDIR) {
    return false;
  }
  return true;
}

Result<void> EnsureDirectoryExists(const std::string& directory_path) {
  if (DirectoryExists(directory_path)) {
    return {};
  }
  const auto parent_dir = cpp_dirname(directory_path);
  if (parent_dir.size() > 1) {
    TDX_EXPECT(EnsureDirectoryExists(parent_dir));
  }
  LOG(DEBUG) << "Setting up " << directory_path;
  if (mkdir(directory_path.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH) <
          0 &&
      errno != EEXIST) {
    return TDX_ERRNO("Failed to create dir: \"" << directory_path
                                                << "\": " << strerror(errno));
  }
  return {};
}

bool RecursivelyRemoveDirectory(const std::string& path) {
  // Copied from libbase TemporaryDir destructor.
  auto callback = [](const char* child, const struct stat*, int file_type,
                     struct FTW*) -> int {
    switch (file_type) {
      case FTW_D:
      case FTW_DP:
      case FTW_DNR:
        if (rmdir(child) == -1) {
          PLOG(ERROR) << "rmdir " << child;
        }
        break;
      case FTW_NS:
      default:
        if (rmdir(child) != -1) {
          break;
        }
        // FALLTHRU (for gcc, lint, pcc, etc; and following for clang)
        FALLTHROUGH_INTENDED;
      case FTW_F:
      case FTW_SL:
      case FTW_SLN:
        if (unlink(child) == -1) {
          PLOG(ERROR) << "unlink " << child;
        }
        break;
    }
    return 0;
  };

  return nftw(path.c_str(), callback, 128, FTW_DEPTH | FTW_MOUNT | FTW_PHYS) ==
         0;
}

namespace {

bool SendFile(int out_fd, int in_fd, off64_t* offset, size_t count) {
  while (count > 0) {
    const auto bytes_written =
        TEMP_FAILURE_RETRY(sendfile(out_fd, in_fd, offset, count));
    if (bytes_written <= 0) {
      return false;
    }

    count -= bytes_written;
  }
  return true;
}

}  // namespace

// Cloud images are sparse, so only the data extents are transferred.
bool Copy(const std::string& from, const std::string& to) {
  android::base::unique_fd fd_from(open(from.c_str(), O_RDONLY | O_CLOEXEC));
  android::base::unique_fd fd_to(
      open(to.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));

  if (fd_from.get() < 0 || fd_to.get() < 0) {
    return false;
  }

  off_t farthest_seek = lseek(fd_from.get(), 0, SEEK_END);
  if (farthest_seek == -1) {
    PLOG(ERROR) << "Could not lseek in \"" << from << "\"";
    return false;
  }
  if (ftruncate64(fd_to.get(), farthest_seek) < 0) {
    PLOG(ERROR) << "Failed to ftruncate " << to;
    return false;
  }
  off64_t offset = 0;
  while (offset < farthest_seek) {
    off_t new_offset = lseek(fd_from.get(), offset, SEEK_HOLE);
    if (new_offset == -1) {
      // ENXIO is returned when there are no more blocks of this type
      // coming.
      if (errno == ENXIO) {
        return true;
      }
      PLOG(ERROR) << "Could not lseek in \"" << from << "\"";
      return false;
    }
    auto data_bytes = new_offset - offset;
    if (lseek(fd_to.get(), offset, SEEK_SET) < 0) {
      PLOG(ERROR) << "lseek() on " << to << " failed";
      return false;
    }
    if (!SendFile(fd_to.get(), fd_from.get(), &offset, data_bytes)) {
      PLOG(ERROR) << "sendfile() failed";
      return false;
    }
    if (offset >= farthest_seek) {
      return true;
    }
    new_offset = lseek(fd_from.get(), offset, SEEK_DATA);
    if (new_offset == -1) {
      // ENXIO is returned when there are no more blocks of this type
      // coming.
      if (errno == ENXIO) {
        return true;
      }
      PLOG(ERROR) << "Could not lseek in \"" << from << "\"";
      return false;
    }
    offset = new_offset;
  }
  return true;
}

std::string AbsolutePath(const std::string& path) {
  if (path.empty()) {
    return {};
  }
  if (path[0] == '/') {
    return path;
  }
  if (path[0] == '~') {
    LOG(WARNING) << "Tilde expansion in path " << path << " is not supported";
    return {};
  }

  std::array<char, PATH_MAX> buffer{};
  if (!realpath(".", buffer.data())) {
    LOG(WARNING) << "Could not get real path for current directory \".\""
                 << ": " << strerror(errno);
    return {};
  }
  return std::string{buffer.data()} + "/" + path;
}

bool MakeFileExecutable(const std::string& path) {
  LOG(DEBUG) << "Making " << path << " executable";
  struct stat st {};
  if (stat(path.c_str(), &st) == -1) {
    return false;
  }
  return chmod(path.c_str(), st.st_mode | S_IXUSR | S_IXGRP | S_IXOTH) == 0;
}

Result<void> SetFileMode(const std::string& path, mode_t mode) {
  if (chmod(path.c_str(), mode) != 0) {
    return TDX_ERRNO("chmod(\"" << path << "\", " << std::oct << mode
                                << ") failed: " << strerror(errno));
  }
  return {};
}

Result<void> MoveFile(const std::string& from, const std::string& to) {
  LOG(DEBUG) << "Moving " << from << " to " << to;
  if (rename(from.c_str(), to.c_str()) == 0) {
    return {};
  }
  TDX_EXPECT(errno == EXDEV, "rename(\"" << from << "\", \"" << to
                                         << "\") failed: " << strerror(errno));
  TDX_EXPECT(Copy(from, to),
             "Failed to copy \"" << from << "\" to \"" << to << "\"");
  TDX_EXPECT(RemoveFile(from), "Failed to remove \"" << from << "\"");
  return {};
}

bool RemoveFile(const std::string& file) {
  LOG(DEBUG) << "Removing file " << file;
  return remove(file.c_str()) == 0;
}

Result<void> WriteNewFile(const std::string& path, const std::string& content,
                          mode_t mode) {
  auto fd = SharedFD::Open(path, O_CREAT | O_WRONLY | O_TRUNC, mode);
  TDX_EXPECT(fd->IsOpen(),
             "Failed to open \"" << path << "\": " << fd->StrError());
  auto written = WriteAll(fd, content);
  TDX_EXPECT_EQ(written, (ssize_t)content.size(),
                "Failed to write \"" << path << "\": " << fd->StrError());
  return {};
}

Result<std::vector<std::string>> FilesMatching(const std::string& pattern) {
  glob_t matches{};
  int ret = glob(pattern.c_str(), 0, nullptr, &matches);
  std::unique_ptr<glob_t, void (*)(glob_t*)> guard(&matches, globfree);
  if (ret == GLOB_NOMATCH) {
    return std::vector<std::string>{};
  }
  TDX_EXPECT(ret == 0, "glob(\"" << pattern << "\") failed with " << ret);
  std::vector<std::string> paths;
  for (size_t i = 0; i < matches.gl_pathc; i++) {
    paths.emplace_back(matches.gl_pathv[i]);
  }
  return paths;
}

std::string CurrentDirectory() {
  char* path = getcwd(nullptr, 0);
  if (path == nullptr) {
    PLOG(ERROR) << "`getcwd(nullptr, 0)` failed";
    return "";
  }
  std::string ret(path);
  free(path);
  return ret;
}

std::string cpp_basename(const std::string& str) {
  char* copy = strdup(str.c_str());  // basename may modify its argument
  std::string ret(basename(copy));
  free(copy);
  return ret;
}

std::string cpp_dirname(const std::string& str) {
  char* copy = strdup(str.c_str());  // dirname may modify its argument
  std::string ret(dirname(copy));
  free(copy);
  return ret;
}

bool FileIsSocket(const std::string& path) {
  struct stat st {};
  return stat(path.c_str(), &st) == 0 && S_ISSOCK(st.st_mode);
}

}  // namespace tdx
