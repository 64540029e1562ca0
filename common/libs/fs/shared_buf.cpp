/*
 * Copyright (C) 2018 The Android Open Source Project
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

#include "common/libs/fs/shared_buf.h"

#include <string>

#include "common/libs/fs/shared_fd.h"

namespace {

const size_t BUFF_SIZE = 1 << 14;

} // namespace

namespace tdx {

ssize_t WriteAll(SharedFD fd, const char* buf, size_t size) {
  size_t total_written = 0;
  while (total_written < size) {
    ssize_t written = fd->Write(buf + total_written, size - total_written);
    if (written < 0) {
      errno = fd->GetErrno();
      return written;
    }
    if (written == 0) {
      break;
    }
    total_written += written;
  }
  return total_written;
}

ssize_t ReadAll(SharedFD fd, std::string* buf) {
  char buff[BUFF_SIZE];
  std::string data;
  ssize_t read;
  while ((read = fd->Read(buff, BUFF_SIZE)) > 0) {
    data.append(buff, read);
  }
  *buf = data;
  if (read < 0) {
    errno = fd->GetErrno();
    return read;
  }
  return buf->size();
}

ssize_t WriteAll(SharedFD fd, const std::string& buf) {
  return WriteAll(fd, buf.data(), buf.size());
}

} // namespace tdx
