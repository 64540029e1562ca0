/*
 * Copyright (C) 2016 The Android Open Source Project
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
#include "common/libs/fs/shared_fd.h"

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <errno.h>
#include <fcntl.h>
#include <stddef.h>
#include <unistd.h>

#include <algorithm>

#include <android-base/logging.h>

namespace tdx {
namespace {

void MakeAddress(const char* name, bool abstract, struct sockaddr_un* dest,
                 socklen_t* len) {
  memset(dest, 0, sizeof(*dest));
  dest->sun_family = AF_UNIX;
  // This is the size of the header in the structure. We need to add the length
  // of the name to this to get the total size.
  *len = offsetof(struct sockaddr_un, sun_path);
  size_t name_len = strlen(name);
  if (abstract) {
    // Leave a '\0' at the start of the name
    name_len = std::min(name_len, sizeof(dest->sun_path) - 1);
    memcpy(dest->sun_path + 1, name, name_len);
    *len += name_len + 1;
  } else {
    name_len = std::min(name_len, sizeof(dest->sun_path) - 1);
    memcpy(dest->sun_path, name, name_len);
    *len += name_len;
  }
}

}  // namespace

void FileInstance::Close() {
  if (fd_ == -1) {
    errno_ = EBADF;
  } else if (close(fd_) == -1) {
    errno_ = errno;
    PLOG(VERBOSE) << "close(" << fd_ << ") failed";
  }
  fd_ = -1;
}

SharedFD SharedFD::Dup(int unmanaged_fd) {
  int fd = fcntl(unmanaged_fd, F_DUPFD_CLOEXEC, 3);
  int error_num = errno;
  return SharedFD(
      std::shared_ptr<FileInstance>(new FileInstance(fd, error_num)));
}

bool SharedFD::Pipe(SharedFD* fd0, SharedFD* fd1) {
  int fds[2];
  int rval = pipe(fds);
  if (rval != -1) {
    (*fd0) = std::shared_ptr<FileInstance>(new FileInstance(fds[0], errno));
    (*fd1) = std::shared_ptr<FileInstance>(new FileInstance(fds[1], errno));
    return true;
  }
  return false;
}

SharedFD SharedFD::Open(const std::string& path, int flags, mode_t mode) {
  int fd = TEMP_FAILURE_RETRY(open(path.c_str(), flags, mode));
  if (fd == -1) {
    return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(fd, errno)));
  } else {
    return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(fd, 0)));
  }
}

SharedFD SharedFD::Socket(int domain, int socket_type, int protocol) {
  int fd = TEMP_FAILURE_RETRY(socket(domain, socket_type, protocol));
  if (fd == -1) {
    return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(fd, errno)));
  } else {
    return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(fd, 0)));
  }
}

SharedFD SharedFD::SocketLocalClient(const std::string& name, bool abstract,
                                     int in_type) {
  struct sockaddr_un addr;
  socklen_t addrlen;
  MakeAddress(name.c_str(), abstract, &addr, &addrlen);
  SharedFD rval = SharedFD::Socket(PF_UNIX, in_type, 0);
  if (!rval->IsOpen()) {
    return rval;
  }
  if (rval->Connect(reinterpret_cast<sockaddr*>(&addr), addrlen) == -1) {
    auto error = rval->GetErrno();
    return SharedFD(
        std::shared_ptr<FileInstance>(new FileInstance(-1, error)));
  }
  return rval;
}

SharedFD SharedFD::SocketLocalServer(const std::string& name) {
  unlink(name.c_str());
  struct sockaddr_un addr;
  socklen_t addrlen;
  MakeAddress(name.c_str(), false, &addr, &addrlen);
  SharedFD rval = SharedFD::Socket(PF_UNIX, SOCK_STREAM, 0);
  if (!rval->IsOpen()) {
    return rval;
  }
  if (rval->Bind(reinterpret_cast<sockaddr*>(&addr), addrlen) == -1 ||
      rval->Listen(1) == -1) {
    auto error = rval->GetErrno();
    LOG(ERROR) << "Failed to listen on \"" << name
               << "\": " << rval->StrError();
    return SharedFD(
        std::shared_ptr<FileInstance>(new FileInstance(-1, error)));
  }
  return rval;
}

}  // namespace tdx
