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

#include "host/libs/vm_manager/tdx_qemu_manager.h"

#include <sys/socket.h>
#include <sys/time.h>

#include <string>
#include <vector>

#include <android-base/logging.h>

#include "common/libs/fs/shared_buf.h"
#include "common/libs/fs/shared_fd.h"
#include "host/libs/config/known_paths.h"

namespace tdx {

TdQemuManager::TdQemuManager(const TdLaunchConfig& config) : config_(config) {}

std::vector<std::string> TdQemuManager::Arguments() const {
  Command qemu_cmd(config_.qemu_binary);
  qemu_cmd.AddParameter("-D");
  qemu_cmd.AddParameter(config_.qemu_log);
  qemu_cmd.AddParameter("-accel");
  qemu_cmd.AddParameter("kvm");
  qemu_cmd.AddParameter("-m");
  qemu_cmd.AddParameter("2G");
  qemu_cmd.AddParameter("-smp");
  qemu_cmd.AddParameter("16");
  qemu_cmd.AddParameter("-name");
  qemu_cmd.AddParameter(config_.process_name,
                        ",process=", config_.process_name,
                        ",debug-threads=on");
  qemu_cmd.AddParameter("-cpu");
  qemu_cmd.AddParameter("host");
  qemu_cmd.AddParameter("-machine");
  qemu_cmd.AddParameter("q35,kernel_irqchip=split,hpet=off");
  qemu_cmd.AddParameter("-bios");
  qemu_cmd.AddParameter(config_.firmware);
  qemu_cmd.AddParameter("-nographic");
  qemu_cmd.AddParameter("-daemonize");
  qemu_cmd.AddParameter("-nodefaults");
  qemu_cmd.AddParameter("-device");
  qemu_cmd.AddParameter("virtio-net-pci,netdev=nic0_vm");
  qemu_cmd.AddParameter("-netdev");
  qemu_cmd.AddParameter("user,id=nic0_vm,hostfwd=tcp::", config_.ssh_port,
                        "-:22");
  qemu_cmd.AddParameter("-drive");
  qemu_cmd.AddParameter("file=", config_.vm_img,
                        ",if=none,id=virtio-disk0");
  qemu_cmd.AddParameter("-device");
  qemu_cmd.AddParameter("virtio-blk-pci,drive=virtio-disk0");
  for (const auto& device_arg : config_.device_args) {
    qemu_cmd.AddParameter(device_arg);
  }
  if (config_.qmp_monitor) {
    qemu_cmd.AddParameter("-chardev");
    qemu_cmd.AddParameter("socket,id=charmonitor,path=",
                          config_.MonitorSocket(), ",server=on,wait=off");
    qemu_cmd.AddParameter("-mon");
    qemu_cmd.AddParameter("chardev=charmonitor,id=monitor,mode=control");
  }
  qemu_cmd.AddParameter("-pidfile");
  qemu_cmd.AddParameter(config_.pid_file);

  auto arguments = qemu_cmd.Arguments();
  arguments.erase(arguments.begin());
  return arguments;
}

Command TdQemuManager::LaunchCommand(const std::string& qemu_binary) const {
  Command qemu_cmd(qemu_binary);
  for (const auto& argument : Arguments()) {
    qemu_cmd.AddParameter(argument);
  }
  return qemu_cmd;
}

Result<void> TdQemuManager::Launch(const std::string& record_path) const {
  auto qemu_binary = TDX_EXPECT(HostToolPath(config_.qemu_binary));
  auto qemu_cmd = LaunchCommand(qemu_binary);
  LOG(DEBUG) << "Launching: " << qemu_cmd.ToString();
  // qemu exits once the guest is daemonized.
  int exit_code = qemu_cmd.Start(SubprocessOptions().ExitWithParent(false))
                      .Wait();
  TDX_EXPECT(exit_code == 0, qemu_binary << " exited with " << exit_code
                                         << ", see " << config_.qemu_log);
  TDX_EXPECT(WriteLaunchRecord(record_path, LaunchRecordFor(config_)));
  return {};
}

Result<void> QuitThroughMonitor(const std::string& monitor_socket,
                                std::chrono::milliseconds reply_timeout) {
  auto monitor_sock =
      SharedFD::SocketLocalClient(monitor_socket, false, SOCK_STREAM);
  TDX_EXPECT(monitor_sock->IsOpen(),
             "The connection to qemu is closed, is it still running? "
                 << monitor_sock->StrError());
  struct timeval timeout;
  timeout.tv_sec = reply_timeout.count() / 1000;
  timeout.tv_usec = (reply_timeout.count() % 1000) * 1000;
  TDX_EXPECT(monitor_sock->SetSockOpt(SOL_SOCKET, SO_RCVTIMEO, &timeout,
                                      sizeof(timeout)) == 0,
             "Failed to set the monitor timeout: " << monitor_sock->StrError());
  std::string msg = "{\"execute\":\"qmp_capabilities\"}{\"execute\":\"quit\"}";
  TDX_EXPECT(WriteAll(monitor_sock, msg) == static_cast<ssize_t>(msg.size()),
             "Error writing to socket: " << monitor_sock->StrError());
  // Log the reply until qemu closes the socket on exit.
  char buff[1000];
  ssize_t len;
  while ((len = monitor_sock->Read(buff, sizeof(buff) - 1)) > 0) {
    buff[len] = '\0';
    LOG(DEBUG) << "From qemu monitor: " << buff;
  }
  TDX_EXPECT(len == 0, "No answer from the qemu monitor at \""
                           << monitor_socket << "\": "
                           << monitor_sock->StrError());
  return {};
}

}  // namespace tdx
