// Copyright (c) 2025 <Your Name>
#include "internal/transport_channel.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace driftsync {
namespace internal {

bool TransportChannel::Open(const std::string& host, uint16_t port) {
  if (IsOpen()) {
    SetError("transport already open");
    return false;
  }

  std::string err;
  driftserver::platform::Endpoint remote;
  if (!driftserver::platform::ResolveEndpoint(host, port, &remote, &err)) {
    SetError(err);
    return false;
  }

  auto sock = driftserver::platform::CreatePlatformSocket();
  if (!sock->Initialize()) {
    SetError("Socket initialization failed: " + sock->GetLastError());
    return false;
  }

  if (!sock->Connect(remote)) {
    SetError("Socket connect failed: " + sock->GetLastError());
    sock->Close();
    return false;
  }

  int fds[2] = {-1, -1};
  if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
    CaptureErrno("socketpair failed");
    sock->Close();
    return false;
  }
  // The write end must never block Shutdown
  (void)fcntl(fds[0], F_SETFL, fcntl(fds[0], F_GETFL) | O_NONBLOCK);

  socket_ = std::move(sock);
  remote_ = remote;
  wake_fds_[0] = fds[0];
  wake_fds_[1] = fds[1];
  return true;
}

bool TransportChannel::Send(const std::vector<uint8_t>& data) {
  if (!socket_) {
    SetError("socket not open");
    return false;
  }

  if (!socket_->Send(data)) {
    SetError(socket_->GetLastError());
    return false;
  }
  return true;
}

TransportChannel::WaitResult TransportChannel::WaitReadable() {
  if (!socket_ || wake_fds_[1] < 0) {
    SetError("socket not open");
    return WaitResult::kError;
  }

  pollfd pfds[2]{};
  pfds[0].fd = socket_->NativeHandle();
  pfds[0].events = POLLIN;
  pfds[1].fd = wake_fds_[1];
  pfds[1].events = POLLIN;

  for (;;) {
    int ready = poll(pfds, 2, -1);
    if (ready < 0) {
      if (errno == EINTR) continue;
      CaptureErrno("poll failed");
      return WaitResult::kError;
    }
    break;
  }

  if (pfds[1].revents != 0) return WaitResult::kInterrupted;
  if (pfds[0].revents & POLLNVAL) {
    SetError("socket descriptor invalid");
    return WaitResult::kError;
  }
  return WaitResult::kReadable;
}

bool TransportChannel::Receive(std::vector<uint8_t>* data, size_t max_size) {
  if (!socket_) {
    SetError("socket not open");
    return false;
  }

  if (!socket_->Receive(nullptr, data, max_size)) {
    SetError(socket_->GetLastError());
    return false;
  }
  return true;
}

void TransportChannel::ShutdownSocket() {
  if (socket_) socket_->Shutdown();
}

bool TransportChannel::Interrupt() {
  if (wake_fds_[0] < 0) {
    SetError("wake-up channel not open");
    return false;
  }

  const char byte = '0';
  ssize_t n;
  do {
    n = send(wake_fds_[0], &byte, 1, MSG_NOSIGNAL);
  } while (n < 0 && errno == EINTR);

  // A full buffer already holds a pending wake-up
  if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
    CaptureErrno("wake-up write failed");
    return false;
  }
  return true;
}

void TransportChannel::Close() {
  if (socket_) {
    socket_->Close();
    socket_.reset();
  }
  for (int& fd : wake_fds_) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
}

bool TransportChannel::IsOpen() const { return socket_ && socket_->IsValid(); }

std::string TransportChannel::GetLastError() const {
  std::lock_guard<std::mutex> lk(err_mtx_);
  return last_error_;
}

void TransportChannel::SetError(const std::string& text) {
  std::lock_guard<std::mutex> lk(err_mtx_);
  last_error_ = text;
}

void TransportChannel::CaptureErrno(const std::string& context) {
  int err = errno;
  std::ostringstream oss;
  oss << context << " (errno " << err << ": " << std::strerror(err) << ")";
  SetError(oss.str());
}

}  // namespace internal
}  // namespace driftsync
