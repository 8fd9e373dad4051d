// Copyright (c) 2025 <Your Name>
/**
 * @file socket_posix.cc
 * @brief POSIX (Linux/macOS) implementation of ISocket interface
 */
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "driftserver/platform/socket_interface.hpp"

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace driftserver {
namespace platform {

namespace {

/** Numeric IPv4 endpoint to sockaddr_in; false for non-numeric addresses. */
bool ToSockaddr(const Endpoint& ep, sockaddr_in* addr) {
  *addr = sockaddr_in{};
  addr->sin_family = AF_INET;
  addr->sin_port = htons(ep.port);
  return inet_pton(AF_INET, ep.address.c_str(), &addr->sin_addr) == 1;
}

Endpoint FromSockaddr(const sockaddr_in& addr) {
  char ip[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip)) == nullptr) ip[0] = 0;
  return Endpoint(ip, ntohs(addr.sin_port));
}

}  // namespace

class SocketPosix : public ISocket {
 public:
  SocketPosix() : sock_(-1) {}

  ~SocketPosix() override { Close(); }

  bool Initialize() override {
    sock_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock_ < 0) {
      CaptureErrno("socket creation failed");
      return false;
    }

    return true;
  }

  bool Bind(uint16_t port) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    int reuse = 1;
    // non-fatal
    (void)setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      CaptureErrno("bind failed");
      return false;
    }

    return true;
  }

  bool Connect(const Endpoint& to) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    sockaddr_in addr{};
    if (!ToSockaddr(to, &addr)) {
      SetError("Invalid IP address: " + to.address);
      return false;
    }

    if (connect(sock_, reinterpret_cast<const sockaddr*>(&addr),
                sizeof(addr)) < 0) {
      CaptureErrno("connect failed");
      return false;
    }

    return true;
  }

  bool WaitReadable(int64_t timeout_us) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    pollfd pfd{};
    pfd.fd = sock_;
    pfd.events = POLLIN;

    // Convert microseconds to milliseconds
    int timeout_ms = static_cast<int>(timeout_us / 1000);

    int ready = poll(&pfd, 1, timeout_ms);

    if (ready < 0) {
      CaptureErrno("poll failed");
      return false;
    }

    return ready > 0 && (pfd.revents & POLLIN);
  }

  bool Receive(Endpoint* from, std::vector<uint8_t>* data,
               size_t max_size) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    data->resize(max_size);
    sockaddr_in addr{};
    socklen_t addrlen = sizeof(addr);

    ssize_t n = recvfrom(sock_, data->data(), max_size, 0,
                         reinterpret_cast<sockaddr*>(&addr), &addrlen);

    if (n < 0) {
      CaptureErrno("recvfrom failed");
      data->clear();
      return false;
    }

    // Zero-length datagrams are legal; callers treat them as short packets
    data->resize(static_cast<size_t>(n));

    if (from) *from = FromSockaddr(addr);

    return true;
  }

  bool Send(const Endpoint& to, const std::vector<uint8_t>& data) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    sockaddr_in addr{};
    if (!ToSockaddr(to, &addr)) {
      SetError("Invalid IP address: " + to.address);
      return false;
    }

    ssize_t sent =
        sendto(sock_, data.data(), data.size(), MSG_NOSIGNAL,
               reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    return CheckSent(sent, data.size());
  }

  bool Send(const std::vector<uint8_t>& data) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    ssize_t sent = send(sock_, data.data(), data.size(), MSG_NOSIGNAL);
    return CheckSent(sent, data.size());
  }

  void Shutdown() override {
    if (sock_ >= 0) {
      // ENOTCONN on an unconnected socket is expected and harmless
      (void)shutdown(sock_, SHUT_RDWR);
    }
  }

  void Close() override {
    if (sock_ >= 0) {
      close(sock_);
      sock_ = -1;
    }
  }

  std::string GetLastError() const override {
    std::lock_guard<std::mutex> lk(err_mtx_);
    return last_error_;
  }

  bool IsValid() const override { return sock_ >= 0; }

  int NativeHandle() const override { return sock_; }

  uint16_t LocalPort() const override {
    if (sock_ < 0) return 0;
    sockaddr_in addr{};
    socklen_t addrlen = sizeof(addr);
    if (getsockname(sock_, reinterpret_cast<sockaddr*>(&addr), &addrlen) != 0)
      return 0;
    return ntohs(addr.sin_port);
  }

 private:
  bool CheckSent(ssize_t sent, size_t expected) {
    if (sent < 0) {
      CaptureErrno("send failed");
      return false;
    }

    if (static_cast<size_t>(sent) != expected) {
      std::ostringstream oss;
      oss << "Partial send: sent " << sent << " of " << expected << " bytes";
      SetError(oss.str());
      return false;
    }

    return true;
  }

  void CaptureErrno(const std::string& context) {
    int err = errno;
    std::ostringstream oss;
    oss << context << " (errno " << err << ": " << std::strerror(err) << ")";
    SetError(oss.str());
  }

  // Send and receive may fail concurrently on different threads
  void SetError(const std::string& text) {
    std::lock_guard<std::mutex> lk(err_mtx_);
    last_error_ = text;
  }

  int sock_;
  mutable std::mutex err_mtx_;
  std::string last_error_;
};

std::unique_ptr<ISocket> CreatePlatformSocket() {
  return std::unique_ptr<ISocket>(new SocketPosix());
}

bool ResolveEndpoint(const std::string& host, uint16_t port, Endpoint* out,
                     std::string* err) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;
  hints.ai_protocol = IPPROTO_UDP;

  addrinfo* info = nullptr;
  int rc = getaddrinfo(host.c_str(), nullptr, &hints, &info);
  if (rc != 0 || info == nullptr) {
    if (err) {
      *err = "failed to resolve host \"" + host + "\": " +
             (rc != 0 ? gai_strerror(rc) : "no address");
    }
    if (info) freeaddrinfo(info);
    return false;
  }

  sockaddr_in addr{};
  std::memcpy(&addr, info->ai_addr, sizeof(addr));
  freeaddrinfo(info);

  addr.sin_port = htons(port);
  *out = FromSockaddr(addr);
  return true;
}

}  // namespace platform
}  // namespace driftserver
