// Copyright (c) 2025 <Your Name>
/**
 * @file transport_channel.hpp
 * @brief Datagram socket plus wake-up channel for the sync client.
 *
 * The receive side blocks on the data socket and on a local wake-up pair at
 * the same time, so Shutdown can unblock a pending wait regardless of network
 * traffic.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "driftserver/platform/socket_interface.hpp"

namespace driftsync {
namespace internal {

/**
 * @brief UDP endpoint connected to the reflector, with an interrupt pair.
 *
 * Send() may be called from one thread while another blocks in
 * WaitReadable()/Receive(). Open() and Close() must not race with either.
 */
class TransportChannel {
 public:
  /**
   * @brief Outcome of WaitReadable().
   */
  enum class WaitResult {
    kReadable,     ///< Data socket has a datagram (or a pending error)
    kInterrupted,  ///< Wake-up byte received
    kError,        ///< poll() failed
  };

  TransportChannel() = default;
  ~TransportChannel() { Close(); }

  TransportChannel(const TransportChannel&) = delete;
  TransportChannel& operator=(const TransportChannel&) = delete;

  /**
   * @brief Resolve host, connect the datagram socket and create the wake-up
   *        pair.
   * @return true on success; on failure nothing stays open.
   */
  bool Open(const std::string& host, uint16_t port);

  /** Send one datagram to the connected reflector. */
  bool Send(const std::vector<uint8_t>& data);

  /** Block until the socket is readable or the wake-up pair fires. */
  WaitResult WaitReadable();

  /**
   * @brief Receive one datagram.
   * @param data Output buffer; resized to the datagram length.
   * @param max_size Largest datagram accepted without truncation.
   */
  bool Receive(std::vector<uint8_t>* data, size_t max_size);

  /**
   * @brief Stop all I/O on the data socket.
   *
   * Pending and later sends/receives fail. The descriptor is kept until
   * Close() so it cannot be reused while a loop still refers to it.
   */
  void ShutdownSocket();

  /** Write one wake-up byte. */
  bool Interrupt();

  /** Release the data socket and both ends of the wake-up pair. */
  void Close();

  bool IsOpen() const;

  std::string GetLastError() const;

  /** Resolved reflector endpoint. */
  const driftserver::platform::Endpoint& Remote() const { return remote_; }

 private:
  void SetError(const std::string& text);
  void CaptureErrno(const std::string& context);

  std::unique_ptr<driftserver::platform::ISocket> socket_;
  driftserver::platform::Endpoint remote_;
  int wake_fds_[2] = {-1, -1};  ///< [0] written by Interrupt, [1] polled

  mutable std::mutex err_mtx_;
  std::string last_error_;
};

}  // namespace internal
}  // namespace driftsync
