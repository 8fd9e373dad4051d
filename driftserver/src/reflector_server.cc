// Copyright (c) 2025 <Your Name>
/**
 * @file reflector_server.cc
 * @brief DRIFTsync reflector implementation (UDP/IPv4).
 */
#include "driftserver/reflector_server.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "driftserver/platform/default_local_clock.hpp"
#include "driftserver/platform/socket_interface.hpp"

namespace driftserver {

namespace {

class StatsTracker {
 public:
  void IncPacketsReceived() {
    packets_received_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncPacketsSent() {
    packets_sent_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncRecvErrors() { recv_errors_.fetch_add(1, std::memory_order_relaxed); }
  void IncShortPackets() {
    short_packets_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncBadMagic() { bad_magic_.fetch_add(1, std::memory_order_relaxed); }
  void IncReplies() { replies_.fetch_add(1, std::memory_order_relaxed); }
  void IncSendErrors() { send_errors_.fetch_add(1, std::memory_order_relaxed); }
  void SetLastError(const std::string& text) {
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    last_error_ = text;
  }

  ServerStats Snapshot() const {
    ServerStats stats;
    stats.packets_received = packets_received_.load(std::memory_order_relaxed);
    stats.packets_sent = packets_sent_.load(std::memory_order_relaxed);
    stats.recv_errors = recv_errors_.load(std::memory_order_relaxed);
    stats.drop_short_packets = short_packets_.load(std::memory_order_relaxed);
    stats.drop_bad_magic = bad_magic_.load(std::memory_order_relaxed);
    stats.drop_replies = replies_.load(std::memory_order_relaxed);
    stats.send_errors = send_errors_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    stats.last_error = last_error_;
    return stats;
  }

 private:
  std::atomic<uint64_t> packets_received_{0};
  std::atomic<uint64_t> packets_sent_{0};
  std::atomic<uint64_t> recv_errors_{0};
  std::atomic<uint64_t> short_packets_{0};
  std::atomic<uint64_t> bad_magic_{0};
  std::atomic<uint64_t> replies_{0};
  std::atomic<uint64_t> send_errors_{0};
  mutable std::mutex last_error_mtx_;
  std::string last_error_;
};

}  // namespace

class ReflectorServer::Impl {
 public:
  Impl() = default;
  ~Impl() { Stop(); }

  bool Start(uint16_t port, LocalClock* clock, const Options& options) {
    std::lock_guard<std::mutex> lock(start_stop_mtx_);
    if (running_.load()) return true;

    clock_ = clock ? clock : &platform::GetDefaultLocalClock();
    verbose_ = options.Verbose();
    log_callback_ = options.LogSink();
    if (!CreateAndBindSocket(port)) {
      return false;
    }
    bound_port_.store(socket_->LocalPort());

    running_.store(true);
    thread_ = std::thread([this]() { Loop(); });
    return true;
  }

  void Stop() {
    std::lock_guard<std::mutex> lock(start_stop_mtx_);
    if (!running_.exchange(false)) return;

    // Loop observes running_ within one WaitReadable timeout
    if (thread_.joinable()) {
      thread_.join();
    }
    if (socket_) {
      socket_->Close();
      socket_.reset();
    }
    bound_port_.store(0);
  }

  ServerStats GetStats() const { return stats_.Snapshot(); }

  uint16_t BoundPort() const { return bound_port_.load(); }

 private:
  /** Creates UDP socket and binds to given port. */
  bool CreateAndBindSocket(uint16_t port) {
    socket_ = platform::CreatePlatformSocket();
    if (!socket_->Initialize()) {
      RecordError("Socket initialization failed: " + socket_->GetLastError());
      socket_.reset();
      return false;
    }

    if (!socket_->Bind(port)) {
      RecordError("Socket bind failed: " + socket_->GetLastError());
      socket_->Close();
      socket_.reset();
      return false;
    }
    return true;
  }

  /** Main loop: wait for datagrams and respond. */
  void Loop() {
    while (running_.load()) {
      if (!socket_->WaitReadable(/*timeout_us=*/200000)) continue;
      HandleSingleDatagram();
    }
  }

  /**
   * @brief Receives one datagram and answers it.
   * @details Orchestrates receive -> validate -> stamp -> send.
   */
  void HandleSingleDatagram() {
    platform::Endpoint from;
    Packet request;
    if (!ReceiveRequest(&from, &request)) return;

    Packet reply = MakeReply(request, clock_->NowMicros());
    if (verbose_ && log_callback_) {
      std::ostringstream oss;
      oss << "[ReflectorServer] processed request from " << from.address << ":"
          << from.port << ", remote time " << request.local
          << ", local time " << reply.remote;
      log_callback_(oss.str());
    }
    SendReply(from, reply);
  }

  /**
   * @brief Receive one request from the socket.
   * @param from    Output: sender endpoint.
   * @param request Output: decoded request.
   * @return true if a well-formed request was received.
   */
  bool ReceiveRequest(platform::Endpoint* from, Packet* request) {
    std::vector<uint8_t> data;
    if (!socket_->Receive(from, &data, kPacketSize + 1)) {
      stats_.IncRecvErrors();
      RecordError("Receive failed: " + socket_->GetLastError());
      return false;
    }

    if (data.size() != kPacketSize) {
      stats_.IncShortPackets();
      RecordError("received incomplete packet of " +
                  std::to_string(data.size()));
      return false;
    }

    if (!Parse(data, request)) {
      stats_.IncBadMagic();
      RecordError("protocol mismatch");
      return false;
    }

    if (IsReply(*request)) {
      stats_.IncReplies();
      RecordError("received reply packet");
      return false;
    }

    stats_.IncPacketsReceived();
    return true;
  }

  /** Send the reply back to the requester. */
  bool SendReply(const platform::Endpoint& to, const Packet& reply) {
    if (!socket_->Send(to, Serialize(reply))) {
      stats_.IncSendErrors();
      RecordError("Send failed: " + socket_->GetLastError());
      return false;
    }

    stats_.IncPacketsSent();
    return true;
  }

  void RecordError(const std::string& msg) {
    if (log_callback_) {
      log_callback_("[ReflectorServer] " + msg);
    }
    stats_.SetLastError(msg);
  }

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> bound_port_{0};
  std::unique_ptr<platform::ISocket> socket_;
  std::mutex start_stop_mtx_;

  LocalClock* clock_{nullptr};
  bool verbose_{false};
  Options::LogCallback log_callback_;
  StatsTracker stats_;
};

ReflectorServer::ReflectorServer() : impl_(new Impl) {}
ReflectorServer::~ReflectorServer() = default;

bool ReflectorServer::Start(uint16_t port, LocalClock* clock,
                            const Options& options) {
  return impl_->Start(port, clock, options);
}
void ReflectorServer::Stop() { impl_->Stop(); }
ServerStats ReflectorServer::GetStats() const { return impl_->GetStats(); }
uint16_t ReflectorServer::BoundPort() const { return impl_->BoundPort(); }

}  // namespace driftserver
