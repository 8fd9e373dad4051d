// Copyright (c) 2025 <Your Name>
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>

#include "driftserver/export.hpp"
#include "driftserver/local_clock.hpp"
#include "driftserver/protocol.hpp"

namespace driftserver {

/**
 * Immutable configuration options for ReflectorServer.
 */
class DRIFT_SERVER_API Options {
 public:
  using LogCallback = std::function<void(const std::string&)>;

  class DRIFT_SERVER_API Builder {
   public:
    Builder();
    /** Log every processed request through the sink (default: false). */
    Builder& Verbose(bool v);
    Builder& LogSink(LogCallback cb);
    Options Build() const;

   private:
    bool verbose_;
    LogCallback log_sink_cb_;
  };

  Options();

  bool Verbose() const;
  const LogCallback& LogSink() const;

 private:
  Options(bool verbose, LogCallback log_cb);

  bool verbose_;
  LogCallback log_callback_;
};

struct ServerStats {
  uint64_t packets_received = 0;    ///< Valid requests processed
  uint64_t packets_sent = 0;        ///< Replies sent successfully
  uint64_t recv_errors = 0;         ///< recvfrom() failures
  uint64_t drop_short_packets = 0;  ///< Datagrams not exactly kPacketSize
  uint64_t drop_bad_magic = 0;      ///< Protocol mismatch
  uint64_t drop_replies = 0;        ///< Reply packets sent to the server
  uint64_t send_errors = 0;         ///< sendto() failures or partial sends
  std::string last_error;           ///< Latest error message

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const ServerStats& s);
};

/**
 * Minimal DRIFTsync reflector (UDP/IPv4).
 *
 * Answers each request with the same packet, the reply flag set and the
 * remote timestamp taken from the server's LocalClock.
 */
class DRIFT_SERVER_API ReflectorServer {
 public:
  ReflectorServer();
  ~ReflectorServer();

  ReflectorServer(const ReflectorServer&) = delete;
  ReflectorServer& operator=(const ReflectorServer&) = delete;

  /**
   * @brief Starts serving on the given UDP port.
   * @param port UDP port to bind (default: 4318, 0 = ephemeral).
   * @param clock Clock for reply timestamps (default: MonotonicClock).
   * @param options Immutable configuration snapshot (defaults applied).
   * @return true on success, false on failure.
   */
  bool Start(uint16_t port = kDefaultPort, LocalClock* clock = nullptr,
             const Options& options = Options());

  /** Stops the server. Safe to call multiple times. */
  void Stop();

  /** Returns latest statistics snapshot (thread-safe). */
  ServerStats GetStats() const;

  /** Port actually bound, 0 when stopped. */
  uint16_t BoundPort() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace driftserver
