// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Client-side clock synchronization against a DRIFTsync reflector.
 *
 * SyncClient periodically exchanges timestamped datagrams with a remote
 * reflector, estimates the offset and relative drift rate between the local
 * monotonic clock and the remote ("global") clock, and exposes the mapping
 * from local time to estimated global time. It never changes the OS clock.
 *
 * All internal arithmetic is done in microseconds. The configured scale is
 * applied at the public accessors only.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

#include "driftserver/local_clock.hpp"
#include "driftserver/protocol.hpp"

namespace driftsync {

/** @name Accessor scales (multipliers applied to microseconds) */
///@{
constexpr double kScaleMicroseconds = 1.0;
constexpr double kScaleMilliseconds = kScaleMicroseconds / 1000.0;
constexpr double kScaleSeconds = kScaleMilliseconds / 1000.0;
///@}

/** Capacity of every estimator window. */
constexpr size_t kWindowCapacity = 10;

/**
 * @brief Immutable options for SyncClient.
 *
 * Use the Builder to construct instances. All fields are read-only via
 * getters.
 */
class Options {
 public:
  using LogCallback = std::function<void(const std::string&)>;

  /**
   * @brief Fluent builder for Options.
   */
  class Builder {
   public:
    Builder();
    explicit Builder(const Options& base);

    /** Set request interval in milliseconds (default: 5000). */
    Builder& IntervalMs(int v);
    /** Set accessor scale; ignored unless positive (default: 1.0 = us). */
    Builder& Scale(double v);
    /** Enable the self-assessed accuracy monitor (default: false). */
    Builder& MeasureAccuracy(bool v);
    /** Max deviation of a round trip from the median in us (default: 10000). */
    Builder& OutlierThresholdUs(int64_t v);
    /** Set log sink (default: none). */
    Builder& LogSink(LogCallback cb);

    Options Build() const;

   private:
    int interval_ms_;
    double scale_;
    bool measure_accuracy_;
    int64_t outlier_threshold_us_;
    LogCallback log_sink_cb_;
  };

  /** @name Getters (immutable) */
  ///@{
  int IntervalMs() const { return interval_ms_; }
  double Scale() const { return scale_; }
  bool MeasureAccuracy() const { return measure_accuracy_; }
  int64_t OutlierThresholdUs() const { return outlier_threshold_us_; }
  const LogCallback& LogSink() const { return log_sink_cb_; }
  ///@}

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const Options& o);

 private:
  // Private ctor for Builder
  Options(int interval_ms, double scale, bool measure_accuracy,
          int64_t outlier_threshold_us, LogCallback log_cb)
      : interval_ms_(interval_ms),
        scale_(scale),
        measure_accuracy_(measure_accuracy),
        outlier_threshold_us_(outlier_threshold_us),
        log_sink_cb_(std::move(log_cb)) {}

  int interval_ms_;
  double scale_;
  bool measure_accuracy_;
  int64_t outlier_threshold_us_;
  LogCallback log_sink_cb_;
};

/**
 * @brief Exchange counters snapshot.
 */
struct Statistics {
  uint64_t sent_requests = 0;
  /** Replies that passed decoding, including rejected ones. */
  uint64_t received_samples = 0;
  /** Replies dropped by the round-trip outlier rule. */
  uint64_t rejected_samples = 0;

  /** Requests without a decoded reply (never negative). */
  uint64_t Lost() const {
    return sent_requests > received_samples ? sent_requests - received_samples
                                            : 0;
  }

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const Statistics& s);
};

/**
 * @brief Self-assessed accuracy over the current window (scaled).
 *
 * All fields are zero when no measurement is available.
 */
struct Accuracy {
  double min = 0.0;
  double average = 0.0;
  double max = 0.0;

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const Accuracy& a);
};

/**
 * @brief DRIFTsync synchronization client.
 *
 * Start() launches two loops: one sends a request every interval, the other
 * processes replies. Both share the estimator state behind one lock. Public
 * accessors may be called from any thread at any time, including
 * concurrently with Shutdown().
 */
class SyncClient {
 public:
  SyncClient();
  ~SyncClient();

  SyncClient(const SyncClient&) = delete;
  SyncClient& operator=(const SyncClient&) = delete;

  /**
   * @brief Start background synchronization.
   * @param clock Local clock (must outlive the client); nullptr = default
   *              monotonic clock.
   * @param host Reflector host name or numeric IPv4 address.
   * @param port UDP port of the reflector.
   * @param opt  Immutable options snapshot.
   * @return true if both loops started; false if already running or the
   *         transport could not be opened.
   */
  bool Start(driftserver::LocalClock* clock, const std::string& host,
             uint16_t port, const Options& opt);
  /** Start with the default monotonic clock. */
  bool Start(const std::string& host,
             uint16_t port = driftserver::kDefaultPort,
             const Options& opt = Options::Builder().Build());

  /**
   * @brief Stop both loops and release the transport.
   *
   * Idempotent. Concurrent callers are serialized; each returns only once
   * both loops have exited. Wakes any GetAccuracy() waiter.
   */
  void Shutdown();

  bool IsRunning() const;

  /** Current local clock reading (scaled). */
  double LocalTime() const;

  /** Current global time estimate (scaled); 0 before the first sample. */
  double GlobalTime() const;

  /** Mean offset of the retained samples (scaled). */
  double Offset() const;

  /** Remote to local tick ratio; 1 until two samples were accepted. */
  double ClockRate() const;

  /** Median of the retained round trips (scaled); 0 when none. */
  double MedianRoundTripTime() const;

  Statistics GetStatistics() const;

  /**
   * @brief Suggest a playback speed to stay aligned to the global timeline.
   * @param global_start Global time at which playback started (scaled).
   * @param position Current playback position (scaled).
   * @return 1.0 inside a 5 ms dead zone, otherwise 1 + difference in
   *         seconds, clamped to [0.5, 2.0].
   */
  double SuggestPlaybackRate(double global_start, double position) const;

  /**
   * @brief Summarize the accuracy window.
   * @param wait Block until a new measurement is recorded.
   * @param reset Clear the window first.
   * @param timeout Max wait; zero or negative waits without deadline.
   * @return Scaled min/average/max; zeros when monitoring is disabled, the
   *         window is empty, the wait timed out or was ended by Shutdown().
   */
  Accuracy GetAccuracy(
      bool wait = false, bool reset = false,
      std::chrono::milliseconds timeout = std::chrono::milliseconds(15000));

  Options GetOptions() const;
  /**
   * @brief Atomically replace options with a new immutable snapshot.
   * The interval takes effect from the next request cycle.
   */
  void SetOptions(const Options& opt);

 private:
  struct Impl;
  std::unique_ptr<Impl> p_;
};

}  // namespace driftsync
