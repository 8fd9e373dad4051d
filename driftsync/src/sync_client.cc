// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Implementation of the DRIFTsync synchronization client.
 *
 * Two loops run while the client is started. The request loop sends a
 * timestamped request every interval. The receive loop waits on the socket
 * and the wake-up channel, validates replies and feeds the estimator. Both
 * share the estimator, the accuracy monitor and the counters behind a single
 * mutex; the condition variable signals "shutdown requested" and "new
 * accuracy measurement".
 */

#include "driftsync/sync_client.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "driftserver/platform/default_local_clock.hpp"
#include "internal/accuracy_monitor.hpp"
#include "internal/drift_estimator.hpp"
#include "internal/playback_rate_advisor.hpp"
#include "internal/transport_channel.hpp"

using std::chrono::milliseconds;

// ---------------- Options ----------------
driftsync::Options::Builder::Builder()
    : interval_ms_(5000),
      scale_(kScaleMicroseconds),
      measure_accuracy_(false),
      outlier_threshold_us_(
          internal::DriftEstimator::kDefaultOutlierThresholdUs),
      log_sink_cb_(Options::LogCallback()) {}

driftsync::Options::Builder::Builder(const Options& base)
    : interval_ms_(base.IntervalMs()),
      scale_(base.Scale()),
      measure_accuracy_(base.MeasureAccuracy()),
      outlier_threshold_us_(base.OutlierThresholdUs()),
      log_sink_cb_(base.LogSink()) {}

driftsync::Options::Builder& driftsync::Options::Builder::IntervalMs(int v) {
  interval_ms_ = std::max(1, v);
  return *this;
}

driftsync::Options::Builder& driftsync::Options::Builder::Scale(double v) {
  if (v > 0.0) scale_ = v;
  return *this;
}

driftsync::Options::Builder& driftsync::Options::Builder::MeasureAccuracy(
    bool v) {
  measure_accuracy_ = v;
  return *this;
}

driftsync::Options::Builder& driftsync::Options::Builder::OutlierThresholdUs(
    int64_t v) {
  outlier_threshold_us_ = std::max<int64_t>(0, v);
  return *this;
}

driftsync::Options::Builder& driftsync::Options::Builder::LogSink(
    LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

driftsync::Options driftsync::Options::Builder::Build() const {
  return driftsync::Options(interval_ms_, scale_, measure_accuracy_,
                            outlier_threshold_us_, log_sink_cb_);
}

namespace driftsync {
std::ostream& operator<<(std::ostream& os, const Options& o) {
  os << "interval=" << o.IntervalMs() << "ms, scale=" << o.Scale()
     << ", accuracy=" << (o.MeasureAccuracy() ? "on" : "off")
     << ", outlier=" << o.OutlierThresholdUs() << "us";
  return os;
}

std::ostream& operator<<(std::ostream& os, const Statistics& s) {
  os << "sent=" << s.sent_requests << ", received=" << s.received_samples
     << ", lost=" << s.Lost() << ", rejected=" << s.rejected_samples;
  return os;
}

std::ostream& operator<<(std::ostream& os, const Accuracy& a) {
  os << "min=" << a.min << ", avg=" << a.average << ", max=" << a.max;
  return os;
}
}  // namespace driftsync

// ---------------- Impl ----------------
struct driftsync::SyncClient::Impl {
  // Clock is set at Start and immutable while the loops run
  driftserver::LocalClock* clock =
      &driftserver::platform::GetDefaultLocalClock();

  // Shared state, all guarded by mtx
  mutable std::mutex mtx;
  mutable std::condition_variable cv;
  Options opts{Options::Builder().Build()};
  bool quitting = true;  // true whenever no loops are supposed to run
  internal::DriftEstimator estimator;
  internal::AccuracyMonitor accuracy;

  // Lifecycle
  std::mutex start_stop_mtx;
  std::atomic<bool> running{false};
  std::thread request_thread;
  std::thread receive_thread;

  // Networking
  internal::TransportChannel transport;

  void RequestLoop();
  void ReceiveLoop();

  /**
   * @brief Validate one datagram and integrate it.
   *
   * @param data Raw datagram.
   * @param now Local time right after the socket became readable.
   */
  void ProcessDatagram(const std::vector<uint8_t>& data, int64_t now);

  /** Global estimate in microseconds for the current local reading. */
  double GlobalTimeMicros() const;

  bool IsQuitting() const;
  void Log(const std::string& msg) const;
};

void driftsync::SyncClient::Impl::RequestLoop() {
  std::unique_lock<std::mutex> lk(mtx);
  while (!quitting) {
    estimator.NoteRequestSent();
    const int interval_ms = opts.IntervalMs();
    lk.unlock();

    std::vector<uint8_t> req =
        driftserver::Serialize(driftserver::MakeRequest(clock->NowMicros()));
    if (!transport.Send(req) && !IsQuitting()) {
      Log("[SyncClient] failed to send: " + transport.GetLastError());
    }

    lk.lock();
    cv.wait_for(lk, milliseconds(interval_ms), [this]() { return quitting; });
  }
}

void driftsync::SyncClient::Impl::ReceiveLoop() {
  std::vector<uint8_t> data;
  while (!IsQuitting()) {
    auto ready = transport.WaitReadable();
    const int64_t now = clock->NowMicros();

    if (IsQuitting() ||
        ready == internal::TransportChannel::WaitResult::kInterrupted) {
      break;
    }

    if (ready == internal::TransportChannel::WaitResult::kError) {
      Log("[SyncClient] wait failed: " + transport.GetLastError());
      // Back off instead of spinning on a broken descriptor
      std::unique_lock<std::mutex> lk(mtx);
      cv.wait_for(lk, milliseconds(100), [this]() { return quitting; });
      continue;
    }

    // One extra byte makes an oversized datagram detectable
    if (!transport.Receive(&data, driftserver::kPacketSize + 1)) {
      if (!IsQuitting()) {
        Log("[SyncClient] failed to receive: " + transport.GetLastError());
      }
      continue;
    }

    ProcessDatagram(data, now);
  }
}

void driftsync::SyncClient::Impl::ProcessDatagram(
    const std::vector<uint8_t>& data, int64_t now) {
  driftserver::Packet reply;
  if (!driftserver::DecodeReply(data, &reply)) {
    std::ostringstream oss;
    oss << "[SyncClient] discarded datagram: ";
    if (data.size() != driftserver::kPacketSize) {
      oss << "incomplete packet of " << data.size();
    } else if (!driftserver::Parse(data, &reply)) {
      oss << "protocol mismatch";
    } else {
      oss << "request packet";
    }
    Log(oss.str());
    return;
  }

  bool measure = false;
  {
    std::lock_guard<std::mutex> lk(mtx);
    measure = opts.MeasureAccuracy();
  }

  // Model reading before this sample is integrated
  int64_t local_before = 0;
  double global_before = 0.0;
  if (measure) {
    local_before = clock->NowMicros();
    global_before = GlobalTimeMicros();
  }

  internal::DriftEstimator::Verdict verdict;
  size_t sample_count = 0;
  int64_t median = 0;
  {
    std::lock_guard<std::mutex> lk(mtx);
    verdict = estimator.Ingest(reply.local, reply.remote, now);
    sample_count = estimator.Samples().Size();
    median = estimator.MedianRoundTripTime();
  }

  if (verdict == internal::DriftEstimator::Verdict::kRejected) {
    std::ostringstream oss;
    oss << "[SyncClient] rejected sample: sent=" << reply.local
        << "us, received=" << now << "us, median rtt=" << median << "us";
    Log(oss.str());
    return;
  }

  if (measure && sample_count > 1) {
    const double global_after = GlobalTimeMicros();
    const int64_t local_after = clock->NowMicros();

    std::lock_guard<std::mutex> lk(mtx);
    accuracy.Record(local_before, global_before, local_after, global_after);
    cv.notify_all();
  }
}

double driftsync::SyncClient::Impl::GlobalTimeMicros() const {
  std::lock_guard<std::mutex> lk(mtx);
  return estimator.GlobalTimeAt(clock->NowMicros());
}

bool driftsync::SyncClient::Impl::IsQuitting() const {
  std::lock_guard<std::mutex> lk(mtx);
  return quitting;
}

void driftsync::SyncClient::Impl::Log(const std::string& msg) const {
  // Copy the sink so user code never runs under the state lock
  Options::LogCallback sink;
  {
    std::lock_guard<std::mutex> lk(mtx);
    sink = opts.LogSink();
  }
  if (sink) sink(msg);
}

// ---------------- SyncClient ----------------
driftsync::SyncClient::SyncClient() : p_(new Impl()) {}
driftsync::SyncClient::~SyncClient() { Shutdown(); }

bool driftsync::SyncClient::Start(driftserver::LocalClock* clock,
                                  const std::string& host, uint16_t port,
                                  const Options& opt) {
  std::lock_guard<std::mutex> guard(p_->start_stop_mtx);
  if (p_->running.load()) return false;

  if (!p_->transport.Open(host, port)) {
    if (opt.LogSink()) {
      opt.LogSink()("[SyncClient] failed to open transport: " +
                    p_->transport.GetLastError());
    }
    return false;
  }

  {
    std::lock_guard<std::mutex> lk(p_->mtx);
    p_->clock = clock ? clock : &driftserver::platform::GetDefaultLocalClock();
    p_->opts = opt;
    p_->estimator.SetOutlierThresholdUs(opt.OutlierThresholdUs());
    p_->estimator.Reset();
    p_->accuracy.Clear();
    p_->quitting = false;
  }

  if (opt.LogSink()) {
    std::ostringstream oss;
    oss << "[SyncClient] started against " << p_->transport.Remote().address
        << ":" << port << " (" << opt << ")";
    opt.LogSink()(oss.str());
  }

  p_->running.store(true);
  p_->receive_thread = std::thread([this]() { p_->ReceiveLoop(); });
  p_->request_thread = std::thread([this]() { p_->RequestLoop(); });
  return true;
}

bool driftsync::SyncClient::Start(const std::string& host, uint16_t port,
                                  const Options& opt) {
  return Start(nullptr, host, port, opt);
}

void driftsync::SyncClient::Shutdown() {
  std::lock_guard<std::mutex> guard(p_->start_stop_mtx);
  if (!p_->running.exchange(false)) return;

  {
    std::lock_guard<std::mutex> lk(p_->mtx);
    p_->quitting = true;
  }
  p_->cv.notify_all();

  // Both are needed: the socket may be idle and the byte may race a datagram
  p_->transport.ShutdownSocket();
  if (!p_->transport.Interrupt()) {
    p_->Log("[SyncClient] failed to wake receiver: " +
            p_->transport.GetLastError());
  }

  if (p_->request_thread.joinable()) p_->request_thread.join();
  if (p_->receive_thread.joinable()) p_->receive_thread.join();

  p_->transport.Close();
  p_->Log("[SyncClient] stopped");
}

bool driftsync::SyncClient::IsRunning() const { return p_->running.load(); }

double driftsync::SyncClient::LocalTime() const {
  std::lock_guard<std::mutex> lk(p_->mtx);
  return static_cast<double>(p_->clock->NowMicros()) * p_->opts.Scale();
}

double driftsync::SyncClient::GlobalTime() const {
  std::lock_guard<std::mutex> lk(p_->mtx);
  return p_->estimator.GlobalTimeAt(p_->clock->NowMicros()) * p_->opts.Scale();
}

double driftsync::SyncClient::Offset() const {
  std::lock_guard<std::mutex> lk(p_->mtx);
  return p_->estimator.Offset() * p_->opts.Scale();
}

double driftsync::SyncClient::ClockRate() const {
  std::lock_guard<std::mutex> lk(p_->mtx);
  return p_->estimator.ClockRate();
}

double driftsync::SyncClient::MedianRoundTripTime() const {
  std::lock_guard<std::mutex> lk(p_->mtx);
  return static_cast<double>(p_->estimator.MedianRoundTripTime()) *
         p_->opts.Scale();
}

driftsync::Statistics driftsync::SyncClient::GetStatistics() const {
  std::lock_guard<std::mutex> lk(p_->mtx);
  return p_->estimator.Stats();
}

double driftsync::SyncClient::SuggestPlaybackRate(double global_start,
                                                  double position) const {
  double global_now = 0.0;
  double scale = 1.0;
  {
    std::lock_guard<std::mutex> lk(p_->mtx);
    global_now = p_->estimator.GlobalTimeAt(p_->clock->NowMicros());
    scale = p_->opts.Scale();
  }
  return internal::PlaybackRateAdvisor::Suggest(global_now, global_start,
                                                position, scale);
}

driftsync::Accuracy driftsync::SyncClient::GetAccuracy(
    bool wait, bool reset, std::chrono::milliseconds timeout) {
  Accuracy result;
  std::unique_lock<std::mutex> lk(p_->mtx);
  if (!p_->opts.MeasureAccuracy()) return result;

  if (reset) p_->accuracy.Clear();

  if (wait) {
    const uint64_t generation = p_->accuracy.Generation();
    auto ready = [this, generation]() {
      return p_->quitting || p_->accuracy.Generation() != generation;
    };
    if (timeout.count() > 0) {
      if (!p_->cv.wait_for(lk, timeout, ready)) return result;
    } else {
      p_->cv.wait(lk, ready);
    }
    if (p_->quitting) return result;
  }

  if (p_->accuracy.Count() == 0) return result;

  const double scale = p_->opts.Scale();
  Accuracy raw = p_->accuracy.Summarize();
  result.min = raw.min * scale;
  result.average = raw.average * scale;
  result.max = raw.max * scale;
  return result;
}

driftsync::Options driftsync::SyncClient::GetOptions() const {
  std::lock_guard<std::mutex> lk(p_->mtx);
  return p_->opts;
}

void driftsync::SyncClient::SetOptions(const Options& opt) {
  std::lock_guard<std::mutex> lk(p_->mtx);
  p_->opts = opt;
  p_->estimator.SetOutlierThresholdUs(opt.OutlierThresholdUs());
}
