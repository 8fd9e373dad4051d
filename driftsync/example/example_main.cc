// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Example program for SyncClient with simple CLI options.
 *
 * Usage:
 *   driftsync_example [host] --port 4318 --interval 5000 \
 *     [--stream] [--count N] [--debug]
 */

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>

#include "driftsync/sync_client.hpp"

namespace {
/**
 * @brief Thread-safe logger for debug messages.
 */
class Logger {
 public:
  explicit Logger(bool enabled) : enabled_(enabled) {}

  void Log(const std::string& msg) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s\n", msg.c_str());
  }

 private:
  bool enabled_;
  std::mutex mutex_;
};

volatile std::sig_atomic_t g_quit = 0;

void SignalHandler(int sig) {
  (void)sig;
  g_quit = 1;
}

void PrintUsage() {
  std::fprintf(stderr,
               "Usage: driftsync_example [host] [options]\n"
               "Options:\n"
               "  host                 (default localhost)\n"
               "  --port N             (default 4318)\n"
               "  --interval ms        (default 5000)\n"
               "  --stream             Print global time every 5 ms\n"
               "  --count n            Stop after n reports (default: run)\n"
               "  --debug              Enable debug logging\n");
}
}  // namespace

int main(int argc, char** argv) {
  std::string host = "localhost";
  uint16_t port = driftserver::kDefaultPort;
  bool stream = false;
  bool debug = false;
  int count = 0;

  auto builder = driftsync::Options::Builder()
                     .Scale(driftsync::kScaleMilliseconds)
                     .MeasureAccuracy(true);

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto need = [&](int more) { return i + more < argc; };
    if (a == "--port" && need(1)) {
      port = static_cast<uint16_t>(std::atoi(argv[++i]));
    } else if (a == "--interval" && need(1)) {
      builder.IntervalMs(std::atoi(argv[++i]));
    } else if (a == "--count" && need(1)) {
      count = std::atoi(argv[++i]);
    } else if (a == "--stream") {
      stream = true;
    } else if (a == "--debug") {
      debug = true;
    } else if (a == "-h" || a == "--help") {
      PrintUsage();
      return 0;
    } else if (!a.empty() && a[0] != '-') {
      host = a;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", a.c_str());
      PrintUsage();
      return 2;
    }
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  Logger logger(debug);
  builder.LogSink([&logger](const std::string& msg) { logger.Log(msg); });

  driftsync::SyncClient client;
  if (!client.Start(host, port, builder.Build())) {
    std::fprintf(stderr, "Failed to start client against %s:%u\n",
                 host.c_str(), static_cast<unsigned>(port));
    return 1;
  }

  if (stream) {
    while (!g_quit) {
      std::printf("%.3f\n", client.GlobalTime());
      std::fflush(stdout);
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    client.Shutdown();
    return 0;
  }

  int reports = 0;
  while (!g_quit && (count <= 0 || reports < count)) {
    // Short waits keep signal handling responsive
    driftsync::Accuracy acc;
    bool fresh = false;
    for (int waited = 0; waited < 15000 && !g_quit; waited += 500) {
      acc = client.GetAccuracy(true, false, std::chrono::milliseconds(500));
      if (acc.max > 0.0 || acc.average > 0.0) {
        fresh = true;
        break;
      }
    }
    if (g_quit) break;
    if (!fresh) acc = client.GetAccuracy();

    driftsync::Statistics st = client.GetStatistics();
    double global_time = client.GlobalTime();

    std::printf("global %.3f ms offset %.3f ms\n", global_time,
                client.Offset());
    std::printf("clock rate %.9f playback %.9f\n", client.ClockRate(),
                client.SuggestPlaybackRate(global_time, 0));
    std::printf("median round trip time %.3f ms\n",
                client.MedianRoundTripTime());
    std::printf("sent %llu lost %llu rejected %llu\n",
                static_cast<unsigned long long>(st.sent_requests),
                static_cast<unsigned long long>(st.Lost()),
                static_cast<unsigned long long>(st.rejected_samples));
    std::printf("accuracy min %.3f ms average %.3f ms max %.3f ms\n\n",
                acc.min, acc.average, acc.max);
    std::fflush(stdout);
    ++reports;
  }

  client.Shutdown();
  return 0;
}
