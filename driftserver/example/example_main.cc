// Copyright (c) 2025 <Your Name>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include "driftserver/monotonic_clock.hpp"
#include "driftserver/reflector_server.hpp"

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
               "Usage: driftserver_example [--port N] [--offset us] "
               "[--rate R] [-v|--verbose]\n");
}
}  // namespace

int main(int argc, char** argv) {
  uint16_t port = driftserver::kDefaultPort;
  int64_t offset_us = 0;
  double rate = 1.0;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto need = [&](int n) { return i + n < argc; };
    if (a == "--port" && need(1)) {
      port = static_cast<uint16_t>(std::atoi(argv[++i]));
    } else if (a == "--offset" && need(1)) {
      offset_us = std::atoll(argv[++i]);
    } else if (a == "--rate" && need(1)) {
      rate = std::atof(argv[++i]);
    } else if (a == "-v" || a == "--verbose") {
      verbose = true;
    } else if (a == "-h" || a == "--help") {
      PrintUsage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", a.c_str());
      PrintUsage();
      return 2;
    }
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  // Errors are always reported; per-request lines only with --verbose
  Logger logger(true);
  auto log_callback = [&logger](const std::string& msg) { logger.Log(msg); };

  driftserver::MonotonicClock clock;
  if (offset_us != 0) clock.AddOffset(offset_us);
  if (rate != 1.0) clock.SetRate(rate);

  driftserver::ReflectorServer server;
  auto options = driftserver::Options::Builder()
                     .Verbose(verbose)
                     .LogSink(log_callback)
                     .Build();
  if (!server.Start(port, &clock, options)) {
    std::fprintf(stderr, "Failed to start reflector on port %u: %s\n",
                 static_cast<unsigned>(port),
                 server.GetStats().last_error.c_str());
    return 1;
  }

  std::printf("driftserver listening on UDP %u\n",
              static_cast<unsigned>(server.BoundPort()));
  std::fflush(stdout);

  while (!g_quit) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  server.Stop();
  std::ostringstream oss;
  oss << server.GetStats();
  std::printf("stopped: %s\n", oss.str().c_str());
  return 0;
}
