// Copyright (c) 2025 <Your Name>
#include <utility>

#include "driftserver/reflector_server.hpp"

namespace driftserver {

Options::Builder::Builder() : verbose_(false) {}

Options::Builder& Options::Builder::Verbose(bool v) {
  verbose_ = v;
  return *this;
}

Options::Builder& Options::Builder::LogSink(LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

Options Options::Builder::Build() const {
  return Options(verbose_, log_sink_cb_);
}

Options::Options() : verbose_(false) {}

Options::Options(bool verbose, LogCallback log_cb)
    : verbose_(verbose), log_callback_(std::move(log_cb)) {}

bool Options::Verbose() const { return verbose_; }

const Options::LogCallback& Options::LogSink() const { return log_callback_; }

std::ostream& operator<<(std::ostream& os, const ServerStats& s) {
  os << "rx=" << s.packets_received << ", tx=" << s.packets_sent
     << ", rx_err=" << s.recv_errors << ", short=" << s.drop_short_packets
     << ", bad_magic=" << s.drop_bad_magic << ", replies=" << s.drop_replies
     << ", tx_err=" << s.send_errors;
  if (!s.last_error.empty()) os << ", err='" << s.last_error << "'";
  return os;
}

}  // namespace driftserver
