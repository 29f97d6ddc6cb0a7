#pragma once

#include "orbitcore/gateway/router.hpp"

#include <atomic>
#include <chrono>
#include <istream>
#include <mutex>
#include <ostream>
#include <string>

namespace orbitcore::gateway {

/// JSON-lines over a pair of streams (stdin/stdout for `orbitcore serve`).
/// The calling thread reads requests; a second thread forwards events.
class StdioTransport {
public:
  StdioTransport(std::istream &in, std::ostream &out,
                 std::chrono::milliseconds pump_interval = std::chrono::milliseconds(10));

  /// Thread-safe; one line per call.
  void write_line(const std::string &line);

  /// Serves until the input reaches EOF or stop() is called.
  void run(CommandRouter &router);
  void stop() { running_ = false; }

  [[nodiscard]] std::size_t lines_read() const { return lines_read_.load(); }

private:
  std::istream &in_;
  std::ostream &out_;
  std::chrono::milliseconds pump_interval_;
  std::mutex write_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> lines_read_{0};
};

} // namespace orbitcore::gateway
