#include "orbitcore/gateway/stdio_transport.hpp"

#include "orbitcore/common/fs.hpp"

#include <thread>

namespace orbitcore::gateway {

StdioTransport::StdioTransport(std::istream &in, std::ostream &out,
                               const std::chrono::milliseconds pump_interval)
    : in_(in), out_(out), pump_interval_(pump_interval) {}

void StdioTransport::write_line(const std::string &line) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  out_ << line << '\n';
  out_.flush();
}

void StdioTransport::run(CommandRouter &router) {
  running_ = true;
  std::thread pump_thread([this, &router] {
    while (running_.load()) {
      if (router.pump() == 0) {
        std::this_thread::sleep_for(pump_interval_);
      }
    }
    router.pump();
  });

  std::string line;
  while (running_.load() && std::getline(in_, line)) {
    const std::string trimmed = common::trim(line);
    if (trimmed.empty()) {
      continue;
    }
    ++lines_read_;
    router.handle_line(trimmed);
  }

  running_ = false;
  pump_thread.join();
}

} // namespace orbitcore::gateway
