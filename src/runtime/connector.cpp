#include "orbitcore/runtime/connector.hpp"

#include <iostream>

namespace orbitcore::runtime {

common::Status RecordingRuntimeConnector::dispatch(const std::string &session_id,
                                                   const session::RuntimeCall &call) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (failures_left_ > 0) {
    --failures_left_;
    return common::Status::error(failure_message_);
  }
  calls_.push_back(DispatchedCall{.session_id = session_id, .call = call});
  return common::Status::success();
}

void RecordingRuntimeConnector::fail_next(const std::size_t count, std::string message) {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_left_ = count;
  failure_message_ = std::move(message);
}

std::vector<DispatchedCall> RecordingRuntimeConnector::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_;
}

std::vector<DispatchedCall>
RecordingRuntimeConnector::calls_for(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DispatchedCall> out;
  for (const auto &call : calls_) {
    if (call.session_id == session_id) {
      out.push_back(call);
    }
  }
  return out;
}

void RecordingRuntimeConnector::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  calls_.clear();
  failures_left_ = 0;
}

common::Status LoopbackRuntimeConnector::dispatch(const std::string &session_id,
                                                  const session::RuntimeCall &call) {
  std::cerr << "[runtime] session=" << session_id
            << " call=" << session::runtime_call_name(call) << "\n";
  return common::Status::success();
}

} // namespace orbitcore::runtime
