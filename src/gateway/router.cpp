#include "orbitcore/gateway/router.hpp"

namespace orbitcore::gateway {

CommandRouter::CommandRouter(runtime::SessionService &service, OutputFn out)
    : service_(service), out_(std::move(out)) {}

void CommandRouter::handle_line(const std::string &line) {
  if (line.empty()) {
    return;
  }
  auto parsed = parse_client_message(line);
  if (!parsed.ok()) {
    out_(encode_error("invalid_message", parsed.error(), std::nullopt));
    return;
  }
  const auto message = parsed.take();

  if (message.type == "subscribe_session") {
    handle_subscribe(message);
  } else if (message.type == "unsubscribe_session") {
    handle_unsubscribe(message);
  } else if (message.type == "subscribe_list") {
    handle_subscribe_list(message);
  } else if (message.type == "create_session") {
    handle_create(message);
  } else if (message.type == "runtime_event") {
    handle_runtime_event(message);
  } else if (is_session_command(message.type)) {
    handle_command(message);
  } else {
    out_(encode_error("unknown_type", "unknown message type: " + message.type,
                      message.session_id, message.id));
  }
}

void CommandRouter::handle_subscribe(const ClientMessage &message) {
  if (!message.session_id.has_value()) {
    out_(encode_error("invalid_message", "subscribe_session requires session_id", std::nullopt,
                      message.id));
    return;
  }
  const std::string &id = *message.session_id;
  const auto since = common::json_u64_field(message.fields, "since_revision");

  auto outcome = service_.registry().subscribe(id, since);
  if (!outcome.status.ok()) {
    reply_route_error(message, outcome.status);
    return;
  }
  auto &reply = *outcome.reply;
  std::lock_guard<std::mutex> lock(mutex_);
  if (reply.replay.has_value()) {
    out_(encode_replay(id, *reply.replay, reply.revision));
  } else {
    out_(encode_session_snapshot(*reply.snapshot));
  }
  subscriptions_.insert_or_assign(id, std::move(reply.live));
}

void CommandRouter::handle_unsubscribe(const ClientMessage &message) {
  if (!message.session_id.has_value()) {
    out_(encode_error("invalid_message", "unsubscribe_session requires session_id", std::nullopt,
                      message.id));
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(*message.session_id);
  }
  out_(encode_ack(message.type, message.id, message.session_id));
}

void CommandRouter::handle_subscribe_list(const ClientMessage &) {
  auto list = service_.registry().subscribe_list();
  std::lock_guard<std::mutex> lock(mutex_);
  out_(encode_sessions_list(list.sessions));
  list_subscription_ = std::move(list.live);
}

void CommandRouter::handle_create(const ClientMessage &message) {
  runtime::CreateSessionRequest request{
      .provider = common::json_string_field(message.fields, "provider").value_or(""),
      .project_path = common::json_string_field(message.fields, "project_path").value_or(""),
      .project_name = common::json_string_field(message.fields, "project_name"),
      .model = common::json_string_field(message.fields, "model"),
      .approval_policy = common::json_string_field(message.fields, "approval_policy"),
      .sandbox_mode = common::json_string_field(message.fields, "sandbox_mode"),
      .forked_from = common::json_string_field(message.fields, "forked_from"),
  };
  auto created = service_.create_session(request);
  if (!created.ok()) {
    out_(encode_error("invalid_request", created.error(), std::nullopt, message.id));
    return;
  }
  out_(encode_ack(message.type, message.id, created.value()->id()));
}

void CommandRouter::handle_command(const ClientMessage &message) {
  if (!message.session_id.has_value()) {
    out_(encode_error("invalid_message", message.type + " requires session_id", std::nullopt,
                      message.id));
    return;
  }
  auto input = command_to_input(message);
  if (!input.ok()) {
    out_(encode_error("invalid_message", input.error(), message.session_id, message.id));
    return;
  }
  route(message, *message.session_id, input.take());
}

void CommandRouter::handle_runtime_event(const ClientMessage &message) {
  if (!message.session_id.has_value()) {
    out_(encode_error("invalid_message", "runtime_event requires session_id", std::nullopt,
                      message.id));
    return;
  }
  const auto raw = common::json_raw_field(message.fields, "event");
  if (!raw.has_value()) {
    out_(encode_error("invalid_message", "runtime_event requires event", message.session_id,
                      message.id));
    return;
  }
  auto input = runtime_event_to_input(*raw);
  if (!input.ok()) {
    out_(encode_error("invalid_message", input.error(), message.session_id, message.id));
    return;
  }
  route(message, *message.session_id, input.take());
}

void CommandRouter::route(const ClientMessage &message, const std::string &session_id,
                          session::Input input) {
  const auto status = service_.registry().send(session_id, std::move(input));
  if (!status.ok()) {
    reply_route_error(message, status);
    return;
  }
  out_(encode_ack(message.type, message.id, session_id));
}

void CommandRouter::reply_route_error(const ClientMessage &message,
                                      const session::RouteStatus &status) {
  out_(encode_error(std::string(session::route_error_code(status.error())), status.message(),
                    message.session_id, message.id));
}

std::size_t CommandRouter::pump() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t written = 0;

  auto it = subscriptions_.begin();
  while (it != subscriptions_.end()) {
    auto &subscription = it->second;
    while (auto event = subscription.try_recv()) {
      out_(encode_event(**event));
      ++written;
    }
    if (!subscription.closed()) {
      ++it;
      continue;
    }
    const char *reason = subscription.lagged() ? "lagged" : "closed";
    out_(encode_resync_required(it->first, reason));
    ++written;
    it = subscriptions_.erase(it);
  }

  if (list_subscription_.has_value()) {
    while (auto event = list_subscription_->try_recv()) {
      out_(encode_session_list_event(*event));
      ++written;
    }
    if (list_subscription_->closed()) {
      // Fell behind: start over with a fresh listing.
      auto list = service_.registry().subscribe_list();
      out_(encode_sessions_list(list.sessions));
      ++written;
      list_subscription_ = std::move(list.live);
    }
  }
  return written;
}

std::size_t CommandRouter::subscription_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_.size();
}

bool CommandRouter::list_subscribed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return list_subscription_.has_value();
}

} // namespace orbitcore::gateway
