#pragma once

#include "orbitcore/gateway/protocol.hpp"
#include "orbitcore/runtime/service.hpp"
#include "orbitcore/session/broadcast.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace orbitcore::gateway {

using OutputFn = std::function<void(const std::string &line)>;

/// Per-connection protocol state: validates client messages, routes them to
/// the registry and forwards subscribed events through `out`.
class CommandRouter {
public:
  CommandRouter(runtime::SessionService &service, OutputFn out);

  CommandRouter(const CommandRouter &) = delete;
  CommandRouter &operator=(const CommandRouter &) = delete;

  void handle_line(const std::string &line);

  /// Forwards pending events from every subscription; returns lines written.
  std::size_t pump();

  [[nodiscard]] std::size_t subscription_count() const;
  [[nodiscard]] bool list_subscribed() const;

private:
  void handle_subscribe(const ClientMessage &message);
  void handle_unsubscribe(const ClientMessage &message);
  void handle_subscribe_list(const ClientMessage &message);
  void handle_create(const ClientMessage &message);
  void handle_command(const ClientMessage &message);
  void handle_runtime_event(const ClientMessage &message);
  void route(const ClientMessage &message, const std::string &session_id, session::Input input);
  void reply_route_error(const ClientMessage &message, const session::RouteStatus &status);

  runtime::SessionService &service_;
  OutputFn out_;
  mutable std::mutex mutex_;
  std::map<std::string, session::Subscription<session::LoggedEventPtr>> subscriptions_;
  std::optional<session::Subscription<session::ListEvent>> list_subscription_;
};

} // namespace orbitcore::gateway
