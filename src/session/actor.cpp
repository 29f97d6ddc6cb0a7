#include "orbitcore/session/actor.hpp"

#include "orbitcore/common/time.hpp"
#include "orbitcore/observability/global.hpp"
#include "orbitcore/session/transition.hpp"

#include <exception>
#include <type_traits>

namespace orbitcore::session {

namespace {

bool is_effect_error(const Input &input) {
  const auto *error = std::get_if<input::Error>(&input);
  return error != nullptr && error->origin == input::ErrorOrigin::Effect;
}

} // namespace

std::shared_ptr<SessionActor> SessionActor::create(SessionState initial, ActorOptions options,
                                                   Dependencies deps) {
  return std::shared_ptr<SessionActor>(
      new SessionActor(std::move(initial), options, std::move(deps)));
}

SessionActor::SessionActor(SessionState initial, ActorOptions options, Dependencies deps)
    : id_(initial.id), options_(options), deps_(std::move(deps)),
      inbox_(options.inbox_capacity), log_(options.event_log_capacity, initial.revision),
      channel_(options.subscriber_queue_capacity),
      executor_(initial.id, deps_.persist, deps_.connector, log_, channel_) {
  if (!deps_.clock) {
    deps_.clock = [] { return common::now_rfc3339(); };
  }
  if (options_.max_messages_per_slice == 0) {
    options_.max_messages_per_slice = 1;
  }
  snapshot_.store(std::make_shared<const SessionState>(std::move(initial)));
}

PushResult SessionActor::post(Input input) {
  const auto result = inbox_.try_push(ActorMessage{std::move(input)});
  if (result == PushResult::Accepted) {
    schedule();
  }
  return result;
}

PushResult SessionActor::subscribe(SubscribeRequest request) {
  const auto result = inbox_.try_push(ActorMessage{std::move(request)});
  if (result == PushResult::Accepted) {
    schedule();
  }
  return result;
}

PushResult SessionActor::shutdown(ShutdownRequest request) {
  const auto result = inbox_.push_control(ActorMessage{std::move(request)});
  if (result == PushResult::Accepted) {
    schedule();
  }
  return result;
}

std::shared_ptr<const SessionState> SessionActor::snapshot() const { return snapshot_.load(); }

void SessionActor::schedule() {
  bool expected = false;
  if (!scheduled_.compare_exchange_strong(expected, true)) {
    return;
  }
  if (deps_.scheduler == nullptr) {
    scheduled_.store(false);
    observability::record_error("actor", "no scheduler attached for session " + id_);
    return;
  }
  auto self = shared_from_this();
  if (!deps_.scheduler->submit([self] { self->run_slice(); })) {
    scheduled_.store(false);
    observability::record_error("actor", "scheduler rejected slice for session " + id_);
  }
}

void SessionActor::run_slice() {
  observability::record_metric(
      observability::InboxDepthMetric{.session_id = id_, .depth = inbox_.size()});
  for (std::size_t i = 0; i < options_.max_messages_per_slice; ++i) {
    auto message = inbox_.try_pop();
    if (!message.has_value()) {
      break;
    }
    try {
      handle(std::move(*message));
    } catch (const std::exception &e) {
      observability::record_error("actor", "session " + id_ + " step failed: " + e.what());
    }
  }
  scheduled_.store(false);
  if (!inbox_.empty()) {
    schedule();
  }
}

void SessionActor::handle(ActorMessage message) {
  if (auto *input = std::get_if<Input>(&message)) {
    handle_input(*input);
  } else if (auto *subscribe = std::get_if<SubscribeRequest>(&message)) {
    handle_subscribe(std::move(*subscribe));
  } else {
    handle_shutdown(std::move(std::get<ShutdownRequest>(message)));
  }
}

void SessionActor::handle_input(const Input &input) {
  const auto current = snapshot_.load();
  auto result = transition(*current, input, deps_.clock());
  if (!result.accepted()) {
    observability::record_invalid_transition(id_, std::string(phase_name(current->phase)),
                                             std::string(input_name(input)));
    return;
  }

  const bool feed_back = !is_effect_error(input);
  std::optional<std::string> first_failure;
  for (const auto &effect : result.effects) {
    common::Status status = common::Status::success();
    try {
      status = executor_.execute(effect, result.state.revision);
    } catch (const std::exception &e) {
      status = common::Status::error(e.what());
    }
    if (status.ok()) {
      continue;
    }
    observability::record_effect_failed(id_, effect_name(effect), status.error(), feed_back);
    if (!first_failure.has_value()) {
      first_failure = std::string(effect_name(effect)) + ": " + status.error();
    }
  }

  const bool was_ended = is_ended(current->phase);
  auto next = std::make_shared<const SessionState>(std::move(result.state));
  snapshot_.store(next);

  if (!was_ended && is_ended(next->phase)) {
    const auto *ended = std::get_if<EndedPhase>(&next->phase);
    observability::record_session_ended(id_, ended != nullptr ? ended->reason : "");
  }

  if (first_failure.has_value() && feed_back) {
    const auto pushed = inbox_.push_control(ActorMessage{Input{input::Error{
        .message = *first_failure, .origin = input::ErrorOrigin::Effect}}});
    if (pushed != PushResult::Accepted) {
      observability::record_error("actor", "could not feed back effect failure for session " +
                                               id_);
    }
  }
}

void SessionActor::handle_subscribe(SubscribeRequest request) {
  SubscribeReply reply;
  reply.live = channel_.subscribe();
  const auto current = snapshot_.load();
  reply.revision = current->revision;
  if (request.since_revision.has_value()) {
    reply.replay = log_.replay_since(*request.since_revision);
  }
  if (!reply.replay.has_value()) {
    reply.snapshot = current;
  }
  request.reply.set_value(std::move(reply));
}

void SessionActor::handle_shutdown(ShutdownRequest request) {
  stopped_.store(true);
  const auto discarded = inbox_.close();
  if (discarded > 0) {
    observability::record_error("actor", "session " + id_ + " discarded " +
                                             std::to_string(discarded) +
                                             " queued messages at shutdown");
  }
  channel_.close_all();
  request.done.set_value();
}

} // namespace orbitcore::session
