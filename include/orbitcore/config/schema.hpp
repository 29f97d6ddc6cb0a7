#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace orbitcore::config {

struct RegistryConfig {
  std::size_t shards = 16;
  std::size_t inbox_capacity = 256;
  std::size_t subscriber_queue_capacity = 256;
  std::size_t event_log_capacity = 1'000;
  std::uint64_t ended_grace_seconds = 300;
  std::uint64_t subscribe_timeout_ms = 2'000;
  std::uint64_t reap_interval_ms = 5'000;
  std::uint64_t list_refresh_ms = 100;
};

struct SchedulerConfig {
  std::size_t workers = 4;
  std::size_t max_messages_per_slice = 64;
};

struct PersistenceConfig {
  std::string db_path = "~/.orbitcore/orbitcore.db";
  std::size_t queue_capacity = 1'000;
  std::size_t batch_size = 50;
  std::uint64_t flush_interval_ms = 100;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "info";
};

struct Config {
  RegistryConfig registry;
  SchedulerConfig scheduler;
  PersistenceConfig persistence;
  ObservabilityConfig observability;
};

} // namespace orbitcore::config
