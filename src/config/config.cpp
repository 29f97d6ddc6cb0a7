#include "orbitcore/config/config.hpp"

#include "orbitcore/common/fs.hpp"
#include "orbitcore/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_set>

namespace orbitcore::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".orbitcore";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("ORBITCORE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::size_t get_size(const common::TomlDocument &doc, const std::string &key,
                     const std::size_t fallback) {
  return static_cast<std::size_t>(doc.get_u64(key, fallback));
}

const std::unordered_set<std::string> &known_keys() {
  static const std::unordered_set<std::string> keys = {
      "registry.shards",
      "registry.inbox_capacity",
      "registry.subscriber_queue_capacity",
      "registry.event_log_capacity",
      "registry.ended_grace_seconds",
      "registry.subscribe_timeout_ms",
      "registry.reap_interval_ms",
      "registry.list_refresh_ms",
      "scheduler.workers",
      "scheduler.max_messages_per_slice",
      "persistence.db_path",
      "persistence.queue_capacity",
      "persistence.batch_size",
      "persistence.flush_interval_ms",
      "observability.backend",
      "observability.level",
  };
  return keys;
}

bool is_known_level(const std::string &level) {
  return level == "debug" || level == "info" || level == "warn" || level == "error";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *db = std::getenv("ORBITCORE_DB_PATH"); db != nullptr && *db != '\0') {
    config.persistence.db_path = db;
  }
  if (const char *workers = std::getenv("ORBITCORE_WORKERS"); workers != nullptr) {
    if (const auto parsed = common::parse_u64(workers); parsed.has_value()) {
      config.scheduler.workers = static_cast<std::size_t>(*parsed);
    }
  }
  if (const char *level = std::getenv("ORBITCORE_LOG_LEVEL"); level != nullptr && *level != '\0') {
    config.observability.level = common::to_lower(level);
  }
  if (const char *backend = std::getenv("ORBITCORE_OBSERVABILITY");
      backend != nullptr && *backend != '\0') {
    config.observability.backend = common::to_lower(backend);
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  auto &registry = config.registry;
  registry.shards = get_size(doc, "registry.shards", registry.shards);
  registry.inbox_capacity = get_size(doc, "registry.inbox_capacity", registry.inbox_capacity);
  registry.subscriber_queue_capacity =
      get_size(doc, "registry.subscriber_queue_capacity", registry.subscriber_queue_capacity);
  registry.event_log_capacity =
      get_size(doc, "registry.event_log_capacity", registry.event_log_capacity);
  registry.ended_grace_seconds =
      doc.get_u64("registry.ended_grace_seconds", registry.ended_grace_seconds);
  registry.subscribe_timeout_ms =
      doc.get_u64("registry.subscribe_timeout_ms", registry.subscribe_timeout_ms);
  registry.reap_interval_ms = doc.get_u64("registry.reap_interval_ms", registry.reap_interval_ms);
  registry.list_refresh_ms = doc.get_u64("registry.list_refresh_ms", registry.list_refresh_ms);

  config.scheduler.workers = get_size(doc, "scheduler.workers", config.scheduler.workers);
  config.scheduler.max_messages_per_slice =
      get_size(doc, "scheduler.max_messages_per_slice", config.scheduler.max_messages_per_slice);

  auto &persistence = config.persistence;
  persistence.db_path = doc.get_string("persistence.db_path", persistence.db_path);
  persistence.queue_capacity =
      get_size(doc, "persistence.queue_capacity", persistence.queue_capacity);
  persistence.batch_size = get_size(doc, "persistence.batch_size", persistence.batch_size);
  persistence.flush_interval_ms =
      doc.get_u64("persistence.flush_interval_ms", persistence.flush_interval_ms);

  config.observability.backend =
      common::to_lower(doc.get_string("observability.backend", config.observability.backend));
  config.observability.level =
      common::to_lower(doc.get_string("observability.level", config.observability.level));

  for (const auto &key : doc.keys()) {
    if (!known_keys().contains(key)) {
      std::cerr << "[config] ignoring unknown key: " << key << "\n";
    }
  }

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.registry.shards == 0) {
    return common::Result<std::vector<std::string>>::failure("registry.shards must be > 0");
  }
  if (config.registry.inbox_capacity == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "registry.inbox_capacity must be > 0");
  }
  if (config.registry.subscriber_queue_capacity == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "registry.subscriber_queue_capacity must be > 0");
  }
  if (config.registry.event_log_capacity == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "registry.event_log_capacity must be > 0");
  }
  if (config.registry.subscribe_timeout_ms == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "registry.subscribe_timeout_ms must be > 0");
  }
  if (config.registry.reap_interval_ms == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "registry.reap_interval_ms must be > 0");
  }
  if (config.registry.list_refresh_ms == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "registry.list_refresh_ms must be > 0");
  }
  if (config.scheduler.workers == 0) {
    return common::Result<std::vector<std::string>>::failure("scheduler.workers must be > 0");
  }
  if (config.scheduler.max_messages_per_slice == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "scheduler.max_messages_per_slice must be > 0");
  }
  if (config.persistence.queue_capacity == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "persistence.queue_capacity must be > 0");
  }
  if (config.persistence.batch_size == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "persistence.batch_size must be > 0");
  }
  if (common::trim(config.persistence.db_path).empty()) {
    return common::Result<std::vector<std::string>>::failure("persistence.db_path is empty");
  }

  for (const auto &backend : common::split(config.observability.backend, ',')) {
    if (backend != "log" && backend != "none" && backend != "noop") {
      return common::Result<std::vector<std::string>>::failure("Invalid observability.backend: " +
                                                                config.observability.backend);
    }
  }
  if (!is_known_level(config.observability.level)) {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.level: " +
                                                              config.observability.level);
  }

  if (config.persistence.batch_size > config.persistence.queue_capacity) {
    warnings.push_back("persistence.batch_size exceeds persistence.queue_capacity");
  }
  if (config.registry.event_log_capacity < config.scheduler.max_messages_per_slice) {
    warnings.push_back("registry.event_log_capacity is smaller than one scheduler slice");
  }
  if (config.registry.ended_grace_seconds == 0) {
    warnings.push_back("registry.ended_grace_seconds is 0; ended sessions are removed immediately");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace orbitcore::config
