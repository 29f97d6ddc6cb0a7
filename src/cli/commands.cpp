#include "orbitcore/cli/commands.hpp"

#include "orbitcore/common/fs.hpp"
#include "orbitcore/config/config.hpp"
#include "orbitcore/gateway/router.hpp"
#include "orbitcore/gateway/stdio_transport.hpp"
#include "orbitcore/observability/factory.hpp"
#include "orbitcore/observability/global.hpp"
#include "orbitcore/persistence/store.hpp"
#include "orbitcore/runtime/connector.hpp"
#include "orbitcore/runtime/service.hpp"

#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace orbitcore::cli {

namespace {

std::string version_string() {
#ifdef ORBITCORE_VERSION
  std::string version = ORBITCORE_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef ORBITCORE_GIT_COMMIT
  const std::string commit = ORBITCORE_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "orbitcore " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

common::Result<config::Config> load_checked_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto checked = config::validate_config(cfg.value());
  if (!checked.ok()) {
    return common::Result<config::Config>::failure("invalid config: " + checked.error());
  }
  for (const auto &warning : checked.value()) {
    std::cerr << "[config] warning: " << warning << "\n";
  }
  return cfg;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  orbitcore [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  serve          Restore sessions and serve JSON lines on stdin/stdout\n";
  std::cout << "                 [--db PATH] [--in-memory]\n";
  std::cout << "  sessions       List sessions in the store [--db PATH] [--active]\n";
  std::cout << "  config-path    Print the config file location\n";
  std::cout << "  version        Print the version\n";
  std::cout << "  help           Show this help\n";
}

int run_serve(std::vector<std::string> args) {
  std::string db_override;
  const bool has_db = take_option(args, "--db", "", db_override);
  const bool in_memory = take_flag(args, "--in-memory");
  if (!args.empty()) {
    std::cerr << "unknown option for serve: " << args.front() << "\n";
    return 1;
  }

  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto config = cfg.take();
  observability::set_global_observer(observability::create_observer(config));

  std::unique_ptr<persistence::SqliteSessionStore> store;
  if (!in_memory) {
    const std::string db_path =
        common::expand_path(has_db ? db_override : config.persistence.db_path);
    auto opened = persistence::SqliteSessionStore::open(db_path);
    if (!opened.ok()) {
      std::cerr << opened.error() << "\n";
      return 1;
    }
    store = opened.take();
    std::cerr << "[serve] store: " << db_path << "\n";
  }

  std::signal(SIGPIPE, SIG_IGN);

  runtime::LoopbackRuntimeConnector connector;
  runtime::SessionService service(config, std::move(store), connector);
  auto status = service.start();
  if (!status.ok()) {
    std::cerr << "failed to start: " << status.error() << "\n";
    return 1;
  }

  gateway::StdioTransport transport(std::cin, std::cout);
  gateway::CommandRouter router(service,
                                [&transport](const std::string &line) { transport.write_line(line); });
  std::cerr << "[serve] " << service.registry().size() << " sessions live, reading stdin\n";
  transport.run(router);

  service.stop();
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 0;
}

int run_sessions(std::vector<std::string> args) {
  std::string db_override;
  const bool has_db = take_option(args, "--db", "", db_override);
  const bool active_only = take_flag(args, "--active");

  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const std::string db_path =
      common::expand_path(has_db ? db_override : cfg.value().persistence.db_path);
  auto opened = persistence::SqliteSessionStore::open(db_path);
  if (!opened.ok()) {
    std::cerr << opened.error() << "\n";
    return 1;
  }
  auto listed = opened.value()->list_sessions();
  if (!listed.ok()) {
    std::cerr << listed.error() << "\n";
    return 1;
  }

  std::size_t shown = 0;
  for (const auto &summary : listed.value()) {
    if (active_only && summary.status != session::SessionStatus::Active) {
      continue;
    }
    const std::string label = summary.custom_name.value_or(
        summary.project_name.value_or(summary.project_path));
    std::cout << summary.id << "  " << std::left << std::setw(10)
              << session::to_string(summary.work_status) << " rev=" << summary.revision
              << " msgs=" << summary.message_count << "  " << summary.provider << "  " << label
              << "\n";
    ++shown;
  }
  if (shown == 0) {
    std::cout << "No sessions.\n";
  }
  return 0;
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "sessions") {
    return run_sessions(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace orbitcore::cli
