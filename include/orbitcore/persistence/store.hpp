#pragma once

#include "orbitcore/common/result.hpp"
#include "orbitcore/session/effect.hpp"
#include "orbitcore/session/types.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace orbitcore::persistence {

struct PersistCommand {
  std::string session_id;
  /// Session revision after the step that produced the operation.
  std::uint64_t revision = 0;
  session::PersistOp op;
};

/// Durable session store on SQLite. Every command also raises the stored
/// session revision to at least the command's revision.
class SqliteSessionStore {
public:
  /// Opens (creating when needed) the database and its schema. ":memory:" is
  /// accepted for a private in-memory store.
  [[nodiscard]] static common::Result<std::unique_ptr<SqliteSessionStore>>
  open(const std::filesystem::path &db_path);

  ~SqliteSessionStore();

  SqliteSessionStore(const SqliteSessionStore &) = delete;
  SqliteSessionStore &operator=(const SqliteSessionStore &) = delete;

  [[nodiscard]] common::Status apply(const PersistCommand &command);

  /// Applies all commands in one transaction; on failure nothing is written.
  [[nodiscard]] common::Status apply_batch(const std::vector<PersistCommand> &commands);

  /// Sessions that were not cleanly ended, fully restored. Sessions waiting
  /// on an undecided approval come back awaiting it; all others come back idle.
  [[nodiscard]] common::Result<std::vector<session::SessionState>> load_active_sessions() const;

  [[nodiscard]] common::Result<std::optional<session::SessionState>>
  load_session(const std::string &session_id) const;

  /// Every stored session, most recently active first.
  [[nodiscard]] common::Result<std::vector<session::SessionSummary>> list_sessions() const;

  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

private:
  SqliteSessionStore(std::filesystem::path db_path, sqlite3 *db);

  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status apply_locked(const PersistCommand &command);
  [[nodiscard]] common::Result<std::vector<session::SessionState>>
  load_where(const std::string &where_clause, const std::string &param) const;
  [[nodiscard]] common::Status load_children(session::SessionState &state,
                                             session::WorkStatus stored_status) const;

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  mutable std::mutex mutex_;
};

} // namespace orbitcore::persistence
