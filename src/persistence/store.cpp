#include "orbitcore/persistence/store.hpp"

#include "orbitcore/common/fs.hpp"
#include "orbitcore/common/json_util.hpp"
#include "orbitcore/session/codec.hpp"

#include <type_traits>

namespace orbitcore::persistence {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

/// Prepared statement that finalizes itself.
class Statement {
public:
  Statement(sqlite3 *db, const std::string &sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
      error_ = sqlite3_errmsg(db);
      stmt_ = nullptr;
    }
  }

  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  [[nodiscard]] bool ok() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string &error() const { return error_; }

  void bind(const int index, const std::string &value) {
    if (stmt_ != nullptr) {
      sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }
  }

  void bind(const int index, const std::optional<std::string> &value) {
    if (stmt_ == nullptr) {
      return;
    }
    if (value.has_value()) {
      sqlite3_bind_text(stmt_, index, value->c_str(), -1, SQLITE_TRANSIENT);
    } else {
      sqlite3_bind_null(stmt_, index);
    }
  }

  void bind_int(const int index, const std::uint64_t value) {
    if (stmt_ != nullptr) {
      sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    }
  }

  void bind_int(const int index, const std::optional<std::uint64_t> &value) {
    if (stmt_ == nullptr) {
      return;
    }
    if (value.has_value()) {
      sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(*value));
    } else {
      sqlite3_bind_null(stmt_, index);
    }
  }

  /// Steps once and expects completion.
  [[nodiscard]] common::Status run() {
    if (stmt_ == nullptr) {
      return common::Status::error(error_);
    }
    if (sqlite3_step(stmt_) != SQLITE_DONE) {
      return common::Status::error(sqlite3_errmsg(db_));
    }
    return common::Status::success();
  }

  /// SQLITE_ROW, SQLITE_DONE or an error code.
  int step() { return stmt_ == nullptr ? SQLITE_MISUSE : sqlite3_step(stmt_); }

  [[nodiscard]] std::string text(const int column) const {
    const auto *value = sqlite3_column_text(stmt_, column);
    return value == nullptr ? std::string() : reinterpret_cast<const char *>(value);
  }

  [[nodiscard]] std::optional<std::string> optional_text(const int column) const {
    if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
      return std::nullopt;
    }
    return text(column);
  }

  [[nodiscard]] std::uint64_t u64(const int column) const {
    const auto value = sqlite3_column_int64(stmt_, column);
    return value < 0 ? 0 : static_cast<std::uint64_t>(value);
  }

  [[nodiscard]] std::optional<std::uint64_t> optional_u64(const int column) const {
    if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
      return std::nullopt;
    }
    return u64(column);
  }

private:
  sqlite3 *db_;
  sqlite3_stmt *stmt_ = nullptr;
  std::string error_;
};

std::optional<std::string> enum_text(const auto &value) {
  if (!value.has_value()) {
    return std::nullopt;
  }
  return std::string(session::to_string(*value));
}

std::optional<std::string> amendment_json(const std::optional<std::vector<std::string>> &values) {
  if (!values.has_value()) {
    return std::nullopt;
  }
  std::vector<std::string> quoted;
  quoted.reserve(values->size());
  for (const auto &value : *values) {
    quoted.push_back(common::json_quote(value));
  }
  return common::json_array(quoted);
}

constexpr const char *SESSION_COLUMNS =
    "id, provider, project_path, project_name, model, custom_name, approval_policy, "
    "sandbox_mode, forked_from, status, work_status, end_reason, started_at, "
    "last_activity_at, ended_at, current_diff, current_plan, current_turn_id, turn_count, "
    "input_tokens, output_tokens, cached_tokens, context_window, current_cwd, git_branch, "
    "git_sha, revision, tool_count";

} // namespace

common::Result<std::unique_ptr<SqliteSessionStore>>
SqliteSessionStore::open(const std::filesystem::path &db_path) {
  using R = common::Result<std::unique_ptr<SqliteSessionStore>>;
  const bool in_memory = db_path == ":memory:";
  if (!in_memory && db_path.has_parent_path()) {
    auto dir = common::ensure_dir(db_path.parent_path());
    if (!dir.ok()) {
      return R::failure(dir.error());
    }
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(db_path.string().c_str(), &db) != SQLITE_OK) {
    const std::string msg = db == nullptr ? "sqlite open failed" : sqlite3_errmsg(db);
    if (db != nullptr) {
      sqlite3_close(db);
    }
    return R::failure("failed to open " + db_path.string() + ": " + msg);
  }
  sqlite3_busy_timeout(db, 5'000);

  std::unique_ptr<SqliteSessionStore> store(new SqliteSessionStore(db_path, db));
  auto status = store->init_schema();
  if (!status.ok()) {
    return R::failure("failed to initialize schema: " + status.error());
  }
  return R::success(std::move(store));
}

SqliteSessionStore::SqliteSessionStore(std::filesystem::path db_path, sqlite3 *db)
    : db_path_(std::move(db_path)), db_(db) {}

SqliteSessionStore::~SqliteSessionStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteSessionStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS sessions (
  id TEXT PRIMARY KEY,
  provider TEXT NOT NULL,
  project_path TEXT NOT NULL,
  project_name TEXT,
  model TEXT,
  custom_name TEXT,
  approval_policy TEXT,
  sandbox_mode TEXT,
  forked_from TEXT,
  status TEXT NOT NULL DEFAULT 'active',
  work_status TEXT NOT NULL DEFAULT 'waiting',
  end_reason TEXT,
  started_at TEXT NOT NULL,
  last_activity_at TEXT,
  ended_at TEXT,
  current_diff TEXT,
  current_plan TEXT,
  current_turn_id TEXT,
  turn_count INTEGER NOT NULL DEFAULT 0,
  tool_count INTEGER NOT NULL DEFAULT 0,
  input_tokens INTEGER NOT NULL DEFAULT 0,
  output_tokens INTEGER NOT NULL DEFAULT 0,
  cached_tokens INTEGER NOT NULL DEFAULT 0,
  context_window INTEGER NOT NULL DEFAULT 0,
  current_cwd TEXT,
  git_branch TEXT,
  git_sha TEXT,
  revision INTEGER NOT NULL DEFAULT 0
);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS messages (
  id TEXT PRIMARY KEY,
  session_id TEXT NOT NULL,
  sequence INTEGER NOT NULL,
  type TEXT NOT NULL,
  content TEXT NOT NULL,
  tool_name TEXT,
  tool_input TEXT,
  tool_output TEXT,
  is_error INTEGER NOT NULL DEFAULT 0,
  timestamp TEXT NOT NULL,
  duration_ms INTEGER
);
CREATE INDEX IF NOT EXISTS idx_messages_session ON messages(session_id, sequence);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS approvals (
  request_id TEXT PRIMARY KEY,
  session_id TEXT NOT NULL,
  approval_type TEXT NOT NULL,
  tool_name TEXT,
  command TEXT,
  file_path TEXT,
  diff TEXT,
  question TEXT,
  proposed_amendment TEXT,
  cwd TEXT,
  decision TEXT,
  decided_at TEXT
);
CREATE INDEX IF NOT EXISTS idx_approvals_session ON approvals(session_id);
)");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS turn_diffs (
  session_id TEXT NOT NULL,
  turn_id TEXT NOT NULL,
  diff TEXT NOT NULL,
  input_tokens INTEGER NOT NULL DEFAULT 0,
  output_tokens INTEGER NOT NULL DEFAULT 0,
  cached_tokens INTEGER NOT NULL DEFAULT 0,
  context_window INTEGER NOT NULL DEFAULT 0,
  PRIMARY KEY (session_id, turn_id)
);
)");
}

common::Status SqliteSessionStore::apply(const PersistCommand &command) {
  return apply_batch({command});
}

common::Status SqliteSessionStore::apply_batch(const std::vector<PersistCommand> &commands) {
  if (commands.empty()) {
    return common::Status::success();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return status;
  }
  for (const auto &command : commands) {
    status = apply_locked(command);
    if (!status.ok()) {
      const auto rollback = exec_sql(db_, "ROLLBACK;");
      if (!rollback.ok()) {
        return common::Status::error(status.error() + " (rollback failed: " + rollback.error() +
                                     ")");
      }
      return common::Status::error(std::string(session::persist_op_name(command.op)) + " for " +
                                   command.session_id + ": " + status.error());
    }
  }
  return exec_sql(db_, "COMMIT;");
}

common::Status SqliteSessionStore::apply_locked(const PersistCommand &command) {
  namespace persist = session::persist;
  const std::string &id = command.session_id;

  auto status = std::visit(
      [&](const auto &op) -> common::Status {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, persist::SessionCreate>) {
          Statement stmt(db_, "INSERT OR IGNORE INTO sessions(id, provider, project_path, "
                              "project_name, model, approval_policy, sandbox_mode, forked_from, "
                              "started_at, last_activity_at) "
                              "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?9)");
          stmt.bind(1, id);
          stmt.bind(2, op.provider);
          stmt.bind(3, op.project_path);
          stmt.bind(4, op.project_name);
          stmt.bind(5, op.model);
          stmt.bind(6, op.approval_policy);
          stmt.bind(7, op.sandbox_mode);
          stmt.bind(8, op.forked_from);
          stmt.bind(9, op.started_at);
          return stmt.run();
        } else if constexpr (std::is_same_v<T, persist::SessionUpdate>) {
          Statement stmt(db_, "UPDATE sessions SET status = COALESCE(?2, status), "
                              "work_status = COALESCE(?3, work_status), "
                              "last_activity_at = COALESCE(?4, last_activity_at) WHERE id = ?1");
          stmt.bind(1, id);
          stmt.bind(2, enum_text(op.status));
          stmt.bind(3, enum_text(op.work_status));
          stmt.bind(4, op.last_activity_at);
          return stmt.run();
        } else if constexpr (std::is_same_v<T, persist::SessionEnd>) {
          Statement stmt(db_, "UPDATE sessions SET status = 'ended', work_status = 'ended', "
                              "end_reason = ?2, ended_at = ?3, last_activity_at = ?3 "
                              "WHERE id = ?1");
          stmt.bind(1, id);
          stmt.bind(2, op.reason);
          stmt.bind(3, op.ended_at);
          return stmt.run();
        } else if constexpr (std::is_same_v<T, persist::Reactivate>) {
          Statement stmt(db_, "UPDATE sessions SET status = 'active', work_status = 'waiting', "
                              "end_reason = NULL, ended_at = NULL, last_activity_at = ?2 "
                              "WHERE id = ?1");
          stmt.bind(1, id);
          stmt.bind(2, op.last_activity_at);
          return stmt.run();
        } else if constexpr (std::is_same_v<T, persist::MessageAppend>) {
          const auto &m = op.message;
          Statement stmt(db_, "INSERT OR IGNORE INTO messages(id, session_id, sequence, type, "
                              "content, tool_name, tool_input, tool_output, is_error, timestamp, "
                              "duration_ms) VALUES(?1, ?2, (SELECT COALESCE(MAX(sequence), 0) + 1 "
                              "FROM messages WHERE session_id = ?2), ?3, ?4, ?5, ?6, ?7, ?8, ?9, "
                              "?10)");
          stmt.bind(1, m.id);
          stmt.bind(2, id);
          stmt.bind(3, std::string(session::to_string(m.type)));
          stmt.bind(4, m.content);
          stmt.bind(5, m.tool_name);
          stmt.bind(6, m.tool_input);
          stmt.bind(7, m.tool_output);
          stmt.bind_int(8, m.is_error ? 1 : 0);
          stmt.bind(9, m.timestamp);
          stmt.bind_int(10, m.duration_ms);
          return stmt.run();
        } else if constexpr (std::is_same_v<T, persist::ToolCountIncrement>) {
          Statement stmt(db_, "UPDATE sessions SET tool_count = tool_count + 1, "
                              "last_activity_at = ?2 WHERE id = ?1");
          stmt.bind(1, id);
          stmt.bind(2, op.last_activity_at);
          return stmt.run();
        } else if constexpr (std::is_same_v<T, persist::MessageUpdate>) {
          Statement stmt(db_, "UPDATE messages SET content = COALESCE(?3, content), "
                              "tool_output = COALESCE(?4, tool_output), "
                              "is_error = COALESCE(?5, is_error), "
                              "duration_ms = COALESCE(?6, duration_ms) "
                              "WHERE session_id = ?1 AND id = ?2");
          stmt.bind(1, id);
          stmt.bind(2, op.message_id);
          stmt.bind(3, op.content);
          stmt.bind(4, op.tool_output);
          stmt.bind_int(5, op.is_error.has_value()
                               ? std::optional<std::uint64_t>(*op.is_error ? 1 : 0)
                               : std::nullopt);
          stmt.bind_int(6, op.duration_ms);
          return stmt.run();
        } else if constexpr (std::is_same_v<T, persist::TokensUpdate>) {
          Statement stmt(db_, "UPDATE sessions SET input_tokens = ?2, output_tokens = ?3, "
                              "cached_tokens = ?4, context_window = ?5 WHERE id = ?1");
          stmt.bind(1, id);
          stmt.bind_int(2, op.usage.input_tokens);
          stmt.bind_int(3, op.usage.output_tokens);
          stmt.bind_int(4, op.usage.cached_tokens);
          stmt.bind_int(5, op.usage.context_window);
          return stmt.run();
        } else if constexpr (std::is_same_v<T, persist::TurnStateUpdate>) {
          Statement stmt(db_, "UPDATE sessions SET current_diff = COALESCE(?2, current_diff), "
                              "current_plan = COALESCE(?3, current_plan), "
                              "current_turn_id = CASE WHEN ?4 = 1 THEN ?5 ELSE current_turn_id "
                              "END, turn_count = COALESCE(?6, turn_count) WHERE id = ?1");
          stmt.bind(1, id);
          stmt.bind(2, op.diff);
          stmt.bind(3, op.plan);
          stmt.bind_int(4, op.current_turn_id.has_value() ? 1 : 0);
          stmt.bind(5, op.current_turn_id.has_value() ? *op.current_turn_id
                                                      : std::optional<std::string>{});
          stmt.bind_int(6, op.turn_count);
          return stmt.run();
        } else if constexpr (std::is_same_v<T, persist::TurnDiffInsert>) {
          const auto &td = op.turn_diff;
          Statement stmt(db_, "INSERT OR REPLACE INTO turn_diffs(session_id, turn_id, diff, "
                              "input_tokens, output_tokens, cached_tokens, context_window) "
                              "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7)");
          stmt.bind(1, id);
          stmt.bind(2, td.turn_id);
          stmt.bind(3, td.diff);
          stmt.bind_int(4, td.token_usage.input_tokens);
          stmt.bind_int(5, td.token_usage.output_tokens);
          stmt.bind_int(6, td.token_usage.cached_tokens);
          stmt.bind_int(7, td.token_usage.context_window);
          return stmt.run();
        } else if constexpr (std::is_same_v<T, persist::SetCustomName>) {
          Statement stmt(db_, "UPDATE sessions SET custom_name = ?2 WHERE id = ?1");
          stmt.bind(1, id);
          stmt.bind(2, op.custom_name);
          return stmt.run();
        } else if constexpr (std::is_same_v<T, persist::SetSessionConfig>) {
          Statement stmt(db_, "UPDATE sessions SET "
                              "approval_policy = COALESCE(?2, approval_policy), "
                              "sandbox_mode = COALESCE(?3, sandbox_mode) WHERE id = ?1");
          stmt.bind(1, id);
          stmt.bind(2, op.approval_policy);
          stmt.bind(3, op.sandbox_mode);
          return stmt.run();
        } else if constexpr (std::is_same_v<T, persist::ModelUpdate>) {
          Statement stmt(db_, "UPDATE sessions SET model = ?2 WHERE id = ?1");
          stmt.bind(1, id);
          stmt.bind(2, op.model);
          return stmt.run();
        } else if constexpr (std::is_same_v<T, persist::EnvironmentUpdate>) {
          Statement stmt(db_, "UPDATE sessions SET current_cwd = COALESCE(?2, current_cwd), "
                              "git_branch = COALESCE(?3, git_branch), "
                              "git_sha = COALESCE(?4, git_sha) WHERE id = ?1");
          stmt.bind(1, id);
          stmt.bind(2, op.cwd);
          stmt.bind(3, op.git_branch);
          stmt.bind(4, op.git_sha);
          return stmt.run();
        } else if constexpr (std::is_same_v<T, persist::ApprovalRequested>) {
          const auto &r = op.request;
          Statement stmt(db_, "INSERT OR REPLACE INTO approvals(request_id, session_id, "
                              "approval_type, tool_name, command, file_path, diff, question, "
                              "proposed_amendment, cwd, decision, decided_at) "
                              "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, NULL, NULL)");
          stmt.bind(1, r.id);
          stmt.bind(2, id);
          stmt.bind(3, std::string(session::to_string(r.approval_type)));
          stmt.bind(4, op.tool_name);
          stmt.bind(5, r.command);
          stmt.bind(6, r.file_path);
          stmt.bind(7, r.diff);
          stmt.bind(8, r.question);
          stmt.bind(9, amendment_json(r.proposed_amendment));
          stmt.bind(10, op.cwd);
          return stmt.run();
        } else {
          static_assert(std::is_same_v<T, persist::ApprovalDecision>);
          Statement stmt(db_, "UPDATE approvals SET decision = ?3, decided_at = ?4 "
                              "WHERE session_id = ?1 AND request_id = ?2");
          stmt.bind(1, id);
          stmt.bind(2, op.request_id);
          stmt.bind(3, std::string(session::to_string(op.decision)));
          stmt.bind(4, op.decided_at);
          return stmt.run();
        }
      },
      command.op);
  if (!status.ok()) {
    return status;
  }

  Statement bump(db_, "UPDATE sessions SET revision = MAX(revision, ?2) WHERE id = ?1");
  bump.bind(1, id);
  bump.bind_int(2, command.revision);
  return bump.run();
}

common::Result<std::vector<session::SessionState>> SqliteSessionStore::load_active_sessions() const {
  return load_where("status = 'active'", "");
}

common::Result<std::optional<session::SessionState>>
SqliteSessionStore::load_session(const std::string &session_id) const {
  using R = common::Result<std::optional<session::SessionState>>;
  auto loaded = load_where("id = ?1", session_id);
  if (!loaded.ok()) {
    return R::failure(loaded.error());
  }
  auto states = loaded.take();
  if (states.empty()) {
    return R::success(std::nullopt);
  }
  return R::success(std::move(states.front()));
}

common::Result<std::vector<session::SessionState>>
SqliteSessionStore::load_where(const std::string &where_clause, const std::string &param) const {
  using R = common::Result<std::vector<session::SessionState>>;
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(db_, std::string("SELECT ") + SESSION_COLUMNS + " FROM sessions WHERE " +
                          where_clause + " ORDER BY started_at, id");
  if (!stmt.ok()) {
    return R::failure(stmt.error());
  }
  if (!param.empty()) {
    stmt.bind(1, param);
  }

  std::vector<std::pair<session::SessionState, session::WorkStatus>> rows;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    session::SessionState state;
    state.id = stmt.text(0);
    state.provider = stmt.text(1);
    state.project_path = stmt.text(2);
    state.project_name = stmt.optional_text(3);
    state.model = stmt.optional_text(4);
    state.custom_name = stmt.optional_text(5);
    state.approval_policy = stmt.optional_text(6);
    state.sandbox_mode = stmt.optional_text(7);
    state.forked_from = stmt.optional_text(8);
    const bool ended =
        session::parse_session_status(stmt.text(9)).value_or(session::SessionStatus::Active) ==
        session::SessionStatus::Ended;
    const auto work_status =
        session::parse_work_status(stmt.text(10)).value_or(session::WorkStatus::Waiting);
    if (ended) {
      state.phase = session::EndedPhase{.reason = stmt.optional_text(11).value_or("")};
    }
    state.started_at = stmt.text(12);
    state.last_activity_at = stmt.optional_text(13);
    state.ended_at = stmt.optional_text(14);
    state.current_diff = stmt.optional_text(15);
    state.current_plan = stmt.optional_text(16);
    state.current_turn_id = stmt.optional_text(17);
    state.turn_count = stmt.u64(18);
    state.token_usage = session::TokenUsage{.input_tokens = stmt.u64(19),
                                            .output_tokens = stmt.u64(20),
                                            .cached_tokens = stmt.u64(21),
                                            .context_window = stmt.u64(22)};
    state.current_cwd = stmt.optional_text(23);
    state.git_branch = stmt.optional_text(24);
    state.git_sha = stmt.optional_text(25);
    state.revision = stmt.u64(26);
    state.tool_count = stmt.u64(27);
    rows.emplace_back(std::move(state), work_status);
  }
  if (rc != SQLITE_DONE) {
    return R::failure(sqlite3_errmsg(db_));
  }

  std::vector<session::SessionState> out;
  out.reserve(rows.size());
  for (auto &[state, work_status] : rows) {
    auto status = load_children(state, work_status);
    if (!status.ok()) {
      return R::failure("failed to load session " + state.id + ": " + status.error());
    }
    out.push_back(std::move(state));
  }
  return R::success(std::move(out));
}

common::Status SqliteSessionStore::load_children(session::SessionState &state,
                                                 const session::WorkStatus stored_status) const {
  {
    Statement stmt(db_, "SELECT id, type, content, tool_name, tool_input, tool_output, "
                        "is_error, timestamp, duration_ms FROM messages WHERE session_id = ?1 "
                        "ORDER BY sequence");
    if (!stmt.ok()) {
      return common::Status::error(stmt.error());
    }
    stmt.bind(1, state.id);
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
      state.messages.push_back(session::Message{
          .id = stmt.text(0),
          .session_id = state.id,
          .type = session::parse_message_type(stmt.text(1)).value_or(session::MessageType::Assistant),
          .content = stmt.text(2),
          .tool_name = stmt.optional_text(3),
          .tool_input = stmt.optional_text(4),
          .tool_output = stmt.optional_text(5),
          .is_error = stmt.u64(6) != 0,
          .timestamp = stmt.text(7),
          .duration_ms = stmt.optional_u64(8),
      });
    }
    if (rc != SQLITE_DONE) {
      return common::Status::error(sqlite3_errmsg(db_));
    }
  }

  {
    Statement stmt(db_, "SELECT turn_id, diff, input_tokens, output_tokens, cached_tokens, "
                        "context_window FROM turn_diffs WHERE session_id = ?1 ORDER BY rowid");
    if (!stmt.ok()) {
      return common::Status::error(stmt.error());
    }
    stmt.bind(1, state.id);
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
      state.turn_diffs.push_back(
          session::TurnDiff{.turn_id = stmt.text(0),
                            .diff = stmt.text(1),
                            .token_usage = session::TokenUsage{.input_tokens = stmt.u64(2),
                                                               .output_tokens = stmt.u64(3),
                                                               .cached_tokens = stmt.u64(4),
                                                               .context_window = stmt.u64(5)}});
    }
    if (rc != SQLITE_DONE) {
      return common::Status::error(sqlite3_errmsg(db_));
    }
  }

  if (session::is_ended(state.phase)) {
    return common::Status::success();
  }

  const bool awaiting = stored_status == session::WorkStatus::Permission ||
                        stored_status == session::WorkStatus::Question;
  if (awaiting) {
    Statement stmt(db_, "SELECT request_id, approval_type, command, file_path, diff, question, "
                        "proposed_amendment FROM approvals WHERE session_id = ?1 AND decision IS "
                        "NULL ORDER BY rowid DESC LIMIT 1");
    if (!stmt.ok()) {
      return common::Status::error(stmt.error());
    }
    stmt.bind(1, state.id);
    const int rc = stmt.step();
    if (rc == SQLITE_ROW) {
      const auto amendment = stmt.optional_text(6);
      session::ApprovalRequest request{
          .id = stmt.text(0),
          .session_id = state.id,
          .approval_type =
              session::parse_approval_type(stmt.text(1)).value_or(session::ApprovalType::Exec),
          .command = stmt.optional_text(2),
          .file_path = stmt.optional_text(3),
          .diff = stmt.optional_text(4),
          .question = stmt.optional_text(5),
          .proposed_amendment = amendment.has_value()
                                    ? session::string_list_from_json(*amendment)
                                    : std::nullopt,
      };
      state.phase = session::AwaitingApprovalPhase{.request_id = request.id,
                                                   .approval_type = request.approval_type,
                                                   .proposed_amendment =
                                                       request.proposed_amendment};
      state.pending_approval = std::move(request);
      return common::Status::success();
    }
    if (rc != SQLITE_DONE) {
      return common::Status::error(sqlite3_errmsg(db_));
    }
  }

  // The runtime that was driving any in-flight turn did not survive the restart.
  state.phase = session::IdlePhase{};
  state.current_turn_id.reset();
  return common::Status::success();
}

common::Result<std::vector<session::SessionSummary>> SqliteSessionStore::list_sessions() const {
  using R = common::Result<std::vector<session::SessionSummary>>;
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(db_, "SELECT s.id, s.provider, s.project_path, s.project_name, s.model, "
                      "s.custom_name, s.status, s.work_status, s.revision, "
                      "(SELECT COUNT(*) FROM messages m WHERE m.session_id = s.id), "
                      "s.started_at, s.last_activity_at, s.tool_count FROM sessions s "
                      "ORDER BY COALESCE(s.last_activity_at, s.started_at) DESC, s.id");
  if (!stmt.ok()) {
    return R::failure(stmt.error());
  }

  std::vector<session::SessionSummary> out;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    out.push_back(session::SessionSummary{
        .id = stmt.text(0),
        .provider = stmt.text(1),
        .project_path = stmt.text(2),
        .project_name = stmt.optional_text(3),
        .model = stmt.optional_text(4),
        .custom_name = stmt.optional_text(5),
        .status = session::parse_session_status(stmt.text(6)).value_or(session::SessionStatus::Active),
        .work_status = session::parse_work_status(stmt.text(7)).value_or(session::WorkStatus::Waiting),
        .revision = stmt.u64(8),
        .message_count = static_cast<std::size_t>(stmt.u64(9)),
        .tool_count = stmt.u64(12),
        .started_at = stmt.text(10),
        .last_activity_at = stmt.optional_text(11),
    });
  }
  if (rc != SQLITE_DONE) {
    return R::failure(sqlite3_errmsg(db_));
  }
  return R::success(std::move(out));
}

} // namespace orbitcore::persistence
