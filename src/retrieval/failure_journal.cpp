#include "raefusion/retrieval/failure_journal.hpp"

#include "raefusion/observability/global.hpp"

namespace raefusion::retrieval {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorCode::Storage, msg);
  }
  return common::Status::success();
}

std::string join_engines(const std::vector<EngineId> &engines) {
  std::string out;
  for (const auto engine : engines) {
    if (!out.empty()) {
      out += ",";
    }
    out += engine_to_string(engine);
  }
  return out;
}

std::string column_text(sqlite3_stmt *stmt, const int index) {
  const auto *text = sqlite3_column_text(stmt, index);
  return text == nullptr ? std::string() : std::string(reinterpret_cast<const char *>(text));
}

} // namespace

FailureJournal::FailureJournal(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "sqlite open failed" : sqlite3_errmsg(db_);
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }

  if (auto status = init_schema(); !status.ok()) {
    open_error_ = status.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

FailureJournal::~FailureJournal() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status FailureJournal::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS failure_events (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  created_at TEXT NOT NULL,
  label TEXT NOT NULL,
  resonance REAL NOT NULL,
  profile TEXT NOT NULL,
  weights TEXT NOT NULL,
  engines TEXT NOT NULL,
  top_score REAL NOT NULL,
  query_fingerprint TEXT NOT NULL
);
)");
}

common::Status FailureJournal::append(const FailureEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorCode::Storage,
                                 "failure journal is not open: " + open_error_);
  }

  constexpr const char *sql =
      "INSERT INTO failure_events(created_at, label, resonance, profile, weights, engines, "
      "top_score, query_fingerprint) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(common::ErrorCode::Storage, sqlite3_errmsg(db_));
  }

  const std::string label(label_to_string(event.classification.label));
  const std::string weights = describe_weights(event.profile);
  const std::string engines = join_engines(event.engines_queried);
  sqlite3_bind_text(stmt, 1, event.timestamp.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, label.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_double(stmt, 3, event.classification.resonance);
  sqlite3_bind_text(stmt, 4, event.profile.name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, weights.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 6, engines.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_double(stmt, 7, event.top_score);
  sqlite3_bind_text(stmt, 8, event.query_fingerprint.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(common::ErrorCode::Storage, sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::vector<JournalEntry>> FailureJournal::recent(const std::size_t limit) {
  using RecentResult = common::Result<std::vector<JournalEntry>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return RecentResult::failure(common::ErrorCode::Storage,
                                 "failure journal is not open: " + open_error_);
  }

  constexpr const char *sql =
      "SELECT id, created_at, label, resonance, profile, weights, engines, top_score, "
      "query_fingerprint FROM failure_events ORDER BY id DESC LIMIT ?1";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return RecentResult::failure(common::ErrorCode::Storage, sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));

  std::vector<JournalEntry> entries;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    JournalEntry entry;
    entry.id = sqlite3_column_int64(stmt, 0);
    entry.timestamp = column_text(stmt, 1);
    entry.label = column_text(stmt, 2);
    entry.resonance = sqlite3_column_double(stmt, 3);
    entry.profile = column_text(stmt, 4);
    entry.weights = column_text(stmt, 5);
    entry.engines = column_text(stmt, 6);
    entry.top_score = sqlite3_column_double(stmt, 7);
    entry.query_fingerprint = column_text(stmt, 8);
    entries.push_back(std::move(entry));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return RecentResult::failure(common::ErrorCode::Storage, sqlite3_errmsg(db_));
  }
  return RecentResult::success(std::move(entries));
}

common::Result<std::size_t> FailureJournal::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure(common::ErrorCode::Storage,
                                                "failure journal is not open: " + open_error_);
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM failure_events", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<std::size_t>::failure(common::ErrorCode::Storage, sqlite3_errmsg(db_));
  }
  std::size_t total = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(total);
}

void FailureJournal::on_failure(const FailureEvent &event) {
  if (auto status = append(event); !status.ok()) {
    observability::record_error("journal", status.error());
  }
}

} // namespace raefusion::retrieval
