#pragma once

#include "raefusion/common/result.hpp"
#include "raefusion/retrieval/backends.hpp"
#include "raefusion/retrieval/types.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace raefusion::retrieval {

struct JournalEntry {
  std::int64_t id = 0;
  std::string timestamp;
  std::string label;
  double resonance = 0.0;
  std::string profile;
  std::string weights;
  std::string engines;
  double top_score = 0.0;
  std::string query_fingerprint;
};

/// Append-only SQLite log of miss events.
class FailureJournal final : public IReflectionSink {
public:
  explicit FailureJournal(std::filesystem::path db_path);
  ~FailureJournal() override;

  FailureJournal(const FailureJournal &) = delete;
  FailureJournal &operator=(const FailureJournal &) = delete;

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }
  [[nodiscard]] const std::string &open_error() const { return open_error_; }

  [[nodiscard]] common::Status append(const FailureEvent &event);
  [[nodiscard]] common::Result<std::vector<JournalEntry>> recent(std::size_t limit);
  [[nodiscard]] common::Result<std::size_t> count();

  void on_failure(const FailureEvent &event) override;
  [[nodiscard]] std::string_view name() const override { return "journal"; }

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::mutex mutex_;
};

} // namespace raefusion::retrieval
