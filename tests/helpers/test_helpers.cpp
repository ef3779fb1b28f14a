#include "tests/helpers/test_helpers.hpp"

#include <fstream>
#include <random>
#include <stdexcept>
#include <thread>

namespace raefusion::testing {

config::Config test_config() {
  config::Config config;
  config.observability.backend = "none";
  config.cache.enabled = false;
  config.miss.journal_enabled = false;
  config.retrieval.source_timeout_ms = 300;
  config.retrieval.query_timeout_ms = 1000;
  config.tuner.retune_interval_ms = 50;
  config.tuner.batch_size = 4;
  return config;
}

retrieval::ScoredItems scored(std::initializer_list<std::string> ids, const double top) {
  retrieval::ScoredItems items;
  double score = top;
  for (const auto &id : ids) {
    items.push_back(retrieval::ScoredItem{.item_id = id, .score = score});
    score -= 0.01;
  }
  return items;
}

retrieval::ScoredItems scored_items(std::initializer_list<std::pair<std::string, double>> items) {
  retrieval::ScoredItems out;
  for (const auto &[id, score] : items) {
    out.push_back(retrieval::ScoredItem{.item_id = id, .score = score});
  }
  return out;
}

retrieval::SourceResult ranked(const retrieval::EngineId engine,
                               std::initializer_list<std::string> ids) {
  retrieval::SourceResult result;
  std::size_t rank = 1;
  for (const auto &id : ids) {
    result.candidates.push_back(retrieval::CandidateResult{
        .engine = engine, .item_id = id, .raw_score = 1.0 / static_cast<double>(rank), .rank = rank});
    ++rank;
  }
  return result;
}

retrieval::SourceResult
ranked_at(const retrieval::EngineId engine,
          std::initializer_list<std::pair<std::string, std::size_t>> ids_and_ranks) {
  retrieval::SourceResult result;
  for (const auto &[id, rank] : ids_and_ranks) {
    result.candidates.push_back(retrieval::CandidateResult{
        .engine = engine, .item_id = id, .raw_score = 1.0 / static_cast<double>(rank), .rank = rank});
  }
  return result;
}

retrieval::SourceResult unavailable(const std::string &reason) {
  return retrieval::SourceResult{.available = false, .error = reason};
}

retrieval::WeightProfile profile(const std::string &name, const double vector,
                                 const double lexical, const double graph,
                                 const retrieval::FusionStrategy strategy,
                                 const retrieval::ClipMode clip) {
  retrieval::WeightProfile out;
  out.name = name;
  out.weights = {{retrieval::EngineId::Vector, vector},
                 {retrieval::EngineId::Lexical, lexical},
                 {retrieval::EngineId::Graph, graph}};
  out.strategy = strategy;
  out.clip = clip;
  return out;
}

void ScriptedResponder::set(FakeBehavior behavior) {
  std::lock_guard<std::mutex> lock(mutex_);
  behavior_ = std::move(behavior);
}

common::Result<retrieval::ScoredItems>
ScriptedResponder::respond(const common::CancellationToken &cancel) {
  ++calls_;
  FakeBehavior behavior;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    behavior = behavior_;
  }

  const auto until = std::chrono::steady_clock::now() + behavior.delay;
  while (std::chrono::steady_clock::now() < until) {
    if (cancel.is_cancelled()) {
      return common::Result<retrieval::ScoredItems>::failure(common::ErrorCode::Cancelled,
                                                             "cancelled");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  if (behavior.throw_error) {
    throw std::runtime_error("engine exploded");
  }
  if (behavior.error.has_value()) {
    return common::Result<retrieval::ScoredItems>::failure(*behavior.error);
  }
  return common::Result<retrieval::ScoredItems>::success(behavior.items);
}

FakeVectorBackend::FakeVectorBackend(FakeBehavior behavior) { set(std::move(behavior)); }

common::Result<retrieval::ScoredItems>
FakeVectorBackend::search(const std::string &, const retrieval::Filters &, const std::size_t limit,
                          const common::CancellationToken &cancel) {
  last_limit_ = limit;
  return responder_.respond(cancel);
}

FakeLexicalBackend::FakeLexicalBackend(FakeBehavior behavior) { set(std::move(behavior)); }

common::Result<retrieval::ScoredItems>
FakeLexicalBackend::search(const std::string &, const retrieval::Filters &, std::size_t,
                           const common::CancellationToken &cancel) {
  return responder_.respond(cancel);
}

FakeGraphBackend::FakeGraphBackend(FakeBehavior behavior) { set(std::move(behavior)); }

common::Result<retrieval::ScoredItems>
FakeGraphBackend::traverse(const std::vector<std::string> &seed_items, const std::uint32_t depth,
                           std::size_t, const common::CancellationToken &cancel) {
  {
    std::lock_guard<std::mutex> lock(seeds_mutex_);
    last_seeds_ = seed_items;
  }
  last_depth_ = depth;
  return responder_.respond(cancel);
}

std::vector<std::string> FakeGraphBackend::last_seeds() const {
  std::lock_guard<std::mutex> lock(seeds_mutex_);
  return last_seeds_;
}

void RecordingSink::on_failure(const retrieval::FailureEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

std::vector<retrieval::FailureEvent> RecordingSink::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::size_t RecordingSink::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

void ThrowingSink::on_failure(const retrieval::FailureEvent &) {
  throw std::runtime_error("sink offline");
}

TempDir::TempDir() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("raefusion-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempDir::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

} // namespace raefusion::testing
