#include "raefusion/retrieval/candidate_source.hpp"

#include "raefusion/common/hash.hpp"
#include "raefusion/observability/global.hpp"

#include <algorithm>
#include <future>
#include <thread>
#include <unordered_set>

namespace raefusion::retrieval {

namespace {

using FetchResult = common::Result<std::vector<CandidateResult>>;

constexpr auto WAIT_SLICE = std::chrono::milliseconds(5);

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

common::Result<ScoredItems> missing_backend() {
  return common::Result<ScoredItems>::failure(common::ErrorCode::SourceUnavailable,
                                              "no backend configured");
}

} // namespace

CandidateSource::CandidateSource(const EngineId engine, SourceOptions options,
                                 std::shared_ptr<ResultCache> cache)
    : engine_(engine), options_(options), cache_(std::move(cache)) {}

FetchResult CandidateSource::fetch(const SourceRequest &request,
                                   const std::chrono::milliseconds timeout,
                                   const common::CancellationToken &cancel) {
  const std::string engine_name(engine_to_string(engine_));
  if (cancel.is_cancelled()) {
    return FetchResult::failure(common::ErrorCode::Cancelled, engine_name + ": cancelled");
  }

  if (circuit_open()) {
    observability::record_source_unavailable(engine_name, "circuit open");
    return FetchResult::failure(common::ErrorCode::SourceUnavailable,
                                engine_name + ": circuit open after repeated failures");
  }

  if (is_trivially_empty(request)) {
    return FetchResult::success({});
  }

  const bool cacheable = cache_ != nullptr && request.use_cache;
  std::string key;
  if (cacheable) {
    key = cache_key(request);
    if (auto hit = cache_->get(key); hit.has_value()) {
      observability::record_source_call(engine_name, std::chrono::milliseconds(0), hit->size(),
                                        true, true);
      return FetchResult::success(std::move(*hit));
    }
  }

  const auto started = std::chrono::steady_clock::now();
  const auto deadline = started + timeout;

  // The worker is detached so a hung backend cannot hold the query; the
  // promise is shared so a late result lands somewhere valid.
  auto promise = std::make_shared<std::promise<common::Result<ScoredItems>>>();
  auto future = promise->get_future();
  std::thread([call = make_call(request, cancel), promise]() {
    try {
      promise->set_value(call());
    } catch (const std::exception &ex) {
      promise->set_value(common::Result<ScoredItems>::failure(
          common::ErrorCode::SourceUnavailable, std::string("backend threw: ") + ex.what()));
    } catch (...) {
      promise->set_value(common::Result<ScoredItems>::failure(
          common::ErrorCode::SourceUnavailable, "backend threw a non-standard exception"));
    }
  }).detach();

  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      record_failure();
      const std::string reason = "timed out after " + std::to_string(timeout.count()) + "ms";
      observability::record_source_unavailable(engine_name, reason);
      return FetchResult::failure(common::ErrorCode::SourceUnavailable,
                                  engine_name + ": " + reason);
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    if (future.wait_for(std::min<std::chrono::milliseconds>(WAIT_SLICE, remaining)) ==
        std::future_status::ready) {
      break;
    }
    if (cancel.is_cancelled()) {
      return FetchResult::failure(common::ErrorCode::Cancelled, engine_name + ": cancelled");
    }
  }

  auto outcome = future.get();
  const auto duration = elapsed_since(started);
  if (!outcome.ok()) {
    if (cancel.is_cancelled()) {
      return FetchResult::failure(common::ErrorCode::Cancelled, engine_name + ": cancelled");
    }
    record_failure();
    observability::record_source_call(engine_name, duration, 0, false, false);
    observability::record_source_unavailable(engine_name, outcome.error());
    return FetchResult::failure(common::ErrorCode::SourceUnavailable,
                                engine_name + ": " + outcome.error());
  }

  auto candidates = to_candidates(outcome.value(), request.limit);
  record_success();
  if (cacheable) {
    cache_->put(key, candidates);
  }
  observability::record_source_call(engine_name, duration, candidates.size(), true, false);
  return FetchResult::success(std::move(candidates));
}

bool CandidateSource::circuit_open() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return failure_count_ >= options_.failure_threshold &&
         std::chrono::steady_clock::now() < open_until_;
}

std::uint32_t CandidateSource::consecutive_failures() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return failure_count_;
}

std::string CandidateSource::cache_key(const SourceRequest &request) const {
  std::string material(engine_to_string(engine_));
  material += '\x1f';
  material += request.text;
  for (const auto &[name, value] : request.filters) {
    material += '\x1f' + name + '=' + value;
  }
  material += '\x1f' + std::to_string(request.limit);
  material += '\x1f' + std::to_string(request.depth);
  for (const auto &seed : request.seeds) {
    material += '\x1e' + seed;
  }
  return common::sha256_hex(material);
}

std::vector<CandidateResult> CandidateSource::to_candidates(const ScoredItems &items,
                                                            const std::size_t limit) const {
  std::vector<CandidateResult> candidates;
  candidates.reserve(std::min(items.size(), limit));
  std::unordered_set<std::string> seen;

  for (const auto &item : items) {
    if (candidates.size() >= limit) {
      break;
    }
    if (item.item_id.empty() || !seen.insert(item.item_id).second) {
      continue;
    }
    candidates.push_back(CandidateResult{.engine = engine_,
                                         .item_id = item.item_id,
                                         .raw_score = item.score,
                                         .rank = candidates.size() + 1});
  }
  return candidates;
}

void CandidateSource::record_success() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  failure_count_ = 0;
}

void CandidateSource::record_failure() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  ++failure_count_;
  if (failure_count_ >= options_.failure_threshold) {
    open_until_ = std::chrono::steady_clock::now() + options_.cooldown;
  }
}

VectorSource::VectorSource(std::shared_ptr<IVectorBackend> backend, SourceOptions options,
                           std::shared_ptr<ResultCache> cache)
    : CandidateSource(EngineId::Vector, options, std::move(cache)), backend_(std::move(backend)) {}

CandidateSource::BackendCall VectorSource::make_call(const SourceRequest &request,
                                                     const common::CancellationToken &cancel) const {
  if (backend_ == nullptr) {
    return missing_backend;
  }
  return [backend = backend_, request, cancel]() {
    return backend->search(request.text, request.filters, request.limit, cancel);
  };
}

LexicalSource::LexicalSource(std::shared_ptr<ILexicalBackend> backend, SourceOptions options,
                             std::shared_ptr<ResultCache> cache)
    : CandidateSource(EngineId::Lexical, options, std::move(cache)),
      backend_(std::move(backend)) {}

CandidateSource::BackendCall
LexicalSource::make_call(const SourceRequest &request,
                         const common::CancellationToken &cancel) const {
  if (backend_ == nullptr) {
    return missing_backend;
  }
  return [backend = backend_, request, cancel]() {
    return backend->search(request.text, request.filters, request.limit, cancel);
  };
}

GraphSource::GraphSource(std::shared_ptr<IGraphBackend> backend, SourceOptions options,
                         std::shared_ptr<ResultCache> cache)
    : CandidateSource(EngineId::Graph, options, std::move(cache)), backend_(std::move(backend)) {}

CandidateSource::BackendCall GraphSource::make_call(const SourceRequest &request,
                                                    const common::CancellationToken &cancel) const {
  if (backend_ == nullptr) {
    return missing_backend;
  }
  return [backend = backend_, request, cancel]() {
    return backend->traverse(request.seeds, request.depth, request.limit, cancel);
  };
}

} // namespace raefusion::retrieval
