#pragma once

#include "raefusion/config/schema.hpp"
#include "raefusion/retrieval/backends.hpp"
#include "raefusion/retrieval/types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace raefusion::retrieval {

struct MissContext {
  std::string query_text;
  std::vector<EngineId> engines_queried;
  RetrievalStatus status = RetrievalStatus::Normal;
  bool cancelled = false;
  /// Strategy that scored the results; the profile's when unset.
  std::optional<FusionStrategy> strategy;
};

/// Detects retrieval misses and hands them to sinks on a worker thread.
class MissRecorder {
public:
  explicit MissRecorder(config::MissConfig config = {});
  ~MissRecorder();

  MissRecorder(const MissRecorder &) = delete;
  MissRecorder &operator=(const MissRecorder &) = delete;

  void add_sink(std::shared_ptr<IReflectionSink> sink);

  /// Returns the queued event when `results` is a miss. Never blocks on sinks.
  [[nodiscard]] std::optional<FailureEvent> inspect(const std::vector<FusedResult> &results,
                                                    const QueryClassification &classification,
                                                    const WeightProfile &profile,
                                                    const MissContext &context = {});

  [[nodiscard]] bool is_miss(const std::vector<FusedResult> &results,
                             FusionStrategy strategy) const;
  [[nodiscard]] double floor_for(FusionStrategy strategy) const;

  /// Blocks until every queued event has been delivered.
  void flush();
  [[nodiscard]] std::uint64_t recorded() const { return recorded_.load(); }

private:
  void worker_loop();
  void deliver(const FailureEvent &event);

  config::MissConfig config_;

  std::mutex sinks_mutex_;
  std::vector<std::shared_ptr<IReflectionSink>> sinks_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  std::deque<FailureEvent> queue_;
  bool delivering_ = false;
  bool stopping_ = false;

  std::atomic<std::uint64_t> recorded_{0};
  std::thread worker_;
};

} // namespace raefusion::retrieval
