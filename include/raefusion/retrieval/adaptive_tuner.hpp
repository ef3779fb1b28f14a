#pragma once

#include "raefusion/common/result.hpp"
#include "raefusion/config/schema.hpp"
#include "raefusion/retrieval/backends.hpp"
#include "raefusion/retrieval/bandit.hpp"
#include "raefusion/retrieval/weight_policy.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

namespace raefusion::retrieval {

/// Learns the tuned profile from feedback and misses.
///
/// `observe` only enqueues; the read path never waits on learning. `retune`
/// drains the queue into the bandit and publishes through the policy store.
/// The background worker retunes every `retune_interval_ms`, or sooner once
/// `batch_size` observations are pending.
class AdaptiveTuner final : public IReflectionSink {
public:
  AdaptiveTuner(std::shared_ptr<WeightPolicyStore> store, config::TunerConfig config);
  ~AdaptiveTuner() override;

  AdaptiveTuner(const AdaptiveTuner &) = delete;
  AdaptiveTuner &operator=(const AdaptiveTuner &) = delete;

  void observe(Feedback feedback);
  void observe(FailureEvent event);

  [[nodiscard]] common::Result<WeightProfile> retune();

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] BanditState snapshot() const;
  [[nodiscard]] std::size_t pending() const;
  [[nodiscard]] std::uint64_t retunes() const { return retunes_.load(); }

  void on_failure(const FailureEvent &event) override { observe(event); }
  [[nodiscard]] std::string_view name() const override { return "tuner"; }

private:
  using Observation = std::variant<Feedback, FailureEvent>;

  void run_loop();

  std::shared_ptr<WeightPolicyStore> store_;
  config::TunerConfig config_;

  mutable std::mutex bandit_mutex_;
  DirichletBandit bandit_;

  mutable std::mutex queue_mutex_;
  std::vector<Observation> queue_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> retunes_{0};
};

} // namespace raefusion::retrieval
