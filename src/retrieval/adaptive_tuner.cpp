#include "raefusion/retrieval/adaptive_tuner.hpp"

#include "raefusion/observability/global.hpp"

#include <algorithm>
#include <chrono>

namespace raefusion::retrieval {

AdaptiveTuner::AdaptiveTuner(std::shared_ptr<WeightPolicyStore> store, config::TunerConfig config)
    : store_(std::move(store)), config_(std::move(config)), bandit_(config_) {}

AdaptiveTuner::~AdaptiveTuner() { stop(); }

void AdaptiveTuner::observe(Feedback feedback) {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  queue_.emplace_back(std::move(feedback));
}

void AdaptiveTuner::observe(FailureEvent event) {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  queue_.emplace_back(std::move(event));
}

common::Result<WeightProfile> AdaptiveTuner::retune() {
  if (store_ == nullptr) {
    return common::Result<WeightProfile>::failure(common::ErrorCode::Internal,
                                                  "tuner has no policy store");
  }

  std::vector<Observation> batch;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    batch.swap(queue_);
  }

  WeightProfile profile;
  {
    std::lock_guard<std::mutex> lock(bandit_mutex_);
    bandit_.decay();
    for (const auto &observation : batch) {
      std::visit([this](const auto &item) { bandit_.apply(item); }, observation);
    }
    bandit_.enforce_window();
    profile.weights = bandit_.weights();
  }

  const auto base = store_->tuned_base();
  profile.name = "tuned";
  profile.strategy = base->strategy;
  profile.clip = base->clip;

  if (auto status = store_->update_tuned_profile(profile); !status.ok()) {
    return common::Result<WeightProfile>::failure(status);
  }

  ++retunes_;
  const auto published = store_->tuned_profile();
  observability::record_retune(describe_weights(*published), batch.size(), published->version);
  observability::record_metric(observability::PendingFeedbackMetric{.depth = pending()});
  return common::Result<WeightProfile>::success(*published);
}

void AdaptiveTuner::start() {
  if (running_ || !config_.enabled) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void AdaptiveTuner::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool AdaptiveTuner::is_running() const { return running_; }

BanditState AdaptiveTuner::snapshot() const {
  std::lock_guard<std::mutex> lock(bandit_mutex_);
  return bandit_.state();
}

std::size_t AdaptiveTuner::pending() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return queue_.size();
}

void AdaptiveTuner::run_loop() {
  const auto step = std::chrono::milliseconds(
      std::clamp<std::uint32_t>(config_.retune_interval_ms, 1, 100));
  auto next_retune =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.retune_interval_ms);

  while (running_) {
    std::this_thread::sleep_for(step);
    const std::size_t waiting = pending();
    const bool batch_ready = config_.batch_size > 0 && waiting >= config_.batch_size;
    const bool interval_due = std::chrono::steady_clock::now() >= next_retune;
    if (waiting == 0 || (!batch_ready && !interval_due)) {
      continue;
    }

    const auto result = retune();
    if (!result.ok()) {
      observability::record_error("tuner", "retune rejected: " + result.error());
    }
    next_retune =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.retune_interval_ms);
  }
}

} // namespace raefusion::retrieval
