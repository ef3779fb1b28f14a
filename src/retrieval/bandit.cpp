#include "raefusion/retrieval/bandit.hpp"

#include "raefusion/common/strings.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <vector>

namespace raefusion::retrieval {

namespace {

constexpr double ENGINE_COUNT = static_cast<double>(ALL_ENGINES.size());

} // namespace

std::optional<SamplingMode> sampling_from_string(const std::string &value) {
  const std::string v = common::to_lower(common::trim(value));
  if (v == "posterior_mean" || v == "mean") {
    return SamplingMode::PosteriorMean;
  }
  if (v == "thompson") {
    return SamplingMode::Thompson;
  }
  return std::nullopt;
}

double BanditState::alpha(const EngineId engine) const {
  const auto it = evidence.find(engine);
  return prior + (it == evidence.end() ? 0.0 : it->second);
}

double BanditState::total_alpha() const {
  double total = 0.0;
  for (const auto engine : ALL_ENGINES) {
    total += alpha(engine);
  }
  return total;
}

DirichletBandit::DirichletBandit(const config::TunerConfig &config)
    : decay_(config.decay), window_(config.window), min_weight_(config.min_weight),
      miss_penalty_(config.miss_penalty),
      sampling_(sampling_from_string(config.sampling).value_or(SamplingMode::PosteriorMean)),
      rng_(config.seed) {
  state_.prior = config.prior > 0.0 ? config.prior : 1.0;
  for (const auto engine : ALL_ENGINES) {
    state_.evidence[engine] = 0.0;
  }
}

void DirichletBandit::credit(const EngineId engine, const double amount) {
  if (!std::isfinite(amount) || amount <= 0.0) {
    return;
  }
  state_.evidence[engine] += amount;
}

void DirichletBandit::apply(const Feedback &feedback) {
  const double rank = static_cast<double>(std::max<std::size_t>(1, feedback.rank));

  if (feedback.relevance == Relevance::Relevant) {
    const double reward = 1.0 / rank;
    double total = 0.0;
    for (const auto &contribution : feedback.contributions) {
      total += std::max(0.0, contribution.weighted);
    }
    for (const auto &contribution : feedback.contributions) {
      const double share = total > 0.0
                               ? std::max(0.0, contribution.weighted) / total
                               : 1.0 / static_cast<double>(feedback.contributions.size());
      credit(contribution.engine, reward * share);
    }
  } else {
    std::set<EngineId> contributed;
    for (const auto &contribution : feedback.contributions) {
      contributed.insert(contribution.engine);
    }
    std::vector<EngineId> others;
    for (const auto engine : ALL_ENGINES) {
      if (!contributed.contains(engine)) {
        others.push_back(engine);
      }
    }
    if (others.empty()) {
      return;
    }
    const double penalty = miss_penalty_ / rank / static_cast<double>(others.size());
    for (const auto engine : others) {
      credit(engine, penalty);
    }
  }
  ++state_.updates;
}

void DirichletBandit::apply(const FailureEvent &event) {
  const auto &engines = event.engines_queried;
  if (engines.size() < 2) {
    return;
  }

  double total = 0.0;
  for (const auto engine : engines) {
    total += event.profile.weight(engine);
  }
  const double spread = static_cast<double>(engines.size() - 1);
  for (const auto engine : engines) {
    const double share =
        total > 0.0 ? event.profile.weight(engine) / total : 1.0 / static_cast<double>(engines.size());
    credit(engine, miss_penalty_ * (1.0 - share) / spread);
  }
  ++state_.updates;
}

void DirichletBandit::decay() {
  for (auto &[engine, value] : state_.evidence) {
    (void)engine;
    value *= decay_;
  }
}

void DirichletBandit::enforce_window() {
  double total = 0.0;
  for (const auto &[engine, value] : state_.evidence) {
    (void)engine;
    total += value;
  }
  if (total <= window_) {
    return;
  }
  const double scale = window_ / total;
  for (auto &[engine, value] : state_.evidence) {
    (void)engine;
    value *= scale;
  }
}

std::map<EngineId, double> DirichletBandit::weights() {
  auto out = sampling_ == SamplingMode::Thompson ? thompson_sample() : posterior_mean();
  for (auto &[engine, weight] : out) {
    (void)engine;
    weight = std::max(min_weight_, weight);
  }
  return out;
}

std::map<EngineId, double> DirichletBandit::posterior_mean() const {
  std::map<EngineId, double> out;
  const double total = state_.total_alpha();
  for (const auto engine : ALL_ENGINES) {
    out[engine] = ENGINE_COUNT * state_.alpha(engine) / total;
  }
  return out;
}

std::map<EngineId, double> DirichletBandit::thompson_sample() {
  std::map<EngineId, double> draws;
  double total = 0.0;
  for (const auto engine : ALL_ENGINES) {
    std::gamma_distribution<double> gamma(state_.alpha(engine), 1.0);
    const double draw = gamma(rng_);
    draws[engine] = draw;
    total += draw;
  }
  if (!(total > 0.0)) {
    return posterior_mean();
  }
  for (auto &[engine, draw] : draws) {
    (void)engine;
    draw = ENGINE_COUNT * draw / total;
  }
  return draws;
}

} // namespace raefusion::retrieval
