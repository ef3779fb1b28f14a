#pragma once

#include "raefusion/config/schema.hpp"
#include "raefusion/retrieval/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>

namespace raefusion::retrieval {

enum class SamplingMode { PosteriorMean, Thompson };

[[nodiscard]] std::optional<SamplingMode> sampling_from_string(const std::string &value);

struct BanditState {
  double prior = 1.0;
  std::map<EngineId, double> evidence;
  std::uint64_t updates = 0;

  [[nodiscard]] double alpha(EngineId engine) const;
  [[nodiscard]] double total_alpha() const;
};

/// Dirichlet-Multinomial credit assignment over the retrieval engines.
///
/// alpha[e] = prior + evidence[e]. Evidence only grows through credit; decay
/// and the window are the only operations that shrink it.
class DirichletBandit {
public:
  explicit DirichletBandit(const config::TunerConfig &config);

  /// Relevant: 1/rank shared by the contributing engines in proportion to
  /// their weighted contribution. Not relevant: penalty/rank shared by the
  /// engines that missed the item.
  void apply(const Feedback &feedback);

  /// Penalty shared by the queried engines in proportion to (1 - weight share).
  void apply(const FailureEvent &event);

  void decay();
  void enforce_window();
  void credit(EngineId engine, double amount);

  [[nodiscard]] std::map<EngineId, double> weights();
  [[nodiscard]] const BanditState &state() const { return state_; }

private:
  [[nodiscard]] std::map<EngineId, double> posterior_mean() const;
  [[nodiscard]] std::map<EngineId, double> thompson_sample();

  BanditState state_;
  double decay_;
  double window_;
  double min_weight_;
  double miss_penalty_;
  SamplingMode sampling_;
  std::mt19937_64 rng_;
};

} // namespace raefusion::retrieval
