#include "raefusion/retrieval/weight_policy.hpp"

#include "raefusion/common/strings.hpp"

#include <cmath>

namespace raefusion::retrieval {

namespace {

WeightProfile make_profile(std::string name, const double vector, const double lexical,
                           const double graph, const ClipMode clip) {
  WeightProfile profile;
  profile.name = std::move(name);
  profile.weights = {{EngineId::Vector, vector}, {EngineId::Lexical, lexical}, {EngineId::Graph, graph}};
  profile.strategy = FusionStrategy::Rrf;
  profile.clip = clip;
  return profile;
}

} // namespace

std::string_view mode_to_string(const ProfileMode mode) {
  return mode == ProfileMode::Deterministic ? "deterministic" : "tuned";
}

std::optional<ProfileMode> mode_from_string(const std::string &value) {
  const std::string v = common::to_lower(common::trim(value));
  if (v == "deterministic") {
    return ProfileMode::Deterministic;
  }
  if (v == "tuned") {
    return ProfileMode::Tuned;
  }
  return std::nullopt;
}

common::Status validate_profile(const WeightProfile &profile) {
  double total = 0.0;
  for (const auto &[engine, weight] : profile.weights) {
    if (!std::isfinite(weight)) {
      return common::Status::error(common::ErrorCode::InvalidProfile,
                                   "profile " + profile.name + ": non-finite weight for " +
                                       std::string(engine_to_string(engine)));
    }
    if (weight < 0.0) {
      return common::Status::error(common::ErrorCode::InvalidProfile,
                                   "profile " + profile.name + ": negative weight for " +
                                       std::string(engine_to_string(engine)));
    }
    total += weight;
  }
  if (total <= 0.0) {
    return common::Status::error(common::ErrorCode::InvalidProfile,
                                 "profile " + profile.name + ": no positive weight");
  }
  return common::Status::success();
}

common::Result<WeightProfile> profile_from_config(const config::ProfileConfig &config) {
  const auto strategy = strategy_from_string(config.strategy);
  if (!strategy.has_value()) {
    return common::Result<WeightProfile>::failure(common::ErrorCode::InvalidProfile,
                                                  "profile " + config.name +
                                                      ": unknown strategy " + config.strategy);
  }
  const auto clip = clip_from_string(config.clip);
  if (!clip.has_value()) {
    return common::Result<WeightProfile>::failure(
        common::ErrorCode::InvalidProfile, "profile " + config.name + ": unknown clip " + config.clip);
  }

  WeightProfile profile = make_profile(config.name, config.vector, config.lexical, config.graph, *clip);
  profile.strategy = *strategy;
  if (auto status = validate_profile(profile); !status.ok()) {
    return common::Result<WeightProfile>::failure(status);
  }
  return common::Result<WeightProfile>::success(std::move(profile));
}

std::vector<WeightProfile> builtin_profiles() {
  return {make_profile("lexical_first", 0.5, 2.0, 0.25, ClipMode::Strict),
          make_profile("consensus", 1.0, 1.0, 0.5, ClipMode::Strict),
          make_profile("vector_first", 2.0, 0.5, 1.0, ClipMode::Lenient)};
}

WeightPolicyStore::WeightPolicyStore(std::vector<WeightProfile> profiles,
                                     std::map<QueryLabel, std::string> routing,
                                     std::string tuned_base, const ProfileMode mode)
    : routing_(std::move(routing)), tuned_base_(std::move(tuned_base)), mode_(mode) {
  for (auto &profile : profiles) {
    const std::string name = profile.name;
    profiles_[name] = std::make_shared<const WeightProfile>(std::move(profile));
  }
  if (const auto it = profiles_.find("consensus"); it != profiles_.end()) {
    fallback_ = it->second;
  } else {
    fallback_ = std::make_shared<const WeightProfile>(builtin_profiles()[1]);
  }
}

common::Result<std::shared_ptr<WeightPolicyStore>>
WeightPolicyStore::from_config(const config::ProfilesConfig &config) {
  using StoreResult = common::Result<std::shared_ptr<WeightPolicyStore>>;

  std::vector<WeightProfile> profiles;
  for (const auto &definition : config.definitions) {
    auto profile = profile_from_config(definition);
    if (!profile.ok()) {
      return StoreResult::failure(profile.status());
    }
    profiles.push_back(std::move(profile.value()));
  }
  if (profiles.empty()) {
    profiles = builtin_profiles();
  }

  const auto known = [&](const std::string &name) {
    for (const auto &profile : profiles) {
      if (profile.name == name) {
        return true;
      }
    }
    return false;
  };

  const std::map<QueryLabel, std::string> routing = {
      {QueryLabel::IdentifierLike, config.route_identifier_like},
      {QueryLabel::Factual, config.route_factual},
      {QueryLabel::Abstract, config.route_abstract},
  };
  for (const auto &[label, name] : routing) {
    if (!known(name)) {
      return StoreResult::failure(common::ErrorCode::InvalidProfile,
                                  "route for " + std::string(label_to_string(label)) +
                                      " names unknown profile " + name);
    }
  }
  if (!known(config.tuned_base)) {
    return StoreResult::failure(common::ErrorCode::InvalidProfile,
                                "tuned_base names unknown profile " + config.tuned_base);
  }

  const auto mode = mode_from_string(config.mode);
  if (!mode.has_value()) {
    return StoreResult::failure(common::ErrorCode::InvalidConfig,
                                "unknown profiles.mode " + config.mode);
  }

  return StoreResult::success(
      std::make_shared<WeightPolicyStore>(std::move(profiles), routing, config.tuned_base, *mode));
}

WeightPolicyStore::Snapshot
WeightPolicyStore::current_profile(const QueryClassification &classification) const {
  if (mode() == ProfileMode::Tuned) {
    if (auto tuned = tuned_.load(); tuned != nullptr) {
      return tuned;
    }
  }
  return deterministic_profile(classification.label);
}

WeightPolicyStore::Snapshot WeightPolicyStore::deterministic_profile(const QueryLabel label) const {
  const auto route = routing_.find(label);
  if (route == routing_.end()) {
    return fallback_;
  }
  const auto it = profiles_.find(route->second);
  return it == profiles_.end() ? fallback_ : it->second;
}

WeightPolicyStore::Snapshot WeightPolicyStore::profile(const std::string &name) const {
  if (name == "tuned") {
    return tuned_.load();
  }
  const auto it = profiles_.find(name);
  return it == profiles_.end() ? nullptr : it->second;
}

WeightPolicyStore::Snapshot WeightPolicyStore::tuned_profile() const { return tuned_.load(); }

WeightPolicyStore::Snapshot WeightPolicyStore::tuned_base() const {
  const auto it = profiles_.find(tuned_base_);
  return it == profiles_.end() ? fallback_ : it->second;
}

std::vector<std::string> WeightPolicyStore::profile_names() const {
  std::vector<std::string> names;
  names.reserve(profiles_.size());
  for (const auto &[name, profile] : profiles_) {
    (void)profile;
    names.push_back(name);
  }
  return names;
}

common::Status WeightPolicyStore::update_tuned_profile(WeightProfile profile) {
  if (auto status = validate_profile(profile); !status.ok()) {
    return status;
  }

  std::lock_guard<std::mutex> lock(writer_mutex_);
  profile.name = "tuned";
  profile.version = ++tuned_version_;
  tuned_.store(std::make_shared<const WeightProfile>(std::move(profile)));
  return common::Status::success();
}

} // namespace raefusion::retrieval
