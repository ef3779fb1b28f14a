#include "raefusion/config/config.hpp"

#include "raefusion/common/strings.hpp"
#include "raefusion/common/toml.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace raefusion::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".raefusion";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("RAEFUSION_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

bool is_engine_name(const std::string &name) {
  return name == "vector" || name == "lexical" || name == "graph";
}

bool is_strategy_name(const std::string &name) { return name == "rrf" || name == "score"; }

bool is_clip_name(const std::string &name) { return name == "strict" || name == "lenient"; }

bool has_profile(const Config &config, const std::string &name) {
  return std::any_of(config.profiles.definitions.begin(), config.profiles.definitions.end(),
                     [&](const ProfileConfig &profile) { return profile.name == name; });
}

void load_profile_tables(Config &config, const common::TomlDocument &doc) {
  for (const auto &name : doc.child_tables("profiles")) {
    auto it = std::find_if(config.profiles.definitions.begin(), config.profiles.definitions.end(),
                           [&](const ProfileConfig &profile) { return profile.name == name; });
    if (it == config.profiles.definitions.end()) {
      ProfileConfig created;
      created.name = name;
      config.profiles.definitions.push_back(created);
      it = std::prev(config.profiles.definitions.end());
    }

    const std::string prefix = "profiles." + name + ".";
    it->vector = doc.get_double(prefix + "vector", it->vector);
    it->lexical = doc.get_double(prefix + "lexical", it->lexical);
    it->graph = doc.get_double(prefix + "graph", it->graph);
    it->strategy = common::to_lower(doc.get_string(prefix + "strategy", it->strategy));
    it->clip = common::to_lower(doc.get_string(prefix + "clip", it->clip));
  }
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << common::quote_toml_string(values[i]);
  }
  out << "]";
  return out.str();
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    const std::filesystem::path &candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::InvalidConfig, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.status());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *mode = std::getenv("RAEFUSION_PROFILE_MODE"); mode != nullptr && *mode) {
    config.profiles.mode = common::to_lower(common::trim(mode));
  }

  if (const char *backend = std::getenv("RAEFUSION_OBSERVABILITY");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }

  if (const char *journal = std::getenv("RAEFUSION_JOURNAL_PATH"); journal != nullptr && *journal) {
    config.miss.journal_path = journal;
    config.miss.journal_enabled = true;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }

  const auto &doc = parsed.value();
  Config config;

  auto &retrieval = config.retrieval;
  retrieval.default_limit = static_cast<std::size_t>(
      doc.get_u64("retrieval.default_limit", retrieval.default_limit));
  retrieval.candidate_multiplier = static_cast<std::size_t>(
      doc.get_u64("retrieval.candidate_multiplier", retrieval.candidate_multiplier));
  retrieval.source_timeout_ms = static_cast<std::uint32_t>(
      doc.get_u64("retrieval.source_timeout_ms", retrieval.source_timeout_ms));
  retrieval.query_timeout_ms = static_cast<std::uint32_t>(
      doc.get_u64("retrieval.query_timeout_ms", retrieval.query_timeout_ms));
  retrieval.default_traversal_depth = static_cast<std::uint32_t>(
      doc.get_u64("retrieval.default_traversal_depth", retrieval.default_traversal_depth));
  retrieval.graph_seed_count = static_cast<std::size_t>(
      doc.get_u64("retrieval.graph_seed_count", retrieval.graph_seed_count));

  auto &fusion = config.fusion;
  fusion.rrf_k = doc.get_double("fusion.rrf_k", fusion.rrf_k);
  fusion.synergy_boost = doc.get_double("fusion.synergy_boost", fusion.synergy_boost);
  fusion.strict_clip_min = doc.get_double("fusion.strict_clip_min", fusion.strict_clip_min);
  fusion.strict_clip_max = doc.get_double("fusion.strict_clip_max", fusion.strict_clip_max);
  fusion.lenient_clip_min = doc.get_double("fusion.lenient_clip_min", fusion.lenient_clip_min);
  fusion.lenient_clip_max = doc.get_double("fusion.lenient_clip_max", fusion.lenient_clip_max);

  config.classifier.identifier_threshold = doc.get_double(
      "classifier.identifier_threshold", config.classifier.identifier_threshold);
  config.classifier.abstract_threshold =
      doc.get_double("classifier.abstract_threshold", config.classifier.abstract_threshold);

  auto &profiles = config.profiles;
  profiles.mode = common::to_lower(doc.get_string("profiles.mode", profiles.mode));
  profiles.route_identifier_like =
      doc.get_string("profiles.route_identifier_like", profiles.route_identifier_like);
  profiles.route_factual = doc.get_string("profiles.route_factual", profiles.route_factual);
  profiles.route_abstract = doc.get_string("profiles.route_abstract", profiles.route_abstract);
  profiles.tuned_base = doc.get_string("profiles.tuned_base", profiles.tuned_base);
  load_profile_tables(config, doc);

  auto &early_exit = config.early_exit;
  early_exit.enabled = doc.get_bool("early_exit.enabled", early_exit.enabled);
  early_exit.threshold =
      static_cast<std::size_t>(doc.get_u64("early_exit.threshold", early_exit.threshold));
  early_exit.primary_engine =
      common::to_lower(doc.get_string("early_exit.primary_engine", early_exit.primary_engine));
  early_exit.expensive_engines =
      doc.get_string_array("early_exit.expensive_engines", early_exit.expensive_engines);

  auto &tuner = config.tuner;
  tuner.enabled = doc.get_bool("tuner.enabled", tuner.enabled);
  tuner.prior = doc.get_double("tuner.prior", tuner.prior);
  tuner.decay = doc.get_double("tuner.decay", tuner.decay);
  tuner.window = doc.get_double("tuner.window", tuner.window);
  tuner.min_weight = doc.get_double("tuner.min_weight", tuner.min_weight);
  tuner.miss_penalty = doc.get_double("tuner.miss_penalty", tuner.miss_penalty);
  tuner.sampling = common::to_lower(doc.get_string("tuner.sampling", tuner.sampling));
  tuner.seed = doc.get_u64("tuner.seed", tuner.seed);
  tuner.retune_interval_ms = static_cast<std::uint32_t>(
      doc.get_u64("tuner.retune_interval_ms", tuner.retune_interval_ms));
  tuner.batch_size = static_cast<std::size_t>(doc.get_u64("tuner.batch_size", tuner.batch_size));

  auto &miss = config.miss;
  miss.relevance_floor = doc.get_double("miss.relevance_floor", miss.relevance_floor);
  miss.rrf_relevance_floor = doc.get_double("miss.rrf_relevance_floor", miss.rrf_relevance_floor);
  miss.journal_enabled = doc.get_bool("miss.journal_enabled", miss.journal_enabled);
  miss.journal_path = doc.get_string("miss.journal_path", miss.journal_path);

  config.cache.enabled = doc.get_bool("cache.enabled", config.cache.enabled);
  config.cache.ttl_seconds =
      static_cast<std::uint32_t>(doc.get_u64("cache.ttl_seconds", config.cache.ttl_seconds));
  config.cache.max_entries =
      static_cast<std::size_t>(doc.get_u64("cache.max_entries", config.cache.max_entries));

  config.sources.failure_threshold = static_cast<std::uint32_t>(
      doc.get_u64("sources.failure_threshold", config.sources.failure_threshold));
  config.sources.cooldown_ms =
      static_cast<std::uint32_t>(doc.get_u64("sources.cooldown_ms", config.sources.cooldown_ms));

  config.metrics.window =
      static_cast<std::size_t>(doc.get_u64("metrics.window", config.metrics.window));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorCode::InvalidConfig,
                                           "Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return parsed;
  }

  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return path_result.status();
  }

  std::ostringstream out;
  out << "[retrieval]\n";
  out << "default_limit = " << config.retrieval.default_limit << "\n";
  out << "candidate_multiplier = " << config.retrieval.candidate_multiplier << "\n";
  out << "source_timeout_ms = " << config.retrieval.source_timeout_ms << "\n";
  out << "query_timeout_ms = " << config.retrieval.query_timeout_ms << "\n";
  out << "default_traversal_depth = " << config.retrieval.default_traversal_depth << "\n";
  out << "graph_seed_count = " << config.retrieval.graph_seed_count << "\n\n";

  out << "[fusion]\n";
  out << "rrf_k = " << config.fusion.rrf_k << "\n";
  out << "synergy_boost = " << config.fusion.synergy_boost << "\n";
  out << "strict_clip_min = " << config.fusion.strict_clip_min << "\n";
  out << "strict_clip_max = " << config.fusion.strict_clip_max << "\n";
  out << "lenient_clip_min = " << config.fusion.lenient_clip_min << "\n";
  out << "lenient_clip_max = " << config.fusion.lenient_clip_max << "\n\n";

  out << "[classifier]\n";
  out << "identifier_threshold = " << config.classifier.identifier_threshold << "\n";
  out << "abstract_threshold = " << config.classifier.abstract_threshold << "\n\n";

  out << "[profiles]\n";
  out << "mode = " << common::quote_toml_string(config.profiles.mode) << "\n";
  out << "route_identifier_like = "
      << common::quote_toml_string(config.profiles.route_identifier_like) << "\n";
  out << "route_factual = " << common::quote_toml_string(config.profiles.route_factual) << "\n";
  out << "route_abstract = " << common::quote_toml_string(config.profiles.route_abstract)
      << "\n";
  out << "tuned_base = " << common::quote_toml_string(config.profiles.tuned_base) << "\n\n";

  for (const auto &profile : config.profiles.definitions) {
    out << "[profiles." << profile.name << "]\n";
    out << "vector = " << profile.vector << "\n";
    out << "lexical = " << profile.lexical << "\n";
    out << "graph = " << profile.graph << "\n";
    out << "strategy = " << common::quote_toml_string(profile.strategy) << "\n";
    out << "clip = " << common::quote_toml_string(profile.clip) << "\n\n";
  }

  out << "[early_exit]\n";
  out << "enabled = " << bool_to_toml(config.early_exit.enabled) << "\n";
  out << "threshold = " << config.early_exit.threshold << "\n";
  out << "primary_engine = " << common::quote_toml_string(config.early_exit.primary_engine)
      << "\n";
  out << "expensive_engines = " << string_array_to_toml(config.early_exit.expensive_engines)
      << "\n\n";

  out << "[tuner]\n";
  out << "enabled = " << bool_to_toml(config.tuner.enabled) << "\n";
  out << "prior = " << config.tuner.prior << "\n";
  out << "decay = " << config.tuner.decay << "\n";
  out << "window = " << config.tuner.window << "\n";
  out << "min_weight = " << config.tuner.min_weight << "\n";
  out << "miss_penalty = " << config.tuner.miss_penalty << "\n";
  out << "sampling = " << common::quote_toml_string(config.tuner.sampling) << "\n";
  out << "seed = " << config.tuner.seed << "\n";
  out << "retune_interval_ms = " << config.tuner.retune_interval_ms << "\n";
  out << "batch_size = " << config.tuner.batch_size << "\n\n";

  out << "[miss]\n";
  out << "relevance_floor = " << config.miss.relevance_floor << "\n";
  out << "rrf_relevance_floor = " << config.miss.rrf_relevance_floor << "\n";
  out << "journal_enabled = " << bool_to_toml(config.miss.journal_enabled) << "\n";
  out << "journal_path = " << common::quote_toml_string(config.miss.journal_path) << "\n\n";

  out << "[cache]\n";
  out << "enabled = " << bool_to_toml(config.cache.enabled) << "\n";
  out << "ttl_seconds = " << config.cache.ttl_seconds << "\n";
  out << "max_entries = " << config.cache.max_entries << "\n\n";

  out << "[sources]\n";
  out << "failure_threshold = " << config.sources.failure_threshold << "\n";
  out << "cooldown_ms = " << config.sources.cooldown_ms << "\n\n";

  out << "[metrics]\n";
  out << "window = " << config.metrics.window << "\n\n";

  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  const auto &path = path_result.value();
  if (path.has_parent_path()) {
    const auto dir = common::ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return dir.status();
    }
  }

  std::ofstream file(path, std::ios::trunc);
  if (!file) {
    return common::Status::error(common::ErrorCode::Storage,
                                 "Unable to write config file: " + path.string());
  }
  file << out.str();
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Validation = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const auto &retrieval = config.retrieval;
  if (retrieval.default_limit == 0) {
    return Validation::failure(common::ErrorCode::InvalidConfig,
                               "retrieval.default_limit must be at least 1");
  }
  if (retrieval.candidate_multiplier == 0) {
    return Validation::failure(common::ErrorCode::InvalidConfig,
                               "retrieval.candidate_multiplier must be at least 1");
  }
  if (retrieval.source_timeout_ms == 0 || retrieval.query_timeout_ms == 0) {
    return Validation::failure(common::ErrorCode::InvalidConfig,
                               "retrieval timeouts must be positive");
  }
  if (retrieval.source_timeout_ms > retrieval.query_timeout_ms) {
    warnings.push_back("retrieval.source_timeout_ms exceeds retrieval.query_timeout_ms");
  }

  const auto &fusion = config.fusion;
  if (!(fusion.rrf_k > 0.0)) {
    return Validation::failure(common::ErrorCode::InvalidConfig, "fusion.rrf_k must be positive");
  }
  if (!(fusion.synergy_boost >= 1.0)) {
    return Validation::failure(common::ErrorCode::InvalidConfig,
                               "fusion.synergy_boost must be at least 1.0");
  }
  if (fusion.strict_clip_min > fusion.strict_clip_max ||
      fusion.lenient_clip_min > fusion.lenient_clip_max) {
    return Validation::failure(common::ErrorCode::InvalidConfig,
                               "fusion clip minimum must not exceed its maximum");
  }
  if (fusion.lenient_clip_min > fusion.strict_clip_min) {
    warnings.push_back("fusion.lenient_clip_min is above fusion.strict_clip_min");
  }

  const auto &classifier = config.classifier;
  if (classifier.identifier_threshold < 0.0 || classifier.abstract_threshold > 1.0 ||
      classifier.identifier_threshold > classifier.abstract_threshold) {
    return Validation::failure(
        common::ErrorCode::InvalidConfig,
        "classifier thresholds must satisfy 0 <= identifier_threshold <= abstract_threshold <= 1");
  }

  const auto &profiles = config.profiles;
  if (profiles.mode != "deterministic" && profiles.mode != "tuned") {
    return Validation::failure(common::ErrorCode::InvalidConfig,
                               "Invalid profiles.mode: " + profiles.mode);
  }
  std::set<std::string> seen;
  for (const auto &profile : profiles.definitions) {
    if (profile.name.empty() || !seen.insert(profile.name).second) {
      return Validation::failure(common::ErrorCode::InvalidConfig,
                                 "Profile names must be unique and non-empty");
    }
    for (const double weight : {profile.vector, profile.lexical, profile.graph}) {
      if (!std::isfinite(weight) || weight < 0.0) {
        return Validation::failure(common::ErrorCode::InvalidConfig,
                                   "Profile " + profile.name + " has a negative weight");
      }
    }
    if (profile.vector + profile.lexical + profile.graph <= 0.0) {
      return Validation::failure(common::ErrorCode::InvalidConfig,
                                 "Profile " + profile.name + " has no positive weight");
    }
    if (!is_strategy_name(profile.strategy)) {
      return Validation::failure(common::ErrorCode::InvalidConfig,
                                 "Profile " + profile.name +
                                     " has invalid strategy: " + profile.strategy);
    }
    if (!is_clip_name(profile.clip)) {
      return Validation::failure(common::ErrorCode::InvalidConfig,
                                 "Profile " + profile.name + " has invalid clip: " + profile.clip);
    }
  }
  for (const auto &route : {profiles.route_identifier_like, profiles.route_factual,
                            profiles.route_abstract, profiles.tuned_base}) {
    if (!has_profile(config, route)) {
      return Validation::failure(common::ErrorCode::InvalidConfig,
                                 "Unknown profile referenced: " + route);
    }
  }

  if (!is_engine_name(config.early_exit.primary_engine)) {
    return Validation::failure(common::ErrorCode::InvalidConfig,
                               "Invalid early_exit.primary_engine: " +
                                   config.early_exit.primary_engine);
  }
  for (const auto &engine : config.early_exit.expensive_engines) {
    if (!is_engine_name(engine)) {
      return Validation::failure(common::ErrorCode::InvalidConfig,
                                 "Invalid early_exit.expensive_engines entry: " + engine);
    }
    if (engine == config.early_exit.primary_engine) {
      return Validation::failure(common::ErrorCode::InvalidConfig,
                                 "early_exit.primary_engine cannot be an expensive engine");
    }
  }
  if (config.early_exit.enabled && config.early_exit.threshold == 0) {
    warnings.push_back("early_exit.threshold of 0 never skips any engine");
  }

  const auto &tuner = config.tuner;
  if (!(tuner.prior > 0.0)) {
    return Validation::failure(common::ErrorCode::InvalidConfig, "tuner.prior must be positive");
  }
  if (!(tuner.decay > 0.0 && tuner.decay <= 1.0)) {
    return Validation::failure(common::ErrorCode::InvalidConfig,
                               "tuner.decay must be in (0, 1]");
  }
  if (!(tuner.window > 0.0)) {
    return Validation::failure(common::ErrorCode::InvalidConfig, "tuner.window must be positive");
  }
  if (tuner.min_weight < 0.0 || tuner.miss_penalty < 0.0) {
    return Validation::failure(common::ErrorCode::InvalidConfig,
                               "tuner.min_weight and tuner.miss_penalty must be non-negative");
  }
  if (tuner.sampling != "posterior_mean" && tuner.sampling != "thompson") {
    return Validation::failure(common::ErrorCode::InvalidConfig,
                               "Invalid tuner.sampling: " + tuner.sampling);
  }
  if (tuner.batch_size == 0) {
    warnings.push_back("tuner.batch_size of 0 retunes only on the interval");
  }
  if (tuner.enabled && profiles.mode == "deterministic") {
    warnings.push_back("tuner is enabled but profiles.mode is deterministic");
  }

  if (config.miss.relevance_floor < 0.0 || config.miss.rrf_relevance_floor < 0.0) {
    return Validation::failure(common::ErrorCode::InvalidConfig,
                               "miss relevance floors must be non-negative");
  }
  if (config.miss.journal_enabled && common::trim(config.miss.journal_path).empty()) {
    return Validation::failure(common::ErrorCode::InvalidConfig,
                               "miss.journal_path is required when the journal is enabled");
  }

  if (config.cache.enabled && (config.cache.ttl_seconds == 0 || config.cache.max_entries == 0)) {
    warnings.push_back("cache is enabled but ttl_seconds or max_entries is 0");
  }
  if (config.sources.failure_threshold == 0) {
    return Validation::failure(common::ErrorCode::InvalidConfig,
                               "sources.failure_threshold must be at least 1");
  }
  if (config.metrics.window == 0) {
    return Validation::failure(common::ErrorCode::InvalidConfig,
                               "metrics.window must be at least 1");
  }

  for (const auto &backend : common::split(common::to_lower(config.observability.backend), ',')) {
    if (backend != "log" && backend != "none" && backend != "noop") {
      warnings.push_back("Unknown observability backend: " + backend);
    }
  }

  return Validation::success(std::move(warnings));
}

} // namespace raefusion::config
