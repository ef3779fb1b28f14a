#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace raefusion::config {

struct RetrievalConfig {
  std::size_t default_limit = 10;
  std::size_t candidate_multiplier = 2;
  std::uint32_t source_timeout_ms = 2000;
  std::uint32_t query_timeout_ms = 5000;
  std::uint32_t default_traversal_depth = 2;
  std::size_t graph_seed_count = 5;
};

struct FusionConfig {
  double rrf_k = 60.0;
  double synergy_boost = 1.5;
  double strict_clip_min = 0.001;
  double strict_clip_max = 1.0;
  double lenient_clip_min = 0.0;
  double lenient_clip_max = 1.0;
};

struct ClassifierConfig {
  double identifier_threshold = 0.35;
  double abstract_threshold = 0.70;
};

struct ProfileConfig {
  std::string name;
  double vector = 1.0;
  double lexical = 1.0;
  double graph = 0.5;
  std::string strategy = "rrf";
  std::string clip = "strict";
};

struct ProfilesConfig {
  std::string mode = "deterministic";
  std::vector<ProfileConfig> definitions = {
      {.name = "lexical_first", .vector = 0.5, .lexical = 2.0, .graph = 0.25},
      {.name = "consensus", .vector = 1.0, .lexical = 1.0, .graph = 0.5},
      {.name = "vector_first", .vector = 2.0, .lexical = 0.5, .graph = 1.0, .clip = "lenient"},
  };
  std::string route_identifier_like = "lexical_first";
  std::string route_factual = "consensus";
  std::string route_abstract = "vector_first";
  std::string tuned_base = "consensus";
};

struct EarlyExitConfig {
  bool enabled = true;
  std::size_t threshold = 5;
  std::string primary_engine = "lexical";
  std::vector<std::string> expensive_engines = {"graph"};
};

struct TunerConfig {
  bool enabled = true;
  double prior = 1.0;
  double decay = 0.98;
  double window = 500.0;
  double min_weight = 0.1;
  double miss_penalty = 0.5;
  std::string sampling = "posterior_mean";
  std::uint64_t seed = 42;
  std::uint32_t retune_interval_ms = 5000;
  std::size_t batch_size = 16;
};

struct MissConfig {
  double relevance_floor = 0.1;
  double rrf_relevance_floor = 0.008;
  bool journal_enabled = false;
  std::string journal_path = "~/.raefusion/failures.db";
};

struct CacheConfig {
  bool enabled = true;
  std::uint32_t ttl_seconds = 300;
  std::size_t max_entries = 1024;
};

struct SourcesConfig {
  std::uint32_t failure_threshold = 3;
  std::uint32_t cooldown_ms = 30'000;
};

struct MetricsConfig {
  std::size_t window = 200;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  RetrievalConfig retrieval;
  FusionConfig fusion;
  ClassifierConfig classifier;
  ProfilesConfig profiles;
  EarlyExitConfig early_exit;
  TunerConfig tuner;
  MissConfig miss;
  CacheConfig cache;
  SourcesConfig sources;
  MetricsConfig metrics;
  ObservabilityConfig observability;
};

} // namespace raefusion::config
