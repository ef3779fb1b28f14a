#include "test_framework.hpp"

#include "raefusion/retrieval/retrieval_engine.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <thread>

namespace {

using namespace std::chrono_literals;
using raefusion::retrieval::EngineId;
using raefusion::retrieval::Query;
using raefusion::retrieval::RetrievalEngine;
using raefusion::retrieval::RetrievalStatus;
using raefusion::testing::FakeBehavior;
using raefusion::testing::scored;

constexpr const char *ABSTRACT_QUESTION =
    "how do distributed systems reach agreement when the network splits?";

struct Harness {
  std::shared_ptr<raefusion::testing::FakeVectorBackend> vector =
      std::make_shared<raefusion::testing::FakeVectorBackend>();
  std::shared_ptr<raefusion::testing::FakeLexicalBackend> lexical =
      std::make_shared<raefusion::testing::FakeLexicalBackend>();
  std::shared_ptr<raefusion::testing::FakeGraphBackend> graph =
      std::make_shared<raefusion::testing::FakeGraphBackend>();
  std::shared_ptr<raefusion::testing::RecordingSink> sink =
      std::make_shared<raefusion::testing::RecordingSink>();
  std::unique_ptr<RetrievalEngine> engine;

  explicit Harness(const raefusion::config::Config &config = raefusion::testing::test_config()) {
    auto created = RetrievalEngine::create(
        config, raefusion::retrieval::EngineBackends{
                    .vector = vector, .lexical = lexical, .graph = graph, .reflection_sinks = {sink}});
    if (!created.ok()) {
      throw std::runtime_error(created.error());
    }
    engine = std::move(created.value());
  }
};

Query query(const std::string &text) {
  Query q;
  q.text = text;
  return q;
}

bool contains(const std::vector<EngineId> &engines, const EngineId engine) {
  return std::find(engines.begin(), engines.end(), engine) != engines.end();
}

} // namespace

void register_retrieval_tests(std::vector<raefusion::tests::TestCase> &tests) {
  using raefusion::tests::require;
  using raefusion::tests::require_near;
  namespace rt = raefusion::retrieval;
  using raefusion::common::ErrorCode;

  tests.push_back({"retrieval_identifier_query_ranks_exact_match_first", [] {
                     Harness h;
                     h.lexical->set(FakeBehavior{.items = scored({"inv-48213"})});
                     h.vector->set(FakeBehavior{.items = scored({"doc-a", "doc-b", "inv-48213"})});
                     h.graph->set(FakeBehavior{.items = scored({"related"})});

                     const auto response = h.engine->retrieve(query("invoice #48213"));
                     require(response.status == RetrievalStatus::Normal, "normal status");
                     require(response.classification.label == rt::QueryLabel::IdentifierLike,
                             "identifier-like");
                     require(response.profile->name == "lexical_first", "routed profile");
                     require(!response.results.empty(), "results expected");
                     require(response.results[0].item_id == "inv-48213", "exact match first");
                     require_near(response.results[0].score, 1.5 * (2.0 / 61.0 + 0.5 / 63.0), 1e-9,
                                  "fused score");
                     require(contains(response.engines_skipped, EngineId::Graph),
                             "graph skipped on a precise lexical hit");
                     require(h.graph->calls() == 0, "graph not called");
                     require(!response.miss.has_value(), "no miss");
                   }});

  tests.push_back({"retrieval_degrades_when_one_engine_fails", [] {
                     Harness h;
                     h.vector->set(FakeBehavior{.error = std::string("index offline")});
                     h.lexical->set(FakeBehavior{.items = scored({"a", "b", "c", "d", "e", "f"})});
                     const auto response = h.engine->retrieve(query("kubernetes"));
                     require(response.status == RetrievalStatus::Degraded, "degraded");
                     require(response.failures.size() == 1, "one failure");
                     require(response.failures[0].engine == EngineId::Vector, "vector failed");
                     require(response.failures[0].code == ErrorCode::SourceUnavailable, "code");
                     require(response.results.size() >= 6, "lexical results served");
                     require(h.engine->metrics().degraded == 1, "degraded counted");
                   }});

  tests.push_back({"retrieval_slow_engine_times_out", [] {
                     Harness h;
                     h.vector->set(FakeBehavior{.items = scored({"late"}), .delay = 800ms});
                     h.lexical->set(FakeBehavior{.items = scored({"fast"})});
                     const auto started = std::chrono::steady_clock::now();
                     const auto response = h.engine->retrieve(query("kubernetes"));
                     require(std::chrono::steady_clock::now() - started < 700ms,
                             "query must not wait for the slow engine");
                     require(response.status == RetrievalStatus::Degraded, "degraded");
                     require(response.results[0].item_id == "fast", "fast engine served");
                   }});

  tests.push_back({"retrieval_all_sources_unavailable", [] {
                     Harness h;
                     h.vector->set(FakeBehavior{.error = std::string("down")});
                     h.lexical->set(FakeBehavior{.throw_error = true});
                     const auto response = h.engine->retrieve(query("kubernetes"));
                     require(response.status == RetrievalStatus::Unavailable, "unavailable");
                     require(response.results.empty(), "no results");
                     require(!response.miss.has_value(), "outage is not a miss");
                     const auto metrics = h.engine->metrics();
                     require(metrics.unavailable == 1, "unavailable counted");
                     require(metrics.window_size == 0, "outage not in quality window");
                   }});

  tests.push_back({"retrieval_zero_matches_is_a_normal_miss", [] {
                     Harness h;
                     const auto response = h.engine->retrieve(query(ABSTRACT_QUESTION));
                     require(response.status == RetrievalStatus::Normal, "empty is still normal");
                     require(response.results.empty(), "no results");
                     require(response.miss.has_value(), "empty result is a miss");
                     h.engine->miss_recorder().flush();
                     require(h.sink->count() == 1, "sink notified");
                   }});

  tests.push_back({"retrieval_empty_query_short_circuits", [] {
                     Harness h;
                     h.vector->set(FakeBehavior{.items = scored({"a"})});
                     const auto response = h.engine->retrieve(query("   "));
                     require(response.status == RetrievalStatus::Normal, "normal");
                     require(response.results.empty(), "no results");
                     require(!response.miss.has_value(), "no miss");
                     require(h.vector->calls() == 0, "no engine called");
                   }});

  tests.push_back({"retrieval_graph_is_seeded_from_first_stage", [] {
                     Harness h;
                     h.vector->set(FakeBehavior{.items = scored({"v1", "v2", "v3"})});
                     h.lexical->set(FakeBehavior{.items = scored({"l1", "l2", "l3", "l4"})});
                     h.graph->set(FakeBehavior{.items = scored({"g1", "v1"})});

                     rt::RetrieveOptions options;
                     options.traversal_depth = 4;
                     const auto response = h.engine->retrieve(query(ABSTRACT_QUESTION), options);
                     require(contains(response.engines_queried, EngineId::Graph), "graph queried");
                     require(h.graph->last_seeds().size() == 5, "seed count");
                     require(h.graph->last_seeds().front() == "v1", "best item seeds first");
                     require(h.graph->last_depth() == 4, "option depth");
                     const bool has_g1 = std::any_of(
                         response.results.begin(), response.results.end(),
                         [](const rt::FusedResult &r) { return r.item_id == "g1"; });
                     require(has_g1, "graph results fused");

                     auto with_depth = query(ABSTRACT_QUESTION);
                     with_depth.traversal_depth = 1;
                     (void)h.engine->retrieve(with_depth);
                     require(h.graph->last_depth() == 1, "query depth");
                     (void)h.engine->retrieve(query(ABSTRACT_QUESTION));
                     require(h.graph->last_depth() == 2, "default depth");
                   }});

  tests.push_back({"retrieval_limit_scales_candidate_fetch", [] {
                     Harness h;
                     h.vector->set(FakeBehavior{.items = scored({"a", "b", "c", "d", "e"})});
                     rt::RetrieveOptions options;
                     options.limit = 2;
                     const auto response = h.engine->retrieve(query("kubernetes"), options);
                     require(response.results.size() == 2, "limit applied");
                     require(h.vector->last_limit() == 4, "fetch limit is limit * multiplier");
                   }});

  tests.push_back({"retrieval_feedback_reaches_metrics_and_tuner", [] {
                     Harness h;
                     h.vector->set(FakeBehavior{.items = scored({"a", "b"})});
                     h.lexical->set(FakeBehavior{.items = scored({"b", "c", "d", "e", "f"})});
                     const auto response = h.engine->retrieve(query("kubernetes"));
                     require(response.results[0].item_id == "b", "consensus item first");

                     const auto status =
                         h.engine->submit_feedback("b", response, rt::Relevance::Relevant);
                     require(status.ok(), status.error());
                     const auto unknown =
                         h.engine->submit_feedback("zzz", response, rt::Relevance::Relevant);
                     require(unknown.code() == ErrorCode::UnknownItem, "unknown item rejected");

                     const auto metrics = h.engine->metrics();
                     require(metrics.feedback_count == 1, "one feedback");
                     require_near(metrics.mrr, 1.0, 1e-12, "rank one");
                     require(metrics.pending_feedback == 1, "queued for the tuner");
                   }});

  tests.push_back({"retrieval_metrics_track_misses", [] {
                     Harness h;
                     h.lexical->set(FakeBehavior{.items = scored({"a", "b", "c", "d", "e"})});
                     (void)h.engine->retrieve(query("kubernetes"));
                     (void)h.engine->retrieve(query("kubernetes cluster"));
                     h.lexical->set(FakeBehavior{});
                     (void)h.engine->retrieve(query("kubernetes"));
                     const auto metrics = h.engine->metrics();
                     require(metrics.queries == 3, "three queries");
                     require(metrics.misses == 1, "one miss");
                     require_near(metrics.miss_rate, 1.0 / 3.0, 1e-12, "miss rate");
                     require(metrics.mean_top_score > 0.0, "mean top score");
                   }});

  tests.push_back({"retrieval_metrics_histogram_scales_by_strategy", [] {
                     rt::RetrievalMetrics metrics;
                     const double ceiling = 2.5 * 1.5 / 61.0;
                     metrics.record_query(RetrievalStatus::Normal, 0.045, false, ceiling);
                     metrics.record_query(RetrievalStatus::Normal, 0.01, false, ceiling);
                     metrics.record_query(RetrievalStatus::Normal, 0.55, false);
                     const auto snapshot = metrics.snapshot();
                     require(snapshot.score_histogram[7] == 1, "0.045 of 0.0615 lands in bucket 7");
                     require(snapshot.score_histogram[1] == 1, "0.01 of 0.0615 lands in bucket 1");
                     require(snapshot.score_histogram[5] == 1, "score-scale sample unchanged");
                     require(snapshot.score_histogram[0] == 0, "nothing collapsed into bucket 0");
                     require_near(snapshot.mean_top_score, (0.045 + 0.01 + 0.55) / 3.0, 1e-12,
                                  "mean uses raw scores");
                   }});

  tests.push_back({"retrieval_forced_profile_and_strategy", [] {
                     Harness h;
                     h.vector->set(FakeBehavior{.items = scored({"a", "b"})});
                     rt::RetrieveOptions options;
                     options.profile = "vector_first";
                     options.strategy = rt::FusionStrategy::Score;
                     const auto forced = h.engine->retrieve(query("invoice #48213"), options);
                     require(forced.profile->name == "vector_first", "forced profile");
                     require(forced.strategy == rt::FusionStrategy::Score, "forced strategy");
                     require(!forced.profile_fallback, "known profile");

                     options.profile = "nope";
                     options.strategy.reset();
                     const auto fallback = h.engine->retrieve(query("invoice #48213"), options);
                     require(fallback.profile_fallback, "fallback flagged");
                     require(fallback.profile->name == "lexical_first", "routed profile used");
                   }});

  tests.push_back({"retrieval_forced_rrf_on_score_profile_uses_rrf_floor", [] {
                     auto config = raefusion::testing::test_config();
                     config.profiles.definitions[1].strategy = "score";
                     Harness h(config);
                     h.vector->set(FakeBehavior{.items = scored({"a"})});
                     h.lexical->set(FakeBehavior{.items = scored({"a"})});

                     rt::RetrieveOptions options;
                     options.strategy = rt::FusionStrategy::Rrf;
                     const auto response = h.engine->retrieve(query("kubernetes"), options);
                     require(response.profile->name == "consensus", "factual route");
                     require(response.strategy == rt::FusionStrategy::Rrf, "forced rrf");
                     require(!response.results.empty() && response.results[0].item_id == "a",
                             "shared hit first");
                     require_near(response.results[0].score, 1.5 * (2.0 / 61.0), 1e-9,
                                  "rrf composite");
                     require(!response.miss.has_value(), "rank-1 consensus hit is not a miss");
                     h.engine->miss_recorder().flush();
                     require(h.sink->count() == 0, "nothing sent to sinks");
                   }});

  tests.push_back({"retrieval_forced_score_on_rrf_profile_uses_score_floor", [] {
                     auto config = raefusion::testing::test_config();
                     config.profiles.definitions[1].vector = 0.1;
                     Harness h(config);
                     h.vector->set(FakeBehavior{.items = scored({"a"})});

                     rt::RetrieveOptions options;
                     options.strategy = rt::FusionStrategy::Score;
                     const auto response = h.engine->retrieve(query("kubernetes"), options);
                     require(response.profile->name == "consensus", "factual route");
                     require(response.profile->strategy == rt::FusionStrategy::Rrf,
                             "profile itself is rrf");
                     require(!response.results.empty(), "weak hit kept");
                     require_near(response.results[0].score, 0.1 / 1.6, 1e-9, "score composite");
                     require(response.miss.has_value(), "below the score floor is a miss");
                     h.engine->miss_recorder().flush();
                     require(h.sink->count() == 1, "miss delivered");
                   }});

  tests.push_back({"retrieval_honors_cancellation", [] {
                     Harness h;
                     raefusion::common::CancellationToken early;
                     early.cancel();
                     const auto skipped = h.engine->retrieve(query("kubernetes"), {}, early);
                     require(skipped.cancelled, "pre-cancelled");
                     require(h.vector->calls() == 0 && h.lexical->calls() == 0, "nothing called");

                     h.vector->set(FakeBehavior{.items = scored({"a"}), .delay = 300ms});
                     h.lexical->set(FakeBehavior{.items = scored({"b"}), .delay = 300ms});
                     raefusion::common::CancellationToken token;
                     std::thread canceller([token] {
                       std::this_thread::sleep_for(20ms);
                       token.cancel();
                     });
                     const auto response = h.engine->retrieve(query("kubernetes"), {}, token);
                     canceller.join();
                     require(response.cancelled, "cancelled mid-flight");
                     require(response.results.empty(), "no partial results");
                     require(!response.miss.has_value(), "cancellation is not a miss");
                     require(h.engine->miss_recorder().recorded() == 0, "nothing recorded");
                     require(h.engine->metrics().queries == 0, "cancelled queries not counted");
                   }});

  tests.push_back({"retrieval_tuned_mode_serves_learned_profile", [] {
                     auto config = raefusion::testing::test_config();
                     config.profiles.mode = "tuned";
                     Harness h(config);
                     h.vector->set(FakeBehavior{.items = scored({"a", "b", "c", "d", "e"})});
                     h.lexical->set(FakeBehavior{.items = scored({"x", "y", "z", "w", "v"})});

                     const auto before = h.engine->retrieve(query("kubernetes"));
                     require(before.profile->name == "consensus", "no tuned snapshot yet");
                     require(h.engine->submit_feedback(before.results[0].item_id, before,
                                                       rt::Relevance::Relevant)
                                 .ok(),
                             "feedback accepted");
                     const auto retuned = h.engine->tuner().retune();
                     require(retuned.ok(), retuned.error());

                     const auto after = h.engine->retrieve(query("kubernetes"));
                     require(after.profile->name == "tuned", "tuned snapshot served");
                     require(h.engine->metrics().tuned_profile != nullptr, "exposed in metrics");
                   }});

  tests.push_back({"retrieval_create_validates_inputs", [] {
                     const auto no_backends =
                         RetrievalEngine::create(raefusion::testing::test_config(), {});
                     require(!no_backends.ok(), "backends required");
                     require(no_backends.code() == ErrorCode::InvalidConfig, "code");

                     auto config = raefusion::testing::test_config();
                     config.fusion.rrf_k = 0.0;
                     const auto bad = RetrievalEngine::create(
                         config, rt::EngineBackends{
                                     .vector = std::make_shared<raefusion::testing::FakeVectorBackend>()});
                     require(!bad.ok(), "invalid config rejected");
                   }});

  tests.push_back({"retrieval_lexical_only_deployment", [] {
                     auto lexical = std::make_shared<raefusion::testing::FakeLexicalBackend>(
                         FakeBehavior{.items = scored({"only"})});
                     auto created = RetrievalEngine::create(raefusion::testing::test_config(),
                                                            rt::EngineBackends{.lexical = lexical});
                     require(created.ok(), created.error());
                     const auto response = created.value()->retrieve(query("ERR_CONN_RESET"));
                     require(response.status == RetrievalStatus::Normal, "normal");
                     require(response.engines_queried.size() == 1, "single engine");
                     require(response.results[0].item_id == "only", "served");
                   }});
}
