#include "test_framework.hpp"

#include "raefusion/retrieval/failure_journal.hpp"
#include "raefusion/retrieval/miss_recorder.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

using raefusion::retrieval::EngineId;
using raefusion::retrieval::FusedResult;
using raefusion::retrieval::QueryClassification;
using raefusion::retrieval::QueryLabel;

std::vector<FusedResult> top_at(const double score) {
  return {FusedResult{.item_id = "only", .score = score, .contributions = {}}};
}

QueryClassification factual() {
  QueryClassification classification;
  classification.label = QueryLabel::Factual;
  classification.resonance = 0.5;
  return classification;
}

raefusion::retrieval::MissContext queried(const std::string &text) {
  return raefusion::retrieval::MissContext{
      .query_text = text, .engines_queried = {EngineId::Vector, EngineId::Lexical}};
}

class ErrorCodeSink final : public raefusion::retrieval::IReflectionSink {
public:
  void on_failure(const raefusion::retrieval::FailureEvent &) override { throw 42; }
  [[nodiscard]] std::string_view name() const override { return "error_code"; }
};

} // namespace

void register_miss_recorder_tests(std::vector<raefusion::tests::TestCase> &tests) {
  using raefusion::tests::require;
  using raefusion::tests::require_near;
  namespace rt = raefusion::retrieval;
  using raefusion::testing::profile;

  tests.push_back({"miss_floor_depends_on_strategy", [] {
                     const rt::MissRecorder recorder;
                     require_near(recorder.floor_for(rt::FusionStrategy::Rrf), 0.008, 1e-12, "rrf");
                     require_near(recorder.floor_for(rt::FusionStrategy::Score), 0.1, 1e-12,
                                  "score");
                     const auto rrf = rt::FusionStrategy::Rrf;
                     require(recorder.is_miss({}, rrf), "empty results are a miss");
                     require(recorder.is_miss(top_at(0.005), rrf), "below floor");
                     require(!recorder.is_miss(top_at(0.008), rrf), "at the floor is not a miss");
                     require(recorder.is_miss(top_at(0.05), rt::FusionStrategy::Score),
                             "score floor is higher");
                   }});

  tests.push_back({"miss_floor_follows_fusion_strategy_not_profile", [] {
                     rt::MissRecorder recorder;
                     const auto score_profile = profile("s", 1, 1, 1, rt::FusionStrategy::Score);
                     auto context = queried("q");
                     context.strategy = rt::FusionStrategy::Rrf;
                     require(!recorder.inspect(top_at(0.0492), factual(), score_profile, context)
                                  .has_value(),
                             "rrf-scored list is judged by the rrf floor");

                     const auto rrf_profile = profile("r", 1, 1, 1);
                     context.strategy = rt::FusionStrategy::Score;
                     require(recorder.inspect(top_at(0.05), factual(), rrf_profile, context)
                                 .has_value(),
                             "score-scored list is judged by the score floor");

                     context.strategy.reset();
                     require(recorder.inspect(top_at(0.05), factual(), score_profile, context)
                                 .has_value(),
                             "unset strategy falls back to the profile");
                     recorder.flush();
                   }});

  tests.push_back({"miss_emits_one_event_to_sinks", [] {
                     rt::MissRecorder recorder;
                     auto sink = std::make_shared<raefusion::testing::RecordingSink>();
                     recorder.add_sink(sink);

                     const auto event = recorder.inspect(top_at(0.002), factual(),
                                                         profile("consensus", 1, 1, 0.5),
                                                         queried("where is the runbook"));
                     require(event.has_value(), "miss expected");
                     recorder.flush();

                     require(sink->count() == 1, "exactly one event delivered");
                     const auto delivered = sink->events().front();
                     require(delivered.query_fingerprint.size() == 64, "sha256 hex fingerprint");
                     require(delivered.query_fingerprint.find("runbook") == std::string::npos,
                             "raw text must not be stored");
                     require(!delivered.timestamp.empty(), "timestamp");
                     require(delivered.engines_queried.size() == 2, "engines recorded");
                     require(delivered.profile.name == "consensus", "profile recorded");
                     require_near(delivered.top_score, 0.002, 1e-12, "top score recorded");
                     require(recorder.recorded() == 1, "counter");
                   }});

  tests.push_back({"miss_not_recorded_for_good_results", [] {
                     rt::MissRecorder recorder;
                     auto sink = std::make_shared<raefusion::testing::RecordingSink>();
                     recorder.add_sink(sink);
                     require(!recorder.inspect(top_at(0.03), factual(), profile("p", 1, 1, 1),
                                               queried("q"))
                                  .has_value(),
                             "healthy result is not a miss");
                     recorder.flush();
                     require(sink->count() == 0, "no events");
                   }});

  tests.push_back({"miss_skips_unavailable_and_cancelled_queries", [] {
                     rt::MissRecorder recorder;
                     auto context = queried("q");
                     context.status = rt::RetrievalStatus::Unavailable;
                     require(!recorder.inspect({}, factual(), profile("p", 1, 1, 1), context)
                                  .has_value(),
                             "infrastructure failure is not a miss");
                     context.status = rt::RetrievalStatus::Normal;
                     context.cancelled = true;
                     require(!recorder.inspect({}, factual(), profile("p", 1, 1, 1), context)
                                  .has_value(),
                             "cancellation is not a miss");
                     context.cancelled = false;
                     context.status = rt::RetrievalStatus::Degraded;
                     require(recorder.inspect({}, factual(), profile("p", 1, 1, 1), context)
                                 .has_value(),
                             "a degraded empty result is still a miss");
                   }});

  tests.push_back({"miss_sink_failure_does_not_stop_delivery", [] {
                     rt::MissRecorder recorder;
                     auto sink = std::make_shared<raefusion::testing::RecordingSink>();
                     recorder.add_sink(std::make_shared<raefusion::testing::ThrowingSink>());
                     recorder.add_sink(sink);
                     (void)recorder.inspect({}, factual(), profile("p", 1, 1, 1), queried("a"));
                     (void)recorder.inspect({}, factual(), profile("p", 1, 1, 1), queried("b"));
                     recorder.flush();
                     require(sink->count() == 2, "later sinks still receive events");
                   }});

  tests.push_back({"miss_sink_non_standard_throw_does_not_stop_delivery", [] {
                     rt::MissRecorder recorder;
                     auto sink = std::make_shared<raefusion::testing::RecordingSink>();
                     recorder.add_sink(std::make_shared<ErrorCodeSink>());
                     recorder.add_sink(sink);
                     (void)recorder.inspect({}, factual(), profile("p", 1, 1, 1), queried("a"));
                     recorder.flush();
                     (void)recorder.inspect({}, factual(), profile("p", 1, 1, 1), queried("b"));
                     recorder.flush();
                     require(sink->count() == 2, "worker survives and keeps delivering");
                   }});

  tests.push_back({"failure_journal_persists_events", [] {
                     raefusion::testing::TempDir dir;
                     const auto db_path = dir.path() / "journal" / "failures.db";
                     {
                       rt::MissRecorder recorder;
                       auto journal = std::make_shared<rt::FailureJournal>(db_path);
                       require(journal->is_open(), journal->open_error());
                       recorder.add_sink(journal);
                       (void)recorder.inspect(top_at(0.001), factual(),
                                              profile("consensus", 1, 1, 0.5), queried("first"));
                       (void)recorder.inspect({}, factual(), profile("vector_first", 2, 0.5, 1),
                                              queried("second"));
                       recorder.flush();
                     }

                     rt::FailureJournal reopened(db_path);
                     require(reopened.is_open(), reopened.open_error());
                     const auto count = reopened.count();
                     require(count.ok() && count.value() == 2, "two rows persisted");
                     const auto recent = reopened.recent(10);
                     require(recent.ok(), recent.error());
                     const auto &entries = recent.value();
                     require(entries.size() == 2, "two entries");
                     require(entries[0].profile == "vector_first", "newest first");
                     require(entries[0].label == "factual", "label stored");
                     require(entries[0].engines == "vector,lexical", "engines stored");
                     require(entries[1].weights.find("graph=0.5") != std::string::npos,
                             "weights stored: " + entries[1].weights);
                   }});

  tests.push_back({"failure_journal_reports_open_errors", [] {
                     raefusion::testing::TempDir dir;
                     dir.create_file("blocker", "not a directory");
                     rt::FailureJournal journal(dir.path() / "blocker" / "failures.db");
                     require(!journal.is_open(), "path under a file cannot open");
                     const auto status = journal.append(rt::FailureEvent{});
                     require(status.code() == raefusion::common::ErrorCode::Storage,
                             "append reports storage error");
                   }});
}
