#include "bench_common.hpp"

#include "raefusion/retrieval/retrieval_engine.hpp"

#include <algorithm>
#include <iostream>

namespace {

namespace rt = raefusion::retrieval;

rt::ScoredItems synthetic_items(const std::string &prefix, const std::size_t count) {
  rt::ScoredItems items;
  items.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    items.push_back(rt::ScoredItem{.item_id = prefix + std::to_string(i),
                                   .score = 1.0 / static_cast<double>(i + 1)});
  }
  return items;
}

class StaticIndex final : public rt::IVectorBackend, public rt::ILexicalBackend {
public:
  explicit StaticIndex(std::string prefix) : prefix_(std::move(prefix)) {}

  raefusion::common::Result<rt::ScoredItems>
  search(const std::string &, const rt::Filters &, const std::size_t limit,
         const raefusion::common::CancellationToken &) override {
    return raefusion::common::Result<rt::ScoredItems>::success(synthetic_items(prefix_, limit));
  }
  [[nodiscard]] std::string_view name() const override { return "static"; }

private:
  std::string prefix_;
};

class StaticGraph final : public rt::IGraphBackend {
public:
  raefusion::common::Result<rt::ScoredItems>
  traverse(const std::vector<std::string> &seeds, std::uint32_t, const std::size_t limit,
           const raefusion::common::CancellationToken &) override {
    return raefusion::common::Result<rt::ScoredItems>::success(
        synthetic_items("node-", std::min(limit, seeds.size() * 4)));
  }
  [[nodiscard]] std::string_view name() const override { return "static-graph"; }
};

} // namespace

void run_retrieval_benchmarks() {
  raefusion::config::Config config;
  config.observability.backend = "none";
  config.cache.enabled = false;

  auto created = rt::RetrievalEngine::create(
      config, rt::EngineBackends{.vector = std::make_shared<StaticIndex>("doc-"),
                                 .lexical = std::make_shared<StaticIndex>("doc-"),
                                 .graph = std::make_shared<StaticGraph>()});
  if (!created.ok()) {
    std::cerr << "retrieval bench setup failed: " << created.error() << "\n";
    return;
  }
  auto &engine = *created.value();

  rt::Query abstract;
  abstract.text = "how do distributed systems reach agreement when the network splits?";
  raefusion::bench::run_bench("retrieve_two_stage", 500, [&] { (void)engine.retrieve(abstract); });

  rt::Query identifier;
  identifier.text = "invoice #48213";
  raefusion::bench::run_bench("retrieve_identifier", 500, [&] { (void)engine.retrieve(identifier); });

  raefusion::bench::run_bench("tuner_retune", 500, [&] {
    rt::Feedback feedback;
    feedback.item_id = "doc-0";
    feedback.contributions = {rt::Contribution{
        .engine = rt::EngineId::Lexical, .raw_score = 1.0, .rank = 1, .weighted = 0.03}};
    engine.tuner().observe(std::move(feedback));
    (void)engine.tuner().retune();
  });
}
