#pragma once

#include "raefusion/retrieval/adaptive_tuner.hpp"
#include "raefusion/retrieval/backends.hpp"
#include "raefusion/retrieval/bandit.hpp"
#include "raefusion/retrieval/candidate_source.hpp"
#include "raefusion/retrieval/early_exit.hpp"
#include "raefusion/retrieval/failure_journal.hpp"
#include "raefusion/retrieval/fusion_engine.hpp"
#include "raefusion/retrieval/metrics.hpp"
#include "raefusion/retrieval/miss_recorder.hpp"
#include "raefusion/retrieval/query_classifier.hpp"
#include "raefusion/retrieval/result_cache.hpp"
#include "raefusion/retrieval/retrieval_engine.hpp"
#include "raefusion/retrieval/types.hpp"
#include "raefusion/retrieval/weight_policy.hpp"
