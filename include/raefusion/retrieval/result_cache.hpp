#pragma once

#include "raefusion/retrieval/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace raefusion::retrieval {

struct CacheStats {
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
  std::size_t size = 0;
};

class ResultCache {
public:
  ResultCache(std::chrono::milliseconds ttl, std::size_t max_entries);

  [[nodiscard]] std::optional<std::vector<CandidateResult>> get(const std::string &key);
  void put(const std::string &key, std::vector<CandidateResult> candidates);
  void clear();

  [[nodiscard]] CacheStats stats() const;

private:
  struct Entry {
    std::vector<CandidateResult> candidates;
    std::chrono::steady_clock::time_point expires_at;
  };

  void evict_overflow();

  std::chrono::milliseconds ttl_;
  std::size_t max_entries_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  std::deque<std::string> insertion_order_;
  CacheStats stats_;
};

} // namespace raefusion::retrieval
