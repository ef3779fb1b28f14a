#include "raefusion/retrieval/result_cache.hpp"

#include <algorithm>

namespace raefusion::retrieval {

ResultCache::ResultCache(const std::chrono::milliseconds ttl, const std::size_t max_entries)
    : ttl_(ttl), max_entries_(max_entries) {}

std::optional<std::vector<CandidateResult>> ResultCache::get(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    ++stats_.misses;
    return std::nullopt;
  }
  if (std::chrono::steady_clock::now() >= it->second.expires_at) {
    entries_.erase(it);
    insertion_order_.erase(std::remove(insertion_order_.begin(), insertion_order_.end(), key),
                           insertion_order_.end());
    ++stats_.misses;
    return std::nullopt;
  }
  ++stats_.hits;
  return it->second.candidates;
}

void ResultCache::put(const std::string &key, std::vector<CandidateResult> candidates) {
  if (max_entries_ == 0 || ttl_.count() <= 0) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto expires_at = std::chrono::steady_clock::now() + ttl_;
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    it->second = Entry{.candidates = std::move(candidates), .expires_at = expires_at};
    return;
  }

  entries_.emplace(key, Entry{.candidates = std::move(candidates), .expires_at = expires_at});
  insertion_order_.push_back(key);
  evict_overflow();
}

void ResultCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  insertion_order_.clear();
}

CacheStats ResultCache::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CacheStats out = stats_;
  out.size = entries_.size();
  return out;
}

void ResultCache::evict_overflow() {
  while (entries_.size() > max_entries_ && !insertion_order_.empty()) {
    entries_.erase(insertion_order_.front());
    insertion_order_.pop_front();
  }
}

} // namespace raefusion::retrieval
