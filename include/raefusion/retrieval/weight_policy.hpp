#pragma once

#include "raefusion/common/result.hpp"
#include "raefusion/config/schema.hpp"
#include "raefusion/retrieval/types.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace raefusion::retrieval {

enum class ProfileMode { Deterministic, Tuned };

[[nodiscard]] std::string_view mode_to_string(ProfileMode mode);
[[nodiscard]] std::optional<ProfileMode> mode_from_string(const std::string &value);

/// Rejects NaN, infinite or negative weights and profiles with no positive weight.
[[nodiscard]] common::Status validate_profile(const WeightProfile &profile);

[[nodiscard]] common::Result<WeightProfile> profile_from_config(const config::ProfileConfig &config);

/// lexical_first, consensus, vector_first.
[[nodiscard]] std::vector<WeightProfile> builtin_profiles();

/// Named deterministic profiles plus one tuned profile.
///
/// Readers get an immutable snapshot without locking; the tuned profile is
/// replaced wholesale by `update_tuned_profile`, and in-flight readers keep
/// whatever snapshot they already hold.
class WeightPolicyStore {
public:
  using Snapshot = std::shared_ptr<const WeightProfile>;

  WeightPolicyStore(std::vector<WeightProfile> profiles, std::map<QueryLabel, std::string> routing,
                    std::string tuned_base, ProfileMode mode);

  [[nodiscard]] static common::Result<std::shared_ptr<WeightPolicyStore>>
  from_config(const config::ProfilesConfig &config);

  WeightPolicyStore(const WeightPolicyStore &) = delete;
  WeightPolicyStore &operator=(const WeightPolicyStore &) = delete;

  [[nodiscard]] Snapshot current_profile(const QueryClassification &classification) const;
  [[nodiscard]] Snapshot deterministic_profile(QueryLabel label) const;
  [[nodiscard]] Snapshot profile(const std::string &name) const;
  [[nodiscard]] Snapshot tuned_profile() const;
  [[nodiscard]] Snapshot tuned_base() const;
  [[nodiscard]] std::vector<std::string> profile_names() const;

  [[nodiscard]] common::Status update_tuned_profile(WeightProfile profile);

  void set_mode(ProfileMode mode) { mode_.store(mode); }
  [[nodiscard]] ProfileMode mode() const { return mode_.load(); }

private:
  std::map<std::string, Snapshot> profiles_;
  std::map<QueryLabel, std::string> routing_;
  std::string tuned_base_;
  Snapshot fallback_;
  std::atomic<ProfileMode> mode_;
  std::atomic<Snapshot> tuned_;
  std::mutex writer_mutex_;
  std::uint64_t tuned_version_ = 0;
};

} // namespace raefusion::retrieval
