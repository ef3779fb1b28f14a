#pragma once

#include <atomic>
#include <memory>

namespace raefusion::common {

/// Shared cancellation flag. Copies observe the same state.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true); }
  [[nodiscard]] bool is_cancelled() const { return flag_->load(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace raefusion::common
