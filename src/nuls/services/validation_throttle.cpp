#include "nuls/services/validation_throttle.hpp"

#include <mutex>

namespace nuls::services {

ValidationThrottle::ValidationThrottle(Clock clock)
    : clock_(clock ? std::move(clock) : [] {
        return std::chrono::steady_clock::now();
      }) {
}

auto ValidationThrottle::IsDue() const -> bool {
  std::shared_lock lock(mutex_);
  if (!last_validated_.has_value()) {
    return true;
  }
  return clock_() - *last_validated_ >= kMinimumInterval;
}

auto ValidationThrottle::Run(Validation validate)
    -> asio::awaitable<std::expected<void, LspError>> {
  if (!IsDue()) {
    co_return lsp::error::Ok();
  }

  auto result = co_await validate();
  if (result) {
    std::unique_lock lock(mutex_);
    last_validated_ = clock_();
  }
  co_return result;
}

}  // namespace nuls::services
