#pragma once

#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <shared_mutex>

#include <asio.hpp>
#include <lsp/error.hpp>

namespace nuls::services {

using lsp::error::LspError;

// Enforces a minimum interval between validations triggered by edits.
// The clock is shared by every document of the session. Skipped edits are
// not validated later.
class ValidationThrottle {
 public:
  using TimePoint = std::chrono::steady_clock::time_point;
  using Clock = std::function<TimePoint()>;
  using Validation =
      std::function<asio::awaitable<std::expected<void, LspError>>()>;

  static constexpr std::chrono::milliseconds kMinimumInterval{500};

  explicit ValidationThrottle(Clock clock = nullptr);

  // True when no validation succeeded within the last kMinimumInterval
  [[nodiscard]] auto IsDue() const -> bool;

  // Run `validate` unless a validation succeeded too recently. The
  // completion time is recorded only when `validate` succeeds.
  auto Run(Validation validate)
      -> asio::awaitable<std::expected<void, LspError>>;

 private:
  Clock clock_;
  mutable std::shared_mutex mutex_;
  std::optional<TimePoint> last_validated_;
};

}  // namespace nuls::services
