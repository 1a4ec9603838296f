#ifndef PFRELAY_RUNTIME_CANCEL_SCOPE_HPP
#define PFRELAY_RUNTIME_CANCEL_SCOPE_HPP
/**
 * @file CancelScope.hpp
 * @brief Hierarchical cooperative cancellation.
 * @note Thread-safe: copies share state; cancel/isCancelled/waitFor may be
 *       called from any thread.
 *
 * A scope is a std::stop_source plus the machinery to derive children and to
 * sleep interruptibly. Cancelling a scope cancels every scope derived from it;
 * cancelling a child leaves its parent untouched. A child derived from an
 * already-cancelled parent starts cancelled.
 */

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>

namespace pfrelay {

namespace runtime {

/* ----------------------------- CancelScope ----------------------------- */

class CancelScope {
public:
  /// @brief Create a root scope.
  CancelScope();

  /// @brief Derive a child scope that is cancelled when this one is.
  [[nodiscard]] CancelScope child() const;

  /// @brief Request cancellation of this scope and all of its children.
  void cancel() const noexcept;

  [[nodiscard]] bool isCancelled() const noexcept;

  /// @brief Token observing this scope, for stop_token aware waits.
  [[nodiscard]] std::stop_token token() const noexcept;

  /**
   * @brief Sleep until the timeout elapses or the scope is cancelled.
   * @param timeout Maximum time to wait.
   * @return true if the scope is cancelled (on entry or during the wait).
   */
  bool waitFor(std::chrono::milliseconds timeout) const;

private:
  struct State {
    std::stop_source source;
    std::optional<std::stop_callback<std::function<void()>>> parentLink;
    mutable std::mutex mtx;
    mutable std::condition_variable_any cv;
  };

  explicit CancelScope(std::shared_ptr<State> state) noexcept;

  std::shared_ptr<State> state_;
};

} // namespace runtime

} // namespace pfrelay

#endif // PFRELAY_RUNTIME_CANCEL_SCOPE_HPP
