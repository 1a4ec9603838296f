/**
 * @file CancelScope.cpp
 * @brief Hierarchical cancellation on std::stop_source.
 */

#include "src/runtime/inc/CancelScope.hpp"

#include <utility>

namespace pfrelay {

namespace runtime {

CancelScope::CancelScope() : state_(std::make_shared<State>()) {}

CancelScope::CancelScope(std::shared_ptr<State> state) noexcept : state_(std::move(state)) {}

CancelScope CancelScope::child() const {
  auto childState = std::make_shared<State>();

  // The callback holds a copy of the child's stop_source, not the State, so a
  // parent outliving its child never keeps the child alive. Registering on an
  // already-stopped parent runs the callback immediately.
  std::stop_source childSource = childState->source;
  childState->parentLink.emplace(state_->source.get_token(),
                                 std::function<void()>([childSource]() mutable {
                                   childSource.request_stop();
                                 }));

  return CancelScope(std::move(childState));
}

void CancelScope::cancel() const noexcept { state_->source.request_stop(); }

bool CancelScope::isCancelled() const noexcept { return state_->source.stop_requested(); }

std::stop_token CancelScope::token() const noexcept { return state_->source.get_token(); }

bool CancelScope::waitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(state_->mtx);
  // Predicate is constant: only the timeout or a stop request ends the wait.
  state_->cv.wait_for(lock, state_->source.get_token(), timeout, [] { return false; });
  return state_->source.stop_requested();
}

} // namespace runtime

} // namespace pfrelay
