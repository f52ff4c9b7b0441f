#pragma once

#include <rediszset/cursor.hpp>
#include <rediszset/logger.hpp>

#include <utility>

namespace rediszset {

template <typename T>
cursor<T>::cursor(dispatcher d, step_fn step, decode_fn decode, std::string start)
    : dispatcher_(std::move(d)),
      step_(std::move(step)),
      decode_(decode),
      token_(std::move(start)) {
  REDISZSET_LOG_DEBUG("cursor opened start={}", token_);
}

template <typename T>
auto cursor<T>::next() -> expected<std::vector<T>, error_info> {
  if (state_ == cursor_state::closed) {
    return fail(error::iterator_closed);
  }
  if (state_ == cursor_state::exhausted) {
    return std::vector<T>{};
  }
  REDISZSET_ASSERT(dispatcher_.has_value());

  auto const mode = dispatcher_->mode();
  if (is_queueing(mode)) {
    REDISZSET_LOG_DEBUG("cursor rejected in {} mode", to_string(mode));
    return fail(error::unsupported_in_mode,
                std::string{"cursor iteration requires direct mode, connection is "} +
                  to_string(mode));
  }

  auto page = dispatcher_->invoke(command_spec<convert::scan_page<T>>{step_(token_), decode_}).get();
  if (!page) {
    return unexpected(std::move(page).error());
  }

  token_ = std::move(page->cursor);
  position_ += page->items.size();
  state_ = token_ == start_token ? cursor_state::exhausted : cursor_state::active;
  REDISZSET_LOG_DEBUG("cursor page size={} next={} state={}", page->items.size(), token_,
                      to_string(state_));
  return std::move(page->items);
}

template <typename T>
void cursor<T>::close() {
  if (state_ == cursor_state::closed) {
    return;
  }
  dispatcher_.reset();
  state_ = cursor_state::closed;
  REDISZSET_LOG_DEBUG("cursor closed position={}", position_);
}

}  // namespace rediszset
