#pragma once

#include <rediszset/command.hpp>
#include <rediszset/config.hpp>
#include <rediszset/connection.hpp>
#include <rediszset/deferred.hpp>
#include <rediszset/error_info.hpp>
#include <rediszset/execution_mode.hpp>
#include <rediszset/expected.hpp>
#include <rediszset/tracing.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <variant>

namespace rediszset {

/// A command plus the conversion applied to its reply.
template <typename T>
struct command_spec {
  command cmd;
  reply_converter<T> convert;
};

/// Result of a dispatch: resolved now (direct mode) or later (pipelined / transactional).
template <typename T>
class dispatch_result {
 public:
  dispatch_result(expected<T, error_info> immediate) : state_(std::move(immediate)) {}
  dispatch_result(deferred<T> handle) : state_(std::move(handle)) {}

  [[nodiscard]] bool is_deferred() const noexcept {
    return std::holds_alternative<deferred<T>>(state_);
  }

  /// The value or error. A deferred result not yet flushed yields error::result_pending.
  [[nodiscard]] auto get() const -> expected<T, error_info> {
    if (auto const* d = std::get_if<deferred<T>>(&state_)) {
      return d->get();
    }
    return std::get<expected<T, error_info>>(state_);
  }

  [[nodiscard]] bool has_value() const { return get().has_value(); }

  /// Precondition: !has_value().
  [[nodiscard]] auto error() const -> error_info { return get().error(); }

  /// Precondition: is_deferred().
  [[nodiscard]] auto handle() const -> deferred<T> const& { return std::get<deferred<T>>(state_); }

 private:
  std::variant<expected<T, error_info>, deferred<T>> state_;
};

/// Fails with error::argument_out_of_range unless `value` fits a signed 32-bit integer.
/// The store accepts wider values; this layer keeps offsets and counts to the 32-bit domain.
auto check_int32(std::int64_t value, std::string_view name) -> expected<void, error_info>;

/// Routes every command according to the connection's current execution mode.
///
/// - direct: blocking round trip, converted immediately
/// - pipelined / transactional: queued with a sink; the caller gets a deferred handle
///
/// Not thread-safe: one logical caller per connection.
class dispatcher {
 public:
  dispatcher(connection& conn, config const& cfg)
      : conn_(&conn),
        hooks_(cfg.trace_hooks),
        redact_error_detail_(cfg.trace_redact_error_detail) {}

  [[nodiscard]] auto mode() const noexcept -> execution_mode { return conn_->mode(); }

  [[nodiscard]] auto conn() const noexcept -> connection& { return *conn_; }

  template <typename T>
  auto invoke(command_spec<T> spec) -> dispatch_result<T>;

 private:
  using clock = std::chrono::steady_clock;

  auto trace_start(std::string_view name, std::size_t argc, execution_mode mode)
    -> dispatch_trace_info;

  auto trace_finish(dispatch_trace_info const& info, clock::time_point start, bool is_deferred,
                    error_info const* err) -> void;

  connection* conn_;
  dispatch_trace_hooks hooks_;
  bool redact_error_detail_;
};

}  // namespace rediszset

#include <rediszset/detail/impl/dispatcher.ipp>
