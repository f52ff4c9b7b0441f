#include <rediszset/dispatcher.hpp>
#include <rediszset/logger.hpp>

#include <atomic>
#include <limits>
#include <string>

namespace rediszset {

auto check_int32(std::int64_t value, std::string_view name) -> expected<void, error_info> {
  if (value < (std::numeric_limits<std::int32_t>::min)() ||
      value > (std::numeric_limits<std::int32_t>::max)()) {
    REDISZSET_LOG_DEBUG("rejected {}={}: outside the 32-bit range", name, value);
    return fail(error::argument_out_of_range,
                std::string{name} + " " + std::to_string(value) +
                  " does not fit a signed 32-bit integer");
  }
  return {};
}

auto dispatcher::trace_start(std::string_view name, std::size_t argc, execution_mode mode)
  -> dispatch_trace_info {
  if (!hooks_.enabled()) {
    return {};
  }

  // Process-wide so that ids stay unique across dispatchers sharing a connection.
  static std::atomic<std::uint64_t> next_id{1};

  dispatch_trace_info info{
    .id = next_id.fetch_add(1, std::memory_order_relaxed),
    .command = name,
    .arg_count = argc,
    .mode = mode,
  };
  if (hooks_.on_start != nullptr) {
    hooks_.on_start(hooks_.user_data, dispatch_trace_start{.info = info});
  }
  return info;
}

auto dispatcher::trace_finish(dispatch_trace_info const& info, clock::time_point start,
                              bool is_deferred, error_info const* err) -> void {
  if (hooks_.on_finish == nullptr) {
    return;
  }

  dispatch_trace_finish evt{
    .info = info,
    .duration = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - start),
    .deferred = is_deferred,
  };
  if (err != nullptr) {
    evt.error = err->code;
    if (!redact_error_detail_) {
      evt.error_detail = err->detail;
    }
  }
  hooks_.on_finish(hooks_.user_data, evt);
}

}  // namespace rediszset
