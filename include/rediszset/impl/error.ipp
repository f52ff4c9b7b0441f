#include <rediszset/error.hpp>

#include <string>

namespace rediszset {
namespace detail {

struct error_category_impl : std::error_category {
  auto name() const noexcept -> char const* override { return "rediszset"; }

  auto message(int ev) const -> std::string override {
    // clang-format off
    switch (static_cast<error>(ev)) {
      case error::invalid_argument:      return "invalid argument";
      case error::argument_mismatch:     return "number of weights does not match number of sets";
      case error::argument_out_of_range: return "argument exceeds the 32-bit integer range";
      case error::unsupported_in_mode:   return "operation not supported in pipeline / transaction mode";
      case error::iterator_closed:       return "cursor is closed";
      case error::server_error:          return "server replied with an error";
      case error::unexpected_reply:      return "unexpected reply type";
      case error::result_pending:        return "result not available until the batch is flushed";
    }
    // clang-format on
    return "unknown rediszset error";
  }

  auto default_error_condition(int ev) const noexcept -> std::error_condition override {
    switch (static_cast<error>(ev)) {
      case error::invalid_argument:
      case error::argument_mismatch:
        return std::errc::invalid_argument;
      case error::argument_out_of_range:
        return std::errc::result_out_of_range;
      case error::unsupported_in_mode:
        return std::errc::operation_not_supported;
      default:
        return std::error_condition{ev, *this};
    }
  }
};

auto category() -> std::error_category const& {
  static error_category_impl instance;
  return instance;
}

}  // namespace detail

auto make_error_code(error e) -> std::error_code {
  return std::error_code{static_cast<int>(e), detail::category()};
}

}  // namespace rediszset
