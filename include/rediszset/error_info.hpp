#pragma once

#include <rediszset/error.hpp>
#include <rediszset/expected.hpp>

#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace rediszset {

/// A compact error object with:
/// - a stable error_code (domain + value); transport failures keep the transport's domain
/// - an optional detail string (human-oriented; may include the argument name or reply text)
/// - an optional underlying std::error_code (program-oriented; no nesting)
struct error_info {
  std::error_code code{};
  std::string detail{};
  std::error_code cause_ec{};

  error_info() = default;

  explicit error_info(std::error_code c) : code(c) {}

  error_info(std::error_code c, std::string d) : code(c), detail(std::move(d)) {}

  template <typename Errc>
    requires requires(Errc e) { std::error_code{e}; }
  explicit error_info(Errc e) : code(std::error_code{e}) {}

  template <typename Errc>
    requires requires(Errc e) { std::error_code{e}; }
  error_info(Errc e, std::string d) : code(std::error_code{e}), detail(std::move(d)) {}

  auto append_detail(std::string_view s) -> error_info& {
    if (s.empty()) {
      return *this;
    }
    if (!detail.empty()) {
      detail += " ";
    }
    detail.append(s.data(), s.size());
    return *this;
  }

  auto set_cause(std::error_code ec) -> error_info& {
    cause_ec = ec;
    return *this;
  }

  [[nodiscard]] auto to_string() const -> std::string {
    std::string out;

    if (code) {
      out += code.category().name();
      out += ": ";
      out += code.message();
    } else {
      out += "unknown error";
    }

    if (!detail.empty()) {
      out += " (";
      out += detail;
      out += ")";
      return out;
    }

    if (cause_ec) {
      out += " (cause=";
      out += cause_ec.category().name();
      out += ": ";
      out += cause_ec.message();
      out += ")";
    }

    return out;
  }
};

/// Shorthand for returning a library error from a function yielding expected<T, error_info>.
inline auto fail(error e, std::string detail = {}) -> unexpected<error_info> {
  return unexpected<error_info>{error_info{e, std::move(detail)}};
}

}  // namespace rediszset
