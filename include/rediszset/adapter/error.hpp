#pragma once

#include <rediszset/error.hpp>
#include <rediszset/error_info.hpp>
#include <rediszset/resp3/kind.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace rediszset::adapter {

enum class error_kind : std::uint8_t {
  type_mismatch,
  unexpected_null,
  value_out_of_range,
  size_mismatch,
  invalid_value,
};

struct path_index {
  std::size_t index{};
};

struct path_field {
  std::string field;  // owning for stable diagnostics
};

using path_element = std::variant<path_index, path_field>;

/// Structured reply-conversion failure, e.g. "$[3].score: expected double, got map".
struct error {
  error_kind kind{};
  resp3::kind actual_type{};
  std::vector<resp3::kind> expected_types{};  // empty means "unknown / not applicable"
  std::vector<path_element> path{};
  std::optional<std::size_t> expected_size{};
  std::optional<std::size_t> got_size{};
  mutable std::optional<std::string> cached_message{};

  auto prepend_path(path_element el) -> void {
    path.insert(path.begin(), std::move(el));
    cached_message.reset();
  }

  [[nodiscard]] auto to_string() const -> const std::string& {
    if (!cached_message.has_value()) {
      cached_message = format_message(*this);
    }
    return *cached_message;
  }

  /// Project onto the library taxonomy: error::unexpected_reply with the path message.
  [[nodiscard]] auto to_error_info() const -> error_info {
    return error_info{rediszset::error::unexpected_reply, to_string()};
  }

  [[nodiscard]] static auto format_message(const error& e) -> std::string;
};

namespace detail {

inline auto make_type_mismatch(resp3::kind actual, std::vector<resp3::kind> expected) -> error {
  return error{
    .kind = error_kind::type_mismatch,
    .actual_type = actual,
    .expected_types = std::move(expected),
  };
}

inline auto make_unexpected_null(resp3::kind expected) -> error {
  return error{
    .kind = error_kind::unexpected_null,
    .actual_type = resp3::kind::null,
    .expected_types = {expected},
  };
}

inline auto make_value_out_of_range(resp3::kind k) -> error {
  return error{
    .kind = error_kind::value_out_of_range,
    .actual_type = k,
    .expected_types = {k},
  };
}

inline auto make_invalid_value(resp3::kind k) -> error {
  return error{
    .kind = error_kind::invalid_value,
    .actual_type = k,
  };
}

inline auto make_size_mismatch(resp3::kind actual, std::size_t expected, std::size_t got)
  -> error {
  return error{
    .kind = error_kind::size_mismatch,
    .actual_type = actual,
    .expected_size = expected,
    .got_size = got,
  };
}

}  // namespace detail

inline auto error::format_message(const error& e) -> std::string {
  auto type_to_string = [](resp3::kind k) -> std::string {
    return resp3::to_string(k);
  };

  std::string path = "$";
  for (const auto& el : e.path) {
    std::visit(
      [&](const auto& v) {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, path_index>) {
          path += "[" + std::to_string(v.index) + "]";
        } else {
          path += "." + v.field;
        }
      },
      el);
  }

  switch (e.kind) {
    case error_kind::type_mismatch: {
      if (e.expected_types.empty()) {
        return path + ": expected <?>, got " + type_to_string(e.actual_type);
      }
      if (e.expected_types.size() == 1) {
        return path + ": expected " + type_to_string(e.expected_types[0]) + ", got " +
               type_to_string(e.actual_type);
      }
      std::string exp = "any of: ";
      for (std::size_t i = 0; i < e.expected_types.size(); ++i) {
        if (i != 0) {
          exp += ", ";
        }
        exp += type_to_string(e.expected_types[i]);
      }
      return path + ": expected (" + exp + "), got " + type_to_string(e.actual_type);
    }
    case error_kind::unexpected_null: {
      if (e.expected_types.size() == 1) {
        return path + ": unexpected null (expected " + type_to_string(e.expected_types[0]) + ")";
      }
      return path + ": unexpected null";
    }
    case error_kind::value_out_of_range: {
      return path + ": value out of range for " + type_to_string(e.actual_type);
    }
    case error_kind::size_mismatch: {
      if (e.expected_size.has_value() && e.got_size.has_value()) {
        return path + ": size mismatch (expected " + std::to_string(*e.expected_size) +
               ", got " + std::to_string(*e.got_size) + ")";
      }
      return path + ": size mismatch";
    }
    case error_kind::invalid_value: {
      return path + ": invalid " + type_to_string(e.actual_type) + " value";
    }
  }
  return path + ": adapter error";
}

}  // namespace rediszset::adapter
