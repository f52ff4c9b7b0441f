#pragma once

#include <rediszset/resp3/kind.hpp>
#include <rediszset/resp3/value.hpp>

#include <concepts>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace rediszset::resp3 {

namespace detail {

template <typename T>
concept has_kind_id = requires {
  { T::kind_id } -> std::convertible_to<kind>;
};

template <typename... Ts>
constexpr bool all_have_kind_id = (has_kind_id<Ts> && ...);

}  // namespace detail

// clang-format off

/// One complete reply as handed over by the connection.
///
/// The command layer never parses bytes itself: the connection (an external collaborator)
/// owns the RESP parser and delivers fully-built replies. Both RESP2 and RESP3 shapes are
/// represented (RESP2 replies simply never use the RESP3-only kinds).
struct message {
  using value_type = std::variant<
    // Simple types
    simple_string,
    simple_error,
    integer,
    double_number,
    boolean,
    big_number,
    null,

    // Bulk types
    bulk_string,
    bulk_error,
    verbatim_string,

    // Aggregate types
    array,
    map,
    set,
    push
  >;

  static_assert(detail::all_have_kind_id<
    simple_string, simple_error, integer, double_number, boolean, big_number, null,
    bulk_string, bulk_error, verbatim_string,
    array, map, set, push
  >, "All RESP3 value types must have a static kind_id member");

  value_type value;

  message() : value(null{}) {}

  template <typename T>
    requires(std::constructible_from<value_type, T> &&
             !std::is_same_v<std::remove_cvref_t<T>, message>)
  explicit message(T&& val) : value(std::forward<T>(val)) {}

  [[nodiscard]] auto get_kind() const -> kind {
    return std::visit([](const auto& val) -> kind {
      using T = std::decay_t<decltype(val)>;
      return T::kind_id;
    }, value);
  }

  template <typename T>
  [[nodiscard]] bool is() const {
    return std::holds_alternative<T>(value);
  }

  /// Throws std::bad_variant_access if the type doesn't match.
  template <typename T>
  [[nodiscard]] auto as() const -> const T& {
    return std::get<T>(value);
  }

  /// Returns nullptr if the type doesn't match.
  template <typename T>
  [[nodiscard]] auto try_as() const -> const T* {
    return std::get_if<T>(&value);
  }

  [[nodiscard]] bool is_null() const { return is<null>(); }

  [[nodiscard]] bool is_error() const {
    return is<simple_error>() || is<bulk_error>();
  }

  /// Text of an error reply; empty for any other kind.
  [[nodiscard]] auto error_text() const -> std::string_view {
    if (auto const* e = try_as<simple_error>()) {
      return e->message;
    }
    if (auto const* e = try_as<bulk_error>()) {
      return e->message;
    }
    return {};
  }

  /// Elements of an array, set or push reply; nullptr for any other kind.
  [[nodiscard]] auto elements() const -> const std::vector<message>* {
    if (auto const* a = try_as<array>()) {
      return &a->elements;
    }
    if (auto const* s = try_as<set>()) {
      return &s->elements;
    }
    if (auto const* p = try_as<push>()) {
      return &p->elements;
    }
    return nullptr;
  }
};

// clang-format on

}  // namespace rediszset::resp3
