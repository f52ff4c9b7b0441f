#pragma once

#include <rediszset/adapter/error.hpp>
#include <rediszset/encoding.hpp>
#include <rediszset/expected.hpp>
#include <rediszset/resp3/message.hpp>
#include <rediszset/tuple.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace rediszset::adapter {

/// Reply -> C++ value conversion.
///
/// Accepts both protocol generations for the shapes sorted-set commands produce:
/// - scores arrive as RESP3 doubles or as RESP2 bulk strings ("1.5", "inf")
/// - booleans arrive as RESP3 booleans or RESP2 integers (0 / 1)
/// - scored member lists arrive nested ([[m, s], ...], RESP3) or flat ([m, s, m, s], RESP2)
///
/// Supported targets: std::string, integral types, bool, floating point, rediszset::tuple,
/// std::optional<U> (null -> nullopt) and sequences (std::vector<U>, ...).

namespace detail {

template <typename...>
inline constexpr bool dependent_false_v = false;

template <typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

template <typename T>
struct is_std_optional : std::false_type {};
template <typename U>
struct is_std_optional<std::optional<U>> : std::true_type {};

template <typename T>
inline constexpr bool is_std_optional_v = is_std_optional<remove_cvref_t<T>>::value;

template <typename T>
struct optional_value_type;
template <typename U>
struct optional_value_type<std::optional<U>> {
  using type = U;
};

template <typename T>
using optional_value_type_t = typename optional_value_type<remove_cvref_t<T>>::type;

template <typename T>
concept string_like = std::is_same_v<remove_cvref_t<T>, std::string>;

template <typename T>
concept bool_like = std::is_same_v<remove_cvref_t<T>, bool>;

template <typename T>
concept integral_like = std::is_integral_v<remove_cvref_t<T>> && !bool_like<T>;

template <typename T>
concept double_like = std::is_floating_point_v<remove_cvref_t<T>>;

template <typename T>
concept tuple_like = std::is_same_v<remove_cvref_t<T>, rediszset::tuple>;

template <typename T>
concept sequence_like =
  !string_like<T> &&
  requires { typename remove_cvref_t<T>::value_type; } &&
  requires(remove_cvref_t<T>& c, typename remove_cvref_t<T>::value_type v) {
    c.push_back(std::move(v));
  };

}  // namespace detail

template <typename T>
auto adapt(const resp3::message& msg) -> expected<T, error>;

namespace detail {

inline auto text_of(const resp3::message& msg) -> const std::string* {
  if (auto const* s = msg.try_as<resp3::bulk_string>()) {
    return &s->data;
  }
  if (auto const* s = msg.try_as<resp3::simple_string>()) {
    return &s->data;
  }
  if (auto const* s = msg.try_as<resp3::verbatim_string>()) {
    return &s->data;
  }
  return nullptr;
}

template <typename T>
auto adapt_scalar(const resp3::message& msg) -> expected<T, error> {
  using U = remove_cvref_t<T>;

  if constexpr (string_like<U>) {
    if (msg.is_null()) {
      return unexpected(make_unexpected_null(resp3::kind::bulk_string));
    }
    if (auto const* text = text_of(msg)) {
      return *text;
    }
    return unexpected(make_type_mismatch(
      msg.get_kind(),
      {resp3::kind::simple_string, resp3::kind::bulk_string, resp3::kind::verbatim_string}));
  } else if constexpr (integral_like<U>) {
    if (msg.is_null()) {
      return unexpected(make_unexpected_null(resp3::kind::integer));
    }
    if (!msg.is<resp3::integer>()) {
      return unexpected(make_type_mismatch(msg.get_kind(), {resp3::kind::integer}));
    }
    const auto v = msg.as<resp3::integer>().value;
    if (v < static_cast<std::int64_t>((std::numeric_limits<U>::min)()) ||
        v > static_cast<std::int64_t>((std::numeric_limits<U>::max)())) {
      return unexpected(make_value_out_of_range(resp3::kind::integer));
    }
    return static_cast<U>(v);
  } else if constexpr (bool_like<U>) {
    if (msg.is_null()) {
      return unexpected(make_unexpected_null(resp3::kind::boolean));
    }
    if (auto const* b = msg.try_as<resp3::boolean>()) {
      return b->value;
    }
    if (auto const* i = msg.try_as<resp3::integer>()) {
      return i->value != 0;
    }
    return unexpected(
      make_type_mismatch(msg.get_kind(), {resp3::kind::boolean, resp3::kind::integer}));
  } else if constexpr (double_like<U>) {
    if (msg.is_null()) {
      return unexpected(make_unexpected_null(resp3::kind::double_number));
    }
    if (auto const* d = msg.try_as<resp3::double_number>()) {
      return static_cast<U>(d->value);
    }
    if (auto const* i = msg.try_as<resp3::integer>()) {
      return static_cast<U>(i->value);
    }
    if (auto const* text = text_of(msg)) {
      auto parsed = parse_score(*text);
      if (!parsed) {
        return unexpected(make_invalid_value(msg.get_kind()));
      }
      return static_cast<U>(*parsed);
    }
    return unexpected(make_type_mismatch(
      msg.get_kind(), {resp3::kind::double_number, resp3::kind::bulk_string}));
  } else {
    static_assert(dependent_false_v<U>, "no scalar adapter for this type");
  }
}

template <typename T>
auto adapt_optional(const resp3::message& msg) -> expected<T, error> {
  using V = optional_value_type_t<T>;
  if (msg.is_null()) {
    return T{std::nullopt};
  }
  auto inner = adapt<V>(msg);
  if (!inner) {
    return unexpected(std::move(inner).error());
  }
  return T{std::move(*inner)};
}

/// Build a tuple from a member message and a score message.
inline auto pair_to_tuple(const resp3::message& member, const resp3::message& score)
  -> expected<rediszset::tuple, error> {
  auto m = adapt_scalar<std::string>(member);
  if (!m) {
    auto e = std::move(m).error();
    e.prepend_path(path_field{"member"});
    return unexpected(std::move(e));
  }
  auto s = adapt_scalar<double>(score);
  if (!s) {
    auto e = std::move(s).error();
    e.prepend_path(path_field{"score"});
    return unexpected(std::move(e));
  }
  return rediszset::tuple{std::move(*m), *s};
}

/// A single [member, score] pair.
inline auto adapt_tuple(const resp3::message& msg) -> expected<rediszset::tuple, error> {
  auto const* elems = msg.elements();
  if (elems == nullptr) {
    return unexpected(make_type_mismatch(msg.get_kind(), {resp3::kind::array}));
  }
  if (elems->size() != 2) {
    return unexpected(make_size_mismatch(msg.get_kind(), 2, elems->size()));
  }
  return pair_to_tuple((*elems)[0], (*elems)[1]);
}

template <typename T>
auto adapt_tuple_sequence(const resp3::message& msg, const std::vector<resp3::message>& elems)
  -> expected<T, error> {
  using U = remove_cvref_t<T>;
  U out{};

  // RESP3 nests each pair; RESP2 (and ZSCAN in both protocols) flattens them.
  const bool nested = !elems.empty() && elems.front().elements() != nullptr;
  if (nested) {
    for (std::size_t i = 0; i < elems.size(); ++i) {
      auto t = adapt_tuple(elems[i]);
      if (!t) {
        auto e = std::move(t).error();
        e.prepend_path(path_index{i});
        return unexpected(std::move(e));
      }
      out.push_back(std::move(*t));
    }
    return out;
  }

  if (elems.size() % 2 != 0) {
    return unexpected(make_size_mismatch(msg.get_kind(), elems.size() + 1, elems.size()));
  }
  for (std::size_t i = 0; i < elems.size(); i += 2) {
    auto t = pair_to_tuple(elems[i], elems[i + 1]);
    if (!t) {
      auto e = std::move(t).error();
      e.prepend_path(path_index{i / 2});
      return unexpected(std::move(e));
    }
    out.push_back(std::move(*t));
  }
  return out;
}

template <typename T>
auto adapt_sequence(const resp3::message& msg) -> expected<T, error> {
  using U = remove_cvref_t<T>;
  using V = typename U::value_type;

  auto const* elems = msg.elements();
  if (elems == nullptr) {
    return unexpected(make_type_mismatch(
      msg.get_kind(), {resp3::kind::array, resp3::kind::set, resp3::kind::push}));
  }

  if constexpr (tuple_like<V>) {
    return adapt_tuple_sequence<U>(msg, *elems);
  } else {
    U out{};
    for (std::size_t i = 0; i < elems->size(); ++i) {
      auto r = adapt<V>((*elems)[i]);
      if (!r) {
        auto e = std::move(r).error();
        e.prepend_path(path_index{i});
        return unexpected(std::move(e));
      }
      out.push_back(std::move(*r));
    }
    return out;
  }
}

}  // namespace detail

template <typename T>
auto adapt(const resp3::message& msg) -> expected<T, error> {
  using U = detail::remove_cvref_t<T>;

  if constexpr (detail::is_std_optional_v<U>) {
    return detail::adapt_optional<U>(msg);
  } else if constexpr (detail::tuple_like<U>) {
    return detail::adapt_tuple(msg);
  } else if constexpr (detail::sequence_like<U>) {
    return detail::adapt_sequence<U>(msg);
  } else {
    return detail::adapt_scalar<U>(msg);
  }
}

}  // namespace rediszset::adapter
