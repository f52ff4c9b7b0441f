#pragma once

#include <rediszset/adapter/adapt.hpp>
#include <rediszset/error_info.hpp>
#include <rediszset/expected.hpp>
#include <rediszset/resp3/message.hpp>
#include <rediszset/tuple.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rediszset::convert {

/// Generic conversion through the adapter; failures become error::unexpected_reply.
template <typename T>
auto to(resp3::message const& msg) -> expected<T, error_info> {
  auto r = adapter::adapt<T>(msg);
  if (!r) {
    return unexpected(r.error().to_error_info());
  }
  return std::move(*r);
}

/// Integer reply read as "did anything change" (single-member ZADD).
inline auto changed(resp3::message const& msg) -> expected<bool, error_info> {
  auto n = to<std::int64_t>(msg);
  if (!n) {
    return unexpected(std::move(n).error());
  }
  return *n > 0;
}

/// At most one scored member: null, [], [m, s] or [[m, s]].
/// Used by ZPOPMIN / ZPOPMAX without count and ZRANDMEMBER key 1 WITHSCORES.
inline auto first_tuple(resp3::message const& msg) -> expected<std::optional<tuple>, error_info> {
  auto items = to<std::optional<std::vector<tuple>>>(msg);
  if (!items) {
    return unexpected(std::move(items).error());
  }
  if (!items->has_value() || (*items)->empty()) {
    return std::optional<tuple>{};
  }
  return std::optional<tuple>{std::move((*items)->front())};
}

/// BZPOPMIN / BZPOPMAX: [key, member, score], or null on timeout.
inline auto blocking_pop(resp3::message const& msg)
  -> expected<std::optional<tuple>, error_info> {
  if (msg.is_null()) {
    return std::optional<tuple>{};
  }
  auto const* elems = msg.elements();
  if (elems == nullptr || elems->size() != 3) {
    return fail(error::unexpected_reply,
                "blocking pop reply must be a [key, member, score] array");
  }
  auto member = to<std::string>((*elems)[1]);
  if (!member) {
    return unexpected(std::move(member).error());
  }
  auto score = to<double>((*elems)[2]);
  if (!score) {
    return unexpected(std::move(score).error());
  }
  return std::optional<tuple>{tuple{std::move(*member), *score}};
}

/// One SCAN-family page.
template <typename T>
struct scan_page {
  std::string cursor;
  std::vector<T> items;
};

/// [cursor, [items...]]. Scored items arrive flat in both protocol versions.
template <typename T>
auto to_scan_page(resp3::message const& msg) -> expected<scan_page<T>, error_info> {
  auto const* elems = msg.elements();
  if (elems == nullptr || elems->size() != 2) {
    return fail(error::unexpected_reply, "scan reply must be a [cursor, elements] array");
  }
  auto token = to<std::string>((*elems)[0]);
  if (!token) {
    return unexpected(std::move(token).error());
  }
  auto items = to<std::vector<T>>((*elems)[1]);
  if (!items) {
    return unexpected(std::move(items).error());
  }
  return scan_page<T>{std::move(*token), std::move(*items)};
}

}  // namespace rediszset::convert
