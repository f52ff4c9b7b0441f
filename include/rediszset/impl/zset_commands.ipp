#include <rediszset/converters.hpp>
#include <rediszset/encoding.hpp>
#include <rediszset/logger.hpp>
#include <rediszset/zset_commands.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace rediszset {

namespace {

template <typename T>
auto reject(error_info err) -> dispatch_result<T> {
  REDISZSET_LOG_DEBUG("rejected before dispatch: {}", err.to_string());
  return expected<T, error_info>{unexpected(std::move(err))};
}

auto check_required(std::string_view value, char const* what) -> expected<void, error_info> {
  if (value.data() == nullptr || value.empty()) {
    return fail(error::invalid_argument, std::string{what} + " must not be null or empty");
  }
  return {};
}

auto check_key(std::string_view key, char const* what = "key") -> expected<void, error_info> {
  return check_required(key, what);
}

auto check_member(std::string_view member) -> expected<void, error_info> {
  if (member.data() == nullptr) {
    return fail(error::invalid_argument, "member must not be null");
  }
  return {};
}

auto check_members(std::vector<std::string_view> const& members) -> expected<void, error_info> {
  if (members.empty()) {
    return fail(error::invalid_argument, "member list must not be empty");
  }
  if (std::any_of(members.begin(), members.end(),
                  [](std::string_view m) { return m.data() == nullptr; })) {
    return fail(error::invalid_argument, "member list must not contain null members");
  }
  return {};
}

auto check_keys(std::vector<std::string_view> const& keys) -> expected<void, error_info> {
  if (keys.empty()) {
    return fail(error::invalid_argument, "key list must not be empty");
  }
  for (auto k : keys) {
    if (auto ok = check_key(k, "every key in the list"); !ok) {
      return ok;
    }
  }
  return {};
}

auto check_score(double v, char const* what) -> expected<void, error_info> {
  if (std::isnan(v)) {
    return fail(error::invalid_argument, std::string{what} + " must not be NaN");
  }
  return {};
}

auto check_limit(limit const& l) -> expected<void, error_info> {
  if (l.is_unlimited()) {
    return {};
  }
  if (auto ok = check_int32(l.offset(), "offset"); !ok) {
    return ok;
  }
  return check_int32(l.count(), "count");
}

void push_limit(command& cmd, limit const& l) {
  if (!l.is_unlimited()) {
    cmd.push("LIMIT").push(l.offset()).push(l.count());
  }
}

/// Seconds as the blocking commands take them ("0.5", "2.0"; "0.0" blocks forever).
auto timeout_seconds(std::chrono::milliseconds timeout) -> std::string {
  return format_score(static_cast<double>(timeout.count()) / 1000.0);
}

auto is_cursor_token(std::string_view token) -> bool {
  return !token.empty() &&
         std::all_of(token.begin(), token.end(), [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace

zset_commands::zset_commands(connection& conn, config cfg)
    : cfg_(std::move(cfg)), dispatcher_(conn, cfg_) {}

// ---- add / remove / update ----

auto zset_commands::zadd(std::string_view key, double score, std::string_view member,
                         zadd_args const& args) -> dispatch_result<bool> {
  if (auto ok = check_key(key); !ok) {
    return reject<bool>(std::move(ok).error());
  }
  if (auto ok = check_member(member); !ok) {
    return reject<bool>(std::move(ok).error());
  }
  if (auto ok = check_score(score, "score"); !ok) {
    return reject<bool>(std::move(ok).error());
  }
  if (auto ok = args.validate(); !ok) {
    return reject<bool>(std::move(ok).error());
  }

  command cmd{"ZADD", key};
  args.append_to(cmd);
  cmd.push(score).push(member);
  return run<bool>(std::move(cmd), &convert::changed);
}

auto zset_commands::zadd(std::string_view key, std::vector<tuple> const& members,
                         zadd_args const& args) -> dispatch_result<std::int64_t> {
  if (auto ok = check_key(key); !ok) {
    return reject<std::int64_t>(std::move(ok).error());
  }
  if (members.empty()) {
    return reject<std::int64_t>(error_info{error::invalid_argument, "member list must not be empty"});
  }
  for (auto const& t : members) {
    if (auto ok = check_score(t.score(), "score"); !ok) {
      return reject<std::int64_t>(std::move(ok).error());
    }
  }
  if (auto ok = args.validate(); !ok) {
    return reject<std::int64_t>(std::move(ok).error());
  }

  command cmd{"ZADD", key};
  args.append_to(cmd);
  for (auto const& t : members) {
    cmd.push(t.score()).push(t.member());
  }
  return run<std::int64_t>(std::move(cmd), &convert::to<std::int64_t>);
}

auto zset_commands::zrem(std::string_view key, std::vector<std::string_view> const& members)
  -> dispatch_result<std::int64_t> {
  if (auto ok = check_key(key); !ok) {
    return reject<std::int64_t>(std::move(ok).error());
  }
  if (auto ok = check_members(members); !ok) {
    return reject<std::int64_t>(std::move(ok).error());
  }

  command cmd{"ZREM", key};
  cmd.push_all(members);
  return run<std::int64_t>(std::move(cmd), &convert::to<std::int64_t>);
}

auto zset_commands::zincrby(std::string_view key, double increment, std::string_view member)
  -> dispatch_result<double> {
  if (auto ok = check_key(key); !ok) {
    return reject<double>(std::move(ok).error());
  }
  if (auto ok = check_member(member); !ok) {
    return reject<double>(std::move(ok).error());
  }
  if (auto ok = check_score(increment, "increment"); !ok) {
    return reject<double>(std::move(ok).error());
  }
  return run<double>(command{"ZINCRBY", key, increment, member}, &convert::to<double>);
}

// ---- random members ----

auto zset_commands::zrandmember(std::string_view key)
  -> dispatch_result<std::optional<std::string>> {
  using result_t = std::optional<std::string>;
  if (auto ok = check_key(key); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  return run<result_t>(command{"ZRANDMEMBER", key}, &convert::to<result_t>);
}

auto zset_commands::zrandmember(std::string_view key, std::int64_t count)
  -> dispatch_result<std::vector<std::string>> {
  using result_t = std::vector<std::string>;
  if (auto ok = check_key(key); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  if (auto ok = check_int32(count, "count"); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  return run<result_t>(command{"ZRANDMEMBER", key, count}, &convert::to<result_t>);
}

auto zset_commands::zrandmember_with_score(std::string_view key)
  -> dispatch_result<std::optional<tuple>> {
  if (auto ok = check_key(key); !ok) {
    return reject<std::optional<tuple>>(std::move(ok).error());
  }
  return run<std::optional<tuple>>(command{"ZRANDMEMBER", key, 1, "WITHSCORES"},
                                   &convert::first_tuple);
}

auto zset_commands::zrandmember_with_scores(std::string_view key, std::int64_t count)
  -> dispatch_result<std::vector<tuple>> {
  using result_t = std::vector<tuple>;
  if (auto ok = check_key(key); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  if (auto ok = check_int32(count, "count"); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  return run<result_t>(command{"ZRANDMEMBER", key, count, "WITHSCORES"}, &convert::to<result_t>);
}

// ---- rank / score / cardinality ----

auto zset_commands::zrank(std::string_view key, std::string_view member)
  -> dispatch_result<std::optional<std::int64_t>> {
  using result_t = std::optional<std::int64_t>;
  if (auto ok = check_key(key); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  if (auto ok = check_member(member); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  return run<result_t>(command{"ZRANK", key, member}, &convert::to<result_t>);
}

auto zset_commands::zrevrank(std::string_view key, std::string_view member)
  -> dispatch_result<std::optional<std::int64_t>> {
  using result_t = std::optional<std::int64_t>;
  if (auto ok = check_key(key); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  if (auto ok = check_member(member); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  return run<result_t>(command{"ZREVRANK", key, member}, &convert::to<result_t>);
}

auto zset_commands::zcard(std::string_view key) -> dispatch_result<std::int64_t> {
  if (auto ok = check_key(key); !ok) {
    return reject<std::int64_t>(std::move(ok).error());
  }
  return run<std::int64_t>(command{"ZCARD", key}, &convert::to<std::int64_t>);
}

auto zset_commands::zscore(std::string_view key, std::string_view member)
  -> dispatch_result<std::optional<double>> {
  using result_t = std::optional<double>;
  if (auto ok = check_key(key); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  if (auto ok = check_member(member); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  return run<result_t>(command{"ZSCORE", key, member}, &convert::to<result_t>);
}

auto zset_commands::zmscore(std::string_view key, std::vector<std::string_view> const& members)
  -> dispatch_result<std::vector<std::optional<double>>> {
  using result_t = std::vector<std::optional<double>>;
  if (auto ok = check_key(key); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  if (auto ok = check_members(members); !ok) {
    return reject<result_t>(std::move(ok).error());
  }

  command cmd{"ZMSCORE", key};
  cmd.push_all(members);
  return run<result_t>(std::move(cmd), &convert::to<result_t>);
}

// ---- index ranges ----

auto zset_commands::zrange(std::string_view key, std::int64_t start, std::int64_t stop)
  -> dispatch_result<std::vector<std::string>> {
  using result_t = std::vector<std::string>;
  if (auto ok = check_key(key); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  return run<result_t>(command{"ZRANGE", key, start, stop}, &convert::to<result_t>);
}

auto zset_commands::zrange_with_scores(std::string_view key, std::int64_t start,
                                       std::int64_t stop) -> dispatch_result<std::vector<tuple>> {
  using result_t = std::vector<tuple>;
  if (auto ok = check_key(key); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  return run<result_t>(command{"ZRANGE", key, start, stop, "WITHSCORES"},
                       &convert::to<result_t>);
}

auto zset_commands::zrevrange(std::string_view key, std::int64_t start, std::int64_t stop)
  -> dispatch_result<std::vector<std::string>> {
  using result_t = std::vector<std::string>;
  if (auto ok = check_key(key); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  return run<result_t>(command{"ZREVRANGE", key, start, stop}, &convert::to<result_t>);
}

auto zset_commands::zrevrange_with_scores(std::string_view key, std::int64_t start,
                                          std::int64_t stop)
  -> dispatch_result<std::vector<tuple>> {
  using result_t = std::vector<tuple>;
  if (auto ok = check_key(key); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  return run<result_t>(command{"ZREVRANGE", key, start, stop, "WITHSCORES"},
                       &convert::to<result_t>);
}

// ---- score ranges ----

auto zset_commands::score_range_query(std::string_view name, std::string_view key,
                                      range const& r, limit const& l, bool reverse,
                                      bool with_scores) -> expected<command, error_info> {
  if (auto ok = check_key(key); !ok) {
    return unexpected(std::move(ok).error());
  }
  if (auto ok = check_limit(l); !ok) {
    return unexpected(std::move(ok).error());
  }
  auto bounds = encode_score_range(r);
  if (!bounds) {
    return unexpected(std::move(bounds).error());
  }

  command cmd{name, key};
  if (reverse) {
    cmd.push(std::move(bounds->max)).push(std::move(bounds->min));
  } else {
    cmd.push(std::move(bounds->min)).push(std::move(bounds->max));
  }
  if (with_scores) {
    cmd.push("WITHSCORES");
  }
  push_limit(cmd, l);
  return cmd;
}

auto zset_commands::zrangebyscore(std::string_view key, range const& r, limit const& l)
  -> dispatch_result<std::vector<std::string>> {
  using result_t = std::vector<std::string>;
  auto cmd = score_range_query("ZRANGEBYSCORE", key, r, l, false, false);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zrangebyscore(std::string_view key, std::string_view min,
                                  std::string_view max)
  -> dispatch_result<std::vector<std::string>> {
  using result_t = std::vector<std::string>;
  if (auto ok = check_key(key); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  if (auto ok = check_required(min, "min bound"); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  if (auto ok = check_required(max, "max bound"); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  return run<result_t>(command{"ZRANGEBYSCORE", key, min, max}, &convert::to<result_t>);
}

auto zset_commands::zrangebyscore(std::string_view key, std::string_view min,
                                  std::string_view max, std::int64_t offset, std::int64_t count)
  -> dispatch_result<std::vector<std::string>> {
  using result_t = std::vector<std::string>;
  if (auto ok = check_key(key); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  if (auto ok = check_required(min, "min bound"); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  if (auto ok = check_required(max, "max bound"); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  auto const page = limit::of(offset, count);
  if (auto ok = check_limit(page); !ok) {
    return reject<result_t>(std::move(ok).error());
  }

  command cmd{"ZRANGEBYSCORE", key, min, max};
  push_limit(cmd, page);
  return run<result_t>(std::move(cmd), &convert::to<result_t>);
}

auto zset_commands::zrangebyscore_with_scores(std::string_view key, range const& r,
                                              limit const& l)
  -> dispatch_result<std::vector<tuple>> {
  using result_t = std::vector<tuple>;
  auto cmd = score_range_query("ZRANGEBYSCORE", key, r, l, false, true);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zrevrangebyscore(std::string_view key, range const& r, limit const& l)
  -> dispatch_result<std::vector<std::string>> {
  using result_t = std::vector<std::string>;
  auto cmd = score_range_query("ZREVRANGEBYSCORE", key, r, l, true, false);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zrevrangebyscore_with_scores(std::string_view key, range const& r,
                                                 limit const& l)
  -> dispatch_result<std::vector<tuple>> {
  using result_t = std::vector<tuple>;
  auto cmd = score_range_query("ZREVRANGEBYSCORE", key, r, l, true, true);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zcount(std::string_view key, double min, double max)
  -> dispatch_result<std::int64_t> {
  return zcount(key, range::closed(min, max));
}

auto zset_commands::zcount(std::string_view key, range const& r)
  -> dispatch_result<std::int64_t> {
  auto cmd = score_range_query("ZCOUNT", key, r, limit::unlimited(), false, false);
  if (!cmd) {
    return reject<std::int64_t>(std::move(cmd).error());
  }
  return run<std::int64_t>(std::move(*cmd), &convert::to<std::int64_t>);
}

auto zset_commands::zremrangebyscore(std::string_view key, range const& r)
  -> dispatch_result<std::int64_t> {
  auto cmd = score_range_query("ZREMRANGEBYSCORE", key, r, limit::unlimited(), false, false);
  if (!cmd) {
    return reject<std::int64_t>(std::move(cmd).error());
  }
  return run<std::int64_t>(std::move(*cmd), &convert::to<std::int64_t>);
}

// ---- lexicographic ranges ----

auto zset_commands::lex_range_query(std::string_view name, std::string_view key,
                                    range const& r, limit const& l, bool reverse)
  -> expected<command, error_info> {
  if (auto ok = check_key(key); !ok) {
    return unexpected(std::move(ok).error());
  }
  if (auto ok = check_limit(l); !ok) {
    return unexpected(std::move(ok).error());
  }
  auto bounds = encode_lex_range(r);
  if (!bounds) {
    return unexpected(std::move(bounds).error());
  }

  command cmd{name, key};
  if (reverse) {
    cmd.push(std::move(bounds->max)).push(std::move(bounds->min));
  } else {
    cmd.push(std::move(bounds->min)).push(std::move(bounds->max));
  }
  push_limit(cmd, l);
  return cmd;
}

auto zset_commands::zrangebylex(std::string_view key, range const& r, limit const& l)
  -> dispatch_result<std::vector<std::string>> {
  using result_t = std::vector<std::string>;
  auto cmd = lex_range_query("ZRANGEBYLEX", key, r, l, false);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zrevrangebylex(std::string_view key, range const& r, limit const& l)
  -> dispatch_result<std::vector<std::string>> {
  using result_t = std::vector<std::string>;
  auto cmd = lex_range_query("ZREVRANGEBYLEX", key, r, l, true);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zlexcount(std::string_view key, range const& r)
  -> dispatch_result<std::int64_t> {
  auto cmd = lex_range_query("ZLEXCOUNT", key, r, limit::unlimited(), false);
  if (!cmd) {
    return reject<std::int64_t>(std::move(cmd).error());
  }
  return run<std::int64_t>(std::move(*cmd), &convert::to<std::int64_t>);
}

auto zset_commands::zremrangebylex(std::string_view key, range const& r)
  -> dispatch_result<std::int64_t> {
  auto cmd = lex_range_query("ZREMRANGEBYLEX", key, r, limit::unlimited(), false);
  if (!cmd) {
    return reject<std::int64_t>(std::move(cmd).error());
  }
  return run<std::int64_t>(std::move(*cmd), &convert::to<std::int64_t>);
}

auto zset_commands::zremrange(std::string_view key, std::int64_t start, std::int64_t stop)
  -> dispatch_result<std::int64_t> {
  if (auto ok = check_key(key); !ok) {
    return reject<std::int64_t>(std::move(ok).error());
  }
  return run<std::int64_t>(command{"ZREMRANGEBYRANK", key, start, stop},
                           &convert::to<std::int64_t>);
}

// ---- pop ----

auto zset_commands::zpopmin(std::string_view key) -> dispatch_result<std::optional<tuple>> {
  if (auto ok = check_key(key); !ok) {
    return reject<std::optional<tuple>>(std::move(ok).error());
  }
  return run<std::optional<tuple>>(command{"ZPOPMIN", key}, &convert::first_tuple);
}

auto zset_commands::zpopmin(std::string_view key, std::int64_t count)
  -> dispatch_result<std::vector<tuple>> {
  using result_t = std::vector<tuple>;
  if (auto ok = check_key(key); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  if (auto ok = check_int32(count, "count"); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  return run<result_t>(command{"ZPOPMIN", key, count}, &convert::to<result_t>);
}

auto zset_commands::zpopmax(std::string_view key) -> dispatch_result<std::optional<tuple>> {
  if (auto ok = check_key(key); !ok) {
    return reject<std::optional<tuple>>(std::move(ok).error());
  }
  return run<std::optional<tuple>>(command{"ZPOPMAX", key}, &convert::first_tuple);
}

auto zset_commands::zpopmax(std::string_view key, std::int64_t count)
  -> dispatch_result<std::vector<tuple>> {
  using result_t = std::vector<tuple>;
  if (auto ok = check_key(key); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  if (auto ok = check_int32(count, "count"); !ok) {
    return reject<result_t>(std::move(ok).error());
  }
  return run<result_t>(command{"ZPOPMAX", key, count}, &convert::to<result_t>);
}

auto zset_commands::bzpopmin(std::string_view key, std::chrono::milliseconds timeout)
  -> dispatch_result<std::optional<tuple>> {
  if (auto ok = check_key(key); !ok) {
    return reject<std::optional<tuple>>(std::move(ok).error());
  }
  if (timeout.count() < 0) {
    return reject<std::optional<tuple>>(
      error_info{error::invalid_argument, "timeout must not be negative"});
  }
  return run<std::optional<tuple>>(command{"BZPOPMIN", key, timeout_seconds(timeout)},
                                   &convert::blocking_pop);
}

auto zset_commands::bzpopmax(std::string_view key, std::chrono::milliseconds timeout)
  -> dispatch_result<std::optional<tuple>> {
  if (auto ok = check_key(key); !ok) {
    return reject<std::optional<tuple>>(std::move(ok).error());
  }
  if (timeout.count() < 0) {
    return reject<std::optional<tuple>>(
      error_info{error::invalid_argument, "timeout must not be negative"});
  }
  return run<std::optional<tuple>>(command{"BZPOPMAX", key, timeout_seconds(timeout)},
                                   &convert::blocking_pop);
}

// ---- multi-set ----

auto zset_commands::set_operation(std::string_view name, std::optional<std::string_view> dst,
                                  std::vector<std::string_view> const& keys,
                                  aggregation_params const* params, bool with_scores)
  -> expected<command, error_info> {
  if (dst.has_value()) {
    if (auto ok = check_key(*dst, "destination key"); !ok) {
      return unexpected(std::move(ok).error());
    }
  }
  if (auto ok = check_keys(keys); !ok) {
    return unexpected(std::move(ok).error());
  }

  command cmd{name};
  if (dst.has_value()) {
    cmd.push(*dst);
  }
  cmd.push(keys.size()).push_all(keys);
  if (params != nullptr) {
    params->append_to(cmd);
  }
  if (with_scores) {
    cmd.push("WITHSCORES");
  }
  return cmd;
}

auto zset_commands::weighted_set_operation(std::string_view name,
                                           std::optional<std::string_view> dst, aggregate agg,
                                           weights const& w,
                                           std::vector<std::string_view> const& keys,
                                           bool with_scores) -> expected<command, error_info> {
  if (auto ok = check_weights(w, keys.size()); !ok) {
    return unexpected(std::move(ok).error());
  }
  for (auto v : w.values()) {
    if (auto ok = check_score(v, "weight"); !ok) {
      return unexpected(std::move(ok).error());
    }
  }
  auto const params = build_aggregation_params(agg, w);
  return set_operation(name, dst, keys, &params, with_scores);
}

auto zset_commands::zdiff(std::vector<std::string_view> const& keys)
  -> dispatch_result<std::vector<std::string>> {
  using result_t = std::vector<std::string>;
  auto cmd = set_operation("ZDIFF", std::nullopt, keys, nullptr, false);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zdiff_with_scores(std::vector<std::string_view> const& keys)
  -> dispatch_result<std::vector<tuple>> {
  using result_t = std::vector<tuple>;
  auto cmd = set_operation("ZDIFF", std::nullopt, keys, nullptr, true);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zdiffstore(std::string_view dst, std::vector<std::string_view> const& keys)
  -> dispatch_result<std::int64_t> {
  auto cmd = set_operation("ZDIFFSTORE", dst, keys, nullptr, false);
  if (!cmd) {
    return reject<std::int64_t>(std::move(cmd).error());
  }
  return run<std::int64_t>(std::move(*cmd), &convert::to<std::int64_t>);
}

auto zset_commands::zinter(std::vector<std::string_view> const& keys)
  -> dispatch_result<std::vector<std::string>> {
  using result_t = std::vector<std::string>;
  auto cmd = set_operation("ZINTER", std::nullopt, keys, nullptr, false);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zinter(aggregate agg, weights const& w,
                           std::vector<std::string_view> const& keys)
  -> dispatch_result<std::vector<std::string>> {
  using result_t = std::vector<std::string>;
  auto cmd = weighted_set_operation("ZINTER", std::nullopt, agg, w, keys, false);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zinter_with_scores(std::vector<std::string_view> const& keys)
  -> dispatch_result<std::vector<tuple>> {
  using result_t = std::vector<tuple>;
  auto cmd = set_operation("ZINTER", std::nullopt, keys, nullptr, true);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zinter_with_scores(aggregate agg, weights const& w,
                                       std::vector<std::string_view> const& keys)
  -> dispatch_result<std::vector<tuple>> {
  using result_t = std::vector<tuple>;
  auto cmd = weighted_set_operation("ZINTER", std::nullopt, agg, w, keys, true);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zinterstore(std::string_view dst, std::vector<std::string_view> const& keys)
  -> dispatch_result<std::int64_t> {
  auto cmd = set_operation("ZINTERSTORE", dst, keys, nullptr, false);
  if (!cmd) {
    return reject<std::int64_t>(std::move(cmd).error());
  }
  return run<std::int64_t>(std::move(*cmd), &convert::to<std::int64_t>);
}

auto zset_commands::zinterstore(std::string_view dst, aggregate agg, weights const& w,
                                std::vector<std::string_view> const& keys)
  -> dispatch_result<std::int64_t> {
  auto cmd = weighted_set_operation("ZINTERSTORE", dst, agg, w, keys, false);
  if (!cmd) {
    return reject<std::int64_t>(std::move(cmd).error());
  }
  return run<std::int64_t>(std::move(*cmd), &convert::to<std::int64_t>);
}

auto zset_commands::zunion(std::vector<std::string_view> const& keys)
  -> dispatch_result<std::vector<std::string>> {
  using result_t = std::vector<std::string>;
  auto cmd = set_operation("ZUNION", std::nullopt, keys, nullptr, false);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zunion(aggregate agg, weights const& w,
                           std::vector<std::string_view> const& keys)
  -> dispatch_result<std::vector<std::string>> {
  using result_t = std::vector<std::string>;
  auto cmd = weighted_set_operation("ZUNION", std::nullopt, agg, w, keys, false);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zunion_with_scores(std::vector<std::string_view> const& keys)
  -> dispatch_result<std::vector<tuple>> {
  using result_t = std::vector<tuple>;
  auto cmd = set_operation("ZUNION", std::nullopt, keys, nullptr, true);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zunion_with_scores(aggregate agg, weights const& w,
                                       std::vector<std::string_view> const& keys)
  -> dispatch_result<std::vector<tuple>> {
  using result_t = std::vector<tuple>;
  auto cmd = weighted_set_operation("ZUNION", std::nullopt, agg, w, keys, true);
  if (!cmd) {
    return reject<result_t>(std::move(cmd).error());
  }
  return run<result_t>(std::move(*cmd), &convert::to<result_t>);
}

auto zset_commands::zunionstore(std::string_view dst, std::vector<std::string_view> const& keys)
  -> dispatch_result<std::int64_t> {
  auto cmd = set_operation("ZUNIONSTORE", dst, keys, nullptr, false);
  if (!cmd) {
    return reject<std::int64_t>(std::move(cmd).error());
  }
  return run<std::int64_t>(std::move(*cmd), &convert::to<std::int64_t>);
}

auto zset_commands::zunionstore(std::string_view dst, aggregate agg, weights const& w,
                                std::vector<std::string_view> const& keys)
  -> dispatch_result<std::int64_t> {
  auto cmd = weighted_set_operation("ZUNIONSTORE", dst, agg, w, keys, false);
  if (!cmd) {
    return reject<std::int64_t>(std::move(cmd).error());
  }
  return run<std::int64_t>(std::move(*cmd), &convert::to<std::int64_t>);
}

// ---- scan ----

auto zset_commands::zscan(std::string_view key, scan_options const& options)
  -> expected<cursor<tuple>, error_info> {
  return zscan(key, cursor<tuple>::start_token, options);
}

auto zset_commands::zscan(std::string_view key, std::string_view start_cursor,
                          scan_options const& options) -> expected<cursor<tuple>, error_info> {
  // Cursor steps never go through the queue.
  if (auto const mode = dispatcher_.mode(); is_queueing(mode)) {
    REDISZSET_LOG_DEBUG("zscan rejected in {} mode", to_string(mode));
    return fail(error::unsupported_in_mode,
                std::string{"cursor scans are not available in "} + to_string(mode) + " mode");
  }
  if (auto ok = check_key(key); !ok) {
    return unexpected(std::move(ok).error());
  }
  if (!is_cursor_token(start_cursor)) {
    return fail(error::invalid_argument, "cursor id must be an unsigned decimal integer");
  }

  auto count = options.count.has_value() ? options.count : cfg_.default_scan_count;
  if (count.has_value()) {
    if (auto ok = check_int32(*count, "count"); !ok) {
      return unexpected(std::move(ok).error());
    }
    if (*count <= 0) {
      return fail(error::invalid_argument, "scan count must be positive");
    }
  }

  auto step = [key = std::string{key}, match = options.match,
               count](std::string_view token) -> command {
    command cmd{"ZSCAN", key, token};
    if (match.has_value()) {
      cmd.push("MATCH").push(*match);
    }
    if (count.has_value()) {
      cmd.push("COUNT").push(*count);
    }
    return cmd;
  };

  return cursor<tuple>{dispatcher_, std::move(step), &convert::to_scan_page<tuple>,
                       std::string{start_cursor}};
}

}  // namespace rediszset
