#pragma once

#include <rediszset/aggregation.hpp>
#include <rediszset/config.hpp>
#include <rediszset/connection.hpp>
#include <rediszset/cursor.hpp>
#include <rediszset/dispatcher.hpp>
#include <rediszset/error_info.hpp>
#include <rediszset/expected.hpp>
#include <rediszset/options.hpp>
#include <rediszset/range.hpp>
#include <rediszset/tuple.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rediszset {

/// Sorted-set commands over a connection.
///
/// Every call validates its arguments first (nothing is sent on failure), encodes ranges and
/// aggregation clauses, then goes through the dispatcher: direct mode resolves the result
/// before returning, pipelined / transactional mode returns a deferred result.
///
/// Arguments:
/// - keys must be non-empty
/// - a default-constructed std::string_view (null data) is a missing member and is rejected;
///   the empty member "" is valid
/// - member / key lists must be non-empty
/// - scores must not be NaN
/// - offsets and counts must fit a signed 32-bit integer
///
/// The connection must outlive this object and every cursor it creates.
class zset_commands {
 public:
  explicit zset_commands(connection& conn, config cfg = {});

  [[nodiscard]] auto get_config() const noexcept -> config const& { return cfg_; }

  // ---- add / remove / update ----

  /// ZADD key [flags] score member -> true when the member was added (or changed, with CH).
  auto zadd(std::string_view key, double score, std::string_view member,
            zadd_args const& args = {}) -> dispatch_result<bool>;

  /// ZADD key [flags] s1 m1 s2 m2 ... -> number of added (or changed, with CH) members.
  auto zadd(std::string_view key, std::vector<tuple> const& members, zadd_args const& args = {})
    -> dispatch_result<std::int64_t>;

  auto zrem(std::string_view key, std::vector<std::string_view> const& members)
    -> dispatch_result<std::int64_t>;

  /// New score of `member`.
  auto zincrby(std::string_view key, double increment, std::string_view member)
    -> dispatch_result<double>;

  // ---- random members ----

  auto zrandmember(std::string_view key) -> dispatch_result<std::optional<std::string>>;

  /// Negative counts allow repeated members.
  auto zrandmember(std::string_view key, std::int64_t count)
    -> dispatch_result<std::vector<std::string>>;

  auto zrandmember_with_score(std::string_view key) -> dispatch_result<std::optional<tuple>>;

  auto zrandmember_with_scores(std::string_view key, std::int64_t count)
    -> dispatch_result<std::vector<tuple>>;

  // ---- rank / score / cardinality ----

  auto zrank(std::string_view key, std::string_view member)
    -> dispatch_result<std::optional<std::int64_t>>;

  auto zrevrank(std::string_view key, std::string_view member)
    -> dispatch_result<std::optional<std::int64_t>>;

  auto zcard(std::string_view key) -> dispatch_result<std::int64_t>;

  auto zscore(std::string_view key, std::string_view member)
    -> dispatch_result<std::optional<double>>;

  /// One entry per member, nullopt for members not in the set.
  auto zmscore(std::string_view key, std::vector<std::string_view> const& members)
    -> dispatch_result<std::vector<std::optional<double>>>;

  // ---- index ranges ----

  auto zrange(std::string_view key, std::int64_t start, std::int64_t stop)
    -> dispatch_result<std::vector<std::string>>;

  auto zrange_with_scores(std::string_view key, std::int64_t start, std::int64_t stop)
    -> dispatch_result<std::vector<tuple>>;

  auto zrevrange(std::string_view key, std::int64_t start, std::int64_t stop)
    -> dispatch_result<std::vector<std::string>>;

  auto zrevrange_with_scores(std::string_view key, std::int64_t start, std::int64_t stop)
    -> dispatch_result<std::vector<tuple>>;

  // ---- score ranges ----

  auto zrangebyscore(std::string_view key, range const& r, limit const& l = limit::unlimited())
    -> dispatch_result<std::vector<std::string>>;

  /// Already-encoded bounds ("(1.5", "-inf", ...), sent as given.
  auto zrangebyscore(std::string_view key, std::string_view min, std::string_view max)
    -> dispatch_result<std::vector<std::string>>;

  auto zrangebyscore(std::string_view key, std::string_view min, std::string_view max,
                     std::int64_t offset, std::int64_t count)
    -> dispatch_result<std::vector<std::string>>;

  auto zrangebyscore_with_scores(std::string_view key, range const& r,
                                 limit const& l = limit::unlimited())
    -> dispatch_result<std::vector<tuple>>;

  /// Highest score first. The range is still given as (min, max).
  auto zrevrangebyscore(std::string_view key, range const& r, limit const& l = limit::unlimited())
    -> dispatch_result<std::vector<std::string>>;

  auto zrevrangebyscore_with_scores(std::string_view key, range const& r,
                                    limit const& l = limit::unlimited())
    -> dispatch_result<std::vector<tuple>>;

  /// Members with min <= score <= max.
  auto zcount(std::string_view key, double min, double max) -> dispatch_result<std::int64_t>;

  auto zcount(std::string_view key, range const& r) -> dispatch_result<std::int64_t>;

  auto zremrangebyscore(std::string_view key, range const& r) -> dispatch_result<std::int64_t>;

  // ---- lexicographic ranges ----

  auto zrangebylex(std::string_view key, range const& r, limit const& l = limit::unlimited())
    -> dispatch_result<std::vector<std::string>>;

  auto zrevrangebylex(std::string_view key, range const& r, limit const& l = limit::unlimited())
    -> dispatch_result<std::vector<std::string>>;

  auto zlexcount(std::string_view key, range const& r) -> dispatch_result<std::int64_t>;

  auto zremrangebylex(std::string_view key, range const& r) -> dispatch_result<std::int64_t>;

  /// ZREMRANGEBYRANK.
  auto zremrange(std::string_view key, std::int64_t start, std::int64_t stop)
    -> dispatch_result<std::int64_t>;

  // ---- pop ----

  auto zpopmin(std::string_view key) -> dispatch_result<std::optional<tuple>>;
  auto zpopmin(std::string_view key, std::int64_t count) -> dispatch_result<std::vector<tuple>>;
  auto zpopmax(std::string_view key) -> dispatch_result<std::optional<tuple>>;
  auto zpopmax(std::string_view key, std::int64_t count) -> dispatch_result<std::vector<tuple>>;

  /// Blocks the connection up to `timeout` (zero: forever). nullopt on timeout.
  auto bzpopmin(std::string_view key, std::chrono::milliseconds timeout)
    -> dispatch_result<std::optional<tuple>>;

  auto bzpopmax(std::string_view key, std::chrono::milliseconds timeout)
    -> dispatch_result<std::optional<tuple>>;

  // ---- multi-set ----

  /// Members of the first set missing from all the others.
  auto zdiff(std::vector<std::string_view> const& keys)
    -> dispatch_result<std::vector<std::string>>;

  auto zdiff_with_scores(std::vector<std::string_view> const& keys)
    -> dispatch_result<std::vector<tuple>>;

  auto zdiffstore(std::string_view dst, std::vector<std::string_view> const& keys)
    -> dispatch_result<std::int64_t>;

  auto zinter(std::vector<std::string_view> const& keys)
    -> dispatch_result<std::vector<std::string>>;

  auto zinter(aggregate agg, weights const& w, std::vector<std::string_view> const& keys)
    -> dispatch_result<std::vector<std::string>>;

  auto zinter_with_scores(std::vector<std::string_view> const& keys)
    -> dispatch_result<std::vector<tuple>>;

  auto zinter_with_scores(aggregate agg, weights const& w,
                          std::vector<std::string_view> const& keys)
    -> dispatch_result<std::vector<tuple>>;

  auto zinterstore(std::string_view dst, std::vector<std::string_view> const& keys)
    -> dispatch_result<std::int64_t>;

  auto zinterstore(std::string_view dst, aggregate agg, weights const& w,
                   std::vector<std::string_view> const& keys) -> dispatch_result<std::int64_t>;

  auto zunion(std::vector<std::string_view> const& keys)
    -> dispatch_result<std::vector<std::string>>;

  auto zunion(aggregate agg, weights const& w, std::vector<std::string_view> const& keys)
    -> dispatch_result<std::vector<std::string>>;

  auto zunion_with_scores(std::vector<std::string_view> const& keys)
    -> dispatch_result<std::vector<tuple>>;

  auto zunion_with_scores(aggregate agg, weights const& w,
                          std::vector<std::string_view> const& keys)
    -> dispatch_result<std::vector<tuple>>;

  auto zunionstore(std::string_view dst, std::vector<std::string_view> const& keys)
    -> dispatch_result<std::int64_t>;

  auto zunionstore(std::string_view dst, aggregate agg, weights const& w,
                   std::vector<std::string_view> const& keys) -> dispatch_result<std::int64_t>;

  // ---- scan ----

  /// Cursor over (member, score) pairs. The first round trip happens on next().
  /// Fails with error::unsupported_in_mode while the connection is pipelined or transactional.
  auto zscan(std::string_view key, scan_options const& options = {})
    -> expected<cursor<tuple>, error_info>;

  /// Resume from a cursor id a previous scan returned.
  auto zscan(std::string_view key, std::string_view start_cursor,
             scan_options const& options = {}) -> expected<cursor<tuple>, error_info>;

 private:
  template <typename T>
  auto run(command cmd, reply_converter<T> convert) -> dispatch_result<T> {
    return dispatcher_.invoke(command_spec<T>{std::move(cmd), convert});
  }

  auto score_range_query(std::string_view name, std::string_view key, range const& r,
                         limit const& l, bool reverse, bool with_scores)
    -> expected<command, error_info>;

  auto lex_range_query(std::string_view name, std::string_view key, range const& r,
                       limit const& l, bool reverse) -> expected<command, error_info>;

  auto set_operation(std::string_view name, std::optional<std::string_view> dst,
                     std::vector<std::string_view> const& keys,
                     aggregation_params const* params, bool with_scores)
    -> expected<command, error_info>;

  auto weighted_set_operation(std::string_view name, std::optional<std::string_view> dst,
                              aggregate agg, weights const& w,
                              std::vector<std::string_view> const& keys, bool with_scores)
    -> expected<command, error_info>;

  config cfg_;
  dispatcher dispatcher_;
};

}  // namespace rediszset
