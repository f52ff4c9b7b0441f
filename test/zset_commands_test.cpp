#include <rediszset/zset_commands.hpp>

#include "support/fake_connection.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace rediszset;
using namespace rediszset::test_support;

using args_t = std::vector<std::string>;

class ZsetCommandsTest : public ::testing::Test {
 protected:
  fake_connection conn;
  zset_commands z{conn};
};

// === Argument encoding ===

TEST_F(ZsetCommandsTest, ZaddSingleWithFlags) {
  conn.script(integer(1));
  auto r = z.zadd("k", 1.5, "m", zadd_args{.xx = true, .gt = true, .ch = true});
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(*r.get());
  EXPECT_EQ(conn.argv(0), (args_t{"ZADD", "k", "XX", "GT", "CH", "1.5", "m"}));
}

TEST_F(ZsetCommandsTest, ZaddSingleNotAdded) {
  conn.script(integer(0));
  auto r = z.zadd("k", 1.0, "m");
  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(*r.get());
}

TEST_F(ZsetCommandsTest, ZaddMany) {
  auto r = z.zadd("k", {tuple{"a", 1.0}, tuple{"b", 2.0}, tuple{"", 3.0}});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r.get(), 3);
  EXPECT_EQ(conn.argv(0), (args_t{"ZADD", "k", "1.0", "a", "2.0", "b", "3.0", ""}));
}

TEST_F(ZsetCommandsTest, ZremAndZmscore) {
  conn.script(integer(2));
  conn.script(arr({bulk("1.5"), nil()}));

  EXPECT_EQ(*z.zrem("k", {"a", "b"}).get(), 2);
  auto scores = z.zmscore("k", {"a", "missing"}).get();
  ASSERT_TRUE(scores.has_value());
  ASSERT_EQ(scores->size(), 2u);
  EXPECT_EQ((*scores)[0], 1.5);
  EXPECT_FALSE((*scores)[1].has_value());

  EXPECT_EQ(conn.argv(0), (args_t{"ZREM", "k", "a", "b"}));
  EXPECT_EQ(conn.argv(1), (args_t{"ZMSCORE", "k", "a", "missing"}));
}

TEST_F(ZsetCommandsTest, ZincrbyReturnsNewScore) {
  conn.script(bulk("4.5"));
  auto r = z.zincrby("k", 2.0, "m");
  EXPECT_EQ(*r.get(), 4.5);
  EXPECT_EQ(conn.argv(0), (args_t{"ZINCRBY", "k", "2.0", "m"}));
}

TEST_F(ZsetCommandsTest, ZrandmemberVariants) {
  conn.script(bulk("a"));
  conn.script(nil());
  conn.script(arr({bulk("a"), bulk("b")}));
  conn.script(arr({bulk("a"), bulk("1")}));
  conn.script(arr({arr({bulk("a"), dbl(1.0)}), arr({bulk("b"), dbl(2.0)})}));

  EXPECT_EQ(*z.zrandmember("k").get(), std::optional<std::string>{"a"});
  EXPECT_FALSE(z.zrandmember("empty").get()->has_value());
  EXPECT_EQ(z.zrandmember("k", -2).get()->size(), 2u);
  EXPECT_EQ(*z.zrandmember_with_score("k").get(), std::optional<tuple>(tuple{"a", 1.0}));
  EXPECT_EQ(z.zrandmember_with_scores("k", 2).get()->size(), 2u);

  EXPECT_EQ(conn.argv(2), (args_t{"ZRANDMEMBER", "k", "-2"}));
  EXPECT_EQ(conn.argv(3), (args_t{"ZRANDMEMBER", "k", "1", "WITHSCORES"}));
  EXPECT_EQ(conn.argv(4), (args_t{"ZRANDMEMBER", "k", "2", "WITHSCORES"}));
}

TEST_F(ZsetCommandsTest, RankAndScore) {
  conn.script(integer(0));
  conn.script(nil());
  conn.script(bulk("2.5"));
  conn.script(integer(7));

  EXPECT_EQ(*z.zrank("k", "a").get(), std::optional<std::int64_t>{0});
  EXPECT_FALSE(z.zrevrank("k", "zz").get()->has_value());
  EXPECT_EQ(*z.zscore("k", "a").get(), std::optional<double>{2.5});
  EXPECT_EQ(*z.zcard("k").get(), 7);

  EXPECT_EQ(conn.argv(1), (args_t{"ZREVRANK", "k", "zz"}));
  EXPECT_EQ(conn.argv(2), (args_t{"ZSCORE", "k", "a"}));
}

TEST_F(ZsetCommandsTest, IndexRanges) {
  conn.script(arr({bulk("a")}));
  conn.script(arr({bulk("a"), bulk("1")}));
  conn.script(arr({bulk("b")}));
  conn.script(arr({arr({bulk("b"), dbl(2.0)})}));
  conn.script(integer(1));

  EXPECT_EQ(z.zrange("k", 0, -1).get()->size(), 1u);
  EXPECT_EQ(z.zrange_with_scores("k", 0, -1).get()->front(), (tuple{"a", 1.0}));
  EXPECT_EQ(z.zrevrange("k", 0, 0).get()->front(), "b");
  EXPECT_EQ(z.zrevrange_with_scores("k", 0, 0).get()->front(), (tuple{"b", 2.0}));
  EXPECT_EQ(*z.zremrange("k", 0, 1).get(), 1);

  EXPECT_EQ(conn.argv(0), (args_t{"ZRANGE", "k", "0", "-1"}));
  EXPECT_EQ(conn.argv(1), (args_t{"ZRANGE", "k", "0", "-1", "WITHSCORES"}));
  EXPECT_EQ(conn.argv(3), (args_t{"ZREVRANGE", "k", "0", "0", "WITHSCORES"}));
  EXPECT_EQ(conn.argv(4), (args_t{"ZREMRANGEBYRANK", "k", "0", "1"}));
}

TEST_F(ZsetCommandsTest, UnlimitedScoreRangeEmitsOnlyKeyMinMax) {
  conn.script(arr({}));
  (void)z.zrangebyscore("k", range{boundary::exclusive(5.0), boundary::unbounded()});

  ASSERT_EQ(conn.call_count(), 1u);
  EXPECT_EQ(conn.calls()[0].cmd.arg_count(), 3u);
  EXPECT_EQ(conn.argv(0), (args_t{"ZRANGEBYSCORE", "k", "(5.0", "+inf"}));
}

TEST_F(ZsetCommandsTest, ScoreRangeWithScoresAndLimit) {
  conn.script(arr({bulk("a"), bulk("1"), bulk("b"), bulk("2")}));
  auto r = z.zrangebyscore_with_scores("k", range::closed(1.0, 2.0), limit::of(0, 10));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r.get()->size(), 2u);
  EXPECT_EQ(conn.argv(0),
            (args_t{"ZRANGEBYSCORE", "k", "1.0", "2.0", "WITHSCORES", "LIMIT", "0", "10"}));
}

TEST_F(ZsetCommandsTest, ExplicitLimitIsSentEvenWhenUnbounded) {
  conn.script(arr({}));
  (void)z.zrangebyscore("k", range::unbounded(), limit::of(0, -1));
  EXPECT_EQ(conn.argv(0), (args_t{"ZRANGEBYSCORE", "k", "-inf", "+inf", "LIMIT", "0", "-1"}));
}

TEST_F(ZsetCommandsTest, ReverseScoreRangeEmitsMaxFirst) {
  conn.script(arr({}));
  conn.script(arr({}));
  (void)z.zrevrangebyscore("k", range{}.gte(1.0).lt(9.0));
  (void)z.zrevrangebyscore_with_scores("k", range{}.gt(1.0), limit::of(2, 3));

  EXPECT_EQ(conn.argv(0), (args_t{"ZREVRANGEBYSCORE", "k", "(9.0", "1.0"}));
  EXPECT_EQ(conn.argv(1),
            (args_t{"ZREVRANGEBYSCORE", "k", "+inf", "(1.0", "WITHSCORES", "LIMIT", "2", "3"}));
}

TEST_F(ZsetCommandsTest, RawTextualScoreBounds) {
  conn.script(arr({}));
  conn.script(arr({}));
  (void)z.zrangebyscore("k", "(1", "+inf");
  (void)z.zrangebyscore("k", "-inf", "5", 1, 2);

  EXPECT_EQ(conn.argv(0), (args_t{"ZRANGEBYSCORE", "k", "(1", "+inf"}));
  EXPECT_EQ(conn.argv(1), (args_t{"ZRANGEBYSCORE", "k", "-inf", "5", "LIMIT", "1", "2"}));
}

TEST_F(ZsetCommandsTest, CountAndRemoveByScore) {
  conn.script(integer(4));
  conn.script(integer(2));
  conn.script(integer(1));

  EXPECT_EQ(*z.zcount("k", 1.0, 3.0).get(), 4);
  EXPECT_EQ(*z.zcount("k", range{}.gt(0.5)).get(), 2);
  EXPECT_EQ(*z.zremrangebyscore("k", range{}.lte(0.0)).get(), 1);

  EXPECT_EQ(conn.argv(0), (args_t{"ZCOUNT", "k", "1.0", "3.0"}));
  EXPECT_EQ(conn.argv(1), (args_t{"ZCOUNT", "k", "(0.5", "+inf"}));
  EXPECT_EQ(conn.argv(2), (args_t{"ZREMRANGEBYSCORE", "k", "-inf", "0.0"}));
}

TEST_F(ZsetCommandsTest, LexRanges) {
  conn.script(arr({bulk("b")}));
  conn.script(arr({}));
  conn.script(integer(3));
  conn.script(integer(1));

  (void)z.zrangebylex("k", range{boundary::inclusive("a"), boundary::exclusive("z")});
  (void)z.zrevrangebylex("k", range{}.gte("a"), limit::of(0, 5));
  EXPECT_EQ(*z.zlexcount("k", range::unbounded()).get(), 3);
  EXPECT_EQ(*z.zremrangebylex("k", range{}.gte("")).get(), 1);

  EXPECT_EQ(conn.argv(0), (args_t{"ZRANGEBYLEX", "k", "[a", "(z"}));
  EXPECT_EQ(conn.argv(1), (args_t{"ZREVRANGEBYLEX", "k", "+", "[a", "LIMIT", "0", "5"}));
  EXPECT_EQ(conn.argv(2), (args_t{"ZLEXCOUNT", "k", "-", "+"}));
  EXPECT_EQ(conn.argv(3), (args_t{"ZREMRANGEBYLEX", "k", "[", "+"}));
}

TEST_F(ZsetCommandsTest, PopVariants) {
  conn.script(arr({bulk("a"), bulk("1")}));
  conn.script(arr({}));
  conn.script(arr({arr({bulk("z"), dbl(9.0)}), arr({bulk("y"), dbl(8.0)})}));

  EXPECT_EQ(*z.zpopmin("k").get(), std::optional<tuple>(tuple{"a", 1.0}));
  EXPECT_FALSE(z.zpopmax("empty").get()->has_value());
  auto many = z.zpopmax("k", 2).get();
  ASSERT_TRUE(many.has_value());
  EXPECT_EQ(*many, (std::vector<tuple>{tuple{"z", 9.0}, tuple{"y", 8.0}}));

  EXPECT_EQ(conn.argv(0), (args_t{"ZPOPMIN", "k"}));
  EXPECT_EQ(conn.argv(2), (args_t{"ZPOPMAX", "k", "2"}));
}

TEST_F(ZsetCommandsTest, BlockingPop) {
  conn.script(arr({bulk("k"), bulk("a"), bulk("1")}));
  conn.script(nil());

  auto hit = z.bzpopmin("k", std::chrono::milliseconds{1500});
  EXPECT_EQ(*hit.get(), std::optional<tuple>(tuple{"a", 1.0}));
  auto timeout = z.bzpopmax("k", std::chrono::seconds{2});
  EXPECT_FALSE(timeout.get()->has_value());

  EXPECT_EQ(conn.argv(0), (args_t{"BZPOPMIN", "k", "1.5"}));
  EXPECT_EQ(conn.argv(1), (args_t{"BZPOPMAX", "k", "2.0"}));
}

TEST_F(ZsetCommandsTest, SetOperationsWithoutParams) {
  conn.script(arr({bulk("a")}));
  conn.script(arr({bulk("a"), bulk("1")}));
  conn.script(integer(1));
  conn.script(integer(2));
  conn.script(integer(3));

  (void)z.zdiff({"x", "y"});
  (void)z.zdiff_with_scores({"x", "y"});
  (void)z.zdiffstore("dst", {"x", "y"});
  (void)z.zinterstore("dst", {"x", "y"});
  (void)z.zunionstore("dst", {"x"});

  EXPECT_EQ(conn.argv(0), (args_t{"ZDIFF", "2", "x", "y"}));
  EXPECT_EQ(conn.argv(1), (args_t{"ZDIFF", "2", "x", "y", "WITHSCORES"}));
  EXPECT_EQ(conn.argv(2), (args_t{"ZDIFFSTORE", "dst", "2", "x", "y"}));
  EXPECT_EQ(conn.argv(3), (args_t{"ZINTERSTORE", "dst", "2", "x", "y"}));
  EXPECT_EQ(conn.argv(4), (args_t{"ZUNIONSTORE", "dst", "1", "x"}));
}

TEST_F(ZsetCommandsTest, SetOperationsWithParams) {
  conn.script(integer(1));
  conn.script(arr({}));

  (void)z.zunionstore("dst", aggregate::min, weights::of({1.0, 0.5}), {"x", "y"});
  (void)z.zinter(aggregate::sum, weights::from_set_count(2), {"x", "y"});

  EXPECT_EQ(conn.argv(0), (args_t{"ZUNIONSTORE", "dst", "2", "x", "y", "WEIGHTS", "1.0", "0.5",
                                  "AGGREGATE", "MIN"}));
  EXPECT_EQ(conn.argv(1),
            (args_t{"ZINTER", "2", "x", "y", "WEIGHTS", "1.0", "1.0", "AGGREGATE", "SUM"}));
}

// === Aggregation semantics (through the in-memory store) ===

TEST_F(ZsetCommandsTest, UnionWeightsAppliedBeforeMax) {
  conn.put("s1", "m1", 1.0);
  conn.put("s2", "m1", 5.0);

  auto r = z.zunion_with_scores(aggregate::max, weights::of({2.0, 3.0}), {"s1", "s2"});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r.get(), (std::vector<tuple>{tuple{"m1", 15.0}}));
  EXPECT_EQ(conn.argv(0), (args_t{"ZUNION", "2", "s1", "s2", "WEIGHTS", "2.0", "3.0", "AGGREGATE",
                                  "MAX", "WITHSCORES"}));
}

TEST_F(ZsetCommandsTest, UnionWeightsAppliedBeforeSum) {
  conn.put("s1", "m1", 1.0);
  conn.put("s2", "m1", 5.0);

  auto r = z.zunion_with_scores(aggregate::sum, weights::of({2.0, 3.0}), {"s1", "s2"});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r.get(), (std::vector<tuple>{tuple{"m1", 17.0}}));
}

TEST_F(ZsetCommandsTest, InterKeepsOnlyCommonMembers) {
  conn.put("s1", "a", 1.0);
  conn.put("s1", "b", 2.0);
  conn.put("s2", "b", 10.0);

  auto members = z.zinter({"s1", "s2"});
  EXPECT_EQ(*members.get(), (std::vector<std::string>{"b"}));

  auto scored = z.zinter_with_scores(aggregate::min, weights::of({1.0, 1.0}), {"s1", "s2"});
  EXPECT_EQ(*scored.get(), (std::vector<tuple>{tuple{"b", 2.0}}));

  auto all = z.zunion({"s1", "s2"});
  EXPECT_EQ(*all.get(), (std::vector<std::string>{"a", "b"}));

  auto plain = z.zunion_with_scores({"s1", "s2"});
  EXPECT_EQ(*plain.get(), (std::vector<tuple>{tuple{"a", 1.0}, tuple{"b", 12.0}}));
}

TEST_F(ZsetCommandsTest, ZunionMembersWithParams) {
  conn.put("s1", "a", 1.0);
  conn.put("s2", "b", 1.0);

  auto r = z.zunion(aggregate::max, weights::of({1.0, 5.0}), {"s1", "s2"});
  EXPECT_EQ(*r.get(), (std::vector<std::string>{"a", "b"}));
}

// === Validation (nothing is sent) ===

TEST_F(ZsetCommandsTest, WeightsMismatchFailsBeforeIo) {
  auto r = z.zunion_with_scores(aggregate::sum, weights::of({1.0}), {"s1", "s2"});
  ASSERT_FALSE(r.has_value());
  EXPECT_FALSE(r.is_deferred());
  EXPECT_EQ(r.error().code, error::argument_mismatch);

  auto s = z.zinterstore("dst", aggregate::sum, weights::of({1.0, 2.0, 3.0}), {"a", "b"});
  EXPECT_EQ(s.error().code, error::argument_mismatch);
  EXPECT_EQ(conn.call_count(), 0u);
}

TEST_F(ZsetCommandsTest, InvalidKeysAndMembers) {
  EXPECT_EQ(z.zcard("").error().code, error::invalid_argument);
  EXPECT_EQ(z.zcard(std::string_view{}).error().code, error::invalid_argument);
  EXPECT_EQ(z.zscore("k", std::string_view{}).error().code, error::invalid_argument);
  EXPECT_EQ(z.zadd("k", 1.0, std::string_view{}).error().code, error::invalid_argument);
  EXPECT_EQ(z.zrem("k", {}).error().code, error::invalid_argument);
  EXPECT_EQ(z.zrem("k", {"a", std::string_view{}}).error().code, error::invalid_argument);
  EXPECT_EQ(z.zmscore("k", {}).error().code, error::invalid_argument);
  EXPECT_EQ(z.zadd("k", std::vector<tuple>{}).error().code, error::invalid_argument);
  EXPECT_EQ(z.zunion({}).error().code, error::invalid_argument);
  EXPECT_EQ(z.zdiff({"a", ""}).error().code, error::invalid_argument);
  EXPECT_EQ(z.zdiffstore("", {"a"}).error().code, error::invalid_argument);
  EXPECT_EQ(z.zrangebyscore("k", "", "+inf").error().code, error::invalid_argument);
  EXPECT_EQ(conn.call_count(), 0u);
}

TEST_F(ZsetCommandsTest, TextualScoreBoundsAreRequired) {
  auto lo = z.zrangebyscore("k", "", "+inf");
  EXPECT_EQ(lo.error().code, error::invalid_argument);
  EXPECT_EQ(lo.error().detail, "min bound must not be null or empty");

  auto hi = z.zrangebyscore("k", "-inf", std::string_view{}, 0, 10);
  EXPECT_EQ(hi.error().code, error::invalid_argument);
  EXPECT_EQ(hi.error().detail, "max bound must not be null or empty");

  EXPECT_EQ(conn.call_count(), 0u);
}

TEST_F(ZsetCommandsTest, EmptyMemberIsAllowed) {
  conn.script(integer(1));
  auto r = z.zadd("k", 1.0, "");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(conn.argv(0), (args_t{"ZADD", "k", "1.0", ""}));
}

TEST_F(ZsetCommandsTest, NaNScoresRejected) {
  auto const nan = std::nan("");
  EXPECT_EQ(z.zadd("k", nan, "m").error().code, error::invalid_argument);
  EXPECT_EQ(z.zadd("k", {tuple{"m", nan}}).error().code, error::invalid_argument);
  EXPECT_EQ(z.zincrby("k", nan, "m").error().code, error::invalid_argument);
  EXPECT_EQ(z.zcount("k", nan, 1.0).error().code, error::invalid_argument);
  EXPECT_EQ(z.zunion(aggregate::sum, weights::of({nan}), {"a"}).error().code,
            error::invalid_argument);
  EXPECT_EQ(conn.call_count(), 0u);
}

TEST_F(ZsetCommandsTest, RangeKindMismatchRejected) {
  EXPECT_EQ(z.zrangebyscore("k", range{}.gte("a")).error().code, error::invalid_argument);
  EXPECT_EQ(z.zrangebylex("k", range{}.gte(1.0)).error().code, error::invalid_argument);
  EXPECT_EQ(z.zcount("k", range{boundary::inclusive(1.0), boundary::inclusive("z")}).error().code,
            error::invalid_argument);
  EXPECT_EQ(conn.call_count(), 0u);
}

TEST_F(ZsetCommandsTest, ZaddFlagConflicts) {
  EXPECT_EQ(z.zadd("k", 1.0, "m", zadd_args{.nx = true, .xx = true}).error().code,
            error::invalid_argument);
  EXPECT_EQ(z.zadd("k", 1.0, "m", zadd_args{.nx = true, .gt = true}).error().code,
            error::invalid_argument);
  EXPECT_EQ(z.zadd("k", 1.0, "m", zadd_args{.gt = true, .lt = true}).error().code,
            error::invalid_argument);
  EXPECT_EQ(conn.call_count(), 0u);
}

TEST_F(ZsetCommandsTest, OffsetsAndCountsLimitedTo32Bits) {
  auto const big = std::int64_t{1} << 32;
  EXPECT_EQ(z.zrangebyscore("k", range{}, limit::of(big, 1)).error().code,
            error::argument_out_of_range);
  EXPECT_EQ(z.zrangebylex("k", range{}, limit::of(0, -big)).error().code,
            error::argument_out_of_range);
  EXPECT_EQ(z.zrangebyscore("k", "-inf", "+inf", 0, big).error().code,
            error::argument_out_of_range);
  EXPECT_EQ(z.zpopmin("k", big).error().code, error::argument_out_of_range);
  EXPECT_EQ(z.zrandmember("k", -big).error().code, error::argument_out_of_range);
  EXPECT_EQ(conn.call_count(), 0u);
}

TEST_F(ZsetCommandsTest, NegativeTimeoutRejected) {
  EXPECT_EQ(z.bzpopmin("k", std::chrono::milliseconds{-1}).error().code, error::invalid_argument);
  EXPECT_EQ(conn.call_count(), 0u);
}

// === Execution modes ===

TEST_F(ZsetCommandsTest, PipelinedCommandsAreDeferred) {
  conn.set_mode(execution_mode::pipelined);

  auto added = z.zadd("k", {tuple{"a", 1.0}, tuple{"b", 2.0}});
  auto card = z.zcard("k");
  ASSERT_TRUE(added.is_deferred());
  ASSERT_TRUE(card.is_deferred());
  EXPECT_EQ(added.error().code, error::result_pending);

  conn.script(integer(2));
  conn.script(integer(2));
  conn.flush();

  EXPECT_EQ(*added.get(), 2);
  EXPECT_EQ(*card.get(), 2);
  EXPECT_EQ(conn.calls()[0].mode, execution_mode::pipelined);
}

TEST_F(ZsetCommandsTest, ValidationStillImmediateInTransaction) {
  conn.set_mode(execution_mode::transactional);
  auto r = z.zcard("");
  EXPECT_FALSE(r.is_deferred());
  EXPECT_EQ(r.error().code, error::invalid_argument);
  EXPECT_EQ(conn.queued_count(), 0u);
}
