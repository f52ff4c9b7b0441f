#include <rediszset/adapter/adapt.hpp>
#include <rediszset/converters.hpp>

#include "support/fake_connection.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using namespace rediszset;
using namespace rediszset::test_support;

// === Scalars ===

TEST(AdaptTest, StringFromBulkAndSimple) {
  EXPECT_EQ(*adapter::adapt<std::string>(bulk("hello")), "hello");
  EXPECT_EQ(*adapter::adapt<std::string>(simple("OK")), "OK");
}

TEST(AdaptTest, StringFromNullFails) {
  auto r = adapter::adapt<std::string>(nil());
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, adapter::error_kind::unexpected_null);
}

TEST(AdaptTest, IntegerRangeChecked) {
  EXPECT_EQ(*adapter::adapt<std::int64_t>(integer(-5)), -5);

  auto r = adapter::adapt<std::int8_t>(integer(300));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, adapter::error_kind::value_out_of_range);
}

TEST(AdaptTest, BoolFromIntegerOrBoolean) {
  EXPECT_TRUE(*adapter::adapt<bool>(integer(1)));
  EXPECT_FALSE(*adapter::adapt<bool>(integer(0)));
  EXPECT_TRUE(*adapter::adapt<bool>(resp3::message{resp3::boolean{true}}));
}

TEST(AdaptTest, ScoreFromEitherProtocol) {
  EXPECT_EQ(*adapter::adapt<double>(dbl(1.5)), 1.5);
  EXPECT_EQ(*adapter::adapt<double>(bulk("1.5")), 1.5);
  EXPECT_EQ(*adapter::adapt<double>(bulk("inf")), std::numeric_limits<double>::infinity());
  EXPECT_EQ(*adapter::adapt<double>(bulk("-inf")), -std::numeric_limits<double>::infinity());
  EXPECT_EQ(*adapter::adapt<double>(integer(3)), 3.0);
}

TEST(AdaptTest, MalformedScore) {
  auto r = adapter::adapt<double>(bulk("not-a-number"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, adapter::error_kind::invalid_value);
}

TEST(AdaptTest, OptionalMapsNull) {
  auto r = adapter::adapt<std::optional<double>>(nil());
  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->has_value());

  auto s = adapter::adapt<std::optional<std::int64_t>>(integer(4));
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(*s, std::optional<std::int64_t>{4});
}

// === Sequences ===

TEST(AdaptTest, VectorOfOptionalScores) {
  auto r = adapter::adapt<std::vector<std::optional<double>>>(
    arr({bulk("1.0"), nil(), dbl(2.5)}));
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->size(), 3u);
  EXPECT_EQ((*r)[0], 1.0);
  EXPECT_FALSE((*r)[1].has_value());
  EXPECT_EQ((*r)[2], 2.5);
}

TEST(AdaptTest, TuplesFlat) {
  auto r = adapter::adapt<std::vector<tuple>>(arr({bulk("a"), bulk("1"), bulk("b"), bulk("2.5")}));
  ASSERT_TRUE(r.has_value());
  std::vector<tuple> const want{tuple{"a", 1.0}, tuple{"b", 2.5}};
  EXPECT_EQ(*r, want);
}

TEST(AdaptTest, TuplesNested) {
  auto r = adapter::adapt<std::vector<tuple>>(
    arr({arr({bulk("a"), dbl(1.0)}), arr({bulk("b"), dbl(2.5)})}));
  ASSERT_TRUE(r.has_value());
  std::vector<tuple> const want{tuple{"a", 1.0}, tuple{"b", 2.5}};
  EXPECT_EQ(*r, want);
}

TEST(AdaptTest, TuplesEmpty) {
  auto r = adapter::adapt<std::vector<tuple>>(arr({}));
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->empty());
}

TEST(AdaptTest, TuplesOddFlatCount) {
  auto r = adapter::adapt<std::vector<tuple>>(arr({bulk("a"), bulk("1"), bulk("b")}));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, adapter::error_kind::size_mismatch);
}

TEST(AdaptTest, ErrorPathPointsAtBadScore) {
  auto r = adapter::adapt<std::vector<tuple>>(
    arr({arr({bulk("a"), dbl(1.0)}), arr({bulk("b"), arr({})})}));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().to_string(), "$[1].score: expected (any of: double, bulk_string), got array");

  auto info = r.error().to_error_info();
  EXPECT_EQ(info.code, error::unexpected_reply);
  EXPECT_EQ(info.detail, r.error().to_string());
}

TEST(AdaptTest, ScalarFromArrayIsTypeMismatch) {
  auto r = adapter::adapt<std::int64_t>(arr({integer(1)}));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().kind, adapter::error_kind::type_mismatch);
}

TEST(AdaptTest, MismatchNamesTheReplyKind) {
  auto r = adapter::adapt<double>(arr({}));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().to_string(), "$: expected (any of: double, bulk_string), got array");

  EXPECT_STREQ(resp3::to_string(resp3::kind::double_number), "double");
  EXPECT_STREQ(resp3::to_string(resp3::kind::verbatim_string), "verbatim_string");
}

// === Command-specific converters ===

TEST(ConvertTest, FirstTupleShapes) {
  EXPECT_FALSE(convert::first_tuple(nil())->has_value());
  EXPECT_FALSE(convert::first_tuple(arr({}))->has_value());

  auto flat = convert::first_tuple(arr({bulk("m"), bulk("2")}));
  ASSERT_TRUE(flat.has_value());
  EXPECT_EQ(*flat, std::optional<tuple>(tuple{"m", 2.0}));

  auto nested = convert::first_tuple(arr({arr({bulk("m"), dbl(2.0)})}));
  ASSERT_TRUE(nested.has_value());
  EXPECT_EQ(*nested, std::optional<tuple>(tuple{"m", 2.0}));
}

TEST(ConvertTest, BlockingPop) {
  EXPECT_FALSE(convert::blocking_pop(nil())->has_value());

  auto r = convert::blocking_pop(arr({bulk("key"), bulk("m"), bulk("3.5")}));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, std::optional<tuple>(tuple{"m", 3.5}));

  auto bad = convert::blocking_pop(arr({bulk("key"), bulk("m")}));
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().code, error::unexpected_reply);
}

TEST(ConvertTest, Changed) {
  EXPECT_TRUE(*convert::changed(integer(1)));
  EXPECT_FALSE(*convert::changed(integer(0)));
}

TEST(ConvertTest, ScanPage) {
  auto r = convert::to_scan_page<tuple>(arr({bulk("17"), arr({bulk("a"), bulk("1")})}));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->cursor, "17");
  ASSERT_EQ(r->items.size(), 1u);
  EXPECT_EQ(r->items[0], (tuple{"a", 1.0}));

  auto bad = convert::to_scan_page<tuple>(arr({bulk("0")}));
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().code, error::unexpected_reply);
}
