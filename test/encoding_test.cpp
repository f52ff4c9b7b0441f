#include <rediszset/encoding.hpp>
#include <rediszset/range.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

using namespace rediszset;

namespace {

constexpr double inf = std::numeric_limits<double>::infinity();

}  // namespace

// === Score formatting ===

TEST(FormatScoreTest, IntegralValuesKeepFraction) {
  EXPECT_EQ(format_score(5.0), "5.0");
  EXPECT_EQ(format_score(0.0), "0.0");
  EXPECT_EQ(format_score(-3.0), "-3.0");
}

TEST(FormatScoreTest, ShortestRoundTrip) {
  EXPECT_EQ(format_score(1.5), "1.5");
  EXPECT_EQ(format_score(0.1), "0.1");
  EXPECT_EQ(format_score(-2.25), "-2.25");

  for (double v : {0.1, 1.0 / 3.0, 123456.789, 1e-7, 6.02214076e23, -0.000123}) {
    auto text = format_score(v);
    auto back = parse_score(text);
    ASSERT_TRUE(back.has_value()) << text;
    EXPECT_EQ(*back, v) << text;
  }
}

TEST(FormatScoreTest, Infinities) {
  EXPECT_EQ(format_score(inf), "+inf");
  EXPECT_EQ(format_score(-inf), "-inf");
}

TEST(ParseScoreTest, AcceptsStoreSpellings) {
  EXPECT_EQ(parse_score("1.5"), 1.5);
  EXPECT_EQ(parse_score("+2"), 2.0);
  EXPECT_EQ(parse_score("-7"), -7.0);
  EXPECT_EQ(parse_score("inf"), inf);
  EXPECT_EQ(parse_score("+inf"), inf);
  EXPECT_EQ(parse_score("-inf"), -inf);
  EXPECT_EQ(parse_score("1e3"), 1000.0);
}

TEST(ParseScoreTest, RejectsGarbage) {
  EXPECT_FALSE(parse_score("").has_value());
  EXPECT_FALSE(parse_score("abc").has_value());
  EXPECT_FALSE(parse_score("1.5x").has_value());
  EXPECT_FALSE(parse_score("nan").has_value());
  EXPECT_FALSE(parse_score("+-1").has_value());
}

// === Score boundaries ===

TEST(ScoreBoundaryTest, Inclusive) {
  auto r = encode_score_boundary(boundary::inclusive(2.5), negative_infinity_token);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, "2.5");
}

TEST(ScoreBoundaryTest, Exclusive) {
  auto r = encode_score_boundary(boundary::exclusive(5.0), negative_infinity_token);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, "(5.0");
}

TEST(ScoreBoundaryTest, UnboundedUsesCallerToken) {
  EXPECT_EQ(*encode_score_boundary(boundary::unbounded(), negative_infinity_token), "-inf");
  EXPECT_EQ(*encode_score_boundary(boundary::unbounded(), positive_infinity_token), "+inf");
}

TEST(ScoreBoundaryTest, InfiniteValue) {
  EXPECT_EQ(*encode_score_boundary(boundary::inclusive(inf), negative_infinity_token), "+inf");
  EXPECT_EQ(*encode_score_boundary(boundary::exclusive(-inf), negative_infinity_token), "(-inf");
}

TEST(ScoreBoundaryTest, RejectsNaN) {
  auto r = encode_score_boundary(boundary::inclusive(std::nan("")), negative_infinity_token);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, error::invalid_argument);
}

TEST(ScoreBoundaryTest, RejectsLexValue) {
  auto r = encode_score_boundary(boundary::inclusive("a"), negative_infinity_token);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, error::invalid_argument);
}

TEST(ScoreRangeTest, ExclusiveMinUnboundedMax) {
  auto r = encode_score_range(range{boundary::exclusive(5.0), boundary::unbounded()});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->min, "(5.0");
  EXPECT_EQ(r->max, "+inf");
}

TEST(ScoreRangeTest, FullyUnbounded) {
  auto r = encode_score_range(range::unbounded());
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->min, "-inf");
  EXPECT_EQ(r->max, "+inf");
}

TEST(ScoreRangeTest, BuilderHelpers) {
  auto r = encode_score_range(range{}.gte(1.0).lt(10.0));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->min, "1.0");
  EXPECT_EQ(r->max, "(10.0");
}

TEST(ScoreRangeTest, MixedKindsRejected) {
  auto r = encode_score_range(range{boundary::inclusive(1.0), boundary::inclusive("z")});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, error::invalid_argument);
}

TEST(ScoreRangeTest, RoundTripAllBoundTypes) {
  boundary const cases[] = {
    boundary::unbounded(),
    boundary::inclusive(-1.25),
    boundary::exclusive(3.0),
    boundary::inclusive(0.1),
    boundary::exclusive(1e21),
    boundary::inclusive(-inf),
    boundary::inclusive(inf),
    boundary::exclusive(-inf),
    boundary::exclusive(inf),
  };

  for (auto const& lo : cases) {
    for (auto const& hi : cases) {
      auto enc = encode_score_range(range{lo, hi});
      ASSERT_TRUE(enc.has_value());

      auto min = decode_score_boundary(enc->min, negative_infinity_token);
      auto max = decode_score_boundary(enc->max, positive_infinity_token);
      ASSERT_TRUE(min.has_value()) << enc->min;
      ASSERT_TRUE(max.has_value()) << enc->max;
      EXPECT_EQ(*min, canonical_score_boundary(lo, negative_infinity_token)) << enc->min;
      EXPECT_EQ(*max, canonical_score_boundary(hi, positive_infinity_token)) << enc->max;
    }
  }
}

TEST(ScoreRangeTest, InclusiveInfinityOnItsOwnEndIsUnbounded) {
  EXPECT_TRUE(canonical_score_boundary(boundary::inclusive(-inf), negative_infinity_token)
                .is_unbounded());
  EXPECT_TRUE(canonical_score_boundary(boundary::inclusive(inf), positive_infinity_token)
                .is_unbounded());

  // Opposite end or exclusive: a real bound, kept as is.
  EXPECT_EQ(canonical_score_boundary(boundary::inclusive(-inf), positive_infinity_token),
            boundary::inclusive(-inf));
  EXPECT_EQ(canonical_score_boundary(boundary::exclusive(inf), positive_infinity_token),
            boundary::exclusive(inf));
  EXPECT_EQ(canonical_score_boundary(boundary::inclusive(2.0), positive_infinity_token),
            boundary::inclusive(2.0));

  auto enc = encode_score_boundary(boundary::inclusive(inf), positive_infinity_token);
  ASSERT_TRUE(enc.has_value());
  EXPECT_EQ(*enc, "+inf");
  auto dec = decode_score_boundary(*enc, positive_infinity_token);
  ASSERT_TRUE(dec.has_value());
  EXPECT_TRUE(dec->is_unbounded());

  auto r = encode_score_range(range{boundary::inclusive(-inf), boundary::exclusive(inf)});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->min, "-inf");
  EXPECT_EQ(r->max, "(+inf");
}

// === Lexicographic boundaries ===

TEST(LexBoundaryTest, InclusiveAndExclusive) {
  auto r = encode_lex_range(range{boundary::inclusive("a"), boundary::exclusive("z")});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->min, "[a");
  EXPECT_EQ(r->max, "(z");
}

TEST(LexBoundaryTest, Unbounded) {
  auto r = encode_lex_range(range::unbounded());
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->min, "-");
  EXPECT_EQ(r->max, "+");
}

TEST(LexBoundaryTest, EmptyValueIsNotUnbounded) {
  auto r = encode_lex_boundary(boundary::inclusive(""), lex_minus_token);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, "[");
  EXPECT_NE(*r, *encode_lex_boundary(boundary::unbounded(), lex_minus_token));
}

TEST(LexBoundaryTest, BinaryBytesPreserved) {
  std::string const bytes{"a\0b", 3};
  auto r = encode_lex_boundary(boundary::exclusive(bytes), lex_plus_token);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, std::string("(a\0b", 4));
}

TEST(LexBoundaryTest, RejectsScoreValue) {
  auto r = encode_lex_boundary(boundary::inclusive(1.0), lex_minus_token);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, error::invalid_argument);
}

TEST(LexBoundaryTest, Decode) {
  EXPECT_EQ(*decode_lex_boundary("[abc", lex_minus_token), boundary::inclusive("abc"));
  EXPECT_EQ(*decode_lex_boundary("(abc", lex_minus_token), boundary::exclusive("abc"));
  EXPECT_EQ(*decode_lex_boundary("-", lex_minus_token), boundary::unbounded());
  EXPECT_EQ(*decode_lex_boundary("[", lex_minus_token), boundary::inclusive(""));
  EXPECT_FALSE(decode_lex_boundary("abc", lex_minus_token).has_value());
  EXPECT_FALSE(decode_lex_boundary("", lex_minus_token).has_value());
}

TEST(ScoreBoundaryDecodeTest, Malformed) {
  EXPECT_FALSE(decode_score_boundary("(", negative_infinity_token).has_value());
  EXPECT_FALSE(decode_score_boundary("abc", negative_infinity_token).has_value());
}
