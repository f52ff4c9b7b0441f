#include <rediszset/assert.hpp>
#include <rediszset/encoding.hpp>

#include <charconv>
#include <cmath>
#include <string>
#include <system_error>
#include <utility>

namespace rediszset {

namespace {

auto is_mixed(range const& r) -> bool {
  return (r.min.is_score() && r.max.is_lex()) || (r.min.is_lex() && r.max.is_score());
}

}  // namespace

auto format_score(double score) -> std::string {
  if (std::isnan(score)) {
    return "nan";
  }
  if (std::isinf(score)) {
    return std::string{score > 0 ? positive_infinity_token : negative_infinity_token};
  }

  char buf[64]{};
  auto res = std::to_chars(buf, buf + sizeof(buf), score);
  REDISZSET_ASSERT(res.ec == std::errc{});

  std::string out(buf, res.ptr);
  if (out.find_first_of(".eE") == std::string::npos) {
    out += ".0";
  }
  return out;
}

auto parse_score(std::string_view text) -> std::optional<double> {
  if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+') {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }

  double v{};
  auto const* last = text.data() + text.size();
  auto res = std::from_chars(text.data(), last, v);
  if (res.ec != std::errc{} || res.ptr != last || std::isnan(v)) {
    return std::nullopt;
  }
  return v;
}

auto canonical_score_boundary(boundary const& b, std::string_view unbounded_token) -> boundary {
  if (b.is_inclusive() && b.is_score() && std::isinf(b.score()) &&
      format_score(b.score()) == unbounded_token) {
    return boundary::unbounded();
  }
  return b;
}

auto encode_score_boundary(boundary const& b, std::string_view unbounded_token)
  -> expected<std::string, error_info> {
  if (canonical_score_boundary(b, unbounded_token).is_unbounded()) {
    return std::string{unbounded_token};
  }
  if (!b.is_score()) {
    return fail(error::invalid_argument, "score range boundary must be numeric");
  }
  if (std::isnan(b.score())) {
    return fail(error::invalid_argument, "score range boundary must not be NaN");
  }

  auto text = format_score(b.score());
  if (b.is_exclusive()) {
    text.insert(text.begin(), open_marker);
  }
  return text;
}

auto encode_lex_boundary(boundary const& b, std::string_view unbounded_token)
  -> expected<std::string, error_info> {
  if (b.is_unbounded()) {
    return std::string{unbounded_token};
  }
  if (!b.is_lex()) {
    return fail(error::invalid_argument, "lexicographic range boundary must be a byte string");
  }

  std::string text;
  text.reserve(b.bytes().size() + 1);
  text.push_back(b.is_inclusive() ? lex_inclusive_marker : lex_exclusive_marker);
  text.append(b.bytes());
  return text;
}

auto encode_score_range(range const& r) -> expected<encoded_range, error_info> {
  if (is_mixed(r)) {
    return fail(error::invalid_argument, "range mixes score and lexicographic boundaries");
  }

  auto min = encode_score_boundary(r.min, negative_infinity_token);
  if (!min) {
    return unexpected(std::move(min).error());
  }
  auto max = encode_score_boundary(r.max, positive_infinity_token);
  if (!max) {
    return unexpected(std::move(max).error());
  }
  return encoded_range{std::move(*min), std::move(*max)};
}

auto encode_lex_range(range const& r) -> expected<encoded_range, error_info> {
  if (is_mixed(r)) {
    return fail(error::invalid_argument, "range mixes score and lexicographic boundaries");
  }

  auto min = encode_lex_boundary(r.min, lex_minus_token);
  if (!min) {
    return unexpected(std::move(min).error());
  }
  auto max = encode_lex_boundary(r.max, lex_plus_token);
  if (!max) {
    return unexpected(std::move(max).error());
  }
  return encoded_range{std::move(*min), std::move(*max)};
}

auto decode_score_boundary(std::string_view token, std::string_view unbounded_token)
  -> expected<boundary, error_info> {
  if (token == unbounded_token) {
    return boundary::unbounded();
  }

  bool exclusive = false;
  if (!token.empty() && token.front() == open_marker) {
    exclusive = true;
    token.remove_prefix(1);
  }

  auto score = parse_score(token);
  if (!score) {
    return fail(error::invalid_argument, "malformed score boundary '" + std::string{token} + "'");
  }
  return exclusive ? boundary::exclusive(*score) : boundary::inclusive(*score);
}

auto decode_lex_boundary(std::string_view token, std::string_view unbounded_token)
  -> expected<boundary, error_info> {
  if (token == unbounded_token) {
    return boundary::unbounded();
  }
  if (token.empty()) {
    return fail(error::invalid_argument, "empty lexicographic boundary token");
  }

  auto marker = token.front();
  token.remove_prefix(1);
  if (marker == lex_inclusive_marker) {
    return boundary::inclusive(token);
  }
  if (marker == lex_exclusive_marker) {
    return boundary::exclusive(token);
  }
  return fail(error::invalid_argument, "lexicographic boundary must start with '[' or '('");
}

}  // namespace rediszset
