#pragma once

#include <rediszset/error_info.hpp>
#include <rediszset/expected.hpp>
#include <rediszset/range.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace rediszset {

// Unbounded tokens. Which one is used depends on the end of the range being encoded.
inline constexpr std::string_view negative_infinity_token = "-inf";
inline constexpr std::string_view positive_infinity_token = "+inf";
inline constexpr std::string_view lex_minus_token = "-";
inline constexpr std::string_view lex_plus_token = "+";

// Boundary prefixes.
inline constexpr char open_marker = '(';
inline constexpr char lex_inclusive_marker = '[';
inline constexpr char lex_exclusive_marker = '(';

/// Both ends of a range, ready to be pushed as two arguments.
struct encoded_range {
  std::string min;
  std::string max;

  friend bool operator==(encoded_range const&, encoded_range const&) = default;
};

/// Decimal text of a score.
///
/// Shortest representation that parses back to the exact same double; integral values keep a
/// trailing ".0" (5.0 -> "5.0"). Infinities use the protocol literals "+inf" / "-inf".
/// NaN renders as "nan", which the store rejects: callers validate scores first.
auto format_score(double score) -> std::string;

/// Parse a score as the store does: decimal / exponent notation, "inf", "+inf", "-inf".
auto parse_score(std::string_view text) -> std::optional<double>;

/// An inclusive infinity on the end where it equals unbounded_token ("-inf" as min, "+inf" as
/// max) selects the same members as an unbounded end and encodes to the same token; it is
/// returned as unbounded(). Every other boundary is returned unchanged.
///
/// decode_score_boundary(encode_score_boundary(b, t), t) == canonical_score_boundary(b, t).
auto canonical_score_boundary(boundary const& b, std::string_view unbounded_token) -> boundary;

/// Numeric boundary -> token.
///   unbounded    -> unbounded_token
///   inclusive(v) -> "v"
///   exclusive(v) -> "(v"
/// Fails with error::invalid_argument for byte-valued boundaries and NaN scores.
auto encode_score_boundary(boundary const& b, std::string_view unbounded_token)
  -> expected<std::string, error_info>;

/// Lexicographic boundary -> token.
///   unbounded    -> unbounded_token
///   inclusive(v) -> "[v"
///   exclusive(v) -> "(v"
/// Fails with error::invalid_argument for numeric boundaries.
auto encode_lex_boundary(boundary const& b, std::string_view unbounded_token)
  -> expected<std::string, error_info>;

/// Score range using "-inf" / "+inf" for unbounded ends.
auto encode_score_range(range const& r) -> expected<encoded_range, error_info>;

/// Lexicographic range using "-" / "+" for unbounded ends.
auto encode_lex_range(range const& r) -> expected<encoded_range, error_info>;

/// Inverse of encode_score_boundary.
auto decode_score_boundary(std::string_view token, std::string_view unbounded_token)
  -> expected<boundary, error_info>;

/// Inverse of encode_lex_boundary.
auto decode_lex_boundary(std::string_view token, std::string_view unbounded_token)
  -> expected<boundary, error_info>;

}  // namespace rediszset
