#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace rediszset {

enum class bound_type : std::uint8_t {
  unbounded = 0,
  inclusive,
  exclusive,
};

/// One endpoint of a range query.
///
/// The value is either a score (numeric ranges: ZRANGEBYSCORE, ZCOUNT, ...) or raw bytes
/// (lexicographic ranges: ZRANGEBYLEX, ZLEXCOUNT, ...). An unbounded boundary carries no value
/// and fits both kinds. An empty byte value is a real bound (the empty string), not "unbounded".
class boundary {
 public:
  using value_type = std::variant<std::monostate, double, std::string>;

  boundary() = default;

  [[nodiscard]] static auto unbounded() -> boundary { return boundary{}; }

  [[nodiscard]] static auto inclusive(double score) -> boundary {
    return boundary{bound_type::inclusive, value_type{std::in_place_index<1>, score}};
  }

  [[nodiscard]] static auto exclusive(double score) -> boundary {
    return boundary{bound_type::exclusive, value_type{std::in_place_index<1>, score}};
  }

  [[nodiscard]] static auto inclusive(std::string_view bytes) -> boundary {
    return boundary{bound_type::inclusive, value_type{std::in_place_index<2>, bytes}};
  }

  [[nodiscard]] static auto exclusive(std::string_view bytes) -> boundary {
    return boundary{bound_type::exclusive, value_type{std::in_place_index<2>, bytes}};
  }

  [[nodiscard]] auto type() const noexcept -> bound_type { return type_; }
  [[nodiscard]] bool is_unbounded() const noexcept { return type_ == bound_type::unbounded; }
  [[nodiscard]] bool is_inclusive() const noexcept { return type_ == bound_type::inclusive; }
  [[nodiscard]] bool is_exclusive() const noexcept { return type_ == bound_type::exclusive; }

  /// Bounded with a numeric value.
  [[nodiscard]] bool is_score() const noexcept { return value_.index() == 1; }

  /// Bounded with a byte-string value.
  [[nodiscard]] bool is_lex() const noexcept { return value_.index() == 2; }

  /// Precondition: is_score().
  [[nodiscard]] auto score() const -> double { return std::get<1>(value_); }

  /// Precondition: is_lex().
  [[nodiscard]] auto bytes() const -> std::string const& { return std::get<2>(value_); }

  friend bool operator==(boundary const&, boundary const&) = default;

 private:
  boundary(bound_type t, value_type v) : type_(t), value_(std::move(v)) {}

  bound_type type_{bound_type::unbounded};
  value_type value_{};
};

/// A (min, max) pair of boundaries. Both ends default to unbounded.
///
///   range{}.gt(5.0)              ->  (5.0 .. +inf
///   range{}.gte("a").lt("z")     ->  [a .. (z
struct range {
  boundary min{};
  boundary max{};

  [[nodiscard]] static auto unbounded() -> range { return range{}; }

  [[nodiscard]] static auto closed(double lo, double hi) -> range {
    return range{boundary::inclusive(lo), boundary::inclusive(hi)};
  }

  [[nodiscard]] static auto open(double lo, double hi) -> range {
    return range{boundary::exclusive(lo), boundary::exclusive(hi)};
  }

  [[nodiscard]] auto gt(double v) const -> range { return with_min(boundary::exclusive(v)); }
  [[nodiscard]] auto gte(double v) const -> range { return with_min(boundary::inclusive(v)); }
  [[nodiscard]] auto lt(double v) const -> range { return with_max(boundary::exclusive(v)); }
  [[nodiscard]] auto lte(double v) const -> range { return with_max(boundary::inclusive(v)); }

  [[nodiscard]] auto gt(std::string_view v) const -> range {
    return with_min(boundary::exclusive(v));
  }
  [[nodiscard]] auto gte(std::string_view v) const -> range {
    return with_min(boundary::inclusive(v));
  }
  [[nodiscard]] auto lt(std::string_view v) const -> range {
    return with_max(boundary::exclusive(v));
  }
  [[nodiscard]] auto lte(std::string_view v) const -> range {
    return with_max(boundary::inclusive(v));
  }

  friend bool operator==(range const&, range const&) = default;

 private:
  [[nodiscard]] auto with_min(boundary b) const -> range { return range{std::move(b), max}; }
  [[nodiscard]] auto with_max(boundary b) const -> range { return range{min, std::move(b)}; }
};

/// Pagination for range queries.
///
/// `limit::unlimited()` is a distinct state: no LIMIT clause is emitted at all. It is not the
/// same as an explicit (0, -1) page, which is sent as-is.
class limit {
 public:
  [[nodiscard]] static auto unlimited() -> limit { return limit{}; }

  [[nodiscard]] static auto of(std::int64_t offset, std::int64_t count) -> limit {
    return limit{page{offset, count}};
  }

  [[nodiscard]] bool is_unlimited() const noexcept { return !page_.has_value(); }

  /// Precondition: !is_unlimited().
  [[nodiscard]] auto offset() const -> std::int64_t { return page_->offset; }

  /// Precondition: !is_unlimited().
  [[nodiscard]] auto count() const -> std::int64_t { return page_->count; }

  friend bool operator==(limit const&, limit const&) = default;

 private:
  struct page {
    std::int64_t offset{};
    std::int64_t count{};
    friend bool operator==(page const&, page const&) = default;
  };

  limit() = default;
  explicit limit(page p) : page_(p) {}

  std::optional<page> page_{};
};

}  // namespace rediszset
