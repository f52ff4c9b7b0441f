#pragma once

#include <rediszset/command.hpp>
#include <rediszset/error_info.hpp>
#include <rediszset/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rediszset {

/// How scores of a member present in several input sets are combined (ZUNION / ZINTER).
enum class aggregate : std::uint8_t {
  sum = 0,
  min,
  max,
};

constexpr auto to_string(aggregate a) noexcept -> std::string_view {
  switch (a) {
    case aggregate::sum:
      return "SUM";
    case aggregate::min:
      return "MIN";
    case aggregate::max:
      return "MAX";
  }
  return "SUM";
}

/// Per-input-set score multipliers, in input-set order.
class weights {
 public:
  weights() = default;

  explicit weights(std::vector<double> values) : values_(std::move(values)) {}

  [[nodiscard]] static auto of(std::initializer_list<double> values) -> weights {
    return weights{std::vector<double>(values)};
  }

  /// n weights of 1.0 (the store's default when no WEIGHTS clause is sent).
  [[nodiscard]] static auto from_set_count(std::size_t n) -> weights {
    return weights{std::vector<double>(n, 1.0)};
  }

  /// Every weight multiplied by `factor`.
  [[nodiscard]] auto multiply(double factor) const -> weights {
    std::vector<double> out;
    out.reserve(values_.size());
    for (auto w : values_) {
      out.push_back(w * factor);
    }
    return weights{std::move(out)};
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t { return values_.size(); }
  [[nodiscard]] bool empty() const noexcept { return values_.empty(); }
  [[nodiscard]] auto values() const noexcept -> std::span<const double> { return values_; }
  [[nodiscard]] auto operator[](std::size_t i) const -> double { return values_[i]; }

  friend bool operator==(weights const&, weights const&) = default;

 private:
  std::vector<double> values_{};
};

/// WEIGHTS / AGGREGATE clause for multi-set operations.
///
/// Always emitted in full once built: an explicit (sum, all-1.0) pair still produces
/// "WEIGHTS 1.0 ... AGGREGATE SUM". Call variants without weights/aggregate never build one.
struct aggregation_params {
  aggregate agg{aggregate::sum};
  std::vector<double> factors{};

  /// Append "WEIGHTS w1 .. wn AGGREGATE <agg>" to `cmd`.
  void append_to(command& cmd) const {
    cmd.push("WEIGHTS");
    for (auto w : factors) {
      cmd.push(w);
    }
    cmd.push("AGGREGATE");
    cmd.push(to_string(agg));
  }

  friend bool operator==(aggregation_params const&, aggregation_params const&) = default;
};

/// Fails with error::argument_mismatch iff w.size() != set_count.
inline auto check_weights(weights const& w, std::size_t set_count) -> expected<void, error_info> {
  if (w.size() != set_count) {
    return fail(error::argument_mismatch,
                "the number of weights (" + std::to_string(w.size()) +
                  ") must match the number of source sets (" + std::to_string(set_count) + ")");
  }
  return {};
}

/// Combine an aggregate and weights. Lengths are validated by the caller (check_weights).
inline auto build_aggregation_params(aggregate agg, weights const& w) -> aggregation_params {
  auto values = w.values();
  return aggregation_params{agg, std::vector<double>(values.begin(), values.end())};
}

}  // namespace rediszset
