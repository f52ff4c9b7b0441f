#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace rediszset {

/// A sorted-set element: member bytes and its score.
///
/// Results keep the order the store returned them in; this layer never re-sorts.
class tuple {
 public:
  tuple(std::string member, double score) : member_(std::move(member)), score_(score) {}

  [[nodiscard]] auto member() const noexcept -> std::string const& { return member_; }
  [[nodiscard]] auto score() const noexcept -> double { return score_; }

  friend bool operator==(tuple const&, tuple const&) = default;

 private:
  std::string member_;
  double score_;
};

}  // namespace rediszset
