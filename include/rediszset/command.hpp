#pragma once

#include <rediszset/assert.hpp>

#include <charconv>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace rediszset {

auto format_score(double score) -> std::string;

/// A single store command: name plus positional byte arguments.
///
/// - Input: command name + arguments (bytes / integers / scores)
/// - Output: argument list (what the connection executes) and, for transports that want it,
///   the RESP array-of-bulk-strings wire form.
class command {
 public:
  explicit command(std::string_view name) : name_(name) {}

  template <typename... Args>
    requires(sizeof...(Args) > 0)
  command(std::string_view name, Args&&... args) : name_(name) {
    args_.reserve(sizeof...(Args));
    (push(std::forward<Args>(args)), ...);
  }

  [[nodiscard]] auto name() const noexcept -> std::string_view { return name_; }

  /// Positional arguments, excluding the command name.
  [[nodiscard]] auto args() const noexcept -> std::vector<std::string> const& { return args_; }

  [[nodiscard]] auto arg_count() const noexcept -> std::size_t { return args_.size(); }

  /// Name followed by arguments.
  [[nodiscard]] auto argv() const -> std::vector<std::string_view> {
    std::vector<std::string_view> out;
    out.reserve(args_.size() + 1);
    out.emplace_back(name_);
    for (auto const& a : args_) {
      out.emplace_back(a);
    }
    return out;
  }

  auto push(std::string_view sv) -> command& {
    args_.emplace_back(sv);
    return *this;
  }

  auto push(char const* s) -> command& {
    return push(s != nullptr ? std::string_view{s} : std::string_view{});
  }

  auto push(std::string const& s) -> command& { return push(std::string_view{s}); }

  auto push(std::string&& s) -> command& {
    args_.push_back(std::move(s));
    return *this;
  }

  template <typename T>
    requires(std::is_integral_v<std::remove_cvref_t<T>> &&
             !std::is_same_v<std::remove_cvref_t<T>, bool>)
  auto push(T v) -> command& {
    char buf[32]{};
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    REDISZSET_ASSERT(res.ec == std::errc{});
    args_.emplace_back(buf, res.ptr);
    return *this;
  }

  auto push(double score) -> command& { return push(format_score(score)); }

  auto push_all(std::span<const std::string_view> values) -> command& {
    for (auto v : values) {
      push(v);
    }
    return *this;
  }

  /// RESP wire bytes: *<argc>\r\n followed by one bulk string per token.
  [[nodiscard]] auto wire() const -> std::string {
    std::string out;
    append_header(out, args_.size() + 1);
    append_bulk_string(out, name_);
    for (auto const& a : args_) {
      append_bulk_string(out, a);
    }
    return out;
  }

 private:
  std::string name_;
  std::vector<std::string> args_{};

  static void append_unsigned(std::string& out, std::size_t v) {
    char buf[32]{};
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    REDISZSET_ASSERT(res.ec == std::errc{});
    out.append(buf, res.ptr);
  }

  static void append_header(std::string& out, std::size_t argc) {
    out.push_back('*');
    append_unsigned(out, argc);
    out.append("\r\n");
  }

  static void append_bulk_string(std::string& out, std::string_view sv) {
    out.push_back('$');
    append_unsigned(out, sv.size());
    out.append("\r\n");
    out.append(sv.data(), sv.size());
    out.append("\r\n");
  }
};

}  // namespace rediszset
