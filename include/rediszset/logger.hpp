#pragma once

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

namespace rediszset {

enum class log_level {
  debug,
  info,
  warning,
  error,
  off,
};

constexpr auto to_string(log_level level) noexcept -> char const* {
  switch (level) {
    case log_level::debug:
      return "debug";
    case log_level::info:
      return "info";
    case log_level::warning:
      return "warning";
    case log_level::error:
      return "error";
    case log_level::off:
      return "off";
  }
  return "unknown";
}

struct log_context {
  log_level level;
  std::string_view message;
  std::string_view file;
  int line;
  std::chrono::system_clock::time_point timestamp;
};

using log_function = void (*)(void*, log_context const&);

class logger {
 public:
  static auto instance() -> logger& {
    static logger inst;
    return inst;
  }

  // Must be called before any logging operations; the sink is not synchronized.
  void set_log_function(log_function fn, void* user_data = nullptr) {
    if (fn != nullptr) {
      log_fn_ = fn;
      log_user_data_ = user_data;
      return;
    }

    log_fn_ = &default_log_function;
    log_user_data_ = nullptr;
  }

  void set_log_level(log_level level) { min_level_.store(level, std::memory_order_relaxed); }

  [[nodiscard]] auto get_log_level() const -> log_level {
    return min_level_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] auto enabled(log_level level) const -> bool {
    return level != log_level::off && level >= min_level_.load(std::memory_order_relaxed);
  }

  void log(log_level level, std::string_view message, std::string_view file, int line) {
    if (!enabled(level)) {
      return;
    }

    log_context ctx{
      .level = level,
      .message = message,
      .file = file,
      .line = line,
      .timestamp = std::chrono::system_clock::now(),
    };
    log_fn_(log_user_data_, ctx);
  }

  template <typename... Args>
  void log(log_level level, std::string_view file, int line, fmt::format_string<Args...> fmt,
           Args&&... args) {
    if (!enabled(level)) {
      return;
    }

    auto message = fmt::format(fmt, std::forward<Args>(args)...);
    log(level, message, file, line);
  }

 private:
  // Silent unless the application opts in with set_log_level().
  logger() : log_fn_(&default_log_function), log_user_data_(nullptr), min_level_(log_level::off) {}

  static void default_log_function(void*, log_context const& ctx) {
    auto file = ctx.file;
    constexpr std::string_view k_prefix = "rediszset/";
    if (auto pos = file.rfind(k_prefix); pos != std::string_view::npos) {
      file = file.substr(pos + k_prefix.size());
    } else if (auto slash = file.find_last_of("/\\"); slash != std::string_view::npos) {
      file = file.substr(slash + 1);
    }

    auto ms = std::chrono::time_point_cast<std::chrono::milliseconds>(ctx.timestamp);
    fmt::print(stderr, "[{:%Y-%m-%d %H:%M:%S}] [rediszset] [{}] [{}:{}] {}\n", ms,
               to_string(ctx.level), file, ctx.line, ctx.message);
  }

  log_function log_fn_;
  void* log_user_data_;
  std::atomic<log_level> min_level_;
};

inline auto get_logger() -> logger& { return logger::instance(); }

inline void set_log_function(log_function fn, void* user_data = nullptr) {
  logger::instance().set_log_function(fn, user_data);
}

inline void set_log_level(log_level level) { logger::instance().set_log_level(level); }

}  // namespace rediszset

#define REDISZSET_LOG_DEBUG(fmt, ...)                                                           \
  ::rediszset::get_logger().log(::rediszset::log_level::debug, __FILE__, __LINE__, fmt __VA_OPT__(, ) \
                                  __VA_ARGS__)

#define REDISZSET_LOG_INFO(fmt, ...)                                                           \
  ::rediszset::get_logger().log(::rediszset::log_level::info, __FILE__, __LINE__, fmt __VA_OPT__(, ) \
                                  __VA_ARGS__)

#define REDISZSET_LOG_WARNING(fmt, ...)                                                           \
  ::rediszset::get_logger().log(::rediszset::log_level::warning, __FILE__, __LINE__, fmt __VA_OPT__(, ) \
                                  __VA_ARGS__)

#define REDISZSET_LOG_ERROR(fmt, ...)                                                           \
  ::rediszset::get_logger().log(::rediszset::log_level::error, __FILE__, __LINE__, fmt __VA_OPT__(, ) \
                                  __VA_ARGS__)
