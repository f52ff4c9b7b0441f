#pragma once

#include <rediszset/error.hpp>
#include <rediszset/error_info.hpp>
#include <rediszset/expected.hpp>
#include <rediszset/logger.hpp>
#include <rediszset/reply_sink.hpp>
#include <rediszset/resp3/message.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace rediszset {

/// Reply -> result conversion attached to a command.
template <typename T>
using reply_converter = auto (*)(resp3::message const&) -> expected<T, error_info>;

namespace detail {

/// Shared by direct and queued execution: error replies become error::server_error,
/// anything else goes through the command's converter.
template <typename T>
auto convert_reply(resp3::message const& msg, reply_converter<T> convert, std::string_view name)
  -> expected<T, error_info> {
  if (msg.is_error()) {
    REDISZSET_LOG_WARNING("server error reply cmd={} err={}", name, msg.error_text());
    return fail(error::server_error, std::string{msg.error_text()});
  }
  auto out = convert(msg);
  if (!out) {
    REDISZSET_LOG_WARNING("reply conversion failed cmd={} err={}", name, out.error().to_string());
  }
  return out;
}

/// Sink for one queued command; holds the converted result once the batch is flushed.
template <typename T>
class pending_reply final : public reply_sink {
 public:
  pending_reply(reply_converter<T> convert, std::string name)
      : convert_(convert), name_(std::move(name)) {}

  [[nodiscard]] bool is_complete() const noexcept override { return result_.has_value(); }

  [[nodiscard]] auto result() const -> std::optional<expected<T, error_info>> const& {
    return result_;
  }

 protected:
  auto do_deliver(resp3::message msg) -> void override {
    result_.emplace(convert_reply<T>(msg, convert_, name_));
  }

  auto do_deliver_error(error_info err) -> void override {
    REDISZSET_LOG_WARNING("queued command failed cmd={} err={}", name_, err.to_string());
    result_.emplace(unexpected(std::move(err)));
  }

 private:
  reply_converter<T> convert_;
  std::string name_;
  std::optional<expected<T, error_info>> result_{};
};

}  // namespace detail

/// Handle to the result of a pipelined or transactional command.
///
/// Resolves when the connection flushes the batch (or executes the transaction). Reading it
/// earlier yields error::result_pending; the handle stays valid and can be read again later.
template <typename T>
class deferred {
 public:
  explicit deferred(std::shared_ptr<detail::pending_reply<T>> sink) : sink_(std::move(sink)) {}

  [[nodiscard]] bool ready() const noexcept { return sink_->is_complete(); }

  [[nodiscard]] auto get() const -> expected<T, error_info> {
    auto const& r = sink_->result();
    if (!r.has_value()) {
      return fail(error::result_pending);
    }
    return *r;
  }

 private:
  std::shared_ptr<detail::pending_reply<T>> sink_;
};

}  // namespace rediszset
