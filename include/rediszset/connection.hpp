#pragma once

#include <rediszset/command.hpp>
#include <rediszset/error_info.hpp>
#include <rediszset/execution_mode.hpp>
#include <rediszset/expected.hpp>
#include <rediszset/reply_sink.hpp>
#include <rediszset/resp3/message.hpp>

#include <memory>

namespace rediszset {

/// The transport the command layer runs on.
///
/// Implemented outside this library (socket handling, RESP parsing, authentication, pooling
/// and timeouts all live there). The command layer only needs:
/// - the current execution mode
/// - a blocking round trip for direct mode
/// - a queue for pipelined / transactional mode
///
/// Failures returned here (timeouts, I/O errors) are passed to callers unchanged.
class connection {
 public:
  virtual ~connection() = default;

  [[nodiscard]] virtual auto mode() const noexcept -> execution_mode = 0;

  /// Send `cmd` and block until its reply arrives.
  /// Error replies from the store are returned as a successful message of error kind.
  virtual auto execute(command const& cmd) -> expected<resp3::message, error_info> = 0;

  /// Queue `cmd`; `sink` receives its reply when the batch is flushed.
  virtual auto enqueue(command cmd, std::shared_ptr<reply_sink> sink)
    -> expected<void, error_info> = 0;
};

}  // namespace rediszset
