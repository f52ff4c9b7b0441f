#pragma once

#include <rediszset/assert.hpp>
#include <rediszset/error_info.hpp>
#include <rediszset/resp3/message.hpp>

#include <utility>

namespace rediszset {

/// Receiver for the reply of one queued command.
///
/// Contract:
/// - The connection delivers exactly one reply (or error) per sink, in submission order,
///   when it flushes the pipeline / executes the transaction.
/// - A sink never receives anything after completion.
/// - Error replies from the store arrive through deliver() as a simple_error / bulk_error
///   message; deliver_error() is for transport-level failures (connection lost, EXEC aborted).
class reply_sink {
 public:
  virtual ~reply_sink() = default;

  auto deliver(resp3::message msg) -> void {
    REDISZSET_ASSERT(!is_complete() && "deliver() called on a completed sink");
    if (is_complete()) {
      return;
    }
    do_deliver(std::move(msg));
  }

  auto deliver_error(error_info err) -> void {
    REDISZSET_ASSERT(!is_complete() && "deliver_error() called on a completed sink");
    if (is_complete()) {
      return;
    }
    do_deliver_error(std::move(err));
  }

  [[nodiscard]] virtual bool is_complete() const noexcept = 0;

 protected:
  virtual auto do_deliver(resp3::message msg) -> void = 0;
  virtual auto do_deliver_error(error_info err) -> void = 0;
};

}  // namespace rediszset
