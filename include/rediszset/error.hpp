#pragma once

#include <system_error>
#include <type_traits>

namespace rediszset {

enum class error {
  /// A required argument is null or empty, a range boundary has the wrong kind for the
  /// operation, a score is NaN, or option flags contradict each other.
  ///
  /// Always detected before anything is sent to the connection.
  invalid_argument = 1,

  /// The number of weights differs from the number of input sets.
  ///
  /// Classified as invalid_argument (compares equal to std::errc::invalid_argument).
  argument_mismatch,

  /// An offset or count does not fit the protocol's 32-bit signed integer domain.
  argument_out_of_range,

  /// The operation cannot run while the connection is pipelined or inside a transaction.
  ///
  /// Currently only cursor scans: their pages must be resolved inline to advance the cursor.
  unsupported_in_mode,

  /// A cursor was used after close().
  iterator_closed,

  /// The store answered with an error reply (simple or bulk error).
  /// error_info::detail carries the reply text.
  server_error,

  /// The reply shape does not match the result type requested by the command.
  /// error_info::detail carries the adapter path message (e.g. "$[1]: expected double, got map").
  unexpected_reply,

  /// A deferred result was read before the external collaborator flushed its batch.
  result_pending,
};

auto make_error_code(error e) -> std::error_code;

}  // namespace rediszset

namespace std {

template <>
struct is_error_code_enum<rediszset::error> : std::true_type {};

}  // namespace std
