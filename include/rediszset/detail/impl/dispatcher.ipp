#pragma once

#include <rediszset/dispatcher.hpp>
#include <rediszset/logger.hpp>

#include <memory>
#include <string>

namespace rediszset {

template <typename T>
auto dispatcher::invoke(command_spec<T> spec) -> dispatch_result<T> {
  auto const mode = conn_->mode();
  auto const start = clock::now();
  // The command is moved into the queue below; keep the name for diagnostics.
  std::string const name{spec.cmd.name()};

  auto const info = trace_start(name, spec.cmd.arg_count(), mode);
  REDISZSET_LOG_DEBUG("dispatch cmd={} argc={} mode={}", name, spec.cmd.arg_count(),
                      to_string(mode));

  if (is_queueing(mode)) {
    auto sink = std::make_shared<detail::pending_reply<T>>(spec.convert, name);
    auto queued = conn_->enqueue(std::move(spec.cmd), sink);
    if (!queued) {
      REDISZSET_LOG_WARNING("enqueue failed cmd={} mode={} err={}", name, to_string(mode),
                            queued.error().to_string());
      trace_finish(info, start, false, &queued.error());
      return expected<T, error_info>{unexpected(std::move(queued).error())};
    }
    trace_finish(info, start, true, nullptr);
    return deferred<T>{std::move(sink)};
  }

  auto reply = conn_->execute(spec.cmd);
  if (!reply) {
    REDISZSET_LOG_WARNING("execute failed cmd={} err={}", name, reply.error().to_string());
    trace_finish(info, start, false, &reply.error());
    return expected<T, error_info>{unexpected(std::move(reply).error())};
  }

  auto result = detail::convert_reply<T>(*reply, spec.convert, name);
  trace_finish(info, start, false, result ? nullptr : &result.error());
  return result;
}

}  // namespace rediszset
