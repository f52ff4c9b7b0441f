#include <rediszset/options.hpp>

namespace rediszset {

auto zadd_args::validate() const -> expected<void, error_info> {
  if (nx && xx) {
    return fail(error::invalid_argument, "ZADD flags NX and XX are mutually exclusive");
  }
  if (nx && (gt || lt)) {
    return fail(error::invalid_argument, "ZADD flag NX cannot be combined with GT or LT");
  }
  if (gt && lt) {
    return fail(error::invalid_argument, "ZADD flags GT and LT are mutually exclusive");
  }
  return {};
}

void zadd_args::append_to(command& cmd) const {
  if (nx) {
    cmd.push("NX");
  } else if (xx) {
    cmd.push("XX");
  }
  if (gt) {
    cmd.push("GT");
  } else if (lt) {
    cmd.push("LT");
  }
  if (ch) {
    cmd.push("CH");
  }
}

}  // namespace rediszset
