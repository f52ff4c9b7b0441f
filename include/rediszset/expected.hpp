#pragma once

#include <iocoro/expected.hpp>

namespace rediszset {

using iocoro::expected;
using iocoro::unexpect;
using iocoro::unexpect_t;
using iocoro::unexpected;

using iocoro::operator==;
using iocoro::operator!=;

}  // namespace rediszset
