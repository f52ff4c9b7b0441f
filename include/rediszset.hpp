#pragma once

#include <rediszset/aggregation.hpp>
#include <rediszset/command.hpp>
#include <rediszset/config.hpp>
#include <rediszset/connection.hpp>
#include <rediszset/cursor.hpp>
#include <rediszset/deferred.hpp>
#include <rediszset/dispatcher.hpp>
#include <rediszset/encoding.hpp>
#include <rediszset/error.hpp>
#include <rediszset/error_info.hpp>
#include <rediszset/execution_mode.hpp>
#include <rediszset/expected.hpp>
#include <rediszset/logger.hpp>
#include <rediszset/options.hpp>
#include <rediszset/range.hpp>
#include <rediszset/tracing.hpp>
#include <rediszset/tuple.hpp>
#include <rediszset/zset_commands.hpp>
