#pragma once

#include <rediszset/impl/assert.ipp>
#include <rediszset/impl/dispatcher.ipp>
#include <rediszset/impl/encoding.ipp>
#include <rediszset/impl/error.ipp>
#include <rediszset/impl/options.ipp>
#include <rediszset/impl/zset_commands.ipp>
