#pragma once

namespace rediszset::resp3 {

/// Shape of a reply handed over by the connection.
///
/// RESP2 replies only ever use simple_string, simple_error, integer, bulk_string, null and
/// array; the rest appear when the connection speaks RESP3.
enum class kind {
  simple_string,
  simple_error,
  integer,
  double_number,
  boolean,
  big_number,
  null,
  bulk_string,
  bulk_error,
  verbatim_string,
  array,
  map,
  set,
  push,
};

/// Name used in adapter diagnostics ("expected double, got map").
[[nodiscard]] constexpr auto to_string(kind k) noexcept -> char const* {
  switch (k) {
    case kind::simple_string:   return "simple_string";
    case kind::simple_error:    return "simple_error";
    case kind::integer:         return "integer";
    case kind::double_number:   return "double";
    case kind::boolean:         return "boolean";
    case kind::big_number:      return "big_number";
    case kind::null:            return "null";
    case kind::bulk_string:     return "bulk_string";
    case kind::bulk_error:      return "bulk_error";
    case kind::verbatim_string: return "verbatim_string";
    case kind::array:           return "array";
    case kind::map:             return "map";
    case kind::set:             return "set";
    case kind::push:            return "push";
  }
  return "unknown";
}

}  // namespace rediszset::resp3
