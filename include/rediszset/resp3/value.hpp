#pragma once

#include <rediszset/resp3/kind.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace rediszset::resp3 {

struct message;

// All payloads own their bytes: a reply outlives the connection buffer it was parsed from
// (deferred results are converted when the batch is flushed, cursors keep pages around).

/// Simple string value (+)
struct simple_string {
  static constexpr kind kind_id = kind::simple_string;
  std::string data;
};

/// Simple error value (-)
struct simple_error {
  static constexpr kind kind_id = kind::simple_error;
  std::string message;
};

/// Integer value (:)
struct integer {
  static constexpr kind kind_id = kind::integer;
  std::int64_t value;
};

/// Double value (,)
struct double_number {
  static constexpr kind kind_id = kind::double_number;
  double value;
};

/// Boolean value (#)
struct boolean {
  static constexpr kind kind_id = kind::boolean;
  bool value;
};

/// Big number value ((), kept as text
struct big_number {
  static constexpr kind kind_id = kind::big_number;
  std::string value;
};

/// Null value (_), also RESP2 null bulk / null array
struct null {
  static constexpr kind kind_id = kind::null;
};

/// Bulk string value ($)
struct bulk_string {
  static constexpr kind kind_id = kind::bulk_string;
  std::string data;
};

/// Bulk error value (!)
struct bulk_error {
  static constexpr kind kind_id = kind::bulk_error;
  std::string message;
};

/// Verbatim string value (=)
struct verbatim_string {
  static constexpr kind kind_id = kind::verbatim_string;
  std::string encoding;  // 3-byte encoding type
  std::string data;
};

/// Array value (*)
struct array {
  static constexpr kind kind_id = kind::array;
  std::vector<message> elements;
};

/// Map value (%), entries in wire order
struct map {
  static constexpr kind kind_id = kind::map;
  std::vector<std::pair<message, message>> entries;
};

/// Set value (~)
struct set {
  static constexpr kind kind_id = kind::set;
  std::vector<message> elements;
};

/// Push value (>)
struct push {
  static constexpr kind kind_id = kind::push;
  std::vector<message> elements;
};

}  // namespace rediszset::resp3
