#pragma once

#include <cstddef>
#include <string>

namespace gardener::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Reverse of json_escape (\n, \r, \t, \", \\ and \u00XX).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Extract a top-level string field from a flat JSON object. Empty when absent.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a numeric field as its raw text. Empty when absent or not a number.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

} // namespace gardener::common
