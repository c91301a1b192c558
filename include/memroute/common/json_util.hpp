#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace memroute::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Extract a string field value from a JSON document. Empty when absent.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a numeric field value (as text) from a JSON document. Empty when absent.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

/// Extract a nested JSON array field (including brackets). Empty when absent.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Parse a JSON array of numbers like `[0.1, -2e-3]`. False on malformed input.
[[nodiscard]] bool json_parse_number_array(const std::string &array_json, std::vector<float> &out);

} // namespace memroute::common
