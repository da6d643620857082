#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace netpilot::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string body.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Position of the opening quote of a top-level key of the object `json`, or npos.
/// String values and nested objects never match.
[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Extract a string field value from a JSON document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a nested JSON object field (including braces) from a JSON document.
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Extract a nested JSON array field (including brackets) from a JSON document.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Raw JSON text of each top-level element of an array literal, in order.
/// Strings keep their quotes; nested arrays and objects stay whole.
[[nodiscard]] std::vector<std::string> json_array_elements(const std::string &array_json);

/// Parse a bare array literal like ["a","b"]; non-string elements are skipped.
[[nodiscard]] std::vector<std::string> json_parse_string_array(const std::string &array_json);

/// Extract a string array field from a JSON document.
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                              const std::string &field);

/// Serialize strings as a JSON array literal.
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

/// Parse a flat JSON object into a key→value map (top-level only; nested values kept raw).
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Strict well-formedness check of a complete JSON document.
[[nodiscard]] bool json_is_valid(const std::string &json);

} // namespace netpilot::common
