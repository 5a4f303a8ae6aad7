#pragma once

#include "devchain/common/result.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace devchain::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string body (handles \n, \r, \t, \uXXXX for ASCII, pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Parse the top level of a JSON object into key -> raw value. String values are
/// unescaped; nested objects/arrays, numbers and literals are kept verbatim.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Split a JSON array into the raw text of each top-level element.
[[nodiscard]] std::vector<std::string> json_split_array(const std::string &array_json);

/// Parse a raw JSON array of strings like ["a","b"]. Non-string elements are skipped.
[[nodiscard]] std::vector<std::string> json_parse_string_array(const std::string &array_json);

/// Parse a raw JSON array of numbers like [0.1, -2e-3].
[[nodiscard]] Result<std::vector<float>> json_parse_float_array(const std::string &array_json);

/// True for the literal `null` (or an empty raw value).
[[nodiscard]] bool json_is_null(const std::string &raw);

} // namespace devchain::common
