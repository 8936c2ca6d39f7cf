#pragma once

#include "liteagent/common/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace liteagent::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Quote and escape a string as a JSON string literal.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape the body of a JSON string literal (no surrounding quotes).
/// Handles the short escapes and \uXXXX, including surrogate pairs.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Validate one JSON value starting at pos (leading whitespace allowed).
/// Returns the position one past the value, or npos if the text is not valid JSON.
[[nodiscard]] std::size_t json_scan_value(const std::string &text, std::size_t pos);

/// True when the whole text is exactly one JSON value, surrounded only by whitespace.
[[nodiscard]] bool json_is_valid(const std::string &text);

/// Top-level members of a JSON object, each value kept as its raw JSON text.
using JsonRawMap = std::unordered_map<std::string, std::string>;

/// Strictly parse a single JSON object. Trailing non-whitespace is an error.
[[nodiscard]] Result<JsonRawMap> json_parse_object(const std::string &json);

/// Decode a raw JSON string literal ("...") to its value; nullopt for other kinds.
[[nodiscard]] std::optional<std::string> json_decode_string(const std::string &raw);

/// Decode a raw JSON boolean; nullopt for other kinds.
[[nodiscard]] std::optional<bool> json_decode_bool(const std::string &raw);

} // namespace liteagent::common
