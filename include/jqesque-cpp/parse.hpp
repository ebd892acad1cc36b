/// @file parse.hpp
/// @brief Tokenizer and value inference for assignment strings.

#pragma once

#include <jqesque-cpp/assignment.hpp>
#include <jqesque-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace jqesque_cpp {

/// Parse `[op]path[=value]` into an Assignment.
///
/// The optional first character selects the operation (`+ = - ? > ~`,
/// default insert). The path runs to the first `=` outside a quoted key;
/// the remainder is the value, interpreted by infer_value(). Remove takes
/// no value; every other operation requires one.
///
/// @param input The assignment string.
/// @param separator The character dividing path segments.
/// @throws ParseError on malformed input.
auto parse(std::string_view input, Separator separator = Dot{}) -> Assignment;

/// Tokenize a bare path (no operation marker, no value).
///
/// Accepts bare keys (`foo`, `my-key`), quoted keys (`"a.b"`), indices
/// (`[0]`) and the append marker (`[-]`).
/// @throws ParseError on malformed input, including an empty path.
auto parse_path(std::string_view path, Separator separator = Dot{}) -> Path;

/// Render a Path in the textual form parse_path() accepts.
/// Keys that are not valid bare keys are quoted and escaped.
auto format_path(const Path& path, Separator separator = Dot{}) -> std::string;

/// Render an Assignment as an assignment string, marker always included.
///
/// The value is written as compact JSON, so parsing the result with the
/// same separator gives back an equal Assignment.
/// @code
/// format_assignment(parse("foo.bar[0]=hello"));  // ">foo.bar[0]=\"hello\""
/// @endcode
auto format_assignment(const Assignment& assignment, Separator separator = Dot{})
    -> std::string;

/// Interpret the raw text after `=` as a JSON value.
///
/// `true`/`false` become booleans, `null` becomes null, anything that
/// parses as a JSON document (numbers, quoted strings, objects, arrays) is
/// used as parsed, and everything else becomes the raw text as a string.
auto infer_value(std::string_view raw) -> nlohmann::json;

}  // namespace jqesque_cpp
