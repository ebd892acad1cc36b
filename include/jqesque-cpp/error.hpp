/// @file error.hpp
/// @brief Error types for the jqesque-cpp library.
///
/// Two disjoint taxonomies: ParseError for malformed assignment strings,
/// ApplyError for well-formed assignments that cannot be applied to a
/// particular document.

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace jqesque_cpp {

/// Reasons an assignment string can fail to parse.
enum class ParseErrorKind : std::uint8_t {
    empty_path,                ///< No path segment before `=` or end of input.
    unknown_operation_marker,  ///< Leading punctuation that is not an operation marker.
    unterminated_bracket,      ///< `[` without a closing `]`.
    invalid_index,             ///< Bracket content other than digits or `-`.
    missing_value,             ///< Non-remove operation without `=value`.
    empty_segment,             ///< Leading, doubled or trailing separator.
    unterminated_quote,        ///< Quoted key without a closing `"`.
    invalid_escape,            ///< Unsupported `\` escape.
    unexpected_character,      ///< Character that cannot appear at this point of the path.
    unexpected_value,          ///< Remove operation followed by `=value`.
    invalid_separator,         ///< Custom separator that collides with path syntax.
};

/// Convert a ParseErrorKind to its string representation.
constexpr auto to_string_view(ParseErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ParseErrorKind::empty_path:               return "empty_path";
        case ParseErrorKind::unknown_operation_marker: return "unknown_operation_marker";
        case ParseErrorKind::unterminated_bracket:     return "unterminated_bracket";
        case ParseErrorKind::invalid_index:            return "invalid_index";
        case ParseErrorKind::missing_value:            return "missing_value";
        case ParseErrorKind::empty_segment:            return "empty_segment";
        case ParseErrorKind::unterminated_quote:       return "unterminated_quote";
        case ParseErrorKind::invalid_escape:           return "invalid_escape";
        case ParseErrorKind::unexpected_character:     return "unexpected_character";
        case ParseErrorKind::unexpected_value:         return "unexpected_value";
        case ParseErrorKind::invalid_separator:        return "invalid_separator";
    }
    return "unknown";
}

/// Reasons a parsed assignment can fail to apply to a document.
enum class ApplyErrorKind : std::uint8_t {
    path_not_found,        ///< Key or container absent for remove/replace/test.
    index_out_of_bounds,   ///< Array index beyond what the operation allows.
    type_mismatch,         ///< Segment kind conflicts with the existing value's type.
    test_failed,           ///< Test operation found a different value.
    invalid_append_index,  ///< `-` used where no element can be addressed.
    missing_value,         ///< Operation other than remove invoked without a value.
};

/// Convert an ApplyErrorKind to its string representation.
constexpr auto to_string_view(ApplyErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ApplyErrorKind::path_not_found:       return "path_not_found";
        case ApplyErrorKind::index_out_of_bounds:  return "index_out_of_bounds";
        case ApplyErrorKind::type_mismatch:        return "type_mismatch";
        case ApplyErrorKind::test_failed:          return "test_failed";
        case ApplyErrorKind::invalid_append_index: return "invalid_append_index";
        case ApplyErrorKind::missing_value:        return "missing_value";
    }
    return "unknown";
}

/// Thrown when an assignment string is malformed.
class ParseError : public std::runtime_error {
public:
    /// @param kind The category of the failure.
    /// @param position Byte offset in the input where it was detected.
    /// @param message A human-readable description.
    ParseError(ParseErrorKind kind, std::size_t position, const std::string& message)
        : std::runtime_error{message}, kind_{kind}, position_{position} {}

    auto kind() const noexcept -> ParseErrorKind { return kind_; }
    auto position() const noexcept -> std::size_t { return position_; }

private:
    ParseErrorKind kind_;
    std::size_t position_;
};

/// Thrown when an assignment cannot be applied to a document.
class ApplyError : public std::runtime_error {
public:
    /// @param kind The category of the failure.
    /// @param segment Index of the path segment being resolved.
    /// @param message A human-readable description.
    ApplyError(ApplyErrorKind kind, std::size_t segment, const std::string& message)
        : std::runtime_error{message}, kind_{kind}, segment_{segment} {}

    auto kind() const noexcept -> ApplyErrorKind { return kind_; }
    auto segment() const noexcept -> std::size_t { return segment_; }

private:
    ApplyErrorKind kind_;
    std::size_t segment_;
};

}  // namespace jqesque_cpp
