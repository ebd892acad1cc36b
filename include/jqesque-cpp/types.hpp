/// @file types.hpp
/// @brief Core vocabulary types: Separator, PathSegment, Path, Operation.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jqesque_cpp {

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Key& k) { ... },
///     [](Index i) { ... },
///     [](AppendIndex) { ... },
/// }, segment);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// =============================================================================
// Separator
// =============================================================================

/// Segments separated by `.` (the default).
struct Dot {
    auto operator==(const Dot&) const -> bool = default;
};

/// Segments separated by `/`.
struct Slash {
    auto operator==(const Slash&) const -> bool = default;
};

/// Segments separated by a caller-supplied character.
struct Custom {
    char ch{'.'};  ///< The separator character.

    auto operator==(const Custom&) const -> bool = default;
};

/// The character dividing path segments. Never divides bracketed indices.
using Separator = std::variant<Dot, Slash, Custom>;

/// Get the character a Separator splits on.
constexpr auto separator_char(const Separator& sep) noexcept -> char {
    if (std::holds_alternative<Slash>(sep)) return '/';
    if (const auto* c = std::get_if<Custom>(&sep)) return c->ch;
    return '.';
}

// =============================================================================
// PathSegment / Path
// =============================================================================

/// An object key.
struct Key {
    std::string name;  ///< The key, unescaped.

    auto operator<=>(const Key&) const = default;
    auto operator==(const Key&) const -> bool = default;
};

/// An array position.
struct Index {
    std::size_t value{0};  ///< Zero-based array position.

    auto operator<=>(const Index&) const = default;
    auto operator==(const Index&) const -> bool = default;
};

/// The `-` marker: the position after the last array element.
struct AppendIndex {
    auto operator<=>(const AppendIndex&) const = default;
    auto operator==(const AppendIndex&) const -> bool = default;
};

/// One step of a JSON path.
using PathSegment = std::variant<Key, Index, AppendIndex>;

/// An ordered sequence of segments, root first.
using Path = std::vector<PathSegment>;

/// Check if a segment addresses an object member.
constexpr auto is_key(const PathSegment& seg) noexcept -> bool {
    return std::holds_alternative<Key>(seg);
}

/// Check if a segment addresses an array element (Index or AppendIndex).
constexpr auto is_array_position(const PathSegment& seg) noexcept -> bool {
    return !std::holds_alternative<Key>(seg);
}

// =============================================================================
// Operation
// =============================================================================

/// What an assignment does at its path.
enum class Operation : std::uint8_t {
    add,      ///< `+` RFC 6902 add: insert before an index, or set a key.
    remove,   ///< `-` Delete an existing key or element.
    replace,  ///< `=` Overwrite an existing key or element.
    test,     ///< `?` Require the existing value to equal the given one.
    insert,   ///< `>` Upsert, creating missing containers. The default.
    merge,    ///< `~` Deep-merge into the existing value.
};

/// Convert an Operation to its string representation.
constexpr auto to_string_view(Operation op) noexcept -> std::string_view {
    switch (op) {
        case Operation::add:     return "add";
        case Operation::remove:  return "remove";
        case Operation::replace: return "replace";
        case Operation::test:    return "test";
        case Operation::insert:  return "insert";
        case Operation::merge:   return "merge";
    }
    return "unknown";
}

/// The prefix character selecting an Operation.
constexpr auto to_marker(Operation op) noexcept -> char {
    switch (op) {
        case Operation::add:     return '+';
        case Operation::remove:  return '-';
        case Operation::replace: return '=';
        case Operation::test:    return '?';
        case Operation::insert:  return '>';
        case Operation::merge:   return '~';
    }
    return '>';
}

/// Map a prefix character to its Operation, or nullopt if it is not a marker.
constexpr auto from_marker(char c) noexcept -> std::optional<Operation> {
    switch (c) {
        case '+': return Operation::add;
        case '-': return Operation::remove;
        case '=': return Operation::replace;
        case '?': return Operation::test;
        case '>': return Operation::insert;
        case '~': return Operation::merge;
        default:  return std::nullopt;
    }
}

/// Check if an Operation creates missing containers on the way to its target.
constexpr auto vivifies(Operation op) noexcept -> bool {
    switch (op) {
        case Operation::add:
        case Operation::insert:
        case Operation::merge:
            return true;
        case Operation::remove:
        case Operation::replace:
        case Operation::test:
            return false;
    }
    return false;
}

/// Check if an Operation requires a value.
constexpr auto requires_value(Operation op) noexcept -> bool {
    return op != Operation::remove;
}

}  // namespace jqesque_cpp
