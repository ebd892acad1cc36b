/// @file assignment.hpp
/// @brief The Assignment class -- a parsed `[op]path[=value]` string.

#pragma once

#include <jqesque-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>
#include <utility>

namespace jqesque_cpp {

/// An immutable (operation, path, value) triple produced by parsing.
///
/// An Assignment owns its data and holds no reference to the input string
/// or to any document. It can be applied any number of times to distinct
/// documents; every application is independent.
///
/// @code
/// auto a = Assignment::parse("foo.bar[0].baz=hello");
/// auto doc = a.as_json();  // {"foo":{"bar":[{"baz":"hello"}]}}
/// @endcode
class Assignment {
public:
    /// Construct directly from parts. No validation beyond what apply() does.
    Assignment(Operation op, Path path, std::optional<nlohmann::json> value)
        : operation_{op}, path_{std::move(path)}, value_{std::move(value)} {}

    /// Parse an assignment string.
    /// @param input e.g. `"~settings.theme={\"color\":\"blue\"}"`.
    /// @param separator The path separator (default: Dot).
    /// @throws ParseError on malformed input.
    static auto parse(std::string_view input, Separator separator = Dot{}) -> Assignment;

    // -- Accessors ------------------------------------------------------------

    auto operation() const -> Operation { return operation_; }
    auto path() const -> const Path& { return path_; }
    auto value() const -> const std::optional<nlohmann::json>& { return value_; }

    // -- Application ----------------------------------------------------------

    /// Build a new document from an empty root using insert semantics.
    /// A value-less (remove) assignment places null at the path.
    auto as_json() const -> nlohmann::json;

    /// Upsert the value at the path, regardless of the recorded operation.
    /// @throws ApplyError on a type conflict along the path.
    void insert_into(nlohmann::json& document) const;

    /// Deep-merge the value at the path, regardless of the recorded operation.
    /// @throws ApplyError on a type conflict along the path.
    void merge_into(nlohmann::json& document) const;

    /// Apply the recorded operation in place.
    ///
    /// Not transactional: on error, intermediate containers created before
    /// the failing segment remain in the document. Use apply_copy() when the
    /// original must survive a failure untouched.
    /// @throws ApplyError if the operation cannot be applied.
    void apply(nlohmann::json& document) const;

    /// Apply the recorded operation to a copy of the document.
    /// @return The modified copy. @p document is never changed.
    /// @throws ApplyError if the operation cannot be applied.
    auto apply_copy(const nlohmann::json& document) const -> nlohmann::json;

    auto operator==(const Assignment& other) const -> bool = default;

private:
    Operation operation_;
    Path path_;
    std::optional<nlohmann::json> value_;
};

}  // namespace jqesque_cpp
