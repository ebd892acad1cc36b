/// @file apply.hpp
/// @brief The operation engine: walks a Path through a JSON document.

#pragma once

#include <jqesque-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>

namespace jqesque_cpp {

/// Largest index insert and merge will pad an array up to, and the largest
/// index add, insert and merge will create an intermediate array for.
/// Beyond it they fail with index_out_of_bounds instead of allocating.
inline constexpr std::size_t max_padded_index = std::size_t{1} << 20;

/// Apply an operation at a path inside a document, in place.
///
/// add, insert and merge create missing intermediate containers: an object
/// when the following segment is a Key, an array when it is an Index or `-`.
/// A null value counts as missing, and a null root is vivified from the
/// first segment. Padding past the end of an array is capped at
/// max_padded_index. remove, replace and test require the path to exist.
/// Existing values of the wrong type are never coerced.
///
/// Not transactional: on error, containers created for earlier segments
/// stay in the document.
///
/// @param document The document to modify.
/// @param path The location. An empty path addresses the root.
/// @param op The operation to perform.
/// @param value The operand; required for every operation except remove.
/// @throws ApplyError if the operation cannot be applied.
void apply(nlohmann::json& document, const Path& path, Operation op,
           const std::optional<nlohmann::json>& value);

/// Recursively merge @p patch into @p target.
///
/// Two objects merge key by key; any other combination replaces the target
/// with the patch. A null in the patch overwrites the target value rather
/// than deleting it.
void deep_merge(nlohmann::json& target, const nlohmann::json& patch);

/// Read the value at a path without modifying the document.
/// @return The value, or nullopt if the path does not resolve.
auto get_path(const nlohmann::json& document, const Path& path)
    -> std::optional<nlohmann::json>;

}  // namespace jqesque_cpp
