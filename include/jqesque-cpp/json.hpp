/// @file json.hpp
/// @brief nlohmann/json interoperability for jqesque-cpp.
///
/// Provides ADL serialization (to_json), JSON Pointer (RFC 6901) rendering
/// of paths, and JSON Patch (RFC 6902) export of assignments.

#pragma once

#include <jqesque-cpp/assignment.hpp>
#include <jqesque-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace jqesque_cpp {

// =============================================================================
// ADL serialization: to_json
// =============================================================================

void to_json(nlohmann::json& j, Operation op);
void to_json(nlohmann::json& j, const PathSegment& seg);

/// `{"op": ..., "path": [...segments], "value": ...}`; no "value" when absent.
void to_json(nlohmann::json& j, const Assignment& a);

// =============================================================================
// JSON Pointer (RFC 6901)
// =============================================================================

/// Render a path as a JSON Pointer.
/// Keys are escaped (`~` -> `~0`, `/` -> `~1`); the append marker is `-`.
/// @code
/// to_pointer(parse_path("foo.bar[0]"));  // "/foo/bar/0"
/// @endcode
auto to_pointer(const Path& path) -> std::string;

// =============================================================================
// JSON Patch (RFC 6902)
// =============================================================================

/// Express an assignment as an RFC 6902 patch.
///
/// add, remove, replace and test become a one-element operation array.
/// insert and merge have no RFC 6902 counterpart; for them the result is
/// the document as_json() would build.
auto to_json_patch(const Assignment& a) -> nlohmann::json;

}  // namespace jqesque_cpp
