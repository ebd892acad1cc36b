#include <jqesque-cpp/json.hpp>

#include <string>
#include <variant>

namespace jqesque_cpp {

namespace {

/// Escape a key for RFC 6901: ~ -> ~0, / -> ~1
auto escape_pointer_segment(const std::string& segment) -> std::string {
    auto result = std::string{};
    result.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') { result += "~0"; }
        else if (c == '/') { result += "~1"; }
        else { result += c; }
    }
    return result;
}

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, Operation op) {
    j = std::string{to_string_view(op)};
}

void to_json(nlohmann::json& j, const PathSegment& seg) {
    std::visit(overload{
        [&](const Key& k) { j = k.name; },
        [&](Index idx) { j = idx.value; },
        [&](AppendIndex) { j = "-"; },
    }, seg);
}

void to_json(nlohmann::json& j, const Assignment& a) {
    auto path = nlohmann::json::array();
    for (const auto& seg : a.path()) {
        auto seg_j = nlohmann::json{};
        to_json(seg_j, seg);
        path.push_back(std::move(seg_j));
    }
    auto op_j = nlohmann::json{};
    to_json(op_j, a.operation());

    j = nlohmann::json::object();
    j["op"] = std::move(op_j);
    j["path"] = std::move(path);
    if (a.value()) {
        j["value"] = *a.value();
    }
}

// =============================================================================
// JSON Pointer (RFC 6901)
// =============================================================================

auto to_pointer(const Path& path) -> std::string {
    auto pointer = std::string{};
    for (const auto& seg : path) {
        pointer.push_back('/');
        std::visit(overload{
            [&](const Key& k) { pointer += escape_pointer_segment(k.name); },
            [&](Index idx) { pointer += std::to_string(idx.value); },
            [&](AppendIndex) { pointer.push_back('-'); },
        }, seg);
    }
    return pointer;
}

// =============================================================================
// JSON Patch (RFC 6902)
// =============================================================================

auto to_json_patch(const Assignment& a) -> nlohmann::json {
    switch (a.operation()) {
        case Operation::insert:
        case Operation::merge:
            return a.as_json();
        case Operation::add:
        case Operation::remove:
        case Operation::replace:
        case Operation::test:
            break;
    }

    auto op = nlohmann::json::object();
    op["op"] = std::string{to_string_view(a.operation())};
    op["path"] = to_pointer(a.path());
    if (a.operation() != Operation::remove) {
        op["value"] = a.value().value_or(nlohmann::json{});
    }
    auto patch = nlohmann::json::array();
    patch.push_back(std::move(op));
    return patch;
}

}  // namespace jqesque_cpp
