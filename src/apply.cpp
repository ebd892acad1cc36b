#include <jqesque-cpp/apply.hpp>

#include <jqesque-cpp/error.hpp>
#include <jqesque-cpp/parse.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace jqesque_cpp {

namespace {

using nlohmann::json;

/// Textual form of the first `count` segments, for error messages.
auto prefix(const Path& path, std::size_t count) -> std::string {
    auto head = Path(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(count));
    return head.empty() ? std::string{"<root>"} : format_path(head);
}

[[noreturn]] void fail(ApplyErrorKind kind, const Path& path, std::size_t i,
                       const std::string& what) {
    throw ApplyError{kind, i, what + " at " + prefix(path, i + 1)};
}

auto container_for(const PathSegment& seg) -> json {
    return is_key(seg) ? json::object() : json::array();
}

/// Reject a non-null node whose type cannot hold `path[i]`.
void check_kind(const json& node, const Path& path, std::size_t i) {
    if (is_key(path[i]) && !node.is_object()) {
        fail(ApplyErrorKind::type_mismatch, path, i,
             std::string{"expected object, found "} + node.type_name());
    }
    if (is_array_position(path[i]) && !node.is_array()) {
        fail(ApplyErrorKind::type_mismatch, path, i,
             std::string{"expected array, found "} + node.type_name());
    }
}

/// Make `node` able to hold `path[i]`, creating the container if it is null.
void prepare(json& node, const Path& path, std::size_t i) {
    if (node.is_null()) {
        node = container_for(path[i]);
        return;
    }
    check_kind(node, path, i);
}

/// Like check_kind(), but a null node means the path does not exist.
void require_container(const json& node, const Path& path, std::size_t i) {
    if (node.is_null()) {
        fail(ApplyErrorKind::path_not_found, path, i, "no container");
    }
    check_kind(node, path, i);
}

/// Grow `array` with nulls until `index` is a valid position.
void pad_through(json& array, std::size_t index, const Path& path, std::size_t i) {
    if (index < array.size()) return;
    if (index > max_padded_index) {
        fail(ApplyErrorKind::index_out_of_bounds, path, i,
             "index " + std::to_string(index) + " exceeds padding limit " +
                 std::to_string(max_padded_index));
    }
    while (array.size() <= index) array.push_back(nullptr);
}

// -- Traversal ----------------------------------------------------------------

/// Step into `path[i]`, creating it from the shape of `path[i + 1]`.
auto descend_or_create(json& node, const Path& path, std::size_t i) -> json& {
    auto& child = std::visit(overload{
        [&](const Key& k) -> json& { return node[k.name]; },
        [&](Index idx) -> json& {
            pad_through(node, idx.value, path, i);
            return node[idx.value];
        },
        [&](AppendIndex) -> json& {
            fail(ApplyErrorKind::invalid_append_index, path, i,
                 "'-' is only valid as the last segment");
        },
    }, path[i]);
    prepare(child, path, i + 1);
    return child;
}

/// The existing value at `path[i]` inside `node`.
auto existing_child(json& node, const Path& path, std::size_t i) -> json& {
    return std::visit(overload{
        [&](const Key& k) -> json& {
            auto it = node.find(k.name);
            if (it == node.end()) {
                fail(ApplyErrorKind::path_not_found, path, i, "key not found");
            }
            return *it;
        },
        [&](Index idx) -> json& {
            if (idx.value >= node.size()) {
                fail(ApplyErrorKind::index_out_of_bounds, path, i,
                     "index " + std::to_string(idx.value) + " beyond array of size " +
                         std::to_string(node.size()));
            }
            return node[idx.value];
        },
        [&](AppendIndex) -> json& {
            fail(ApplyErrorKind::invalid_append_index, path, i,
                 "'-' does not address an existing element");
        },
    }, path[i]);
}

// -- Leaf operations ----------------------------------------------------------
// `parent` already has the container type path[i] needs.

void add_at(json& parent, const Path& path, std::size_t i, const json& value) {
    std::visit(overload{
        [&](const Key& k) { parent[k.name] = value; },
        [&](Index idx) {
            if (idx.value > parent.size()) {
                fail(ApplyErrorKind::index_out_of_bounds, path, i,
                     "index " + std::to_string(idx.value) + " beyond array of size " +
                         std::to_string(parent.size()));
            }
            parent.insert(parent.begin() + static_cast<std::ptrdiff_t>(idx.value), value);
        },
        [&](AppendIndex) { parent.push_back(value); },
    }, path[i]);
}

void insert_at(json& parent, const Path& path, std::size_t i, const json& value) {
    std::visit(overload{
        [&](const Key& k) { parent[k.name] = value; },
        [&](Index idx) {
            pad_through(parent, idx.value, path, i);
            parent[idx.value] = value;
        },
        [&](AppendIndex) { parent.push_back(value); },
    }, path[i]);
}

void merge_at(json& parent, const Path& path, std::size_t i, const json& value) {
    std::visit(overload{
        [&](const Key& k) { deep_merge(parent[k.name], value); },
        [&](Index idx) {
            pad_through(parent, idx.value, path, i);
            deep_merge(parent[idx.value], value);
        },
        [&](AppendIndex) { parent.push_back(value); },
    }, path[i]);
}

void remove_at(json& parent, const Path& path, std::size_t i) {
    std::visit(overload{
        [&](const Key& k) {
            auto it = parent.find(k.name);
            if (it == parent.end()) {
                fail(ApplyErrorKind::path_not_found, path, i, "key not found");
            }
            parent.erase(it);
        },
        [&](Index idx) {
            if (idx.value >= parent.size()) {
                fail(ApplyErrorKind::index_out_of_bounds, path, i,
                     "index " + std::to_string(idx.value) + " beyond array of size " +
                         std::to_string(parent.size()));
            }
            parent.erase(idx.value);
        },
        [&](AppendIndex) {
            fail(ApplyErrorKind::invalid_append_index, path, i,
                 "'-' does not address an existing element");
        },
    }, path[i]);
}

void test_value(const json& actual, const json& expected, const Path& path, std::size_t i) {
    if (actual != expected) {
        fail(ApplyErrorKind::test_failed, path, i,
             "expected " + expected.dump() + " but found " + actual.dump());
    }
}

void apply_at_root(json& document, Operation op, const std::optional<json>& value) {
    switch (op) {
        case Operation::add:
        case Operation::insert:
        case Operation::replace:
            document = *value;
            return;
        case Operation::merge:
            deep_merge(document, *value);
            return;
        case Operation::remove:
            document = nullptr;
            return;
        case Operation::test:
            if (document != *value) {
                throw ApplyError{ApplyErrorKind::test_failed, 0,
                                 "expected " + value->dump() + " but found " +
                                     document.dump() + " at <root>"};
            }
            return;
    }
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

void apply(nlohmann::json& document, const Path& path, Operation op,
           const std::optional<nlohmann::json>& value) {
    if (requires_value(op) && !value) {
        throw ApplyError{ApplyErrorKind::missing_value, 0,
                         std::string{to_string_view(op)} + " requires a value"};
    }
    if (path.empty()) {
        apply_at_root(document, op, value);
        return;
    }

    const auto last = path.size() - 1;
    auto* node = &document;
    if (vivifies(op)) {
        prepare(*node, path, 0);
        for (std::size_t i = 0; i < last; ++i) {
            node = &descend_or_create(*node, path, i);
        }
    } else {
        for (std::size_t i = 0; i < last; ++i) {
            require_container(*node, path, i);
            node = &existing_child(*node, path, i);
        }
        require_container(*node, path, last);
    }

    switch (op) {
        case Operation::add:
            add_at(*node, path, last, *value);
            return;
        case Operation::insert:
            insert_at(*node, path, last, *value);
            return;
        case Operation::merge:
            merge_at(*node, path, last, *value);
            return;
        case Operation::remove:
            remove_at(*node, path, last);
            return;
        case Operation::replace:
            existing_child(*node, path, last) = *value;
            return;
        case Operation::test:
            test_value(existing_child(*node, path, last), *value, path, last);
            return;
    }
}

void deep_merge(nlohmann::json& target, const nlohmann::json& patch) {
    if (target.is_object() && patch.is_object()) {
        for (auto it = patch.begin(); it != patch.end(); ++it) {
            deep_merge(target[it.key()], it.value());
        }
        return;
    }
    target = patch;
}

auto get_path(const nlohmann::json& document, const Path& path)
    -> std::optional<nlohmann::json> {
    const auto* node = &document;
    for (const auto& seg : path) {
        const auto* next = std::visit(overload{
            [&](const Key& k) -> const json* {
                if (!node->is_object()) return nullptr;
                auto it = node->find(k.name);
                return it == node->end() ? nullptr : &*it;
            },
            [&](Index idx) -> const json* {
                if (!node->is_array() || idx.value >= node->size()) return nullptr;
                return &(*node)[idx.value];
            },
            [](AppendIndex) -> const json* { return nullptr; },
        }, seg);
        if (next == nullptr) return std::nullopt;
        node = next;
    }
    return *node;
}

}  // namespace jqesque_cpp
