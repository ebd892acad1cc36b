#include <jqesque-cpp/apply.hpp>
#include <jqesque-cpp/error.hpp>
#include <jqesque-cpp/parse.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

using namespace jqesque_cpp;
using json = nlohmann::json;

namespace {

auto path(std::string_view p) -> Path { return parse_path(p); }

auto apply_error_kind(json& doc, std::string_view p, Operation op,
                      const std::optional<json>& value) -> ApplyErrorKind {
    try {
        apply(doc, path(p), op, value);
    } catch (const ApplyError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected ApplyError for: " << p;
    return ApplyErrorKind::path_not_found;
}

auto sample() -> json {
    return json::parse(R"({
        "existing_key": "value",
        "array": [1, 2, 3],
        "nested": {"key": "value", "array": [1, 2, 3]}
    })");
}

}  // namespace

// -- insert ------------------------------------------------------------------

TEST(ApplyInsert, builds_from_null_root) {
    auto doc = json{};
    apply(doc, path("foo.bar[0].baz"), Operation::insert, json("hello"));
    EXPECT_EQ(doc, json::parse(R"({"foo":{"bar":[{"baz":"hello"}]}})"));
}

TEST(ApplyInsert, pads_arrays_with_null) {
    auto doc = json{};
    apply(doc, path("foo[1].bar[2]"), Operation::insert, json("value"));
    EXPECT_EQ(doc, json::parse(R"({"foo":[null,{"bar":[null,null,"value"]}]})"));
}

TEST(ApplyInsert, nested_indices) {
    auto doc = json{};
    apply(doc, path("a[0][1][2]"), Operation::insert, json("value"));
    EXPECT_EQ(doc, json::parse(R"({"a":[[null,[null,null,"value"]]]})"));
}

TEST(ApplyInsert, overwrites_existing_subtree) {
    auto doc = json::parse(R"({"settings":{"theme":{"color":"red","font":"Arial","size":12}}})");
    apply(doc, path("settings.theme"), Operation::insert,
              json{{"color", "blue"}, {"font", "Helvetica"}});
    EXPECT_EQ(doc["settings"]["theme"], (json{{"color", "blue"}, {"font", "Helvetica"}}));
}

TEST(ApplyInsert, overwrites_array_element) {
    auto doc = sample();
    apply(doc, path("array[1]"), Operation::insert, json(42));
    EXPECT_EQ(doc["array"], (json{1, 42, 3}));
}

TEST(ApplyInsert, append_marker_appends) {
    auto doc = sample();
    apply(doc, path("array[-]"), Operation::insert, json(4));
    EXPECT_EQ(doc["array"], (json{1, 2, 3, 4}));
}

TEST(ApplyInsert, null_intermediate_is_replaced_by_container) {
    auto doc = json::parse(R"({"a": null})");
    apply(doc, path("a.b"), Operation::insert, json(1));
    EXPECT_EQ(doc, json::parse(R"({"a":{"b":1}})"));
}

TEST(ApplyInsert, is_idempotent) {
    auto doc = sample();
    apply(doc, path("nested.deep[0].x"), Operation::insert, json("v"));
    const auto once = doc;
    apply(doc, path("nested.deep[0].x"), Operation::insert, json("v"));
    EXPECT_EQ(doc, once);
}

TEST(ApplyInsert, reads_back_what_was_written) {
    const auto value = json::parse(R"({"k": [1, "two", null, {"x": false}]})");
    for (auto p : {"a", "a.b.c", "a[3]", "a[0][0].b", "\"x.y\".z[2]"}) {
        auto doc = json{};
        apply(doc, path(p), Operation::insert, value);
        EXPECT_EQ(get_path(doc, path(p)).value(), value) << p;
    }
}

TEST(ApplyInsert, key_against_array_is_type_mismatch) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "array.key", Operation::insert, json(1)),
              ApplyErrorKind::type_mismatch);
}

TEST(ApplyInsert, index_against_object_is_type_mismatch) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "nested[0]", Operation::insert, json(1)),
              ApplyErrorKind::type_mismatch);
}

TEST(ApplyInsert, descending_through_scalar_is_type_mismatch) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "existing_key.child", Operation::insert, json(1)),
              ApplyErrorKind::type_mismatch);
}

TEST(ApplyInsert, intermediate_append_marker_rejected) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "array[-].x", Operation::insert, json(1)),
              ApplyErrorKind::invalid_append_index);
}

TEST(ApplyInsert, containers_created_before_failure_are_kept) {
    auto doc = json::parse(R"({"a": 1})");
    EXPECT_EQ(apply_error_kind(doc, "fresh[-].x", Operation::insert, json(1)),
              ApplyErrorKind::invalid_append_index);
    EXPECT_EQ(doc, json::parse(R"({"a": 1, "fresh": []})"));
}

TEST(ApplyInsert, largest_index_is_out_of_bounds) {
    auto doc = json{};
    EXPECT_EQ(apply_error_kind(doc, "a[18446744073709551615]", Operation::insert, json(1)),
              ApplyErrorKind::index_out_of_bounds);
    EXPECT_EQ(doc, json::parse(R"({"a":[]})"));
}

TEST(ApplyInsert, largest_intermediate_index_is_out_of_bounds) {
    auto doc = json{};
    EXPECT_EQ(apply_error_kind(doc, "a[18446744073709551615].b", Operation::insert, json(1)),
              ApplyErrorKind::index_out_of_bounds);
    EXPECT_EQ(doc, json::parse(R"({"a":[]})"));
}

TEST(ApplyInsert, padding_limit) {
    auto doc = json{};
    EXPECT_EQ(apply_error_kind(doc, "a[1152921504606846975]", Operation::insert, json(1)),
              ApplyErrorKind::index_out_of_bounds);

    const auto beyond = "a[" + std::to_string(max_padded_index + 1) + "]";
    EXPECT_EQ(apply_error_kind(doc, beyond, Operation::insert, json(1)),
              ApplyErrorKind::index_out_of_bounds);
    EXPECT_TRUE(doc["a"].empty());

    apply(doc, path("a[" + std::to_string(max_padded_index) + "]"), Operation::insert, json(1));
    EXPECT_EQ(doc["a"].size(), max_padded_index + 1);
    EXPECT_EQ(doc["a"].back(), json(1));
}

TEST(ApplyInsert, failure_reports_index_segment) {
    auto doc = json{};
    try {
        apply(doc, path("a[18446744073709551615].b"), Operation::insert, json(1));
        FAIL() << "expected ApplyError";
    } catch (const ApplyError& e) {
        EXPECT_EQ(e.kind(), ApplyErrorKind::index_out_of_bounds);
        EXPECT_EQ(e.segment(), 1u);
    }
}

// -- add ---------------------------------------------------------------------

TEST(ApplyAdd, sets_object_key) {
    auto doc = sample();
    apply(doc, path("nested.new"), Operation::add, json("v"));
    EXPECT_EQ(doc["nested"]["new"], json("v"));
}

TEST(ApplyAdd, overwrites_object_key) {
    auto doc = sample();
    apply(doc, path("existing_key"), Operation::add, json(7));
    EXPECT_EQ(doc["existing_key"], json(7));
}

TEST(ApplyAdd, inserts_before_index) {
    auto doc = sample();
    apply(doc, path("array[1]"), Operation::add, json(42));
    EXPECT_EQ(doc["array"], (json{1, 42, 2, 3}));
}

TEST(ApplyAdd, index_equal_to_length_appends) {
    auto doc = sample();
    apply(doc, path("array[3]"), Operation::add, json(4));
    EXPECT_EQ(doc["array"], (json{1, 2, 3, 4}));
}

TEST(ApplyAdd, append_marker) {
    auto doc = sample();
    apply(doc, path("array[-]"), Operation::add, json(99));
    EXPECT_EQ(doc["array"], (json{1, 2, 3, 99}));
}

TEST(ApplyAdd, index_beyond_length_is_out_of_bounds) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "array[10]", Operation::add, json(1)),
              ApplyErrorKind::index_out_of_bounds);
    EXPECT_EQ(doc, sample());
}

TEST(ApplyAdd, length_property) {
    for (std::size_t len = 0; len < 4; ++len) {
        for (std::size_t n = 0; n < 6; ++n) {
            auto doc = json{{"a", json::array()}};
            for (std::size_t i = 0; i < len; ++i) doc["a"].push_back(i);
            const auto p = "a[" + std::to_string(n) + "]";
            if (n > len) {
                EXPECT_EQ(apply_error_kind(doc, p, Operation::add, json("new")),
                          ApplyErrorKind::index_out_of_bounds) << p;
            } else {
                apply(doc, path(p), Operation::add, json("new"));
                EXPECT_EQ(doc["a"].size(), len + 1) << p;
                EXPECT_EQ(doc["a"][n], json("new")) << p;
            }
        }
    }
}

TEST(ApplyAdd, largest_index_is_out_of_bounds) {
    auto doc = json{};
    EXPECT_EQ(apply_error_kind(doc, "a[18446744073709551615]", Operation::add, json(1)),
              ApplyErrorKind::index_out_of_bounds);
    EXPECT_EQ(apply_error_kind(doc, "a[18446744073709551615].b", Operation::add, json(1)),
              ApplyErrorKind::index_out_of_bounds);
}

TEST(ApplyAdd, vivifies_missing_intermediates) {
    auto doc = sample();
    apply(doc, path("nonexistent.key"), Operation::add, json("value"));
    EXPECT_EQ(doc["nonexistent"], (json{{"key", "value"}}));
}

TEST(ApplyAdd, vivifies_array_for_index) {
    auto doc = json{};
    apply(doc, path("list[0]"), Operation::add, json(1));
    EXPECT_EQ(doc, json::parse(R"({"list":[1]})"));
}

// -- remove ------------------------------------------------------------------

TEST(ApplyRemove, top_level_key) {
    auto doc = sample();
    apply(doc, path("existing_key"), Operation::remove, std::nullopt);
    EXPECT_FALSE(doc.contains("existing_key"));
    EXPECT_EQ(doc.size(), 2u);
}

TEST(ApplyRemove, nested_key) {
    auto doc = sample();
    apply(doc, path("nested.key"), Operation::remove, std::nullopt);
    EXPECT_EQ(doc["nested"], (json{{"array", {1, 2, 3}}}));
}

TEST(ApplyRemove, array_element_shifts_left) {
    auto doc = sample();
    apply(doc, path("array[1]"), Operation::remove, std::nullopt);
    EXPECT_EQ(doc["array"], (json{1, 3}));
}

TEST(ApplyRemove, whole_array) {
    auto doc = sample();
    apply(doc, path("array"), Operation::remove, std::nullopt);
    EXPECT_FALSE(doc.contains("array"));
}

TEST(ApplyRemove, missing_key_leaves_document_unchanged) {
    auto doc = sample();
    const auto before = doc.dump();
    EXPECT_EQ(apply_error_kind(doc, "nonexistent_key", Operation::remove, std::nullopt),
              ApplyErrorKind::path_not_found);
    EXPECT_EQ(doc.dump(), before);
}

TEST(ApplyRemove, missing_nested_key) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "nested.nonexistent_key", Operation::remove, std::nullopt),
              ApplyErrorKind::path_not_found);
}

TEST(ApplyRemove, missing_intermediate_is_not_created) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "nonexistent_array[0]", Operation::remove, std::nullopt),
              ApplyErrorKind::path_not_found);
    EXPECT_EQ(doc, sample());
}

TEST(ApplyRemove, index_out_of_bounds) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "array[10]", Operation::remove, std::nullopt),
              ApplyErrorKind::index_out_of_bounds);
}

TEST(ApplyRemove, append_marker_rejected) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "array[-]", Operation::remove, std::nullopt),
              ApplyErrorKind::invalid_append_index);
}

TEST(ApplyRemove, null_root_has_nothing_to_remove) {
    auto doc = json{};
    EXPECT_EQ(apply_error_kind(doc, "a", Operation::remove, std::nullopt),
              ApplyErrorKind::path_not_found);
    EXPECT_TRUE(doc.is_null());
}

// -- replace -----------------------------------------------------------------

TEST(ApplyReplace, existing_key) {
    auto doc = sample();
    apply(doc, path("nested.key"), Operation::replace, json("new_value"));
    EXPECT_EQ(doc["nested"]["key"], json("new_value"));
}

TEST(ApplyReplace, array_element_in_place) {
    auto doc = sample();
    apply(doc, path("array[1]"), Operation::replace, json(42));
    EXPECT_EQ(doc["array"], (json{1, 42, 3}));
}

TEST(ApplyReplace, whole_object) {
    auto doc = sample();
    apply(doc, path("nested"), Operation::replace, json{{"new", "object"}});
    EXPECT_EQ(doc["nested"], (json{{"new", "object"}}));
}

TEST(ApplyReplace, with_null) {
    auto doc = sample();
    apply(doc, path("nested.key"), Operation::replace, json(nullptr));
    EXPECT_TRUE(doc["nested"].contains("key"));
    EXPECT_TRUE(doc["nested"]["key"].is_null());
}

TEST(ApplyReplace, keeps_key_order) {
    auto doc = nlohmann::json::parse(R"({"a":1,"b":2,"c":3})");
    apply(doc, path("b"), Operation::replace, json(20));
    EXPECT_EQ(doc.dump(), R"({"a":1,"b":20,"c":3})");
}

TEST(ApplyReplace, missing_key) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "nested.nonexistent", Operation::replace, json(1)),
              ApplyErrorKind::path_not_found);
    EXPECT_EQ(doc, sample());
}

TEST(ApplyReplace, missing_index) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "array[10]", Operation::replace, json(1)),
              ApplyErrorKind::index_out_of_bounds);
}

TEST(ApplyReplace, key_inside_array_element_is_type_mismatch) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "array[1].key", Operation::replace, json(1)),
              ApplyErrorKind::type_mismatch);
}

TEST(ApplyReplace, key_against_array_is_type_mismatch) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "array.key", Operation::replace, json(1)),
              ApplyErrorKind::type_mismatch);
}

// -- test --------------------------------------------------------------------

TEST(ApplyTest, matching_value_succeeds_without_mutation) {
    auto doc = sample();
    EXPECT_NO_THROW(apply(doc, path("nested.key"), Operation::test, json("value")));
    EXPECT_NO_THROW(apply(doc, path("array[0]"), Operation::test, json(1)));
    EXPECT_NO_THROW(apply(doc, path("nested.array"), Operation::test, json{1, 2, 3}));
    EXPECT_EQ(doc, sample());
}

TEST(ApplyTest, nested_array_element) {
    auto doc = json::parse(R"({"array": [[null, 2]]})");
    EXPECT_NO_THROW(apply(doc, path("array[0][1]"), Operation::test, json(2)));
}

TEST(ApplyTest, mismatch_fails_without_mutation) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "existing_key", Operation::test, json("other")),
              ApplyErrorKind::test_failed);
    EXPECT_EQ(doc, sample());
}

TEST(ApplyTest, mismatch_message_shows_both_values) {
    auto doc = json{{"key", "actual_value"}};
    try {
        apply(doc, path("key"), Operation::test, json("expected_value"));
        FAIL() << "expected ApplyError";
    } catch (const ApplyError& e) {
        const auto msg = std::string{e.what()};
        EXPECT_NE(msg.find("expected_value"), std::string::npos);
        EXPECT_NE(msg.find("actual_value"), std::string::npos);
    }
}

TEST(ApplyTest, type_sensitive_comparison) {
    auto doc = json{{"n", 1}};
    EXPECT_EQ(apply_error_kind(doc, "n", Operation::test, json("1")),
              ApplyErrorKind::test_failed);
}

TEST(ApplyTest, missing_key) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "nonexistent", Operation::test, json("value")),
              ApplyErrorKind::path_not_found);
}

// -- merge -------------------------------------------------------------------

TEST(ApplyMerge, preserves_unmentioned_keys) {
    auto doc = json::parse(R"({"settings":{"theme":{"color":"red","font":"Arial","size":12}}})");
    apply(doc, path("settings.theme"), Operation::merge,
              json{{"color", "blue"}, {"font", "Helvetica"}});
    EXPECT_EQ(doc["settings"]["theme"],
              (json{{"color", "blue"}, {"font", "Helvetica"}, {"size", 12}}));
}

TEST(ApplyMerge, recursive_on_shared_objects) {
    auto doc = json::parse(R"({"a":{"b":{"c":1,"d":2}}})");
    apply(doc, path("a"), Operation::merge, json::parse(R"({"b":{"d":3,"e":4}})"));
    EXPECT_EQ(doc, json::parse(R"({"a":{"b":{"c":1,"d":3,"e":4}}})"));
}

TEST(ApplyMerge, null_overwrites_instead_of_deleting) {
    auto doc = json::parse(R"({"cfg":{"x":1,"y":2}})");
    apply(doc, path("cfg"), Operation::merge, json{{"x", nullptr}});
    EXPECT_TRUE(doc["cfg"].contains("x"));
    EXPECT_TRUE(doc["cfg"]["x"].is_null());
    EXPECT_EQ(doc["cfg"]["y"], json(2));
}

TEST(ApplyMerge, repeated_null_merge_keeps_null) {
    auto doc = json::parse(R"({"cfg":{"x":1}})");
    const auto patch = json{{"x", nullptr}};
    apply(doc, path("cfg"), Operation::merge, patch);
    doc["cfg"]["x"] = 5;
    apply(doc, path("cfg"), Operation::merge, patch);
    EXPECT_TRUE(doc["cfg"]["x"].is_null());
}

TEST(ApplyMerge, arrays_replaced_wholesale) {
    auto doc = json::parse(R"({"list":[1,2,3]})");
    apply(doc, path("list"), Operation::merge, json{9});
    EXPECT_EQ(doc["list"], json{9});
}

TEST(ApplyMerge, object_over_scalar_replaces) {
    auto doc = json::parse(R"({"v":"text"})");
    apply(doc, path("v"), Operation::merge, json{{"k", 1}});
    EXPECT_EQ(doc["v"], (json{{"k", 1}}));
}

TEST(ApplyMerge, nothing_there_acts_like_insert) {
    auto doc = json{};
    apply(doc, path("a.b[1]"), Operation::merge, json{{"k", 1}});
    EXPECT_EQ(doc, json::parse(R"({"a":{"b":[null,{"k":1}]}})"));
}

TEST(ApplyMerge, into_array_element) {
    auto doc = json::parse(R"({"items":[{"id":1,"name":"a"}]})");
    apply(doc, path("items[0]"), Operation::merge, json{{"name", "b"}});
    EXPECT_EQ(doc, json::parse(R"({"items":[{"id":1,"name":"b"}]})"));
}

TEST(ApplyMerge, largest_index_is_out_of_bounds) {
    auto doc = json{};
    EXPECT_EQ(apply_error_kind(doc, "a[18446744073709551615]", Operation::merge, json{{"k", 1}}),
              ApplyErrorKind::index_out_of_bounds);
    EXPECT_EQ(apply_error_kind(doc, "a[18446744073709551615].b", Operation::merge, json(1)),
              ApplyErrorKind::index_out_of_bounds);
    EXPECT_EQ(apply_error_kind(doc, "a[1152921504606846975]", Operation::merge, json(1)),
              ApplyErrorKind::index_out_of_bounds);
}

// -- deep_merge --------------------------------------------------------------

TEST(DeepMerge, new_keys) {
    auto doc = json{{"key", "value"}};
    deep_merge(doc, json{{"key2", "value2"}});
    EXPECT_EQ(doc, (json{{"key", "value"}, {"key2", "value2"}}));
}

TEST(DeepMerge, nested_keys) {
    auto doc = json{{"key", "value"}};
    deep_merge(doc, json::parse(R"({"parent":{"child":"value"}})"));
    EXPECT_EQ(doc, json::parse(R"({"key":"value","parent":{"child":"value"}})"));
}

TEST(DeepMerge, scalar_patch_replaces_object) {
    auto doc = json{{"key", "value"}};
    deep_merge(doc, json(5));
    EXPECT_EQ(doc, json(5));
}

// -- Root and value handling -------------------------------------------------

TEST(ApplyRoot, empty_path_insert_replaces_document) {
    auto doc = sample();
    apply(doc, Path{}, Operation::insert, json("value"));
    EXPECT_EQ(doc, json("value"));
}

TEST(ApplyRoot, empty_path_merge_and_test) {
    auto doc = json{{"a", 1}};
    apply(doc, Path{}, Operation::merge, json{{"b", 2}});
    EXPECT_EQ(doc, (json{{"a", 1}, {"b", 2}}));
    EXPECT_NO_THROW(apply(doc, Path{}, Operation::test, doc));
    EXPECT_THROW(apply(doc, Path{}, Operation::test, json(1)), ApplyError);
}

TEST(ApplyRoot, empty_path_remove_resets_to_null) {
    auto doc = sample();
    apply(doc, Path{}, Operation::remove, std::nullopt);
    EXPECT_TRUE(doc.is_null());
}

TEST(ApplyRoot, scalar_root_with_key_is_type_mismatch) {
    auto doc = json(5);
    EXPECT_EQ(apply_error_kind(doc, "a", Operation::insert, json(1)),
              ApplyErrorKind::type_mismatch);
}

TEST(ApplyValue, missing_value_rejected) {
    auto doc = sample();
    EXPECT_EQ(apply_error_kind(doc, "a", Operation::insert, std::nullopt),
              ApplyErrorKind::missing_value);
    EXPECT_EQ(apply_error_kind(doc, "existing_key", Operation::test, std::nullopt),
              ApplyErrorKind::missing_value);
}

TEST(ApplyFailure, reports_failing_segment) {
    auto doc = sample();
    try {
        apply(doc, path("nested.missing.deeper"), Operation::replace, json(1));
        FAIL() << "expected ApplyError";
    } catch (const ApplyError& e) {
        EXPECT_EQ(e.kind(), ApplyErrorKind::path_not_found);
        EXPECT_EQ(e.segment(), 1u);
        EXPECT_NE(std::string{e.what()}.find("nested.missing"), std::string::npos);
    }
}

// -- get_path ----------------------------------------------------------------

TEST(GetPath, existing_values) {
    const auto doc = sample();
    EXPECT_EQ(get_path(doc, path("nested.key")).value(), json("value"));
    EXPECT_EQ(get_path(doc, path("nested.array[2]")).value(), json(3));
    EXPECT_EQ(get_path(doc, Path{}).value(), doc);
}

TEST(GetPath, absent_or_mismatched_is_nullopt) {
    const auto doc = sample();
    EXPECT_FALSE(get_path(doc, path("nested.nope")).has_value());
    EXPECT_FALSE(get_path(doc, path("array[3]")).has_value());
    EXPECT_FALSE(get_path(doc, path("array.key")).has_value());
    EXPECT_FALSE(get_path(doc, path("array[-]")).has_value());
}
