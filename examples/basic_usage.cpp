// basic_usage — demonstrates the core jqesque-cpp API
//
// Shows parsing assignment strings with each operation marker, building
// a document from nothing, insert vs merge, custom separators, error
// handling, and JSON Patch export.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <jqesque-cpp/jqesque.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

namespace jq = jqesque_cpp;
using json = nlohmann::json;

static void show(const char* label, const json& doc) {
    std::printf("%-28s %s\n", label, doc.dump().c_str());
}

int main() {
    // -- Build a document from an empty root ----------------------------------
    auto doc = jq::Assignment::parse("foo.bar[0].baz=hello").as_json();
    show("as_json:", doc);

    // -- Each marker -----------------------------------------------------------
    jq::Assignment::parse("+foo.bar[-]={\"baz\": 42}").apply(doc);
    show("+ append:", doc);

    jq::Assignment::parse("=foo.bar[0].baz=world").apply(doc);
    show("= replace:", doc);

    jq::Assignment::parse("~foo.bar[1]={\"extra\": true}").apply(doc);
    show("~ merge:", doc);

    jq::Assignment::parse("?foo.bar[1].baz=42").apply(doc);
    std::printf("%-28s passed\n", "? test:");

    jq::Assignment::parse("-foo.bar[0]").apply(doc);
    show("- remove:", doc);

    jq::Assignment::parse(">foo.flags[2]=true").apply(doc);
    show("> insert (padded):", doc);

    // -- Insert overwrites, merge preserves ------------------------------------
    const auto base = json::parse(R"({"theme":{"color":"red","size":12}})");
    const auto change = jq::Assignment::parse(R"(theme={"color":"blue"})");

    auto inserted = base;
    change.insert_into(inserted);
    show("insert_into:", inserted);

    auto merged = base;
    change.merge_into(merged);
    show("merge_into:", merged);

    // -- Other separators -----------------------------------------------------
    show("slash:", jq::Assignment::parse("a/b[0]/c=1", jq::Slash{}).as_json());
    show("custom ':':", jq::Assignment::parse("a:b:c=null", jq::Custom{':'}).as_json());

    // -- Errors ---------------------------------------------------------------
    try {
        jq::Assignment::parse("foo[abc]=1");
    } catch (const jq::ParseError& e) {
        std::printf("parse error (%s): %s\n",
                    std::string{jq::to_string_view(e.kind())}.c_str(), e.what());
    }

    try {
        jq::Assignment::parse("?foo.bar[0].baz=0").apply(doc);
    } catch (const jq::ApplyError& e) {
        std::printf("apply error (%s): %s\n",
                    std::string{jq::to_string_view(e.kind())}.c_str(), e.what());
    }

    // -- JSON Patch export ----------------------------------------------------
    const auto a = jq::Assignment::parse("+items[-]=\"milk\"");
    show("as assignment json:", json(a));
    show("as RFC 6902 patch:", jq::to_json_patch(a));

    return 0;
}
