// Helper to generate seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, only a corpus generator.
//
// Every parse seed is checked against the parser first, so the corpus
// only holds inputs that reach past the error paths.

#include <jqesque-cpp/jqesque.hpp>

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace jq = jqesque_cpp;

static void write_seed(const std::string& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    const auto parse_dir = std::string{"fuzz/corpus/parse"};
    const auto apply_dir = std::string{"fuzz/corpus/apply"};
    fs::create_directories(parse_dir);
    fs::create_directories(apply_dir);

    const auto assignments = std::vector<std::string>{
        "foo.bar[0].baz=hello",
        "+items[-]={\"id\": 1}",
        "-items[0]",
        "=settings.theme.color=\"blue\"",
        "?flag=true",
        ">a[0][1][2]=null",
        "~settings={\"size\":14}",
        "\"complex.key\".\"with \\\"quotes\\\"\"=3.14",
        "\"ключ\"=значение",
    };

    auto written = 0;
    for (std::size_t i = 0; i < assignments.size(); ++i) {
        try {
            (void)jq::parse(assignments[i]);
        } catch (const jq::ParseError& e) {
            std::fprintf(stderr, "skipping seed %zu: %s\n", i, e.what());
            continue;
        }
        write_seed(parse_dir + "/seed_" + std::to_string(i) + ".txt", assignments[i]);
        ++written;
    }

    // Apply seeds: a document line followed by assignment lines.
    write_seed(apply_dir + "/seed_build.txt",
               "null\nfoo.bar[0].baz=hello\n+foo.bar[-]=1\n~foo={\"x\":{\"y\":2}}\n");
    write_seed(apply_dir + "/seed_edit.txt",
               "{\"list\":[1,2,3],\"obj\":{\"k\":\"v\"}}\n"
               "=list[1]=20\n-obj.k\n?list[0]=1\n+list[3]=4\n");
    write_seed(apply_dir + "/seed_errors.txt",
               "{\"a\":[1]}\n-missing\n=a[5]=0\na.key=1\na[-].x=1\n");

    std::printf("wrote %d parse seeds and 3 apply seeds\n", written);
    return 0;
}
