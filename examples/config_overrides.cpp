// config_overrides — apply command-line overrides to a JSON config
//
// Every argument is an assignment string applied, in order, to a base
// configuration. A failing override is reported and skipped; the config
// is only modified by overrides that succeed as a whole.
//
// Build: cmake --build build -DJQESQUE_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/examples/config_overrides 'server.port=9090' '~log={"level":"debug"}'

#include <jqesque-cpp/jqesque.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>
#include <vector>

namespace jq = jqesque_cpp;
using json = nlohmann::json;

namespace {

auto base_config() -> json {
    return json::parse(R"({
        "server": {"host": "0.0.0.0", "port": 8080, "workers": 4},
        "log": {"level": "info", "format": "text"},
        "features": ["search"]
    })");
}

auto default_overrides() -> std::vector<std::string> {
    return {
        "server.port=9090",
        R"(~log={"level":"debug"})",
        "+features[-]=export",
        "-server.workers",
        "=server.timeout=30",
        "?server.host=\"0.0.0.0\"",
        "tls.cert_path=/etc/ssl/server.pem",
    };
}

}  // anonymous namespace

int main(int argc, char** argv) {
    auto overrides = std::vector<std::string>{argv + 1, argv + argc};
    if (overrides.empty()) overrides = default_overrides();

    auto config = base_config();
    std::printf("base:\n%s\n\n", config.dump(2).c_str());

    auto failures = 0;
    for (const auto& text : overrides) {
        try {
            const auto a = jq::Assignment::parse(text);
            config = a.apply_copy(config);
            std::printf("  ok    %-40s %s\n", text.c_str(),
                        jq::format_assignment(a).c_str());
        } catch (const jq::ParseError& e) {
            std::printf("  FAIL  %-40s %s\n", text.c_str(), e.what());
            ++failures;
        } catch (const jq::ApplyError& e) {
            std::printf("  FAIL  %-40s %s\n", text.c_str(), e.what());
            ++failures;
        }
    }

    std::printf("\nresult:\n%s\n", config.dump(2).c_str());
    return failures == 0 ? 0 : 1;
}
