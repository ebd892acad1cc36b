// Fuzz target for the assignment parser: markers, quoting, brackets and
// value inference with every separator.
// Any input that parses must format back to an assignment with the same
// operation and path.

#include <jqesque-cpp/jqesque.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

namespace jq = jqesque_cpp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};

    for (const auto sep : {jq::Separator{jq::Dot{}}, jq::Separator{jq::Slash{}},
                           jq::Separator{jq::Custom{':'}}}) {
        try {
            const auto a = jq::parse(input, sep);
            // Values can differ once invalid UTF-8 has been replaced by dump().
            const auto again = jq::parse(jq::format_assignment(a, sep), sep);
            if (again.operation() != a.operation() || again.path() != a.path()) {
                std::abort();
            }
        } catch (const jq::ParseError&) {
        }
    }
    return 0;
}
