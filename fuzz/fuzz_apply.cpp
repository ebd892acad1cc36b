// Fuzz target for the operation engine. The first line of the input is
// a JSON document and every following line an assignment applied to it.
// Successful inserts must read back the value they wrote.

#include <jqesque-cpp/jqesque.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

namespace jq = jqesque_cpp;

namespace {

// Each line may pad an array up to max_padded_index; cap the lines per
// input so the worst case stays inside libFuzzer's RSS limit.
constexpr int max_lines = 16;

}  // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto input = std::string_view{reinterpret_cast<const char*>(data), size};

    const auto eol = input.find('\n');
    const auto head = input.substr(0, eol);
    auto doc = nlohmann::json::parse(head.begin(), head.end(), nullptr, false);
    if (doc.is_discarded()) return 0;
    if (eol == std::string_view::npos) return 0;
    input.remove_prefix(eol + 1);

    for (int n = 0; n < max_lines && !input.empty(); ++n) {
        const auto end = input.find('\n');
        const auto line = input.substr(0, end);
        input.remove_prefix(end == std::string_view::npos ? input.size() : end + 1);

        try {
            const auto a = jq::parse(line);
            a.apply(doc);
            if (a.operation() == jq::Operation::insert && !a.path().empty() &&
                !jq::is_array_position(a.path().back())) {
                if (jq::get_path(doc, a.path()) != a.value()) std::abort();
            }
        } catch (const jq::ParseError&) {
        } catch (const jq::ApplyError&) {
        }
    }
    return 0;
}
