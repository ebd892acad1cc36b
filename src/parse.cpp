#include <jqesque-cpp/parse.hpp>

#include <jqesque-cpp/error.hpp>

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace jqesque_cpp {

namespace {

auto is_bare_key_char(char c) -> bool {
    const auto u = static_cast<unsigned char>(c);
    return u >= 0x80
        || (c >= 'a' && c <= 'z')
        || (c >= 'A' && c <= 'Z')
        || (c >= '0' && c <= '9')
        || c == '_' || c == '-';
}

auto is_ascii_punct(char c) -> bool {
    return (c >= '!' && c <= '/') || (c >= ':' && c <= '@')
        || (c >= '[' && c <= '`') || (c >= '{' && c <= '~');
}

[[noreturn]] void fail(ParseErrorKind kind, std::size_t pos, std::string_view what) {
    throw ParseError{kind, pos,
                     std::string{what} + " at offset " + std::to_string(pos)};
}

void validate_separator(char sep) {
    switch (sep) {
        case '[': case ']': case '"': case '\\': case '=':
        case ' ': case '\t': case '\n': case '\r': case '\0':
            fail(ParseErrorKind::invalid_separator, 0,
                 std::string{"separator '"} + sep + "' collides with path syntax");
        default:
            break;
    }
}

/// Single-pass path tokenizer. Stops at the first `=` that is not inside a
/// quoted key, or at the end of the input.
class PathScanner {
public:
    PathScanner(std::string_view input, std::size_t pos, char sep)
        : input_{input}, pos_{pos}, sep_{sep} {}

    auto position() const -> std::size_t { return pos_; }

    auto scan() -> Path {
        auto segments = Path{};
        auto expect_segment = true;  // at the start, or right after a separator
        while (pos_ < input_.size()) {
            const auto c = input_[pos_];
            if (c == '=') break;

            if (c == '[') {
                segments.push_back(scan_bracket());
                expect_segment = false;
                continue;
            }
            if (c == sep_) {
                if (expect_segment) {
                    fail(ParseErrorKind::empty_segment, pos_, "empty path segment");
                }
                expect_segment = true;
                ++pos_;
                continue;
            }
            if (c == '\\') {
                fail(ParseErrorKind::invalid_escape, pos_, "escape outside quoted key");
            }
            if (!expect_segment) {
                fail(ParseErrorKind::unexpected_character, pos_,
                     std::string{"unexpected '"} + c + "' after segment");
            }
            if (c == '"') {
                segments.push_back(Key{scan_quoted()});
            } else if (is_bare_key_char(c)) {
                segments.push_back(Key{scan_bare()});
            } else {
                fail(ParseErrorKind::unexpected_character, pos_,
                     std::string{"unexpected '"} + c + "' in path");
            }
            expect_segment = false;
        }

        if (segments.empty()) {
            fail(ParseErrorKind::empty_path, pos_, "empty path");
        }
        if (expect_segment) {
            fail(ParseErrorKind::empty_segment, pos_, "trailing separator");
        }
        return segments;
    }

private:
    auto scan_bracket() -> PathSegment {
        const auto open = pos_;
        const auto close = input_.find(']', open + 1);
        if (close == std::string_view::npos) {
            fail(ParseErrorKind::unterminated_bracket, open, "unterminated '['");
        }
        const auto content = input_.substr(open + 1, close - open - 1);
        pos_ = close + 1;

        if (content == "-") return AppendIndex{};

        auto value = std::size_t{0};
        const auto* first = content.data();
        const auto* last = content.data() + content.size();
        // from_chars accepts neither a sign nor whitespace, so this rejects
        // "-1", "+1", " 1" and empty brackets as well as overflow.
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (content.empty() || ec != std::errc{} || ptr != last) {
            fail(ParseErrorKind::invalid_index, open,
                 "invalid array index '" + std::string{content} + "'");
        }
        return Index{value};
    }

    auto scan_quoted() -> std::string {
        const auto open = pos_++;
        auto out = std::string{};
        while (true) {
            if (pos_ >= input_.size()) {
                fail(ParseErrorKind::unterminated_quote, open, "unterminated quoted key");
            }
            const auto c = input_[pos_++];
            if (c == '"') return out;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= input_.size()) {
                fail(ParseErrorKind::unterminated_quote, open, "unterminated quoted key");
            }
            switch (input_[pos_++]) {
                case '\\': out.push_back('\\'); break;
                case '"':  out.push_back('"');  break;
                case 'n':  out.push_back('\n'); break;
                case 'r':  out.push_back('\r'); break;
                case 't':  out.push_back('\t'); break;
                default:
                    fail(ParseErrorKind::invalid_escape, pos_ - 2,
                         std::string{"invalid escape '\\"} + input_[pos_ - 1] + "'");
            }
        }
    }

    auto scan_bare() -> std::string {
        const auto start = pos_;
        while (pos_ < input_.size() && input_[pos_] != sep_ && is_bare_key_char(input_[pos_])) {
            ++pos_;
        }
        return std::string{input_.substr(start, pos_ - start)};
    }

    std::string_view input_;
    std::size_t pos_;
    char sep_;
};

auto needs_quoting(const std::string& key, char sep) -> bool {
    if (key.empty()) return true;
    for (auto c : key) {
        if (c == sep || !is_bare_key_char(c)) return true;
    }
    return false;
}

void append_quoted(std::string& out, const std::string& key) {
    out.push_back('"');
    for (auto c : key) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:   out.push_back(c); break;
        }
    }
    out.push_back('"');
}

}  // anonymous namespace

// =============================================================================
// Assignment parsing
// =============================================================================

auto parse(std::string_view input, Separator separator) -> Assignment {
    const auto sep = separator_char(separator);
    validate_separator(sep);

    auto op = Operation::insert;
    auto pos = std::size_t{0};
    if (!input.empty()) {
        const auto first = input.front();
        if (auto marker = from_marker(first)) {
            op = *marker;
            pos = 1;
        } else if (is_ascii_punct(first) && first != sep &&
                   first != '"' && first != '[' && first != '_' && first != '\\') {
            fail(ParseErrorKind::unknown_operation_marker, 0,
                 std::string{"unknown operation marker '"} + first + "'");
        }
    }

    auto scanner = PathScanner{input, pos, sep};
    auto path = scanner.scan();
    pos = scanner.position();

    if (pos >= input.size()) {
        if (requires_value(op)) {
            fail(ParseErrorKind::missing_value, pos,
                 std::string{to_string_view(op)} + " requires a value");
        }
        return Assignment{op, std::move(path), std::nullopt};
    }

    // input[pos] is the '=' that ended the path
    if (!requires_value(op)) {
        fail(ParseErrorKind::unexpected_value, pos, "remove does not take a value");
    }
    ++pos;
    if (pos < input.size() && input[pos] == ' ') ++pos;
    if (pos >= input.size()) {
        fail(ParseErrorKind::missing_value, pos,
             std::string{to_string_view(op)} + " requires a value");
    }
    return Assignment{op, std::move(path), infer_value(input.substr(pos))};
}

auto parse_path(std::string_view path, Separator separator) -> Path {
    const auto sep = separator_char(separator);
    validate_separator(sep);

    auto scanner = PathScanner{path, 0, sep};
    auto result = scanner.scan();
    if (scanner.position() < path.size()) {
        fail(ParseErrorKind::unexpected_character, scanner.position(),
             "unexpected '=' in path");
    }
    return result;
}

auto format_path(const Path& path, Separator separator) -> std::string {
    const auto sep = separator_char(separator);
    auto out = std::string{};
    for (std::size_t i = 0; i < path.size(); ++i) {
        std::visit(overload{
            [&](const Key& k) {
                if (i > 0) out.push_back(sep);
                if (needs_quoting(k.name, sep)) {
                    append_quoted(out, k.name);
                } else {
                    out += k.name;
                }
            },
            [&](Index idx) { out += "[" + std::to_string(idx.value) + "]"; },
            [&](AppendIndex) { out += "[-]"; },
        }, path[i]);
    }
    return out;
}

auto format_assignment(const Assignment& assignment, Separator separator) -> std::string {
    auto out = std::string(1, to_marker(assignment.operation()));
    out += format_path(assignment.path(), separator);
    if (const auto& value = assignment.value()) {
        out.push_back('=');
        out += value->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return out;
}

// =============================================================================
// Value inference
// =============================================================================

auto infer_value(std::string_view raw) -> nlohmann::json {
    if (raw == "true") return true;
    if (raw == "false") return false;
    if (raw == "null") return nullptr;

    auto parsed = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
    if (!parsed.is_discarded()) return parsed;

    return std::string{raw};
}

}  // namespace jqesque_cpp
