#include <jqesque-cpp/assignment.hpp>

#include <jqesque-cpp/apply.hpp>
#include <jqesque-cpp/parse.hpp>

namespace jqesque_cpp {

auto Assignment::parse(std::string_view input, Separator separator) -> Assignment {
    return jqesque_cpp::parse(input, separator);
}

auto Assignment::as_json() const -> nlohmann::json {
    auto document = nlohmann::json{};
    insert_into(document);
    return document;
}

void Assignment::insert_into(nlohmann::json& document) const {
    jqesque_cpp::apply(document, path_, Operation::insert,
                       value_.value_or(nlohmann::json{}));
}

void Assignment::merge_into(nlohmann::json& document) const {
    jqesque_cpp::apply(document, path_, Operation::merge,
                       value_.value_or(nlohmann::json{}));
}

void Assignment::apply(nlohmann::json& document) const {
    jqesque_cpp::apply(document, path_, operation_, value_);
}

auto Assignment::apply_copy(const nlohmann::json& document) const -> nlohmann::json {
    auto copy = document;
    apply(copy);
    return copy;
}

}  // namespace jqesque_cpp
