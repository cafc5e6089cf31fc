#include "field_value.h"

#include <string>
#include <vector>
#include <variant>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace ptt 
{

bool is_truthy(const FieldValue& value) {
    if (auto v = std::get_if<bool>(&value)) {
        return *v;
    }
    if (auto v = std::get_if<int>(&value)) {
        return *v != 0;
    }
    if (auto v = std::get_if<std::string>(&value)) {
        return !v->empty();
    }
    // lists are truthy even when empty
    return !is_empty(value);
}

bool is_empty(const FieldValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

std::string to_string(const FieldValue& value) {
    if (auto v = std::get_if<bool>(&value)) {
        return *v ? "true" : "false";
    }
    if (auto v = std::get_if<int>(&value)) {
        return fmt::format("{}", *v);
    }
    if (auto v = std::get_if<std::string>(&value)) {
        return *v;
    }
    if (auto v = std::get_if<std::vector<int>>(&value)) {
        return fmt::format("[{}]", fmt::join(*v, ", "));
    }
    if (auto v = std::get_if<std::vector<std::string>>(&value)) {
        return fmt::format("[{}]", fmt::join(*v, ", "));
    }
    return "";
}

};
