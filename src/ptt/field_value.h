#pragma once

#include <string>
#include <vector>
#include <variant>

namespace ptt
{

// Value stored for a field after a transformer accepted a match
// NOTE: std::monostate is the empty value which transformers use to reject a match
using FieldValue = std::variant<
    std::monostate,
    bool,
    int,
    std::string,
    std::vector<int>,
    std::vector<std::string>
>;

// empty, false, 0 and "" are falsy
// lists are always truthy even when they have no elements
bool is_truthy(const FieldValue& value);
bool is_empty(const FieldValue& value);
std::string to_string(const FieldValue& value);

};
