#pragma once

#include <string>
#include <cstddef>
#include <functional>
#include "field_value.h"

namespace ptt
{

// Converts the clean text of a match into a field value
// The previous value of the field is passed in so that values can be accumulated
// Returning a falsy value rejects the match
using Transformer = std::function<FieldValue(const std::string& input, const FieldValue& previous)>;

namespace transformers
{

// longest list that range(...) will expand "start-end" into
constexpr size_t MAX_RANGE_LENGTH = 1000;

FieldValue none(const std::string& input, const FieldValue& previous);
FieldValue integer(const std::string& input, const FieldValue& previous);
FieldValue boolean(const std::string& input, const FieldValue& previous);
FieldValue lowercase(const std::string& input, const FieldValue& previous);
FieldValue uppercase(const std::string& input, const FieldValue& previous);
// "1-3" --> [1,2,3], "1,2,3" --> [1,2,3], "5" --> [5]
// Numbers that don't fit in an int or spans longer than MAX_RANGE_LENGTH are rejected
FieldValue range(const std::string& input, const FieldValue& previous);
// "2010-2015" --> "2010-2015", "2010-15" --> "2010-2015", "2010" --> 2010
FieldValue year_range(const std::string& input, const FieldValue& previous);

Transformer value(FieldValue v);
// wraps the chained value in a list
Transformer array(Transformer chain = none);
// appends the chained value to the previous list if it isn't already present
Transformer uniq_concat(Transformer chain = none);

};

};
