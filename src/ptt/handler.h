#pragma once

#include <string>
#include <vector>
#include <map>
#include <regex>
#include <optional>
#include <functional>
#include <stdexcept>
#include "field_value.h"
#include "transformers.h"

namespace ptt
{

// NOTE: Use std::map so that iteration is alphabetical
using FieldMap = std::map<std::string, FieldValue>;

// Where a field was first found in the working title
struct MatchInfo {
    std::string raw_match;
    size_t match_index = 0;
};
using MatchedMap = std::map<std::string, MatchInfo>;

// State shared between all handlers during a single parse
struct HandlerContext {
    const std::string& title;
    FieldMap& result;
    MatchedMap& matched;
};

// Returned by a handler which claimed part of the working title
struct HandlerMatch {
    std::string raw_match;
    size_t match_index = 0;
    bool remove = false;            // delete the match from the working title
    bool skip_from_title = false;   // the match doesn't limit where the title ends
};

struct HandlerOptions {
    bool skip_if_already_found = true;      // skip if the field already has a value
    bool skip_from_title = false;           // don't end the title at this match
    bool skip_if_first = false;             // skip if this match comes before all other matched fields
    std::vector<std::string> skip_if_before;// skip if this match comes before any of these fields
    bool remove = false;                    // remove the match so later handlers can't see it
    std::optional<FieldValue> value;        // store this instead of the transformed value
};

using HandlerFn = std::function<std::optional<HandlerMatch>(HandlerContext& ctx)>;

struct Handler {
    std::string name;
    HandlerFn fn;
};

// Registering a handler that has an unsupported shape
class HandlerConfigError: public std::invalid_argument 
{
public:
    using std::invalid_argument::invalid_argument;
};

// Text passed to the transformer
// This is the first capture group if it has any contents, otherwise the entire match
std::string extract_clean_match(const std::smatch& match);

// Build a handler that stores the transformed match of the regex under the field name
HandlerFn create_pattern_handler(
    const std::string& name, 
    std::regex regex, 
    Transformer transformer, 
    HandlerOptions options);

};
