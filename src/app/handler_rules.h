#pragma once

// Handler catalog loaded from a json file
// Refer to app_schemas.cpp for the format

#include <string>
#include <vector>
#include <optional>
#include <tl/expected.hpp>
#include <rapidjson/document.h>

#include "ptt/handler.h"
#include "ptt/parser.h"
#include "ptt/transformers.h"

namespace app
{

struct HandlerRule {
    std::string name;
    std::string pattern;
    bool is_case_insensitive = false;
    std::string transform = "none";
    std::optional<std::string> collect;     // "array" or "uniq_concat"
    ptt::HandlerOptions options;
};

// Unexpected value is a string containing the error message
tl::expected<std::vector<HandlerRule>, std::string> load_handler_rules(const rapidjson::Document& doc);
tl::expected<std::vector<HandlerRule>, std::string> load_handler_rules_from_filepath(const char* filename);

tl::expected<ptt::Transformer, std::string> create_transformer(
    const std::string& transform, 
    const std::optional<std::string>& collect);

// Rules are added to the parser in order
// NOTE: On failure the rules before the failing rule are already added
//       The parser should be discarded by the caller
tl::expected<void, std::string> register_handler_rules(ptt::Parser& parser, const std::vector<HandlerRule>& rules);

};
