#pragma once

#include <string>
#include <rapidjson/document.h>
#include "ptt/parser.h"

namespace app
{

// { "input": "...", "title": "...", "fields": { "name": value, ... } }
rapidjson::Document parse_result_to_document(const std::string& input, const ptt::ParseResult& result);
void field_value_to_json(const ptt::FieldValue& value, rapidjson::Value& out, rapidjson::Document::AllocatorType& allocator);

};
