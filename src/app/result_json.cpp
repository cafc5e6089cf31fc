#include "result_json.h"

#include <string>
#include <vector>
#include <variant>
#include <rapidjson/document.h>

namespace app
{

void field_value_to_json(const ptt::FieldValue& value, rapidjson::Value& out, rapidjson::Document::AllocatorType& allocator) {
    if (auto v = std::get_if<bool>(&value)) {
        out.SetBool(*v);
    } else if (auto v = std::get_if<int>(&value)) {
        out.SetInt(*v);
    } else if (auto v = std::get_if<std::string>(&value)) {
        out.SetString(v->c_str(), static_cast<rapidjson::SizeType>(v->size()), allocator);
    } else if (auto v = std::get_if<std::vector<int>>(&value)) {
        out.SetArray();
        for (int i: *v) {
            out.PushBack(i, allocator);
        }
    } else if (auto v = std::get_if<std::vector<std::string>>(&value)) {
        out.SetArray();
        for (auto& s: *v) {
            rapidjson::Value str;
            str.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), allocator);
            out.PushBack(str, allocator);
        }
    } else {
        out.SetNull();
    }
}

rapidjson::Document parse_result_to_document(const std::string& input, const ptt::ParseResult& result) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    rapidjson::Value input_value;
    input_value.SetString(input.c_str(), static_cast<rapidjson::SizeType>(input.size()), allocator);
    doc.AddMember("input", input_value, allocator);

    rapidjson::Value title_value;
    title_value.SetString(result.title.c_str(), static_cast<rapidjson::SizeType>(result.title.size()), allocator);
    doc.AddMember("title", title_value, allocator);

    rapidjson::Value fields;
    fields.SetObject();
    for (auto& [name, value]: result.fields) {
        rapidjson::Value key;
        key.SetString(name.c_str(), static_cast<rapidjson::SizeType>(name.size()), allocator);
        rapidjson::Value field;
        field_value_to_json(value, field, allocator);
        fields.AddMember(key, field, allocator);
    }
    doc.AddMember("fields", fields, allocator);

    return doc;
}

};
