#include "handler_rules.h"
#include "app_schemas.h"
#include "util/file_loading.h"

#include <string>
#include <vector>
#include <regex>
#include <unordered_map>
#include <rapidjson/document.h>
#include <rapidjson/schema.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>

static
std::optional<ptt::FieldValue> load_field_value(const rapidjson::Value& v) {
    if (v.IsString()) {
        return std::string(v.GetString());
    }
    if (v.IsBool()) {
        return v.GetBool();
    }
    if (v.IsInt()) {
        return v.GetInt();
    }
    return {};
}

static
void load_bool(const rapidjson::Value& obj, const char* key, bool& out) {
    if (obj.HasMember(key) && obj[key].IsBool()) {
        out = obj[key].GetBool();
    }
}

namespace app
{

// NOTE: Refer to app_schemas.cpp for schema
tl::expected<std::vector<HandlerRule>, std::string> load_handler_rules(const rapidjson::Document& doc) {
    if (!util::validate_document(doc, HANDLER_CATALOG_SCHEMA_DOC)) {
        return tl::make_unexpected<std::string>("Handler catalog has invalid format");
    }

    auto rules = std::vector<HandlerRule>();
    const auto& data = doc["handlers"].GetArray();
    rules.reserve(data.Size());

    for (auto& e: data) {
        auto& rule = rules.emplace_back();
        rule.name = e["name"].GetString();
        rule.pattern = e["pattern"].GetString();
        if (e.HasMember("flags")) {
            rule.is_case_insensitive = std::string(e["flags"].GetString()) == "i";
        }
        if (e.HasMember("transform")) {
            rule.transform = e["transform"].GetString();
        }
        if (e.HasMember("collect")) {
            rule.collect = e["collect"].GetString();
        }

        if (!e.HasMember("options")) {
            continue;
        }

        const auto& opts = e["options"];
        auto& options = rule.options;
        load_bool(opts, "skip_if_already_found", options.skip_if_already_found);
        load_bool(opts, "skip_from_title", options.skip_from_title);
        load_bool(opts, "skip_if_first", options.skip_if_first);
        load_bool(opts, "remove", options.remove);
        if (opts.HasMember("skip_if_before")) {
            for (auto& group: opts["skip_if_before"].GetArray()) {
                options.skip_if_before.push_back(group.GetString());
            }
        }
        if (opts.HasMember("value")) {
            options.value = load_field_value(opts["value"]);
        }
    }

    return rules;
}

tl::expected<std::vector<HandlerRule>, std::string> load_handler_rules_from_filepath(const char* filename) {
    auto load_result = util::load_document_from_file(filename);
    if (load_result.code != util::DocumentLoadCode::OK) {
        auto err = fmt::format("Failed to load handler catalog json from: {}", filename);
        return tl::make_unexpected<std::string>(std::move(err));
    }

    auto rules_opt = load_handler_rules(load_result.doc);
    if (!rules_opt) {
        auto err = fmt::format("Handler catalog file ({}) has invalid format", filename);
        return tl::make_unexpected<std::string>(std::move(err));
    }
    return rules_opt;
}

tl::expected<ptt::Transformer, std::string> create_transformer(
    const std::string& transform, 
    const std::optional<std::string>& collect)
{
    namespace tf = ptt::transformers;
    static const std::unordered_map<std::string, ptt::Transformer> TRANSFORMERS = {
        { "none", tf::none },
        { "integer", tf::integer },
        { "boolean", tf::boolean },
        { "lowercase", tf::lowercase },
        { "uppercase", tf::uppercase },
        { "range", tf::range },
        { "year_range", tf::year_range },
    };

    auto it = TRANSFORMERS.find(transform);
    if (it == TRANSFORMERS.end()) {
        return tl::make_unexpected<std::string>(fmt::format("Unknown transformer '{}'", transform));
    }

    auto transformer = it->second;
    if (!collect) {
        return transformer;
    }

    const auto& collect_type = collect.value();
    if (collect_type == "array") {
        return tf::array(std::move(transformer));
    }
    if (collect_type == "uniq_concat") {
        return tf::uniq_concat(std::move(transformer));
    }
    return tl::make_unexpected<std::string>(fmt::format("Unknown collector '{}'", collect_type));
}

tl::expected<void, std::string> register_handler_rules(ptt::Parser& parser, const std::vector<HandlerRule>& rules) {
    for (auto& rule: rules) {
        auto transformer_opt = create_transformer(rule.transform, rule.collect);
        if (!transformer_opt) {
            auto err = fmt::format("Handler '{}': {}", rule.name, transformer_opt.error());
            spdlog::error(err);
            return tl::make_unexpected<std::string>(std::move(err));
        }

        auto flags = std::regex_constants::ECMAScript;
        if (rule.is_case_insensitive) {
            flags |= std::regex_constants::icase;
        }

        try {
            auto regex = std::regex(rule.pattern, flags);
            parser.AddHandler(rule.name, std::move(regex), std::move(transformer_opt.value()), rule.options);
        } catch (const std::regex_error& ex) {
            auto err = fmt::format("Handler '{}' has an invalid pattern '{}': {}", rule.name, rule.pattern, ex.what());
            spdlog::error(err);
            return tl::make_unexpected<std::string>(std::move(err));
        } catch (const ptt::HandlerConfigError& ex) {
            auto err = fmt::format("Handler '{}' could not be added: {}", rule.name, ex.what());
            spdlog::error(err);
            return tl::make_unexpected<std::string>(std::move(err));
        }

        spdlog::debug(fmt::format("Added handler '{}' with pattern '{}'", rule.name, rule.pattern));
    }
    return {};
}

};
