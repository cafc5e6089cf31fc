#include <gtest/gtest.h>

#include <string>
#include <vector>
#include <rapidjson/document.h>

#include "app/handler_rules.h"
#include "app/result_json.h"
#include "ptt/parser.h"
#include "util/file_loading.h"

static const char* CATALOG_JSON = R"json({
    "handlers": [
        { "name": "resolution", "pattern": "\\b([0-9]{3,4})p\\b", "transform": "integer" },
        { "name": "year", "pattern": "\\b((?:19|20)[0-9]{2})\\b", "transform": "integer" },
        { 
            "name": "container", "pattern": "\\.(mkv|mp4)$", "flags": "i", "transform": "lowercase",
            "options": { "remove": true }
        },
        { 
            "name": "group", "pattern": "-([A-Za-z0-9]+)$",
            "options": { "skip_if_before": ["resolution"] }
        },
        {
            "name": "languages", "pattern": "\\b(rus|eng)\\b", "flags": "i", 
            "transform": "lowercase", "collect": "uniq_concat",
            "options": { "skip_if_already_found": false, "skip_if_first": true, "skip_from_title": true, "value": "multi" }
        }
    ]
})json";

static std::vector<app::HandlerRule> load_rules(const char* json) {
    auto load_result = util::load_document_from_cstr(json);
    EXPECT_EQ(load_result.code, util::DocumentLoadCode::OK);
    auto rules_opt = app::load_handler_rules(load_result.doc);
    EXPECT_TRUE(rules_opt.has_value());
    if (!rules_opt) {
        return {};
    }
    return std::move(rules_opt.value());
}

TEST(HandlerRules, LoadsCatalog) {
    const auto rules = load_rules(CATALOG_JSON);
    ASSERT_EQ(rules.size(), 5u);

    EXPECT_EQ(rules[0].name, "resolution");
    EXPECT_EQ(rules[0].transform, "integer");
    EXPECT_FALSE(rules[0].is_case_insensitive);
    EXPECT_FALSE(rules[0].collect.has_value());

    EXPECT_TRUE(rules[2].is_case_insensitive);
    EXPECT_TRUE(rules[2].options.remove);
    EXPECT_TRUE(rules[2].options.skip_if_already_found);

    EXPECT_EQ(rules[3].options.skip_if_before, (std::vector<std::string>{"resolution"}));

    const auto& languages = rules[4];
    EXPECT_EQ(languages.collect, "uniq_concat");
    EXPECT_FALSE(languages.options.skip_if_already_found);
    EXPECT_TRUE(languages.options.skip_if_first);
    EXPECT_TRUE(languages.options.skip_from_title);
    ASSERT_TRUE(languages.options.value.has_value());
    EXPECT_EQ(std::get<std::string>(languages.options.value.value()), "multi");
}

TEST(HandlerRules, RegisteredCatalogParses) {
    const auto rules = load_rules(CATALOG_JSON);
    auto parser = ptt::Parser();
    auto res = app::register_handler_rules(parser, rules);
    ASSERT_TRUE(res.has_value()) << res.error();
    ASSERT_EQ(parser.GetHandlers().size(), 5u);

    const auto parsed = parser.Parse("Movie.Name.2020.1080p-GROUP.mkv");
    EXPECT_EQ(parsed.title, "Movie Name");
    EXPECT_EQ(std::get<int>(parsed.fields.at("resolution")), 1080);
    EXPECT_EQ(std::get<int>(parsed.fields.at("year")), 2020);
    EXPECT_EQ(std::get<std::string>(parsed.fields.at("container")), "mkv");
    EXPECT_EQ(std::get<std::string>(parsed.fields.at("group")), "GROUP");
    EXPECT_EQ(parsed.fields.count("languages"), 0u);
}

TEST(HandlerRules, RejectsInvalidSchema) {
    const char* missing_pattern = R"json({ "handlers": [ { "name": "year" } ] })json";
    auto doc = util::load_document_from_cstr(missing_pattern);
    ASSERT_EQ(doc.code, util::DocumentLoadCode::OK);
    EXPECT_FALSE(app::load_handler_rules(doc.doc).has_value());

    const char* unknown_transform = R"json({ "handlers": [ { "name": "year", "pattern": "2020", "transform": "date" } ] })json";
    doc = util::load_document_from_cstr(unknown_transform);
    ASSERT_EQ(doc.code, util::DocumentLoadCode::OK);
    EXPECT_FALSE(app::load_handler_rules(doc.doc).has_value());

    const char* unknown_option = R"json({ "handlers": [ { "name": "year", "pattern": "2020", "options": { "skip": true } } ] })json";
    doc = util::load_document_from_cstr(unknown_option);
    ASSERT_EQ(doc.code, util::DocumentLoadCode::OK);
    EXPECT_FALSE(app::load_handler_rules(doc.doc).has_value());
}

TEST(HandlerRules, RejectsMalformedJson) {
    auto doc = util::load_document_from_cstr("{ \"handlers\": [ ");
    EXPECT_EQ(doc.code, util::DocumentLoadCode::PARSE_ERROR);
}

TEST(HandlerRules, MissingFile) {
    auto rules = app::load_handler_rules_from_filepath("does/not/exist.json");
    ASSERT_FALSE(rules.has_value());
    EXPECT_NE(rules.error().find("does/not/exist.json"), std::string::npos);
}

TEST(HandlerRules, InvalidPatternIsReported) {
    app::HandlerRule rule;
    rule.name = "broken";
    rule.pattern = "([0-9]";

    auto parser = ptt::Parser();
    auto res = app::register_handler_rules(parser, { rule });
    ASSERT_FALSE(res.has_value());
    EXPECT_NE(res.error().find("broken"), std::string::npos);
    EXPECT_TRUE(parser.GetHandlers().empty());
}

TEST(HandlerRules, CreateTransformer) {
    EXPECT_TRUE(app::create_transformer("integer", std::nullopt).has_value());
    EXPECT_FALSE(app::create_transformer("date", std::nullopt).has_value());
    EXPECT_FALSE(app::create_transformer("integer", "set").has_value());

    auto transformer = app::create_transformer("integer", "uniq_concat");
    ASSERT_TRUE(transformer.has_value());
    auto v = transformer.value()("3", std::vector<int>{1});
    EXPECT_EQ(std::get<std::vector<int>>(v), (std::vector<int>{1, 3}));
}

TEST(HandlerRules, ExampleCatalogLoads) {
    auto rules = app::load_handler_rules_from_filepath("res/handlers.json");
    ASSERT_TRUE(rules.has_value()) << rules.error();

    auto parser = ptt::Parser();
    auto res = app::register_handler_rules(parser, rules.value());
    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_EQ(parser.GetHandlers().size(), rules.value().size());
}

TEST(ResultJson, ContainsTitleAndFields) {
    ptt::ParseResult result;
    result.title = "Movie Name";
    result.fields["year"] = 2020;
    result.fields["seasons"] = std::vector<int>{1, 2};
    result.fields["extended"] = true;
    result.fields["group"] = std::string("GROUP");

    const auto doc = app::parse_result_to_document("Movie.Name.2020", result);
    ASSERT_TRUE(doc.IsObject());
    EXPECT_STREQ(doc["input"].GetString(), "Movie.Name.2020");
    EXPECT_STREQ(doc["title"].GetString(), "Movie Name");

    const auto& fields = doc["fields"];
    EXPECT_EQ(fields["year"].GetInt(), 2020);
    EXPECT_TRUE(fields["extended"].GetBool());
    EXPECT_STREQ(fields["group"].GetString(), "GROUP");
    ASSERT_TRUE(fields["seasons"].IsArray());
    EXPECT_EQ(fields["seasons"].Size(), 2u);
    EXPECT_EQ(fields["seasons"][1].GetInt(), 2);
}
