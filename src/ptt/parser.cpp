#include "parser.h"
#include "title_sanitizer.h"

#include <string>
#include <regex>
#include <variant>
#include <algorithm>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

// "a__b" --> "a b"
// NOTE: A regex isn't used here since long runs of underscores would recurse once per character
static std::string collapse_underscores(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    bool is_prev_underscore = false;
    for (char c: str) {
        const bool is_underscore = (c == '_');
        if (!is_underscore) {
            out.push_back(c);
        } else if (!is_prev_underscore) {
            out.push_back(' ');
        }
        is_prev_underscore = is_underscore;
    }
    return out;
}

namespace ptt 
{

void Parser::AddHandler(
    const std::string& name, HandlerMatcher matcher, 
    Transformer transformer, HandlerOptions options) 
{
    if (auto regex = std::get_if<std::regex>(&matcher)) {
        if (name.empty()) {
            throw HandlerConfigError("Pattern handler requires a field name");
        }
        auto fn = create_pattern_handler(name, std::move(*regex), std::move(transformer), std::move(options));
        handlers.push_back({ name, std::move(fn) });
        return;
    }

    if (auto fn = std::get_if<HandlerFn>(&matcher); fn && *fn) {
        handlers.push_back({ name.empty() ? "unknown" : name, std::move(*fn) });
        return;
    }

    throw HandlerConfigError(fmt::format(
        "Handler for {} should be a regex or a function", name));
}

void Parser::AddHandler(const std::string& name, HandlerMatcher matcher, HandlerOptions options) {
    AddHandler(name, std::move(matcher), Transformer{}, std::move(options));
}

void Parser::AddHandler(HandlerFn fn) {
    AddHandler("unknown", HandlerMatcher{std::move(fn)});
}

ParseResult Parser::Parse(const std::string& raw_title) const {
    std::string title = collapse_underscores(raw_title);
    FieldMap result;
    MatchedMap matched;
    size_t end_of_title = title.size();

    for (auto& handler: handlers) {
        HandlerContext ctx { title, result, matched };
        const auto match_opt = handler.fn(ctx);
        if (!match_opt) {
            continue;
        }

        const auto& match = match_opt.value();
        const size_t match_length = match.raw_match.size();
        spdlog::debug("handler '{}' matched '{}' at {}", handler.name, match.raw_match, match.match_index);

        // NOTE: Indices of all later matches are relative to the shortened title
        if (match.remove && (match.match_index <= title.size())) {
            title.erase(match.match_index, match_length);
        }

        // NOTE: A match at the very start can't end the title since nothing would be left
        if (!match.skip_from_title && (match.match_index > 0) && (match.match_index < end_of_title)) {
            end_of_title = match.match_index;
        }

        // removed text that was before the end of the title shifts the end back
        if (match.remove && match.skip_from_title && (match.match_index < end_of_title)) {
            end_of_title -= std::min(match_length, end_of_title);
        }
    }

    spdlog::debug("title ends at {} of '{}'", end_of_title, title);

    ParseResult res;
    res.title = clean_title(title.substr(0, std::min(end_of_title, title.size())));
    res.fields = std::move(result);
    return res;
}

};
