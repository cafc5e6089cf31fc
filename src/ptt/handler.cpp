#include "handler.h"

#include <string>
#include <regex>
#include <optional>
#include <algorithm>
#include <spdlog/spdlog.h>

// a release group tag at the start of the title, e.g. "[Group] Title"
const std::regex BEFORE_TITLE_REGEX("^\\[([^\\[\\]]+)\\]");

namespace ptt 
{

std::string extract_clean_match(const std::smatch& match) {
    if ((match.size() > 1) && match[1].matched && (match[1].length() > 0)) {
        return match[1].str();
    }
    return match[0].str();
}

HandlerFn create_pattern_handler(
    const std::string& name, 
    std::regex regex, 
    Transformer transformer, 
    HandlerOptions options) 
{
    if (!transformer) {
        transformer = transformers::none;
    }

    return [name, regex = std::move(regex), transformer = std::move(transformer), options = std::move(options)]
    (HandlerContext& ctx) -> std::optional<HandlerMatch> 
    {
        auto& result = ctx.result;
        auto& matched = ctx.matched;

        FieldValue previous;
        if (auto it = result.find(name); it != result.end()) {
            previous = it->second;
        }

        if (options.skip_if_already_found && is_truthy(previous)) {
            return {};
        }

        std::smatch match;
        if (!std::regex_search(ctx.title, match, regex)) {
            return {};
        }

        const auto raw_match = match[0].str();
        if (raw_match.empty()) {
            return {};
        }
        const auto match_index = static_cast<size_t>(match.position(0));
        const auto transformed = transformer(extract_clean_match(match), previous);

        // NOTE: A match inside the leading release group tag shouldn't end the title 
        //       since the tag is removed when the title is cleaned
        bool is_before_title = false;
        std::smatch before_title_match;
        if (std::regex_search(ctx.title, before_title_match, BEFORE_TITLE_REGEX)) {
            is_before_title = before_title_match[1].str().find(raw_match) != std::string::npos;
        }

        bool has_other_matches = false;
        bool is_before_all_others = true;
        for (auto& [other_name, other]: matched) {
            if (other_name == name) {
                continue;
            }
            has_other_matches = true;
            if (match_index >= other.match_index) {
                is_before_all_others = false;
            }
        }
        const bool is_skip_if_first = options.skip_if_first && has_other_matches && is_before_all_others;

        const bool is_skip_if_before = std::any_of(
            options.skip_if_before.begin(), options.skip_if_before.end(), 
            [&matched, match_index](const std::string& group) {
                auto it = matched.find(group);
                return (it != matched.end()) && (match_index < it->second.match_index);
            });

        if (!is_truthy(transformed)) {
            spdlog::debug("handler '{}' rejected '{}' at {}", name, raw_match, match_index);
            return {};
        }
        if (is_skip_if_first || is_skip_if_before) {
            spdlog::debug("handler '{}' skipped '{}' at {} (skip_if_first={}, skip_if_before={})", 
                name, raw_match, match_index, is_skip_if_first, is_skip_if_before);
            return {};
        }

        // NOTE: Only the first match of a field is used for ordering
        matched.try_emplace(name, MatchInfo{raw_match, match_index});
        if (options.value && is_truthy(options.value.value())) {
            result[name] = options.value.value();
        } else {
            result[name] = transformed;
        }

        HandlerMatch res;
        res.raw_match = raw_match;
        res.match_index = match_index;
        res.remove = options.remove;
        res.skip_from_title = is_before_title || options.skip_from_title;
        return res;
    };
}

};
