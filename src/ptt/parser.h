#pragma once

// Extracts the title from a release name by running an ordered list of handlers
// - Each handler may claim a field and the position it was found at
// - The title ends where the earliest claimed metadata begins
// - Handlers are run in the order they were added, which decides precedence
// - The leftover title is cleaned using clean_title(...)

#include <string>
#include <vector>
#include <regex>
#include <variant>
#include "handler.h"
#include "transformers.h"

namespace ptt
{

struct ParseResult {
    std::string title;
    FieldMap fields;
};

// Either a regex to build a pattern handler from, or a handler function
// NOTE: std::monostate is an unsupported shape which is rejected when added
using HandlerMatcher = std::variant<std::monostate, std::regex, HandlerFn>;

class Parser 
{
private:
    std::vector<Handler> handlers;
public:
    // THROWS: HandlerConfigError if the matcher is empty or the name of a pattern handler is empty
    void AddHandler(
        const std::string& name, HandlerMatcher matcher, 
        Transformer transformer = {}, HandlerOptions options = {});
    void AddHandler(const std::string& name, HandlerMatcher matcher, HandlerOptions options);
    // Handler function without a field name is registered as "unknown"
    void AddHandler(HandlerFn fn);

    // Safe to call from multiple threads once all handlers are added
    ParseResult Parse(const std::string& raw_title) const;
    const std::vector<Handler>& GetHandlers() const { return handlers; }
};

};
