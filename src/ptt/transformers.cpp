#include "transformers.h"

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fmt/core.h>

static std::optional<int> parse_integer(const std::string& str);
static std::vector<std::string> split_numbers(const std::string& str);

template <typename T>
static void append_unique(std::vector<T>& list, const T& value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

namespace ptt 
{

namespace transformers
{

FieldValue none(const std::string& input, const FieldValue& previous) {
    return input;
}

FieldValue integer(const std::string& input, const FieldValue& previous) {
    auto v = parse_integer(input);
    if (!v) {
        return {};
    }
    return v.value();
}

FieldValue boolean(const std::string& input, const FieldValue& previous) {
    return true;
}

FieldValue lowercase(const std::string& input, const FieldValue& previous) {
    std::string out = input;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { 
        return static_cast<char>(std::tolower(c)); 
    });
    return out;
}

FieldValue uppercase(const std::string& input, const FieldValue& previous) {
    std::string out = input;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { 
        return static_cast<char>(std::toupper(c)); 
    });
    return out;
}

FieldValue range(const std::string& input, const FieldValue& previous) {
    const auto parts = split_numbers(input);

    std::vector<int> numbers;
    numbers.reserve(parts.size());
    for (auto& part: parts) {
        auto v = parse_integer(part);
        if (!v) {
            return {};
        }
        numbers.push_back(v.value());
    }

    const size_t N = numbers.size();
    if (N == 1) {
        return numbers;
    }

    if ((N == 2) && (numbers[0] < numbers[1])) {
        const long long span = static_cast<long long>(numbers[1]) - numbers[0] + 1;
        if (span > static_cast<long long>(MAX_RANGE_LENGTH)) {
            return {};
        }
        std::vector<int> expanded;
        expanded.reserve(static_cast<size_t>(span));
        for (long long i = 0; i < span; i++) {
            expanded.push_back(static_cast<int>(numbers[0] + i));
        }
        return expanded;
    }

    if (N > 2) {
        for (size_t i = 1; i < N; i++) {
            if (static_cast<long long>(numbers[i]) != static_cast<long long>(numbers[i-1])+1) {
                return {};
            }
        }
        return numbers;
    }

    return {};
}

FieldValue year_range(const std::string& input, const FieldValue& previous) {
    const auto parts = split_numbers(input);
    if (parts.empty()) {
        return {};
    }

    const auto start_opt = parse_integer(parts[0]);
    if (!start_opt) {
        return {};
    }
    const int start = start_opt.value();

    if (parts.size() == 1) {
        return start;
    }
    const auto end_opt = parse_integer(parts[1]);
    if (!end_opt) {
        return {};
    }
    if (end_opt.value() == 0) {
        return start;
    }

    // "2010-15" --> 2015
    long long end = end_opt.value();
    if (end < 100) {
        end = static_cast<long long>(start) - (start % 100) + end;
    }
    if ((end <= start) || (end > INT32_MAX)) {
        return {};
    }
    return fmt::format("{}-{}", start, end);
}

Transformer value(FieldValue v) {
    return [v = std::move(v)](const std::string& input, const FieldValue& previous) -> FieldValue {
        return v;
    };
}

Transformer array(Transformer chain) {
    return [chain = std::move(chain)](const std::string& input, const FieldValue& previous) -> FieldValue {
        auto v = chain(input, previous);
        if (auto i = std::get_if<int>(&v)) {
            return std::vector<int>{ *i };
        }
        if (auto s = std::get_if<std::string>(&v)) {
            return std::vector<std::string>{ *s };
        }
        if (auto b = std::get_if<bool>(&v)) {
            return std::vector<std::string>{ *b ? "true" : "false" };
        }
        // lists are passed through and the empty value is rejected
        return v;
    };
}

Transformer uniq_concat(Transformer chain) {
    return [chain = std::move(chain)](const std::string& input, const FieldValue& previous) -> FieldValue {
        auto v = chain(input, previous);

        // NOTE: 0 is a valid element even though it is falsy
        const bool is_zero = std::holds_alternative<int>(v);
        if (!is_truthy(v) && !is_zero) {
            if (is_empty(previous)) {
                return std::vector<std::string>{};
            }
            return previous;
        }

        const bool is_int_list = 
            std::holds_alternative<int>(v) || 
            std::holds_alternative<std::vector<int>>(v);

        if (is_int_list) {
            std::vector<int> list;
            if (auto p = std::get_if<std::vector<int>>(&previous)) {
                list = *p;
            }
            if (auto i = std::get_if<int>(&v)) {
                append_unique(list, *i);
            } else {
                for (auto n: std::get<std::vector<int>>(v)) {
                    append_unique(list, n);
                }
            }
            return list;
        }

        std::vector<std::string> list;
        if (auto p = std::get_if<std::vector<std::string>>(&previous)) {
            list = *p;
        }
        if (auto s = std::get_if<std::string>(&v)) {
            append_unique(list, *s);
        } else if (auto l = std::get_if<std::vector<std::string>>(&v)) {
            for (auto& str: *l) {
                append_unique(list, str);
            }
        } else {
            append_unique(list, to_string(v));
        }
        return list;
    };
}

};

};

// parses a leading integer with optional sign and surrounding whitespace
// "01" --> 1, " 12abc" --> 12, "abc" --> {}, "99999999999" --> {}
std::optional<int> parse_integer(const std::string& str) {
    size_t i = 0;
    const size_t N = str.size();
    while ((i < N) && std::isspace(static_cast<unsigned char>(str[i]))) {
        i++;
    }

    bool is_negative = false;
    if ((i < N) && ((str[i] == '-') || (str[i] == '+'))) {
        is_negative = (str[i] == '-');
        i++;
    }

    long long v = 0;
    size_t total_digits = 0;
    while ((i < N) && std::isdigit(static_cast<unsigned char>(str[i]))) {
        v = v*10 + (str[i] - '0');
        if (v > INT32_MAX) {
            return {};
        }
        total_digits++;
        i++;
    }

    if (total_digits == 0) {
        return {};
    }
    return static_cast<int>(is_negative ? -v : v);
}

// splits a string on every run of non digit characters
// "s01-e03" --> ["01", "03"]
std::vector<std::string> split_numbers(const std::string& str) {
    std::vector<std::string> parts;
    std::string curr;
    for (char c: str) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            curr.push_back(c);
        } else if (!curr.empty()) {
            parts.push_back(std::move(curr));
            curr.clear();
        }
    }
    if (!curr.empty()) {
        parts.push_back(std::move(curr));
    }
    return parts;
}
