#include "title_sanitizer.h"

#include <regex>
#include <string>
#include <algorithm>

#include "util/utf8.h"

// chinese/japanese/russian characters
#define NON_ENGLISH_CHARS L"\u3040-\u30ff\u3400-\u4dbf\u4e00-\u9fff\uf900-\ufaff\uff66-\uff9f\u0400-\u04ff"
#define CYRILLIC_CHARS L"\u0400-\u04ff"
#define WORD_CHARS L"A-Za-z0-9_"
// release group markings can be enclosed in [], 【】 or ★★
#define MARKING_OPEN L"\\[\u3010\u2605"
#define MARKING_CLOSE L"\\]\u3011\u2605"

const std::wregex MOVIE_FLAG_REGEX(L"[\\[(]movie[)\\]]", std::regex_constants::ECMAScript | std::regex_constants::icase);

const std::wregex NOT_ALLOWED_SYMBOLS_AT_START_AND_END_REGEX(
    L"^[^" WORD_CHARS NON_ENGLISH_CHARS L"#" MARKING_OPEN L"]+"
    L"|[ \\-:/\\\\\\[|{(#$&^]+$");

// NOTE: std::regex has no lookbehind so the text preceding the match is captured and put back
//       (?<=/.*)\(.*\)$ --> (/.*?)\(.*\)$
const std::wregex RUSSIAN_CAST_REGEX(
    L"\\([^)]*[" CYRILLIC_CHARS L"][^)]*\\)$"
    L"|(/.*?)\\(.*\\)$");

const std::wregex LEADING_MARKINGS_REGEX(L"^[" MARKING_OPEN L"].*[" MARKING_CLOSE L"][ .]?(.+)");
const std::wregex TRAILING_MARKINGS_REGEX(L"(.+)[ .]?[" MARKING_OPEN L"].*[" MARKING_CLOSE L"]$");

const std::wregex ALT_TITLES_REGEX(
    L"[^/|(]*[" NON_ENGLISH_CHARS L"][^/|]*[/|]"
    L"|[/|][^/|(]*[" NON_ENGLISH_CHARS L"][^/|]*");

// NOTE: Lookbehind is emulated by capturing the preceding latin text, same as above
const std::wregex NOT_ONLY_NON_ENGLISH_REGEX(
    L"([a-zA-Z][^" NON_ENGLISH_CHARS L"]+)[" NON_ENGLISH_CHARS L"].*[" NON_ENGLISH_CHARS L"]"
    L"|[" NON_ENGLISH_CHARS L"].*[" NON_ENGLISH_CHARS L"](?=[^" NON_ENGLISH_CHARS L"]+[a-zA-Z])");

const std::wregex REMAINING_NOT_ALLOWED_SYMBOLS_AT_START_AND_END_REGEX(
    L"^[^" WORD_CHARS NON_ENGLISH_CHARS L"#]+"
    L"|[\\[\\]({} ]+$");

static bool is_space(wchar_t c);

namespace ptt 
{

std::string clean_title(const std::string& raw_title) {
    const auto first_only = std::regex_constants::format_first_only;

    std::wstring title = util::utf8_to_wide(raw_title);
    if (title.size() > MAX_CLEAN_TITLE_LENGTH) {
        title.resize(MAX_CLEAN_TITLE_LENGTH);
    }

    // dot delimited release names
    if ((title.find(L' ') == std::wstring::npos) && (title.find(L'.') != std::wstring::npos)) {
        std::replace(title.begin(), title.end(), L'.', L' ');
    }
    std::replace(title.begin(), title.end(), L'_', L' ');

    title = std::regex_replace(title, MOVIE_FLAG_REGEX, L"", first_only);
    title = std::regex_replace(title, NOT_ALLOWED_SYMBOLS_AT_START_AND_END_REGEX, L"");
    title = std::regex_replace(title, RUSSIAN_CAST_REGEX, L"$1", first_only);
    title = std::regex_replace(title, LEADING_MARKINGS_REGEX, L"$1", first_only);
    title = std::regex_replace(title, TRAILING_MARKINGS_REGEX, L"$1", first_only);
    title = std::regex_replace(title, ALT_TITLES_REGEX, L"");
    title = std::regex_replace(title, NOT_ONLY_NON_ENGLISH_REGEX, L"$1");
    title = std::regex_replace(title, REMAINING_NOT_ALLOWED_SYMBOLS_AT_START_AND_END_REGEX, L"");
    title = trim(title);

    return util::wide_to_utf8(title);
}

std::wstring trim(const std::wstring& str) {
    auto start = str.begin();
    while ((start != str.end()) && is_space(*start)) {
        start++;
    }

    auto end = str.end();
    while ((end != start) && is_space(*(end-1))) {
        end--;
    }

    return std::wstring(start, end);
}

};

bool is_space(wchar_t c) {
    switch (c) {
    case L' ':  case L'\t': case L'\n': case L'\v': case L'\f': case L'\r':
    case 0x00A0: case 0x1680: case 0x2028: case 0x2029: case 0x202F:
    case 0x205F: case 0x3000: case 0xFEFF:
        return true;
    default:
        return (c >= 0x2000) && (c <= 0x200A);
    }
}
