#pragma once

#include <string>
#include <cstddef>

namespace ptt
{

// std::regex recurses once per character so longer titles are cut to this many characters
constexpr size_t MAX_CLEAN_TITLE_LENGTH = 512;

// Cleans the part of a release name that was left over as the title
// "[Group] Some.Title.2020 / Другое название (Актёры)" --> "Some Title 2020"
// - Input and output are utf8
// - Leaves purely non-english titles intact
// - Only the first MAX_CLEAN_TITLE_LENGTH characters are kept
std::string clean_title(const std::string& raw_title);

// Removes surrounding whitespace, including unicode spaces
std::wstring trim(const std::wstring& str);

};
