#pragma once

// helper file for unicode text
// std::regex has no unicode awareness on narrow strings, so text that needs
// matching against non-latin character ranges is decoded to wide characters first
// - invalid byte sequences decode to U+FFFD
// - wchar_t holds utf32 on linux and utf16 on windows

#include <string>

namespace util
{

std::wstring utf8_to_wide(const std::string& str);
std::string wide_to_utf8(const std::wstring& str);

};
