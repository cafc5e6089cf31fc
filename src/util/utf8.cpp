#include "utf8.h"

#include <string>
#include <iterator>
#include <cstdint>
#include <utf8.h>

static constexpr uint32_t REPLACEMENT_CHAR = 0xFFFD;

namespace util 
{

std::wstring utf8_to_wide(const std::string& str) {
    std::string valid;
    valid.reserve(str.size());
    utf8::replace_invalid(str.begin(), str.end(), std::back_inserter(valid), REPLACEMENT_CHAR);

    std::wstring out;
    out.reserve(valid.size());
    if constexpr (sizeof(wchar_t) == 2) {
        utf8::utf8to16(valid.begin(), valid.end(), std::back_inserter(out));
    } else {
        utf8::utf8to32(valid.begin(), valid.end(), std::back_inserter(out));
    }
    return out;
}

std::string wide_to_utf8(const std::wstring& str) {
    std::string out;
    out.reserve(str.size());

    if constexpr (sizeof(wchar_t) == 2) {
        // NOTE: Surrogate pairs are never split since every pattern that operates 
        //       on wide text only removes characters from the BMP
        utf8::utf16to8(str.begin(), str.end(), std::back_inserter(out));
        return out;
    }

    for (wchar_t c: str) {
        auto cp = static_cast<uint32_t>(c);
        const bool is_surrogate = (cp >= 0xD800) && (cp <= 0xDFFF);
        if (is_surrogate || (cp > 0x10FFFF)) {
            cp = REPLACEMENT_CHAR;
        }
        utf8::append(cp, std::back_inserter(out));
    }
    return out;
}

};
