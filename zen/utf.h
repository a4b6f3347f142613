// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef UTF_H_01832479146991573473545
#define UTF_H_01832479146991573473545

#include <cstdint>
#include "string_tools.h"


namespace zen
{
//convert between UTF-8 (char) and UTF-32 (wchar_t on Linux); invalid input is replaced by U+FFFD
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

constexpr std::string_view BYTE_ORDER_MARK_UTF8 = "\xEF\xBB\xBF";

size_t unicodeLength(const std::string& str); //number of code points






//----------------------- implementation ----------------------------------
namespace impl
{
using CodePoint = uint32_t;

const CodePoint REPLACEMENT_CHAR = 0xfffd;
const CodePoint CODE_POINT_MAX   = 0x10ffff;

static_assert(sizeof(wchar_t) == 4, "UTF-32 wchar_t expected");


inline
void codePointToUtf8(CodePoint cp, std::string& output)
{
    //https://en.wikipedia.org/wiki/UTF-8
    if (cp <= 0x7f)
        output += static_cast<char>(cp);
    else if (cp <= 0x7ff)
    {
        output += static_cast<char>((cp >> 6   ) | 0xc0);
        output += static_cast<char>((cp & 0x3f) | 0x80);
    }
    else if (cp <= 0xffff)
    {
        output += static_cast<char>((cp >> 12         ) | 0xe0);
        output += static_cast<char>(((cp >> 6) & 0x3f) | 0x80);
        output += static_cast<char>((cp & 0x3f       ) | 0x80);
    }
    else if (cp <= CODE_POINT_MAX)
    {
        output += static_cast<char>((cp >> 18          ) | 0xf0);
        output += static_cast<char>(((cp >> 12) & 0x3f) | 0x80);
        output += static_cast<char>(((cp >> 6 ) & 0x3f) | 0x80);
        output += static_cast<char>((cp & 0x3f        ) | 0x80);
    }
    else
        codePointToUtf8(REPLACEMENT_CHAR, output);
}


template <class Function> inline
void utf8ToCodePoint(std::string_view str, Function onCodePoint) //"onCodePoint" is a unary function taking a CodePoint
{
    auto it = str.begin();
    while (it != str.end())
    {
        const auto lead = static_cast<unsigned char>(*it++);

        int trailCount = 0;
        CodePoint cp = 0;
        if (lead < 0x80)
            cp = lead;
        else if ((lead >> 5) == 0x6) { cp = lead & 0x1f; trailCount = 1; }
        else if ((lead >> 4) == 0xe) { cp = lead & 0x0f; trailCount = 2; }
        else if ((lead >> 3) == 0x1e) { cp = lead & 0x07; trailCount = 3; }
        else
        {
            onCodePoint(REPLACEMENT_CHAR);
            continue;
        }

        bool valid = true;
        for (int i = 0; i < trailCount; ++i)
        {
            if (it == str.end() || (static_cast<unsigned char>(*it) >> 6) != 0x2)
            {
                valid = false;
                break;
            }
            cp = (cp << 6) | (static_cast<unsigned char>(*it++) & 0x3f);
        }
        onCodePoint(valid && cp <= CODE_POINT_MAX ? cp : REPLACEMENT_CHAR);
    }
}


inline
std::wstring utf8ToWide(std::string_view str)
{
    std::wstring output;
    output.reserve(str.size());
    utf8ToCodePoint(str, [&](CodePoint cp) { output += static_cast<wchar_t>(cp); });
    return output;
}


inline
std::string wideToUtf8(std::wstring_view str)
{
    std::string output;
    output.reserve(str.size());
    for (const wchar_t c : str)
        codePointToUtf8(static_cast<CodePoint>(c), output);
    return output;
}
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    using SourceView = std::basic_string_view<std::remove_cvref_t<decltype(str[0])>>; //std::basic_string, string literal, char pointer
    using TargetChar = typename TargetString::value_type;

    const SourceView view(str);

    if constexpr (std::is_same_v<typename SourceView::value_type, TargetChar>)
        return TargetString(view);
    else if constexpr (std::is_same_v<TargetChar, wchar_t>)
        return impl::utf8ToWide(view);
    else
        return impl::wideToUtf8(view);
}


inline
size_t unicodeLength(const std::string& str)
{
    size_t len = 0;
    impl::utf8ToCodePoint(str, [&](impl::CodePoint) { ++len; });
    return len;
}
}

#endif //UTF_H_01832479146991573473545
