// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_213458973046
#define STRING_TOOLS_H_213458973046

#include <cassert>
#include <cstdio>
#include <cstring>
#include <cwchar>
#include <algorithm>
#include <charconv>
#include <string>
#include <string_view>
#include <vector>


//enhance *any* std::basic_string<> with the functionality we actually need
namespace zen
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only!
template <class Char> bool isHexDigit  (Char c);

template <class Char> bool startsWith(std::basic_string_view<Char> str, std::basic_string_view<Char> prefix);
template <class Char> bool endsWith  (std::basic_string_view<Char> str, std::basic_string_view<Char> postfix);
template <class Char> bool contains  (std::basic_string_view<Char> str, std::basic_string_view<Char> term);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S> S afterLast  (const S& str, std::basic_string_view<typename S::value_type> term, IfNotFoundReturn infr);
template <class S> S beforeLast (const S& str, std::basic_string_view<typename S::value_type> term, IfNotFoundReturn infr);

template <class S> [[nodiscard]] std::vector<S> splitCpy(const S& str, typename S::value_type delimiter);

enum class TrimSide
{
    both,
    left,
    right,
};
template <class S> [[nodiscard]] S trimCpy(S str, TrimSide side = TrimSide::both);
template <class S>            void trim   (S& str, TrimSide side = TrimSide::both);

template <class S> [[nodiscard]] S replaceCpy(S str, std::basic_string_view<typename S::value_type> oldTerm, std::basic_string_view<typename S::value_type> newTerm);
template <class S>            void replace   (S& str, std::basic_string_view<typename S::value_type> oldTerm, std::basic_string_view<typename S::value_type> newTerm);

//number conversion: integral and floating point types
template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str);

std::pair<char, char> hexify(unsigned char c, bool upperCase = true);

template <class S, class Num> S printNumber(const char* format, const Num& number); //format a single number using std::snprintf()






//---------------------- implementation ----------------------
template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    //caveat: std::isspace() is locale-dependent and breaks on negative chars
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}


template <class Char> inline
bool isDigit(Char c) { return static_cast<Char>('0') <= c && c <= static_cast<Char>('9'); }


template <class Char> inline
bool isHexDigit(Char c)
{
    return isDigit(c) ||
           (static_cast<Char>('A') <= c && c <= static_cast<Char>('F')) ||
           (static_cast<Char>('a') <= c && c <= static_cast<Char>('f'));
}


template <class Char> inline
bool startsWith(std::basic_string_view<Char> str, std::basic_string_view<Char> prefix)
{
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}


template <class Char> inline
bool endsWith(std::basic_string_view<Char> str, std::basic_string_view<Char> postfix)
{
    return str.size() >= postfix.size() && str.compare(str.size() - postfix.size(), postfix.size(), postfix) == 0;
}


template <class Char> inline
bool contains(std::basic_string_view<Char> str, std::basic_string_view<Char> term)
{
    return str.find(term) != std::basic_string_view<Char>::npos;
}

//string literals don't bind to basic_string_view<Char> during deduction:
inline bool startsWith(std::string_view  str, std::string_view  prefix) { return startsWith<char   >(str, prefix); }
inline bool startsWith(std::wstring_view str, std::wstring_view prefix) { return startsWith<wchar_t>(str, prefix); }
inline bool endsWith  (std::string_view  str, std::string_view  postfix) { return endsWith<char   >(str, postfix); }
inline bool endsWith  (std::wstring_view str, std::wstring_view postfix) { return endsWith<wchar_t>(str, postfix); }
inline bool contains  (std::string_view  str, std::string_view  term) { return contains<char   >(str, term); }
inline bool contains  (std::wstring_view str, std::wstring_view term) { return contains<wchar_t>(str, term); }


template <class S> inline
S afterLast(const S& str, std::basic_string_view<typename S::value_type> term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.rfind(term);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return str.substr(pos + term.size());
}


template <class S> inline
S beforeLast(const S& str, std::basic_string_view<typename S::value_type> term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.rfind(term);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return str.substr(0, pos);
}


template <class S> inline
std::vector<S> splitCpy(const S& str, typename S::value_type delimiter)
{
    std::vector<S> output;
    size_t posFirst = 0;
    for (;;)
    {
        const size_t posLast = str.find(delimiter, posFirst);
        if (posLast == S::npos)
        {
            output.push_back(str.substr(posFirst));
            return output;
        }
        output.push_back(str.substr(posFirst, posLast - posFirst));
        posFirst = posLast + 1;
    }
}


template <class S> inline
void trim(S& str, TrimSide side)
{
    auto itEnd   = str.end();
    auto itBegin = str.begin();

    if (side != TrimSide::left)
        while (itEnd != itBegin && isWhiteSpace(*(itEnd - 1)))
            --itEnd;

    if (side != TrimSide::right)
        while (itBegin != itEnd && isWhiteSpace(*itBegin))
            ++itBegin;

    str = S(itBegin, itEnd);
}


template <class S> inline
S trimCpy(S str, TrimSide side)
{
    trim(str, side);
    return str;
}


template <class S> inline
void replace(S& str, std::basic_string_view<typename S::value_type> oldTerm, std::basic_string_view<typename S::value_type> newTerm)
{
    assert(!oldTerm.empty());
    if (oldTerm.empty())
        return;

    for (size_t pos = str.find(oldTerm); pos != S::npos; pos = str.find(oldTerm, pos + newTerm.size()))
        str.replace(pos, oldTerm.size(), newTerm);
}


template <class S> inline
S replaceCpy(S str, std::basic_string_view<typename S::value_type> oldTerm, std::basic_string_view<typename S::value_type> newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S printNumber(const char* format, const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    char buffer[128]; //zero-initialize?
    const int charsWritten = std::snprintf(buffer, std::size(buffer), format, number);
    if (charsWritten < 0 || static_cast<size_t>(charsWritten) >= std::size(buffer))
    {
        assert(false);
        return S();
    }
    return S(buffer, buffer + charsWritten);
}


namespace impl
{
template <class S> inline
S widen(const std::string& str) { return S(str.begin(), str.end()); } //ASCII only: digits, sign, dot, exponent
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    std::string output;

    if constexpr (std::is_same_v<Num, bool>)
        output = number ? "true" : "false";
    else if constexpr (std::is_floating_point_v<Num>)
        output = printNumber<std::string>("%g", static_cast<double>(number));
    else
    {
        char buffer[32];
        const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), number);
        assert(rv.ec == std::errc());
        output.assign(buffer, rv.ptr);
    }

    if constexpr (std::is_same_v<typename S::value_type, char>)
        return output;
    else
        return impl::widen<S>(output);
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_arithmetic_v<Num>);
    std::string strNarrow;
    for (const auto c : str) //ASCII only
        strNarrow += static_cast<char>(c);
    trim(strNarrow);

    if constexpr (std::is_same_v<Num, bool>)
        return strNarrow == "true" || strNarrow == "1";
    else if constexpr (std::is_floating_point_v<Num>)
        return static_cast<Num>(std::strtod(strNarrow.c_str(), nullptr));
    else
    {
        const char* first = strNarrow.data();
        if (!strNarrow.empty() && strNarrow[0] == '+')
            ++first;
        Num number = 0;
        std::from_chars(first, strNarrow.data() + strNarrow.size(), number); //returns 0 on error
        return number;
    }
}


inline
std::pair<char, char> hexify(unsigned char c, bool upperCase)
{
    auto hexifyDigit = [upperCase](int num) -> char //input [0, 15], output 0-9, A-F
    {
        assert(0 <= num && num <= 15);
        if (num <= 9)
            return static_cast<char>('0' + num);
        return static_cast<char>((upperCase ? 'A' : 'a') + (num - 10));
    };
    return {hexifyDigit(c / 16), hexifyDigit(c % 16)};
}
}

#endif //STRING_TOOLS_H_213458973046
