// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CVRT_TEXT_H_018727339083427097434
#define CVRT_TEXT_H_018727339083427097434

#include <chrono>
#include <string_view>
#include <type_traits>
#include <zen/string_tools.h>
#include <zen/utf.h>


namespace zen
{
/*  Conversion of string-convertible types to and from std::string (UTF-8)
    used by XML element values and attributes.

    Supported by default:
        - bool
        - all built-in arithmetic numbers
        - std::chrono::duration
        - std::string, std::wstring

    Add support for enums and other user types via template specialization:

    template <> inline
    void writeText(const MyEnum& value, std::string& output) { ... }

    template <> inline
    bool readText(const std::string& input, MyEnum& value) { ... return false on unknown input }      */

template <class T> bool readText(const std::string& input, T& value);
template <class T> void writeText(const T& value, std::string& output);








//------------------------------ implementation -------------------------------------
namespace xml_impl
{
template <class T>
struct IsChronoDuration : std::false_type {};

template <class Rep, class Period>
struct IsChronoDuration<std::chrono::duration<Rep, Period>> : std::true_type {};

template <class T>
constexpr bool isStdString = std::is_same_v<T, std::string> || std::is_same_v<T, std::wstring>;
}


template <class T> inline
void writeText(const T& value, std::string& output)
{
    if constexpr (std::is_same_v<T, bool>)
        output = value ? "true" : "false";
    else if constexpr (xml_impl::isStdString<T>)
        output = utfTo<std::string>(value);
    else if constexpr (std::is_convertible_v<const T&, std::string_view>) //string literals (write only)
        output = std::string(std::string_view(value));
    else if constexpr (std::is_convertible_v<const T&, std::wstring_view>)
        output = utfTo<std::string>(std::wstring(std::wstring_view(value)));
    else if constexpr (std::is_arithmetic_v<T>)
        output = numberTo<std::string>(value);
    else if constexpr (xml_impl::IsChronoDuration<T>::value)
        output = numberTo<std::string>(value.count());
    else
        static_assert(sizeof(T) == -1, "unknown type: specialize zen::writeText() and zen::readText()");
}


template <class T> inline
bool readText(const std::string& input, T& value)
{
    if constexpr (std::is_same_v<T, bool>)
    {
        const std::string tmp = trimCpy(input);
        if (tmp == "true")
            value = true;
        else if (tmp == "false")
            value = false;
        else
            return false;
        return true;
    }
    else if constexpr (xml_impl::isStdString<T>)
    {
        value = utfTo<T>(input);
        return true;
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        const std::string tmp = trimCpy(input);
        if (tmp.empty())
            return false;
        value = stringTo<T>(tmp);
        return true;
    }
    else if constexpr (xml_impl::IsChronoDuration<T>::value)
    {
        value = T(stringTo<typename T::rep>(input));
        return true;
    }
    else
        static_assert(sizeof(T) == -1, "unknown type: specialize zen::writeText() and zen::readText()");
}
}

#endif //CVRT_TEXT_H_018727339083427097434
