// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CVRT_STRUC_H_018727409908342709743
#define CVRT_STRUC_H_018727409908342709743

#include "dom.h"


namespace zen
{
/*  Conversion of arbitrary types to and from XML elements:
        - string-convertible types (see cvrt_text.h) map to the element text
        - std::vector<T> maps to a sequence of <Item> child elements

    Specialize readStruc() and writeStruc() for structured user types.      */








//------------------------------ implementation -------------------------------------
namespace xml_impl
{
template <class T>
struct IsStdVector : std::false_type {};

template <class T, class Alloc>
struct IsStdVector<std::vector<T, Alloc>> : std::true_type {};
}


template <class T> inline
void writeStruc(const T& value, XmlElement& output)
{
    if constexpr (xml_impl::IsStdVector<T>::value)
    {
        for (const typename T::value_type& childVal : value)
            zen::writeStruc(childVal, output.addChild("Item"));
    }
    else
    {
        std::string text;
        writeText(value, text);
        output.setText(std::move(text));
    }
}


template <class T> inline
bool readStruc(const XmlElement& input, T& value)
{
    if constexpr (xml_impl::IsStdVector<T>::value)
    {
        value.clear();
        bool success = true;
        for (const XmlElement& xmlChild : input.children())
        {
            typename T::value_type childVal{};
            if (zen::readStruc(xmlChild, childVal))
                value.push_back(std::move(childVal));
            else
                success = false;
        }
        return success;
    }
    else
        return readText(input.getText(), value);
}
}

#endif //CVRT_STRUC_H_018727409908342709743
