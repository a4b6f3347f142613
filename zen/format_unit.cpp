// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "format_unit.h"
#include <cmath>
#include "i18n.h"
#include "utf.h"

using namespace zen;


std::wstring zen::formatThreeDigitPrecision(double value)
{
    //print three digits: 0,01 | 0,11 | 1,11 | 11,1 | 111
    if (std::abs(value) < 9.995) //9.999 must not be formatted as "10.00"
        return utfTo<std::wstring>(printNumber<std::string>("%.2f", value));
    if (std::abs(value) < 99.95) //99.99 must not be formatted as "100.0"
        return utfTo<std::wstring>(printNumber<std::string>("%.1f", value));

    return formatNumber(std::llround(value));
}


std::wstring zen::formatFilesizeShort(int64_t size)
{
    if (std::abs(size) == 1)
        return replaceCpy(_("%x byte"), L"%x", numberTo<std::wstring>(size));

    if (std::abs(size) <= 999)
        return replaceCpy(_("%x bytes"), L"%x", numberTo<std::wstring>(size));

    double sizeInUnit = static_cast<double>(size);

    auto formatUnit = [&](const std::wstring& unitTxt) { return replaceCpy(unitTxt, L"%x", formatThreeDigitPrecision(sizeInUnit)); };

    sizeInUnit /= bytesPerKilo;
    if (std::abs(sizeInUnit) < 999.5)
        return formatUnit(_("%x KB"));

    sizeInUnit /= bytesPerKilo;
    if (std::abs(sizeInUnit) < 999.5)
        return formatUnit(_("%x MB"));

    sizeInUnit /= bytesPerKilo;
    if (std::abs(sizeInUnit) < 999.5)
        return formatUnit(_("%x GB"));

    sizeInUnit /= bytesPerKilo;
    if (std::abs(sizeInUnit) < 999.5)
        return formatUnit(_("%x TB"));

    sizeInUnit /= bytesPerKilo;
    return formatUnit(_("%x PB"));
}


std::wstring zen::formatNumber(int64_t n)
{
    //locale-independent: group by three digits using ','
    std::wstring digits = numberTo<std::wstring>(n < 0 ? -static_cast<uint64_t>(n) : static_cast<uint64_t>(n));

    for (size_t pos = digits.size(); pos > 3; pos -= 3)
        digits.insert(pos - 3, 1, L',');

    if (n < 0)
        digits.insert(0, 1, L'-');
    return digits;
}
