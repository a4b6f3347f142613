// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sys_error.h"
#include <system_error>
#include <vector>

using namespace zen;


namespace
{
//symbolic name of the error codes file operations usually fail with
std::wstring formatSystemErrorCode(ErrorCode ec)
{
    switch (ec)
    {
            ZEN_CHECK_CASE_FOR_CONSTANT(EPERM);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOENT);
            ZEN_CHECK_CASE_FOR_CONSTANT(EIO);
            ZEN_CHECK_CASE_FOR_CONSTANT(EACCES);
            ZEN_CHECK_CASE_FOR_CONSTANT(EBUSY);
            ZEN_CHECK_CASE_FOR_CONSTANT(EEXIST);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
            ZEN_CHECK_CASE_FOR_CONSTANT(EISDIR);
            ZEN_CHECK_CASE_FOR_CONSTANT(EINVAL);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOSPC);
            ZEN_CHECK_CASE_FOR_CONSTANT(EROFS);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOTEMPTY);
            ZEN_CHECK_CASE_FOR_CONSTANT(ELOOP);
            ZEN_CHECK_CASE_FOR_CONSTANT(EDQUOT);
        default:
            return L"errno " + numberTo<std::wstring>(ec);
    }
}
}


std::wstring zen::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode ecCurrent = getLastError(); //not necessarily == ec
    ZEN_ON_SCOPE_EXIT(errno = ecCurrent);

    //std::generic_category(): thread-safe, unlike ::strerror()
    return trimCpy(utfTo<std::wstring>(std::generic_category().message(ec)));
}


std::wstring zen::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


//"ENOENT: No such file or directory [unlink]"
std::wstring zen::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::vector<std::wstring> parts;
    for (const std::wstring& part : {trimCpy(errorCode), trimCpy(errorMsg)})
        if (!part.empty())
            parts.push_back(part);

    std::wstring output = parts.empty() ? std::wstring() : parts[0];
    if (parts.size() > 1)
        output += L": " + parts[1];

    if (!functionName.empty())
        output += (output.empty() ? L"[" : L" [") + utfTo<std::wstring>(functionName) + L']';
    return output;
}
