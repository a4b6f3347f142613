// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SYS_ERROR_H_3284791347018951324534
#define SYS_ERROR_H_3284791347018951324534

#include <cerrno>
#include "scope_guard.h"
#include "i18n.h"
#include "zstring.h"


namespace zen
{
using ErrorCode = int;

inline ErrorCode getLastError() { return errno; } //errno is a macro: no "::" prefix

std::wstring getSystemErrorDescription(ErrorCode ec); //empty if unknown

//"ENOENT: No such file or directory [unlink]"
std::wstring formatSystemError(const std::string& functionName, ErrorCode ec);
std::wstring formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg);


//low-level error: system detail only, no user-level context
class SysError
{
public:
    explicit SysError(const std::wstring& msg) : msg_(msg) {}
    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

//macro: evaluate errno before any other call can overwrite it
#define THROW_LAST_SYS_ERROR(functionName)                           \
    do { const zen::ErrorCode ecInternal = zen::getLastError(); throw zen::SysError(zen::formatSystemError(functionName, ecInternal)); } while (false)
}

#endif //SYS_ERROR_H_3284791347018951324534
