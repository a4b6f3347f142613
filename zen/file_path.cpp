// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_path.h"

using namespace zen;


Zstring zen::normalizeSeparators(const Zstring& path)
{
    Zstring output;
    output.reserve(path.size());

    for (const Zchar c : path)
        if (c != FILE_NAME_SEPARATOR || !endsWith(output, Zstr("/")))
            output += c;

    if (output.size() > 1 && endsWith(output, Zstr("/"))) //keep root "/"
        output.pop_back();
    return output;
}


std::optional<PathComponents> zen::parsePathComponents(const Zstring& itemPath)
{
    if (!startsWith(itemPath, Zstr("/")))
        return std::nullopt;

    Zstring relPath = normalizeSeparators(itemPath).substr(1);
    return PathComponents{Zstr("/"), std::move(relPath)};
}


std::optional<Zstring> zen::getParentFolderPath(const Zstring& itemPath)
{
    if (const std::optional<PathComponents> pc = parsePathComponents(itemPath))
    {
        if (pc->relPath.empty())
            return std::nullopt;

        return appendPath(pc->rootPath, beforeLast(pc->relPath, Zstr("/"), IfNotFoundReturn::none));
    }
    return std::nullopt;
}


Zstring zen::appendSeparator(Zstring path) //support rvalue references!
{
    if (!endsWith(path, Zstr("/")))
        path += FILE_NAME_SEPARATOR;
    return path; //returning a by-value parameter => RVO if possible, r-value otherwise!
}


bool zen::isValidRelPath(const Zstring& relPath)
{
    return !startsWith(relPath, Zstr("/")) &&
           !endsWith  (relPath, Zstr("/")) &&
           !contains  (relPath, Zstr("//"));
}


Zstring zen::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    assert(isValidRelPath(relPath));
    if (relPath.empty())
        return basePath; //with or without path separator, e.g. / or /folder

    if (basePath.empty()) //basePath might be a relative path, too!
        return relPath;

    if (endsWith(basePath, Zstr("/")))
        return basePath + relPath;

    Zstring output = basePath;
    output.reserve(basePath.size() + 1 + relPath.size());     //append all three strings using a single memory allocation
    return std::move(output) + FILE_NAME_SEPARATOR + relPath; //
}
