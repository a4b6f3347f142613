// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_access.h"
#include <algorithm>
#include "file_traverser.h"

    #include <fcntl.h> //open, close, AT_SYMLINK_NOFOLLOW
    #include <sys/stat.h>
    #include <unistd.h>

using namespace zen;


namespace
{
std::wstring fmtAttributesError(const Zstring& itemPath) { return replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)); }


ItemType toItemType(const struct stat& itemInfo)
{
    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}
}


ItemType zen::getItemType(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        THROW_LAST_FILE_ERROR(fmtAttributesError(itemPath), "lstat");

    return toItemType(itemInfo);
}


std::optional<ItemType> zen::getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
    {
        const ErrorCode ec = getLastError(); //copy before directly or indirectly making other system calls!
        if (ec == ENOENT || ec == ENOTDIR) //ENOTDIR: some parent component is a file
            return std::nullopt;
        throwFileError(fmtAttributesError(itemPath), "lstat", ec);
    }
    return toItemType(itemInfo);
}


uint64_t zen::getFileSize(const Zstring& filePath) //throw FileError
{
    struct stat fileInfo = {};
    if (::stat(filePath.c_str(), &fileInfo) != 0)
        THROW_LAST_FILE_ERROR(fmtAttributesError(filePath), "stat");

    return fileInfo.st_size;
}


void zen::removeFilePlain(const Zstring& filePath) //throw FileError
{
    if (::unlink(filePath.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), "unlink");
}


void zen::removeSymlinkPlain(const Zstring& linkPath) //throw FileError
{
    if (::unlink(linkPath.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot delete symbolic link %x."), L"%x", fmtPath(linkPath)), "unlink");
}


void zen::removeDirectoryPlain(const Zstring& dirPath) //throw FileError
{
    if (::rmdir(dirPath.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(dirPath)), "rmdir");
}


namespace
{
void removeDirectoryImpl(const Zstring& folderPath) //throw FileError
{
    std::vector<Zstring> folderPaths;
    {
        std::vector<Zstring> filePaths;
        std::vector<Zstring> symlinkPaths;

        //get all files and directories from current directory (WITHOUT subdirectories!)
        traverseFolder(folderPath,
        [&](const    FileInfo& fi) {    filePaths.push_back(fi.fullPath); },
        [&](const  FolderInfo& fi) {  folderPaths.push_back(fi.fullPath); },
        [&](const SymlinkInfo& si) { symlinkPaths.push_back(si.fullPath); }); //throw FileError

        for (const Zstring& filePath : filePaths)
            removeFilePlain(filePath); //throw FileError

        for (const Zstring& symlinkPath : symlinkPaths)
            removeSymlinkPlain(symlinkPath); //throw FileError
    } //=> save stack space and allow deletion of extremely deep hierarchies!

    //delete directories recursively
    for (const Zstring& subFolderPath : folderPaths)
        removeDirectoryImpl(subFolderPath); //throw FileError; call recursively to correctly handle symbolic links

    removeDirectoryPlain(folderPath); //throw FileError
}
}


void zen::removeDirectoryPlainRecursion(const Zstring& dirPath) //throw FileError
{
    if (getItemType(dirPath) == ItemType::symlink) //throw FileError
        removeSymlinkPlain(dirPath); //throw FileError
    else
        removeDirectoryImpl(dirPath); //throw FileError
}


void zen::removeReadOnlyAttribute(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        THROW_LAST_FILE_ERROR(fmtAttributesError(itemPath), "lstat");

    if (S_ISLNK(itemInfo.st_mode) || (itemInfo.st_mode & S_IWUSR))
        return;

    if (::chmod(itemPath.c_str(), itemInfo.st_mode | S_IWUSR) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write permissions of %x."), L"%x", fmtPath(itemPath)), "chmod");
}


void zen::createDirectory(const Zstring& dirPath) //throw FileError, ErrorTargetExisting
{
    const std::wstring errorMsg = replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath));

    //don't allow creating irregular folders!
    const Zstring dirName = getItemName(dirPath);
    if (dirName.empty() || std::all_of(dirName.begin(), dirName.end(), [](Zchar c) { return c == Zstr('.'); }))
        throw FileError(errorMsg, replaceCpy<std::wstring>(L"Invalid folder name %x.", L"%x", fmtPath(dirName)));

    const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

    if (::mkdir(dirPath.c_str(), mode) != 0)
        THROW_LAST_FILE_ERROR(errorMsg, "mkdir"); //EEXIST => ErrorTargetExisting
}


void zen::createDirectoryIfMissingRecursion(const Zstring& dirPath) //throw FileError
{
    //path most likely already exists => check first
    if (const std::optional<ItemType> type = getItemTypeIfExists(dirPath)) //throw FileError
    {
        if (*type == ItemType::file /*obscure, but possible*/)
            throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)),
                            replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(dirPath))));
        return;
    }

    if (const std::optional<Zstring> parentPath = getParentFolderPath(dirPath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    try
    {
        createDirectory(dirPath); //throw FileError, ErrorTargetExisting
    }
    catch (ErrorTargetExisting&) //possible, if createDirectoryIfMissingRecursion() is run in parallel
    {
        if (getItemType(dirPath) == ItemType::file) //throw FileError
            throw;
    }
}
