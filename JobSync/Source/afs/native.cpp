// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "native.h"
#include <zen/extra_log.h>
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/file_traverser.h>

    #include <cstdlib> //free()
    #include <sys/stat.h>
    #include <unistd.h> //getcwd()

using namespace zen;
using namespace jsync;
using AFS = AbstractFileSystem;


namespace
{
struct InputStreamNative : public AFS::InputStream
{
    explicit InputStreamNative(const Zstring& filePath) : fileIn_(filePath) {} //throw FileError

    //may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead) override //throw FileError
    {
        return fileIn_.tryRead(buffer, bytesToRead); //throw FileError
    }

    std::optional<AFS::StreamAttributes> tryGetAttributesFast() override //throw FileError
    {
        struct stat fileInfo = {};
        if (::fstat(fileIn_.getHandle(), &fileInfo) != 0)
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(fileIn_.getFilePath())), "fstat");

        return AFS::StreamAttributes({fileInfo.st_mtim.tv_sec, static_cast<uint64_t>(fileInfo.st_size)});
    }

private:
    FileInputPlain fileIn_;
};

//===========================================================================================================================

struct OutputStreamNative : public AFS::OutputStreamImpl
{
    explicit OutputStreamNative(const Zstring& filePath) :
        fileOut_(filePath, OutputMode::overwrite) {} //throw FileError

    size_t tryWrite(const void* buffer, size_t bytesToWrite) override //throw FileError; may return short! CONTRACT: bytesToWrite > 0
    {
        return fileOut_.tryWrite(buffer, bytesToWrite); //throw FileError
    }

    void finalize() override //throw FileError
    {
        fileOut_.close(); //throw FileError
    }

private:
    FileOutputPlain fileOut_;
};


Zstring getWorkingDirectory() //throw SysError
{
    char* dirPath = ::getcwd(nullptr, 0);
    if (!dirPath)
        THROW_LAST_SYS_ERROR("getcwd");
    ZEN_ON_SCOPE_EXIT(::free(dirPath));

    return dirPath;
}


AFS::ItemType zenToAfsItemType(zen::ItemType type)
{
    switch (type)
    {
        case zen::ItemType::file:
            return AFS::ItemType::file;
        case zen::ItemType::folder:
            return AFS::ItemType::folder;
        case zen::ItemType::symlink:
            return AFS::ItemType::symlink;
    }
    assert(false);
    return static_cast<AFS::ItemType>(type);
}
}

//===========================================================================================================================

AfsPath NativeFileSystem::getAfsPath(const Zstring& itemPath) const
{
    Zstring nativePath = itemPath;

    if (!startsWith(nativePath, Zstr("/")))
        try
        {
            nativePath = appendSeparator(getWorkingDirectory()) + nativePath; //throw SysError
        }
        catch (const SysError& e) //resolve against device root
        {
            logExtraWarning(replaceCpy(_("Cannot resolve relative path %x."), L"%x", fmtPath(itemPath)) + L"\n\n" + e.toString());
        }

    return sanitizeDeviceRelativePath(nativePath);
}


std::optional<AFS::ItemType> NativeFileSystem::getItemTypeIfExists(const AfsPath& itemPath) const //throw FileError
{
    if (const std::optional<zen::ItemType> type = zen::getItemTypeIfExists(getNativePath(itemPath))) //throw FileError
        return zenToAfsItemType(*type);
    return std::nullopt;
}


uint64_t NativeFileSystem::getFileSize(const AfsPath& filePath) const //throw FileError
{
    return zen::getFileSize(getNativePath(filePath)); //throw FileError
}


void NativeFileSystem::createFolderPlain(const AfsPath& folderPath) const //throw FileError, ErrorTargetExisting
{
    createDirectory(getNativePath(folderPath)); //throw FileError, ErrorTargetExisting
}


void NativeFileSystem::removeFilePlain(const AfsPath& filePath) const //throw FileError
{
    zen::removeFilePlain(getNativePath(filePath)); //throw FileError
}


void NativeFileSystem::removeSymlinkPlain(const AfsPath& linkPath) const //throw FileError
{
    zen::removeSymlinkPlain(getNativePath(linkPath)); //throw FileError
}


void NativeFileSystem::removeFolderPlain(const AfsPath& folderPath) const //throw FileError
{
    removeDirectoryPlain(getNativePath(folderPath)); //throw FileError
}


void NativeFileSystem::removeReadOnly(const AfsPath& itemPath) const //throw FileError
{
    removeReadOnlyAttribute(getNativePath(itemPath)); //throw FileError
}


std::unique_ptr<AFS::InputStream> NativeFileSystem::getInputStream(const AfsPath& filePath) const //throw FileError
{
    return std::make_unique<InputStreamNative>(getNativePath(filePath)); //throw FileError
}


//already existing: overwrite
std::unique_ptr<AFS::OutputStreamImpl> NativeFileSystem::getOutputStream(const AfsPath& filePath, //throw FileError
                                                                         std::optional<uint64_t> /*streamSize*/) const
{
    return std::make_unique<OutputStreamNative>(getNativePath(filePath)); //throw FileError
}


void NativeFileSystem::traverseFolder(const AfsPath& folderPath, //throw FileError
                                      const std::function<void(const FileInfo&    fi)>& onFile,
                                      const std::function<void(const FolderInfo&  fi)>& onFolder,
                                      const std::function<void(const SymlinkInfo& si)>& onSymlink) const
{
    zen::traverseFolder(getNativePath(folderPath), //throw FileError
    [&](const zen::FileInfo& fi)
    {
        if (onFile)
            onFile({fi.itemName, fi.fileSize, fi.modTime});
    },
    [&](const zen::FolderInfo& fi)
    {
        if (onFolder)
            onFolder({fi.itemName});
    },
    [&](const zen::SymlinkInfo& si)
    {
        if (onSymlink)
            onSymlink({si.itemName});
    });
}
