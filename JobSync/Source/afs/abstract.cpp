// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "abstract.h"
#include <typeindex>
#include <zen/extra_log.h>
#include <zen/format_unit.h>

using namespace zen;
using namespace jsync;
using AFS = AbstractFileSystem;


AfsPath jsync::sanitizeDeviceRelativePath(Zstring relPath)
{
    std::vector<Zstring> itemNames;
    for (const Zstring& itemName : splitCpy(relPath, FILE_NAME_SEPARATOR))
        if (itemName == Zstr(".."))
        {
            if (!itemNames.empty()) //no way up from device root
                itemNames.pop_back();
        }
        else if (!itemName.empty() && itemName != Zstr("."))
            itemNames.push_back(itemName);

    Zstring output;
    for (const Zstring& itemName : itemNames)
        output = appendPath(output, itemName);
    return AfsPath(output);
}


std::wstring jsync::getErrorCategory(const FileError& e)
{
    if (dynamic_cast<const ErrorItemNotFound*>(&e))
        return _("Item not found");
    if (dynamic_cast<const ErrorAccessDenied*>(&e))
        return _("Access denied");
    if (dynamic_cast<const ErrorPathTooLong*>(&e))
        return _("Path too long");
    return _("I/O error");
}


namespace
{
void logCategorizedError(const FileError& e) //nothrow
{
    logExtraError(getErrorCategory(e) + L": " + e.toString());
}
}


std::weak_ordering AFS::compareDevice(const AbstractFileSystem& lhs, const AbstractFileSystem& rhs)
{
    //note: in worst case, order is guaranteed to be stable only during each program run
    //caveat: typeid returns static type for pointers, dynamic type for references!!!
    if (const std::strong_ordering cmp = std::type_index(typeid(lhs)) <=> std::type_index(typeid(rhs));
        cmp != std::strong_ordering::equal)
        return cmp;

    return lhs.compareDeviceSameAfsType(rhs);
}


std::optional<AbstractPath> AFS::getParentPath(const AbstractPath& itemPath)
{
    if (const std::optional<AfsPath> parentPath = getParentPath(itemPath.afsPath))
        return AbstractPath(itemPath.afsDevice, *parentPath);

    return {};
}


std::optional<AfsPath> AFS::getParentPath(const AfsPath& itemPath)
{
    if (!itemPath.value.empty())
        return AfsPath(beforeLast(itemPath.value, Zstr("/"), IfNotFoundReturn::none));

    return {};
}

//----------------------------------------------------------------------------------------------------------------

AFS::OutputStream::OutputStream(std::unique_ptr<OutputStreamImpl>&& outStream, const AbstractPath& filePath, std::optional<uint64_t> streamSize) :
    outStream_(std::move(outStream)),
    filePath_(filePath),
    bytesExpected_(streamSize) {}


AFS::OutputStream::~OutputStream()
{
    //we delete the file on errors: => file should not have existed prior to creating OutputStream instance!!
    outStream_.reset(); //close file handle *before* remove!

    if (!finalizeSucceeded_) //transactional output stream! => clean up!
        //even needed if we have a finalizeSucceeded_ = true, but then get an exception in the caller
        try { AFS::removeFileIfExists(filePath_); } //throw FileError
        catch (const FileError& e) { logExtraError(e.toString()); }
}


size_t AFS::OutputStream::tryWrite(const void* buffer, size_t bytesToWrite) //throw FileError
{
    const size_t bytesWritten = outStream_->tryWrite(buffer, bytesToWrite); //throw FileError
    bytesWrittenTotal_ += bytesWritten;
    return bytesWritten;
}


void AFS::OutputStream::finalize() //throw FileError
{
    //catch corrupt data streams of backends that do not report errors reliably
    if (bytesExpected_ && *bytesExpected_ != bytesWrittenTotal_)
        throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getDisplayPath(filePath_))),
                        _("Unexpected size of data stream:") + L' ' + formatNumber(bytesWrittenTotal_) + L'\n' +
                        _("Expected:") + L' ' + formatNumber(*bytesExpected_));

    outStream_->finalize(); //throw FileError
    finalizeSucceeded_ = true;
}

//----------------------------------------------------------------------------------------------------------------

uint64_t AFS::copyFileAsStream(const AbstractPath& sourcePath, const AbstractPath& targetPath, //throw FileError, X
                               const CopyProgressCallback& onProgress /*throw X*/)
{
    auto streamIn = getInputStream(sourcePath); //throw FileError

    uint64_t fileSize = 0;
    //try to get the most current attributes if possible (input file might have changed in the meantime!)
    if (std::optional<StreamAttributes> attr = streamIn->tryGetAttributesFast()) //throw FileError
        fileSize = attr->fileSize;
    else
        fileSize = getFileSize(sourcePath); //throw FileError

    //already existing: overwrite
    auto streamOut = getOutputStream(targetPath, fileSize); //throw FileError

    std::vector<std::byte> buffer(COPY_BLOCK_SIZE);
    uint64_t totalBytesRead    = 0;
    uint64_t totalBytesWritten = 0;

    for (bool eof = false; !eof;)
    {
        //fill complete chunk: tryRead() may return short!
        size_t bytesInBuffer = 0;
        while (bytesInBuffer < buffer.size())
        {
            const size_t bytesRead = streamIn->tryRead(buffer.data() + bytesInBuffer, buffer.size() - bytesInBuffer); //throw FileError
            if (bytesRead == 0) //EOF
            {
                eof = true;
                break;
            }
            bytesInBuffer += bytesRead;
        }
        totalBytesRead += bytesInBuffer;

        if (bytesInBuffer > 0)
        {
            for (size_t bytesWritten = 0; bytesWritten < bytesInBuffer;)
                bytesWritten += streamOut->tryWrite(buffer.data() + bytesWritten, bytesInBuffer - bytesWritten); //throw FileError

            totalBytesWritten += bytesInBuffer;

            if (onProgress)
                onProgress({.bytesTotal = fileSize, .bytesCurrent = totalBytesWritten}); //throw X
        }
    }

    //check incomplete input *before* failing with (slightly) misleading error message in OutputStream::finalize()
    if (totalBytesRead != fileSize)
        throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getDisplayPath(sourcePath))),
                        _("Unexpected size of data stream:") + L' ' + formatNumber(totalBytesRead) + L'\n' +
                        _("Expected:") + L' ' + formatNumber(fileSize));

    streamOut->finalize(); //throw FileError
    return totalBytesWritten;
}


void AFS::createFolderIfMissingRecursion(const AbstractPath& folderPath) //throw FileError
{
    const std::optional<ItemType> type = getItemTypeIfExists(folderPath); //throw FileError
    if (type)
    {
        if (*type == ItemType::file)
            throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(getDisplayPath(folderPath))),
                            replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(folderPath))));
        return;
    }

    if (const std::optional<AbstractPath> parentPath = getParentPath(folderPath))
        createFolderIfMissingRecursion(*parentPath); //throw FileError

    try
    {
        createFolderPlain(folderPath); //throw FileError
    }
    catch (const ErrorTargetExisting&) {} //possible, if createFolderIfMissingRecursion() is run in parallel
}


void AFS::removeFileIfExists(const AbstractPath& filePath) //throw FileError
{
    try
    {
        removeFilePlain(filePath); //throw FileError
    }
    catch (const FileError&)
    {
        try
        {
            if (!getItemTypeIfExists(filePath)) //throw FileError
                return;
        }
        catch (const FileError& e2) { throw FileError(replaceCpy(e2.toString(), L"\n\n", L"\n")); } //add context

        throw;
    }
}


void AFS::removeFolderIfExistsRecursion(const AbstractPath& folderPath) //throw FileError
{
    const std::optional<ItemType> type = getItemTypeIfExists(folderPath); //throw FileError
    if (!type)
        return;

    if (*type == ItemType::symlink) //don't follow
        return removeSymlinkPlain(folderPath); //throw FileError

    std::vector<Zstring> fileNames;
    std::vector<Zstring> folderNames;
    std::vector<Zstring> symlinkNames;

    traverseFolder(folderPath, //throw FileError
    [&](const FileInfo&    fi) { fileNames   .push_back(fi.itemName); },
    [&](const FolderInfo&  fi) { folderNames .push_back(fi.itemName); },
    [&](const SymlinkInfo& si) { symlinkNames.push_back(si.itemName); });

    for (const Zstring& fileName : fileNames)
        removeFilePlain(appendRelPath(folderPath, fileName)); //throw FileError

    for (const Zstring& linkName : symlinkNames)
        removeSymlinkPlain(appendRelPath(folderPath, linkName)); //throw FileError

    for (const Zstring& folderName : folderNames)
        removeFolderIfExistsRecursion(appendRelPath(folderPath, folderName)); //throw FileError

    removeFolderPlain(folderPath); //throw FileError
}

//================================================================================================================

void AFS::checkOwnDevice(const AbstractPath& itemPath) const //throw std::logic_error
{
    if (compareDevice(itemPath.afsDevice.ref(), *this) != std::weak_ordering::equivalent)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


bool AFS::fileExists(const Zstring& itemPath) const
{
    return getFileHandle(itemPath).exists();
}


bool AFS::directoryExists(const Zstring& itemPath) const
{
    return getDirectoryHandle(itemPath).exists();
}


std::unique_ptr<AFS::InputStream> AFS::openInputStream(const FileHandle& file) const //throw FileError
{
    checkOwnDevice(file.getPath()); //throw std::logic_error
    return getInputStream(file.getPath().afsPath); //throw FileError
}


bool AFS::tryDeleteFile(const FileHandle& file) const
{
    checkOwnDevice(file.getPath()); //throw std::logic_error
    try
    {
        removeReadOnly (file.getPath().afsPath); //throw FileError
        removeFilePlain(file.getPath().afsPath); //
        return true;
    }
    catch (const FileError& e)
    {
        logCategorizedError(e);
        return false;
    }
}


bool AFS::tryCreateDirectory(const DirectoryHandle& sourceDir, const DirectoryHandle& targetDir) const
{
    checkOwnDevice(targetDir.getPath()); //throw std::logic_error

    const AbstractPath folderPath = appendRelPath(targetDir.getPath(), sourceDir.getName());
    try
    {
        try
        {
            createFolderPlain(folderPath.afsPath); //throw FileError, ErrorTargetExisting
        }
        catch (const ErrorTargetExisting&)
        {
            if (getItemTypeIfExists(folderPath.afsPath) != ItemType::folder) //throw FileError
                throw;
        }
        return true;
    }
    catch (const FileError& e)
    {
        logCategorizedError(e);
        return false;
    }
}


bool AFS::tryDeleteDirectory(const DirectoryHandle& dir) const
{
    checkOwnDevice(dir.getPath()); //throw std::logic_error
    try
    {
        if (!getItemTypeIfExists(dir.getPath().afsPath)) //throw FileError
            throw ErrorItemNotFound(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(dir.getFullPath())),
                                    _("The item does not exist."));

        removeFolderIfExistsRecursion(dir.getPath()); //throw FileError
        return true;
    }
    catch (const FileError& e)
    {
        logCategorizedError(e);
        return false;
    }
}


bool AFS::tryCopyFile(const AbstractFileSystem& sourceFs, const FileHandle& sourceFile, const DirectoryHandle& targetDir,
                      const CopyProgressCallback& onProgress /*throw X*/) const
{
    checkOwnDevice(targetDir.getPath()); //throw std::logic_error
    if (compareDevice(sourceFile.getDevice().ref(), sourceFs) != std::weak_ordering::equivalent)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    const AbstractPath targetPath = appendRelPath(targetDir.getPath(), sourceFile.getName());
    try
    {
        copyFileAsStream(sourceFile.getPath(), targetPath, onProgress); //throw FileError, X
        return true;
    }
    catch (const FileError& e) //partial target file was removed by ~OutputStream()
    {
        logCategorizedError(e);
        return false;
    }
}

//================================================================================================================

bool FileHandle::exists() const
{
    try
    {
        return AbstractFileSystem::getItemTypeIfExists(filePath_) == AbstractFileSystem::ItemType::file; //throw FileError
    }
    catch (const FileError& e)
    {
        logCategorizedError(e);
        return false;
    }
}


bool DirectoryHandle::exists() const
{
    try
    {
        return AbstractFileSystem::getItemTypeIfExists(folderPath_) == AbstractFileSystem::ItemType::folder; //throw FileError
    }
    catch (const FileError& e)
    {
        logCategorizedError(e);
        return false;
    }
}


std::optional<DirectoryHandle> DirectoryHandle::getParent() const
{
    if (const std::optional<AbstractPath> parentPath = AbstractFileSystem::getParentPath(folderPath_))
        return DirectoryHandle(*parentPath);
    return {};
}


std::vector<FileHandle> DirectoryHandle::getFiles() const //throw FileError
{
    std::vector<FileHandle> files;
    AbstractFileSystem::traverseFolder(folderPath_, //throw FileError
    [&](const AbstractFileSystem::FileInfo& fi) { files.push_back(getChildFile(fi.itemName)); }, nullptr, nullptr);
    return files;
}


std::vector<DirectoryHandle> DirectoryHandle::getDirectories() const //throw FileError
{
    std::vector<DirectoryHandle> folders;
    AbstractFileSystem::traverseFolder(folderPath_, //throw FileError
    nullptr, [&](const AbstractFileSystem::FolderInfo& fi) { folders.push_back(getChildDirectory(fi.itemName)); }, nullptr);
    return folders;
}
