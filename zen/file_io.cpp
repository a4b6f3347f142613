// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_io.h"
#include <algorithm>
#include <vector>
#include "extra_log.h"

    #include <sys/stat.h>
    #include <fcntl.h>  //open
    #include <unistd.h> //close, read, write

using namespace zen;


FileBase::~FileBase()
{
    if (hFile_ != invalidFileHandle)
        try
        {
            close(); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


void FileBase::close() //throw FileError
{
    if (hFile_ == invalidFileHandle)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    if (::close(hFile_) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), "close");

    hFile_ = invalidFileHandle; //do NOT set on error! => ~FileOutputPlain() still wants to (try to) delete the file!
}

//----------------------------------------------------------------------------------------------------

namespace
{
std::pair<FileBase::FileHandle, uint64_t> openHandleForRead(const Zstring& filePath) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(filePath));

    //caveat: check for file types that block during open(): character device, block device, named pipe
    struct stat fileInfo = {};
    if (::stat(filePath.c_str(), &fileInfo) != 0) //follows symlinks
        THROW_LAST_FILE_ERROR(errorMsg, "stat");

    if (S_ISDIR(fileInfo.st_mode))
        throw FileError(errorMsg, formatSystemError("stat", EISDIR));

    if (!S_ISREG(fileInfo.st_mode))
        throw FileError(errorMsg, _("Unsupported item type.") + L" [" + utfTo<std::wstring>(printNumber<std::string>("0%06o", fileInfo.st_mode & S_IFMT)) + L']');

    const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
    if (fdFile == -1) //don't check "< 0" -> docu seems to allow "-2" to be a valid file handle
        THROW_LAST_FILE_ERROR(errorMsg, "open");

    return {fdFile /*pass ownership*/, static_cast<uint64_t>(fileInfo.st_size)};
}
}


FileInputPlain::FileInputPlain(const Zstring& filePath) :
    FileInputPlain(openHandleForRead(filePath), filePath) {} //throw FileError


FileInputPlain::FileInputPlain(const std::pair<FileHandle, uint64_t>& fileDetails, const Zstring& filePath) :
    FileBase(fileDetails.first, filePath),
    fileSize_(fileDetails.second)
{
    //optimize read-ahead on input file:
    if (::posix_fadvise(getHandle(), 0 /*offset*/, 0 /*len*/, POSIX_FADV_SEQUENTIAL) != 0) //"len == 0" means "end of the file"
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)), "posix_fadvise(POSIX_FADV_SEQUENTIAL)");
}


//may return short, only 0 means EOF! =>  CONTRACT: bytesToRead > 0!
size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw FileError
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    ssize_t bytesRead = 0;
    do
    {
        bytesRead = ::read(getHandle(), buffer, bytesToRead);
    }
    while (bytesRead < 0 && errno == EINTR); //if ::read is interrupted (EINTR) right in the middle, it will return successfully with "bytesRead < bytesToRead"

    if (bytesRead < 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getFilePath())), "read");

    return bytesRead; //"zero indicates end of file"
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForWrite(const Zstring& filePath, OutputMode mode) //throw FileError, ErrorTargetExisting
{
    const mode_t fileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH; //0666 => umask will be applied implicitly!

    const int fdFile = ::open(filePath.c_str(),
                              O_CREAT | (mode == OutputMode::overwrite ? O_TRUNC : O_EXCL) | O_WRONLY | O_CLOEXEC,
                              fileMode);
    if (fdFile == -1)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), "open"); //EEXIST => ErrorTargetExisting

    return fdFile; //pass ownership
}
}


FileOutputPlain::FileOutputPlain(const Zstring& filePath, OutputMode mode) :
    FileBase(openHandleForWrite(filePath, mode), filePath) {} //throw FileError, ErrorTargetExisting


FileOutputPlain::~FileOutputPlain()
{
    if (getHandle() != invalidFileHandle) //not finalized => clean up garbage
    {
        //"deleting while handle is open" == FILE_FLAG_DELETE_ON_CLOSE
        if (::unlink(getFilePath().c_str()) != 0)
            logExtraError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(getFilePath())) + L"\n\n" + formatSystemError("unlink", getLastError()));
    }
}


//may return short! CONTRACT: bytesToWrite > 0
size_t FileOutputPlain::tryWrite(const void* buffer, size_t bytesToWrite) //throw FileError
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    ssize_t bytesWritten = 0;
    do
    {
        bytesWritten = ::write(getHandle(), buffer, bytesToWrite);
    }
    while (bytesWritten < 0 && errno == EINTR);

    if (bytesWritten <= 0)
    {
        if (bytesWritten == 0) //comment in safe-read.c suggests to treat this as an error due to buggy drivers
            errno = ENOSPC;

        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), "write");
    }
    return bytesWritten;
}

//----------------------------------------------------------------------------------------------------

std::string zen::getFileContent(const Zstring& filePath) //throw FileError
{
    FileInputPlain fileIn(filePath); //throw FileError

    std::string output;
    output.reserve(fileIn.getFileSize());

    std::vector<char> buffer(FileBase::defaultBlockSize);
    for (;;)
    {
        const size_t bytesRead = fileIn.tryRead(buffer.data(), buffer.size()); //throw FileError
        if (bytesRead == 0) //end of file
            return output;
        output.append(buffer.data(), bytesRead);
    }
}


void zen::setFileContent(const Zstring& filePath, std::string_view bytes) //throw FileError
{
    const Zstring tmpFilePath = filePath + Zstr(".") + numberTo<Zstring>(::getpid()) + Zstr(".tmp");
    {
        FileOutputPlain tmpFile(tmpFilePath, OutputMode::overwrite); //throw FileError

        for (size_t pos = 0; pos < bytes.size(); )
            pos += tmpFile.tryWrite(bytes.data() + pos, std::min(bytes.size() - pos, FileBase::defaultBlockSize)); //throw FileError

        tmpFile.close(); //throw FileError
    }
    //take over ownership:
    ZEN_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    //operation finished: move temp file transactionally
    if (::rename(tmpFilePath.c_str(), filePath.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), "rename");
}
