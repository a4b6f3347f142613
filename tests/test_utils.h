// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef TEST_UTILS_H_4509823745023984570234
#define TEST_UTILS_H_4509823745023984570234

#include <algorithm>
#include <iostream>
#include <stdlib.h> //mkdtemp
#include <zen/extra_log.h>
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/file_path.h>
#include "../JobSync/Source/afs/native.h"


namespace jsync::test
{
//unique folder below /tmp, deleted recursively on destruction
class TempFolder
{
public:
    TempFolder()
    {
        std::string pathTmpl = "/tmp/jobsync_test_XXXXXX";
        if (!::mkdtemp(pathTmpl.data()))
            throw zen::FileError(zen::replaceCpy<std::wstring>(L"Cannot create directory %x.", L"%x", zen::fmtPath(pathTmpl)));
        folderPath_ = pathTmpl;
    }

    ~TempFolder()
    {
        try
        {
            zen::removeDirectoryPlainRecursion(folderPath_); //throw FileError
        }
        catch (const zen::FileError& e) { std::cerr << zen::utfTo<std::string>(e.toString()) << std::endl; }
    }

    const Zstring& getPath() const { return folderPath_; }

    Zstring operator/(const Zstring& relPath) const { return zen::appendPath(folderPath_, relPath); }

private:
    TempFolder           (const TempFolder&) = delete;
    TempFolder& operator=(const TempFolder&) = delete;

    Zstring folderPath_;
};


inline
void writeFile(const Zstring& filePath, const std::string& content) //throw FileError
{
    if (const std::optional<Zstring> parentPath = zen::getParentFolderPath(filePath))
        zen::createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    zen::setFileContent(filePath, content); //throw FileError
}


inline
std::string readFile(const Zstring& filePath) { return zen::getFileContent(filePath); } //throw FileError


//deterministic, non-repeating within 251 bytes
inline
std::string makeTestData(size_t size)
{
    std::string data(size, '\0');
    for (size_t i = 0; i < size; ++i)
        data[i] = static_cast<char>(i % 251);
    return data;
}


//write fails after "bytesLimit" bytes
class FailingWriteFileSystem : public NativeFileSystem
{
public:
    explicit FailingWriteFileSystem(size_t bytesLimit) : bytesLimit_(bytesLimit) {}

protected:
    std::unique_ptr<OutputStreamImpl> getOutputStream(const AfsPath& filePath, //throw FileError
                                                      std::optional<uint64_t> streamSize) const override
    {
        return std::make_unique<OutputStreamFailing>(NativeFileSystem::getOutputStream(filePath, streamSize), bytesLimit_); //throw FileError
    }

private:
    struct OutputStreamFailing : public OutputStreamImpl
    {
        OutputStreamFailing(std::unique_ptr<OutputStreamImpl>&& streamOut, size_t bytesLimit) : streamOut_(std::move(streamOut)), bytesLimit_(bytesLimit) {}

        size_t tryWrite(const void* buffer, size_t bytesToWrite) override //throw FileError
        {
            if (bytesWritten_ >= bytesLimit_)
                throw zen::FileError(L"Cannot write file.", L"Simulated disk failure.");

            const size_t bytesWritten = streamOut_->tryWrite(buffer, std::min(bytesToWrite, bytesLimit_ - bytesWritten_)); //throw FileError
            bytesWritten_ += bytesWritten;
            return bytesWritten;
        }

        void finalize() override { streamOut_->finalize(); } //throw FileError

        const std::unique_ptr<OutputStreamImpl> streamOut_;
        const size_t bytesLimit_;
        size_t bytesWritten_ = 0;
    };

    const size_t bytesLimit_;
};


inline
bool logContains(const zen::ErrorLog& log, const std::wstring& term)
{
    for (const zen::LogEntry& entry : log)
        if (zen::contains(zen::utfTo<std::wstring>(entry.message), term))
            return true;
    return false;
}


//drain process-wide error log between tests
inline
zen::ErrorLog takeExtraLog() { return zen::fetchExtraLog(); }
}

#endif //TEST_UTILS_H_4509823745023984570234
