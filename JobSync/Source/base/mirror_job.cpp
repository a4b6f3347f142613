// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#include "mirror_job.h"
#include <zen/extra_log.h>

using namespace zen;
using namespace jsync;
using AFS = AbstractFileSystem;


namespace
{
void countFilesRecursion(const AbstractPath& folderPath, FileCounterResult& result) //throw FileError
{
    std::vector<Zstring> folderNames;

    AFS::traverseFolder(folderPath, //throw FileError
    [&](const AFS::FileInfo& fi)
    {
        ++result.countedFiles;
        result.countedBytes += fi.fileSize;
    },
    [&](const AFS::FolderInfo& fi) { folderNames.push_back(fi.itemName); },
    nullptr);

    for (const Zstring& folderName : folderNames)
        countFilesRecursion(AFS::appendRelPath(folderPath, folderName), result); //throw FileError
}
}


FileCounterResult MirrorJob::countFiles() const //throw FileError
{
    FileCounterResult result;
    countFilesRecursion(sourceDir_.getPath(), result); //throw FileError
    return result;
}


void MirrorJob::runImpl(bool preview) //throw CancelProcess, X
{
    if (!sourceDir_.exists())
    {
        logExtraError(replaceCpy(_("Source folder %x not found."), L"%x", fmtPath(sourceDir_.getFullPath())));
        return;
    }

    bool targetExists = targetDir_.exists();
    if (!targetExists && !preview)
        try
        {
            AFS::createFolderIfMissingRecursion(targetDir_.getPath()); //throw FileError
            targetExists = true;
        }
        catch (const FileError& e)
        {
            logExtraError(e.toString());
            return;
        }

    mirrorFolder(sourceDir_, targetDir_, targetExists, preview); //throw CancelProcess, X
}


//targetExists == false: preview of a target folder yet to be created
void MirrorJob::mirrorFolder(const DirectoryHandle& sourceDir, const DirectoryHandle& targetDir, bool targetExists, bool preview) //throw CancelProcess, X
{
    //delete first: make room for items of a different type but the same name
    if (targetExists)
        deleteObsoleteItems(sourceDir, targetDir, preview); //throw CancelProcess, X

    std::vector<FileHandle>      sourceFiles;
    std::vector<DirectoryHandle> sourceFolders;
    try
    {
        sourceFiles   = sourceDir.getFiles();       //throw FileError
        sourceFolders = sourceDir.getDirectories(); //
    }
    catch (const FileError& e)
    {
        logExtraError(e.toString());
        return;
    }

    for (const FileHandle& sourceFile : sourceFiles)
    {
        checkpoint(); //throw CancelProcess

        uint64_t fileSize = 0;
        try
        {
            fileSize = sourceFile.getFileSize(); //throw FileError

            const FileHandle targetFile = targetDir.getChildFile(sourceFile.getName());

            if (!targetExists || !targetFile.exists())
                copyFile(sourceFile, sourceDir, targetDir, false /*targetExisting*/, preview); //throw CancelProcess, X
            else if (targetFile.getFileSize() != fileSize) //throw FileError
                copyFile(sourceFile, sourceDir, targetDir, true /*targetExisting*/, preview); //throw CancelProcess, X
        }
        catch (const FileError& e)
        {
            logExtraError(e.toString());
            events().fileCopyError.notify({sourceFile, targetDir});
        }

        events().proceededFile.notify({sourceFile, fileSize});
    }

    for (const DirectoryHandle& sourceSubDir : sourceFolders)
    {
        checkpoint(); //throw CancelProcess

        const DirectoryHandle targetSubDir = targetDir.getChildDirectory(sourceSubDir.getName());
        bool targetSubDirExists = targetExists && targetSubDir.exists();

        if (!targetSubDirExists)
        {
            const DirectoryCreationEvent creationEvent{sourceSubDir, targetDir};
            events().creatingDirectory.notify(creationEvent);

            if (!preview)
            {
                if (!targetDir.getDevice().ref().tryCreateDirectory(sourceSubDir, targetDir)) //error is logged by backend
                    continue;
                targetSubDirExists = true;
            }
            events().createdDirectory.notify(creationEvent);
        }

        mirrorFolder(sourceSubDir, targetSubDir, targetSubDirExists, preview); //throw CancelProcess, X
    }
}


void MirrorJob::copyFile(const FileHandle& sourceFile, const DirectoryHandle& sourceDir, const DirectoryHandle& targetDir, bool targetExisting, bool preview) //throw CancelProcess, X
{
    const FileCopyEvent copyEvent{sourceFile, sourceDir, targetDir};

    (targetExisting ? events().modifyingFile : events().creatingFile).notify(copyEvent);

    if (!preview)
    {
        uint64_t bytesCopied = 0;
        auto onProgress = [&](const CopyProgress& progress)
        {
            bytesCopied = progress.bytesCurrent;
            events().fileCopyProgress.notify(progress); //throw X
        };

        if (!targetDir.getDevice().ref().tryCopyFile(sourceFile.getDevice().ref(), sourceFile, targetDir, onProgress)) //error is logged by backend
        {
            events().fileCopyError.notify({sourceFile, targetDir});
            return;
        }
        addWrittenBytes(bytesCopied);
    }

    (targetExisting ? events().modifiedFile : events().createdFile).notify(copyEvent);
}


void MirrorJob::deleteObsoleteItems(const DirectoryHandle& sourceDir, const DirectoryHandle& targetDir, bool preview) //throw CancelProcess, X
{
    std::vector<FileHandle>      targetFiles;
    std::vector<DirectoryHandle> targetFolders;
    try
    {
        targetFiles   = targetDir.getFiles();       //throw FileError
        targetFolders = targetDir.getDirectories(); //
    }
    catch (const FileError& e)
    {
        logExtraError(e.toString());
        return;
    }

    for (const FileHandle& targetFile : targetFiles)
        if (!sourceDir.getChildFile(targetFile.getName()).exists())
        {
            checkpoint(); //throw CancelProcess

            events().deletingFile.notify({targetFile});

            if (!preview && !targetFile.getDevice().ref().tryDeleteFile(targetFile)) //error is logged by backend
                events().fileDeletionError.notify({targetFile});
            else
                events().deletedFile.notify({targetFile});
        }

    for (const DirectoryHandle& targetSubDir : targetFolders)
        if (!sourceDir.getChildDirectory(targetSubDir.getName()).exists())
        {
            checkpoint(); //throw CancelProcess

            events().deletingDirectory.notify({targetSubDir});

            if (!preview && !targetSubDir.getDevice().ref().tryDeleteDirectory(targetSubDir)) //error is logged by backend
                events().directoryDeletionError.notify({targetSubDir});
            else
                events().deletedDirectory.notify({targetSubDir});
        }
}
