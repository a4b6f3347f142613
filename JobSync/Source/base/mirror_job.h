// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef MIRROR_JOB_H_0934857230948572309457
#define MIRROR_JOB_H_0934857230948572309457

#include "job_base.h"


namespace jsync
{
/*  make target an exact copy of source:
    - files missing on target: create
    - files of different size: overwrite
    - items missing on source: delete
    source and target may live on different backends     */
class MirrorJob : public JobBase
{
public:
    MirrorJob(const std::wstring& name, const DirectoryHandle& sourceDir, const DirectoryHandle& targetDir) :
        JobBase(name), sourceDir_(sourceDir), targetDir_(targetDir) {}

    //recursive count of source files
    FileCounterResult countFiles() const override; //throw FileError

    const DirectoryHandle& getSourceDir() const { return sourceDir_; }
    const DirectoryHandle& getTargetDir() const { return targetDir_; }

private:
    void runImpl(bool preview) override; //throw CancelProcess, X

    void mirrorFolder(const DirectoryHandle& sourceDir, const DirectoryHandle& targetDir, bool targetExists, bool preview); //throw CancelProcess, X
    void copyFile(const FileHandle& sourceFile, const DirectoryHandle& sourceDir, const DirectoryHandle& targetDir, bool targetExisting, bool preview); //throw CancelProcess, X
    void deleteObsoleteItems(const DirectoryHandle& sourceDir, const DirectoryHandle& targetDir, bool preview); //throw CancelProcess, X

    const DirectoryHandle sourceDir_;
    const DirectoryHandle targetDir_;
};
}

#endif //MIRROR_JOB_H_0934857230948572309457
