// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#include "run_logger.h"
#include <zen/format_unit.h>

using namespace zen;
using namespace jsync;


namespace
{
std::wstring getTargetFilePath(const FileCopyEvent& ce) { return ce.targetDir.getChildFile(ce.sourceFile.getName()).getFullPath(); }

std::wstring getTargetFolderPath(const DirectoryCreationEvent& ce) { return ce.targetDir.getChildDirectory(ce.sourceDir.getName()).getFullPath(); }
}


RunLogger::RunLogger(JobWorker& worker)
{
    WorkerEvents& we = worker.events();

    we.started.subscribe([this]
    {
        logInfo(_("Starting jobs."));
        logInfo(_("Counting files..."));
    });

    we.filesCounted.subscribe([this](const FileCounterResult& fc)
    {
        logInfo(_("Finished file counting.") + L' ' +
                replaceCpy(_("Files: %x"), L"%x", formatNumber(fc.countedFiles)) + L" (" + formatFilesizeShort(fc.countedBytes) + L')');
    });

    we.jobStarted .subscribe([this](const Job& job) { logInfo(replaceCpy(_("Proceeding job: %x..."), L"%x", job.getName())); });
    we.jobFinished.subscribe([this](const Job& job) { logInfo(replaceCpy(_("Finished job: %x"),      L"%x", job.getName())); });

    we.finished.subscribe([this] { logInfo(_("Finished all jobs.")); });

    //-------------------------------------------------------------------------------------------------
    we.createdFile.subscribe([this](const FileCopyEvent& ce)
    {
        logInfo(_("File created:") + L' ' + ce.sourceFile.getFullPath() + L" -> " + getTargetFilePath(ce));
    });

    we.modifiedFile.subscribe([this](const FileCopyEvent& ce)
    {
        logInfo(_("File modified:") + L' ' + ce.sourceFile.getFullPath() + L" -> " + getTargetFilePath(ce));
    });

    we.deletedFile.subscribe([this](const FileDeletionEvent& de) { logInfo(_("File deleted:") + L' ' + de.file.getFullPath()); });

    we.createdDirectory.subscribe([this](const DirectoryCreationEvent& ce)
    {
        logInfo(_("Directory created:") + L' ' + ce.sourceDir.getFullPath() + L" -> " + getTargetFolderPath(ce));
    });

    we.deletedDirectory.subscribe([this](const DirectoryDeletionEvent& de) { logInfo(_("Directory deleted:") + L' ' + de.dir.getFullPath()); });

    //-------------------------------------------------------------------------------------------------
    we.fileCopyError.subscribe([this](const FileCopyErrorEvent& ee)
    {
        logError(replaceCpy(replaceCpy(_("Cannot copy file %x to %y."),
                                       L"%x", fmtPath(ee.sourceFile.getFullPath())),
                            L"%y", fmtPath(ee.targetDir.getChildFile(ee.sourceFile.getName()).getFullPath())));
    });

    we.fileDeletionError.subscribe([this](const FileDeletionEvent& de)
    {
        logError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(de.file.getFullPath())));
    });

    we.directoryDeletionError.subscribe([this](const DirectoryDeletionEvent& de)
    {
        logError(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(de.dir.getFullPath())));
    });
}
