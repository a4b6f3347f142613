// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef SYNC_EVENTS_H_0923475823094572304957
#define SYNC_EVENTS_H_0923475823094572304957

#include <functional>
#include <vector>
#include "../afs/abstract.h"


namespace jsync
{
/*  callback registry for one kind of notification
    - subscribe before the run starts: no synchronization between subscribe() and notify()
    - notify() runs all callbacks on the calling thread in order of subscription      */
template <class... Args>
class EventChannel
{
public:
    using Callback = std::function<void(const Args&... args)>;

    void subscribe(const Callback& cb) { callbacks_.push_back(cb); }

    void notify(const Args&... args) const //throw X
    {
        for (const Callback& cb : callbacks_)
            cb(args...); //throw X
    }

    size_t subscriberCount() const { return callbacks_.size(); }

private:
    std::vector<Callback> callbacks_;
};


struct FileCopyEvent //creating/created and modifying/modified
{
    FileHandle      sourceFile;
    DirectoryHandle sourceDir;
    DirectoryHandle targetDir;
};

struct FileCopyErrorEvent
{
    FileHandle      sourceFile;
    DirectoryHandle targetDir;
};

struct FileDeletionEvent //deleting/deleted and deletion error
{
    FileHandle file;
};

struct DirectoryCreationEvent
{
    DirectoryHandle sourceDir;
    DirectoryHandle targetDir; //parent of the new directory
};

struct DirectoryDeletionEvent //deleting/deleted and deletion error
{
    DirectoryHandle dir;
};

struct FileProceededEvent
{
    FileHandle file;
    uint64_t fileSize = 0;
};


//notification vocabulary shared by Job and JobWorker
struct JobEvents
{
    EventChannel<FileCopyEvent> creatingFile;
    EventChannel<FileCopyEvent> createdFile;
    EventChannel<FileCopyEvent> modifyingFile;
    EventChannel<FileCopyEvent> modifiedFile;

    EventChannel<FileDeletionEvent> deletingFile;
    EventChannel<FileDeletionEvent> deletedFile;

    EventChannel<DirectoryCreationEvent> creatingDirectory;
    EventChannel<DirectoryCreationEvent> createdDirectory;

    EventChannel<DirectoryDeletionEvent> deletingDirectory;
    EventChannel<DirectoryDeletionEvent> deletedDirectory;

    EventChannel<CopyProgress> fileCopyProgress;

    EventChannel<FileCopyErrorEvent>     fileCopyError;
    EventChannel<FileDeletionEvent>      fileDeletionError;
    EventChannel<DirectoryDeletionEvent> directoryDeletionError;

    EventChannel<FileProceededEvent> proceededFile;

    EventChannel<> finished;
};
}

#endif //SYNC_EVENTS_H_0923475823094572304957
