// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#include "job_worker.h"
#include <set>
#include <zen/extra_log.h>
#include <zen/thread.h>

using namespace zen;
using namespace jsync;


namespace
{
template <class... Args> inline
void relay(EventChannel<Args...>& source, const EventChannel<Args...>& target)
{
    source.subscribe([&target](const Args&... args) { target.notify(args...); });
}
}


void JobWorker::start(const std::vector<SharedRef<Job>>& jobs, bool preview) //throw std::logic_error, X
{
    {
        std::lock_guard dummy(lockRun_); //stop() must see either no run or a fully initialized one

        if (running_)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        //jobs are single-use: each instance is run once by one worker
        std::set<const Job*> jobsUnique;
        for (const SharedRef<Job>& job : jobs)
            if (job.ref().submitted_ || !jobsUnique.insert(&job.ref()).second)
                throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        for (SharedRef<Job> job : jobs)
        {
            job.ref().submitted_ = true;
            jobQueue_.push_back(job.ptr());
        }

        running_ = true;
        stopRequested_ = false;
        totalWrittenBytes_ = 0;
        proceededFiles_    = 0;
        fileCounterResult_ = FileCounterResult();
        currentJob_ = nullptr;
    }
    ZEN_ON_SCOPE_EXIT(std::lock_guard dummy(lockRun_); currentJob_ = nullptr; jobQueue_.clear(); running_ = false);

    events_.started.notify(); //throw X

    //pre-count all jobs: progress denominator
    FileCounterResult fileCount;
    for (const SharedRef<Job>& job : jobs)
        try
        {
            fileCount += job.ref().countFiles(); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); } //contributes nothing

    {
        std::lock_guard dummy(lockRun_);
        fileCounterResult_ = fileCount;
    }
    events_.filesCounted.notify(fileCount); //throw X

    while (std::shared_ptr<Job> job = dequeueNextJob())
    {
        currentJobFinished_ = false;
        subscribeToJob(*job);

        events_.jobStarted.notify(*job); //throw X

        job->run(preview); //throw X

        if (!currentJobFinished_) //stopped
            break;
    }

    {
        std::lock_guard dummy(lockRun_);
        if (stopRequested_)
            return;
    }
    events_.finished.notify(); //throw X
}


std::future<void> JobWorker::startAsync(const std::vector<SharedRef<Job>>& jobs, bool preview)
{
    return runAsync([this, jobs, preview] { start(jobs, preview); }); //throw std::logic_error, X
}


std::shared_ptr<Job> JobWorker::dequeueNextJob()
{
    std::lock_guard dummy(lockRun_);

    currentJob_ = nullptr;
    if (stopRequested_ || jobQueue_.empty())
        return nullptr;

    currentJob_ = jobQueue_.front();
    jobQueue_.pop_front();
    return currentJob_;
}


void JobWorker::subscribeToJob(Job& job)
{
    JobEvents& je = job.events();

    relay(je.creatingFile,  events_.creatingFile);
    relay(je.createdFile,   events_.createdFile);
    relay(je.modifyingFile, events_.modifyingFile);
    relay(je.modifiedFile,  events_.modifiedFile);

    relay(je.deletingFile, events_.deletingFile);
    relay(je.deletedFile,  events_.deletedFile);

    relay(je.creatingDirectory, events_.creatingDirectory);
    relay(je.createdDirectory,  events_.createdDirectory);
    relay(je.deletingDirectory, events_.deletingDirectory);
    relay(je.deletedDirectory,  events_.deletedDirectory);

    relay(je.fileCopyProgress, events_.fileCopyProgress);

    relay(je.fileCopyError,          events_.fileCopyError);
    relay(je.fileDeletionError,      events_.fileDeletionError);
    relay(je.directoryDeletionError, events_.directoryDeletionError);

    //subscribers see the notification before the counter reflects it
    je.proceededFile.subscribe([this](const FileProceededEvent& pe)
    {
        events_.proceededFile.notify(pe); //throw X
        ++proceededFiles_;
    });

    //jobs are single-use: no need to unsubscribe
    je.finished.subscribe([this, &job]
    {
        currentJobFinished_ = true;
        events_.jobFinished.notify(job); //throw X
        totalWrittenBytes_ += job.getWrittenBytes();
    });
}


void JobWorker::pause()
{
    std::lock_guard dummy(lockRun_);
    if (currentJob_)
        currentJob_->pause();
}


void JobWorker::resume()
{
    std::lock_guard dummy(lockRun_);
    if (currentJob_)
        currentJob_->resume();
}


void JobWorker::stop()
{
    std::lock_guard dummy(lockRun_);
    if (!running_)
        return;

    stopRequested_ = true;
    jobQueue_.clear();
    if (currentJob_)
        currentJob_->stop();
}


bool JobWorker::isPaused() const
{
    std::lock_guard dummy(lockRun_);
    return currentJob_ && currentJob_->isPaused();
}


FileCounterResult JobWorker::getFileCounterResult() const
{
    std::lock_guard dummy(lockRun_);
    return fileCounterResult_;
}
