// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef JOB_WORKER_H_8923457230945872309457
#define JOB_WORKER_H_8923457230945872309457

#include <atomic>
#include <deque>
#include <future>
#include <mutex>
#include <zen/stl_tools.h>
#include "job.h"


namespace jsync
{
struct WorkerEvents : public JobEvents //"finished": all jobs are done
{
    EventChannel<> started; //before counting files
    EventChannel<FileCounterResult> filesCounted;
    EventChannel<Job> jobStarted;
    EventChannel<Job> jobFinished;
};


/*  run a sequence of jobs, one at a time, in submission order
    - relays all job notifications via events()
    - no "finished" notification after stop()
    - pause()/resume()/stop() and the getters are callable from any thread     */
class JobWorker
{
public:
    JobWorker() {}

    //run on calling thread; returns when all jobs are done or after stop()
    void start(const std::vector<zen::SharedRef<Job>>& jobs, bool preview); //throw std::logic_error (already running), X

    //run on a worker thread: exceptions are reported via the future
    std::future<void> startAsync(const std::vector<zen::SharedRef<Job>>& jobs, bool preview);

    //no-ops if there is no current job
    void pause ();
    void resume();

    //stop current job and drop all queued jobs
    void stop();

    bool isPaused () const; //= current job is paused
    bool isRunning() const { return running_; }

    uint64_t getTotalWrittenBytes() const { return totalWrittenBytes_; }
    uint64_t getProceededFiles   () const { return proceededFiles_; }
    FileCounterResult getFileCounterResult() const;

    //subscribe before starting a run
    WorkerEvents& events() { return events_; }

private:
    JobWorker           (const JobWorker&) = delete;
    JobWorker& operator=(const JobWorker&) = delete;

    void subscribeToJob(Job& job);
    std::shared_ptr<Job> dequeueNextJob(); //returns nullptr if done

    WorkerEvents events_;

    std::atomic<bool> running_{false};
    bool currentJobFinished_ = false; //accessed by the thread running start() only
    std::atomic<uint64_t> totalWrittenBytes_{0};
    std::atomic<uint64_t> proceededFiles_{0};

    mutable std::mutex lockRun_;
    std::deque<std::shared_ptr<Job>> jobQueue_;    //
    std::shared_ptr<Job> currentJob_;              //protected by lockRun_
    FileCounterResult fileCounterResult_;          //
    bool stopRequested_ = false;                   //
};
}

#endif //JOB_WORKER_H_8923457230945872309457
