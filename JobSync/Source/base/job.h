// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef JOB_H_2384572309845723409857234
#define JOB_H_2384572309845723409857234

#include <atomic>
#include <string>
#include "file_counter.h"
#include "sync_events.h"


namespace jsync
{
/*  unit of synchronization work over one source/target directory pair
    - single-use: run() at most once, then discard
    - run() emits "finished" when complete; after stop() it returns without "finished"
    - pause()/resume()/stop()/isPaused(): callable from any thread          */
class Job
{
public:
    virtual ~Job() {}

    virtual std::wstring getName() const = 0;

    virtual FileCounterResult countFiles() const = 0; //throw FileError

    virtual void run(bool preview) = 0; //throw X

    virtual void pause () = 0;
    virtual void resume() = 0;
    virtual void stop  () = 0;

    virtual bool isPaused() const = 0;

    //cumulative bytes written to the target: valid during and after run()
    virtual uint64_t getWrittenBytes() const = 0;

    JobEvents& events() { return events_; }

protected:
    Job() {}

private:
    Job           (const Job&) = delete;
    Job& operator=(const Job&) = delete;

    JobEvents events_;

    friend class JobWorker;
    std::atomic<bool> submitted_{false}; //set when passed to JobWorker::start()
};
}

#endif //JOB_H_2384572309845723409857234
