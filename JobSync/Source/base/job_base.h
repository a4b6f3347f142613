// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef JOB_BASE_H_7823094572390485723904
#define JOB_BASE_H_7823094572390485723904

#include <atomic>
#include <condition_variable>
#include <mutex>
#include "job.h"


namespace jsync
{
//Exception class used to abort a running job
class CancelProcess {};


//cooperative pause/stop: derived classes call checkpoint() between file-level operations
class JobBase : public Job
{
public:
    std::wstring getName() const override { return name_; }

    //emits "finished" unless stopped
    void run(bool preview) final; //throw X

    void pause () override;
    void resume() override;
    void stop  () override;

    bool isPaused() const override;

    uint64_t getWrittenBytes() const override { return writtenBytes_; }

protected:
    explicit JobBase(const std::wstring& name) : name_(name) {}

    virtual void runImpl(bool preview) = 0; //throw CancelProcess, X

    //blocks while paused
    void checkpoint(); //throw CancelProcess

    void addWrittenBytes(uint64_t bytes) { writtenBytes_ += bytes; }

private:
    const std::wstring name_;

    mutable std::mutex lockState_;
    std::condition_variable conditionStateChanged_;
    bool paused_  = false; //
    bool stopped_ = false; //protected by lockState_

    std::atomic<uint64_t> writtenBytes_{0};
};
}

#endif //JOB_BASE_H_7823094572390485723904
