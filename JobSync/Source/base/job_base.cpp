// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#include "job_base.h"

using namespace jsync;


void JobBase::run(bool preview) //throw X
{
    try
    {
        checkpoint(); //throw CancelProcess
        runImpl(preview); //throw CancelProcess, X
    }
    catch (CancelProcess&) { return; } //stopped: completed items stay, in-flight item is abandoned

    events().finished.notify(); //throw X
}


void JobBase::pause()
{
    std::lock_guard dummy(lockState_);
    paused_ = true;
}


void JobBase::resume()
{
    {
        std::lock_guard dummy(lockState_);
        paused_ = false;
    }
    conditionStateChanged_.notify_all();
}


void JobBase::stop()
{
    {
        std::lock_guard dummy(lockState_);
        stopped_ = true;
    }
    conditionStateChanged_.notify_all();
}


bool JobBase::isPaused() const
{
    std::lock_guard dummy(lockState_);
    return paused_;
}


void JobBase::checkpoint() //throw CancelProcess
{
    std::unique_lock dummy(lockState_);
    conditionStateChanged_.wait(dummy, [this] { return !paused_ || stopped_; });

    if (stopped_)
        throw CancelProcess();
}
