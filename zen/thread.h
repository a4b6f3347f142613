// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef THREAD_H_7896323423432235246427
#define THREAD_H_7896323423432235246427

#include <future>
#include <mutex>
#include <thread>


namespace zen
{
/*  run a function on a detached thread and return its result via std::future
    unlike std::async:
        - always runs on a new thread
        - the returned future does not block in its destructor

    Example:
        std::future<void> ft = zen::runAsync([&] { worker.start(jobs, false); });
        ...
        ft.get(); //rethrows exceptions of the worker thread                  */
template <class Function> inline
auto runAsync(Function&& fun)
{
    using ResultType = decltype(fun());

    std::packaged_task<ResultType()> task(std::forward<Function>(fun)); //requires copy-constructible function object
    std::future<ResultType> result = task.get_future();
    std::thread(std::move(task)).detach(); //~thread() calls std::terminate() if joinable()
    return result;
}


//value accessible only while holding its mutex
template <class T>
class Protected
{
public:
    Protected() {}

    template <class Function>
    auto access(Function fun)
    {
        std::lock_guard dummy(lockValue_);
        return fun(value_);
    }

private:
    Protected           (const Protected&) = delete;
    Protected& operator=(const Protected&) = delete;

    std::mutex lockValue_;
    T value_{};
};
}

#endif //THREAD_H_7896323423432235246427
