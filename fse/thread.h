// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef THREAD_H_5610982374019287340
#define THREAD_H_5610982374019287340

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "scope_guard.h"


namespace fse
{
//thrown at an interruption point of a worker thread after InterruptibleThread::requestStop()
class ThreadStopRequest {};

namespace impl
{
class StopState
{
public:
    void requestStop()
    {
        {
            std::lock_guard dummy(lockStop_); //a sleeper between predicate check and wait must not miss the signal
            stopRequested_ = true;
        }
        stopSignal_.notify_all();
    }

    bool stopRequested() const { return stopRequested_; }

    template <class Rep, class Period>
    void sleepFor(const std::chrono::duration<Rep, Period>& relTime) //throw ThreadStopRequest
    {
        std::unique_lock lock(lockStop_);
        if (stopSignal_.wait_for(lock, relTime, [this] { return stopRequested_.load(); }))
            throw ThreadStopRequest();
    }

private:
    std::atomic<bool> stopRequested_{false};
    std::mutex lockStop_;
    std::condition_variable stopSignal_;
};

//non-null inside the worker function of an InterruptibleThread only
inline thread_local StopState* currentStopState = nullptr;
}


//joins on destruction (after requesting a stop): no detached workers outliving their data
class InterruptibleThread
{
public:
    InterruptibleThread() {}

    template <class Function>
    explicit InterruptibleThread(Function&& f) //worker function may throw ThreadStopRequest
    {
        worker_ = std::thread([f = std::forward<Function>(f), stopState = stopState_]() mutable
        {
            impl::currentStopState = stopState.get();
            FSE_ON_SCOPE_EXIT(impl::currentStopState = nullptr);
            try
            {
                f(); //throw ThreadStopRequest
            }
            catch (const ThreadStopRequest&) {} //regular way to end the worker
        });
    }

    InterruptibleThread(InterruptibleThread&&) noexcept = default;
    InterruptibleThread& operator=(InterruptibleThread&& tmp) noexcept
    {
        stopAndJoin(); //old worker ends *now*, not when tmp dies
        worker_    = std::move(tmp.worker_);
        stopState_ = std::move(tmp.stopState_);
        return *this;
    }

    ~InterruptibleThread() { stopAndJoin(); }

    bool joinable() const { return worker_.joinable(); }
    void requestStop() { stopState_->requestStop(); }
    void join() { worker_.join(); }

private:
    void stopAndJoin()
    {
        if (joinable())
        {
            requestStop();
            join();
        }
    }

    std::thread worker_;
    std::shared_ptr<impl::StopState> stopState_ = std::make_shared<impl::StopState>();
};


//context of worker thread; no-ops outside an InterruptibleThread:
inline
void interruptionPoint() //throw ThreadStopRequest
{
    if (impl::currentStopState && impl::currentStopState->stopRequested())
        throw ThreadStopRequest();
}

template <class Rep, class Period> inline
void interruptibleSleep(const std::chrono::duration<Rep, Period>& relTime) //throw ThreadStopRequest
{
    if (impl::currentStopState)
        impl::currentStopState->sleepFor(relTime); //throw ThreadStopRequest
    else
        std::this_thread::sleep_for(relTime);
}


void setCurrentThreadName(const std::string& threadName);

//------------------------------------------------------------------------------------------

//value that is only reachable while holding its mutex
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

#endif //THREAD_H_5610982374019287340
