#pragma once
#include <atomic>
#include <csignal>
#include <thread>

#include <httplib.h>

// Blocks SIGINT/SIGTERM in the calling thread, and so in every thread it
// starts afterwards. Returns the blocked set. Throws std::runtime_error.
sigset_t block_shutdown_signals();

// Waits on `signals` with sigwait() and stops `svr`. A signal that lands before
// listen() has started is held until the server is running, or until release()
// reports that listen() already returned. The destructor releases and joins,
// so the watcher thread never outlives its scope.
// `signals` must already be blocked in every thread.
class ShutdownWatcher
{
  public:
    ShutdownWatcher(httplib::Server& svr, const sigset_t& signals);
    ~ShutdownWatcher();

    ShutdownWatcher(const ShutdownWatcher&)            = delete;
    ShutdownWatcher& operator=(const ShutdownWatcher&) = delete;
    ShutdownWatcher(ShutdownWatcher&&)                 = delete;
    ShutdownWatcher& operator=(ShutdownWatcher&&)      = delete;

    // Call once listen() has returned; wakes the watcher if no signal came.
    void release();

    // True once a signal from the set has been received.
    bool signalled() const
    {
        return signalled_;
    }

  private:
    void run(httplib::Server& svr);

    sigset_t          signals_;
    int               wake_signal_ = SIGTERM;
    std::atomic<bool> released_{ false };
    std::atomic<bool> signalled_{ false };
    std::thread       thread_;
};
