#include "shutdown_watcher.hpp"

#include <chrono>
#include <iostream>
#include <pthread.h>
#include <stdexcept>

sigset_t block_shutdown_signals()
{
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &set, nullptr) != 0)
        throw std::runtime_error("pthread_sigmask failed");
    return set;
}

ShutdownWatcher::ShutdownWatcher(httplib::Server& svr, const sigset_t& signals) : signals_(signals)
{
    // release() wakes the thread with a signal it is waiting for
    if (sigismember(&signals_, SIGTERM) != 1)
    {
        for (int s = 1; s < NSIG; ++s)
        {
            if (sigismember(&signals_, s) == 1)
            {
                wake_signal_ = s;
                break;
            }
        }
    }
    thread_ = std::thread([this, &svr] { run(svr); });
}

ShutdownWatcher::~ShutdownWatcher()
{
    release();
    if (thread_.joinable())
        thread_.join();
}

void ShutdownWatcher::release()
{
    if (released_.exchange(true))
        return;
    // thread-directed, so no other thread can be hit by it; a surplus one is
    // dropped when the thread exits
    if (!signalled_ && thread_.joinable() && pthread_kill(thread_.native_handle(), wake_signal_) != 0)
        std::cerr << "[userdesk] could not wake shutdown watcher\n";
}

void ShutdownWatcher::run(httplib::Server& svr)
{
    int sig = 0;
    if (sigwait(&signals_, &sig) != 0)
    {
        std::cerr << "[userdesk] sigwait failed; signals will not stop the server\n";
        return;
    }
    if (!released_)
    {
        signalled_ = true;
        std::cout << "[userdesk] signal " << sig << " received, shutting down" << std::endl;
    }

    // stop() is a no-op until listen() has set the server running
    while (!released_ && !svr.is_running())
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    svr.stop();
}
