#pragma once

#include <deque>
#include <mutex>
#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

namespace Spraynet::Threading {

// Work posted from background threads and run by the simulation thread
struct MainThreadTask {
    std::string name;
    std::function<void()> work;
};

class MainThreadQueue {
public:
    MainThreadQueue() = default;
    ~MainThreadQueue() = default;

    MainThreadQueue(const MainThreadQueue&) = delete;
    MainThreadQueue& operator=(const MainThreadQueue&) = delete;

    // Thread-safe
    void enqueue(std::string name, std::function<void()> work);

    // Simulation thread only
    size_t processAll();

    bool hasPending() const;
    size_t getPendingCount() const;

private:
    void processTask(MainThreadTask& task);

    std::deque<MainThreadTask> m_queue;
    mutable std::mutex m_mutex;
    std::atomic<size_t> m_pending_count{0};
};

} // namespace Spraynet::Threading
