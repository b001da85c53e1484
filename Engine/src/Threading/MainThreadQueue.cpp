#include "MainThreadQueue.hpp"
#include "Utils/Log.hpp"


namespace Spraynet::Threading {

void MainThreadQueue::enqueue(std::string name, std::function<void()> work) {
    if (!work) return;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push_back(MainThreadTask{std::move(name), std::move(work)});
    }
    m_pending_count.fetch_add(1, std::memory_order_relaxed);
}

size_t MainThreadQueue::processAll() {
    std::deque<MainThreadTask> tasks_to_process;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        tasks_to_process.swap(m_queue);
    }

    size_t count = tasks_to_process.size();
    m_pending_count.fetch_sub(count, std::memory_order_relaxed);

    for (MainThreadTask& task : tasks_to_process) {
        processTask(task);
    }

    return count;
}

bool MainThreadQueue::hasPending() const {
    return m_pending_count.load(std::memory_order_relaxed) > 0;
}

size_t MainThreadQueue::getPendingCount() const {
    return m_pending_count.load(std::memory_order_relaxed);
}

void MainThreadQueue::processTask(MainThreadTask& task) {
    try {
        task.work();
    } catch (const std::exception& e) {
        LOG_APP_ERROR("MainThreadQueue: Task '{}' threw exception: {}", task.name, e.what());
    }
}

} // namespace Spraynet::Threading
