#include "UploadWorker.hpp"
#include "MainThreadQueue.hpp"
#include "Utils/Log.hpp"

namespace Spraynet::Threading {

UploadWorker::UploadWorker(MainThreadQueue* completion_queue)
    : m_completion_queue(completion_queue) {
    m_worker = std::thread(&UploadWorker::workerThread, this);
}

UploadWorker::~UploadWorker() {
    shutdown();
}

bool UploadWorker::submit(uint64_t key, std::string name, UploadWork work, UploadCallback on_complete) {
    if (!work || m_shutdown) return false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return false;
        }
        if (!m_busy_keys.insert(key).second) {
            LOG_APP_DEBUG("UploadWorker: '{}' rejected, upload for {} already in flight", name, key);
            return false;
        }
        m_queue.push_back(UploadJob{key, std::move(name), std::move(work), std::move(on_complete)});
    }
    m_condition.notify_one();
    return true;
}

bool UploadWorker::isBusy(uint64_t key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_busy_keys.count(key) != 0;
}

size_t UploadWorker::getPendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_busy_keys.size();
}

void UploadWorker::waitForIdle() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idle_condition.wait(lock, [this]() {
        return (m_busy_keys.empty() && m_posting == 0) || m_shutdown;
    });
}

void UploadWorker::shutdown() {
    if (m_shutdown.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    LOG_APP_INFO("UploadWorker: Shutting down...");

    std::deque<UploadJob> dropped;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        dropped.swap(m_queue);
    }
    m_condition.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }

    for (UploadJob& job : dropped) {
        finish(job, UploadStatus::Cancelled);
    }
    m_idle_condition.notify_all();

    LOG_APP_INFO("UploadWorker: Shutdown complete");
}

void UploadWorker::workerThread() {
    LOG_APP_TRACE("UploadWorker: Worker started");

    while (true) {
        UploadJob job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_condition.wait(lock, [this]() {
                return m_shutdown || !m_queue.empty();
            });

            if (m_shutdown) {
                break;
            }

            job = std::move(m_queue.front());
            m_queue.pop_front();
        }

        UploadStatus status = UploadStatus::Failed;
        try {
            CancelToken token(m_shutdown);
            status = job.work(token);
        } catch (const std::exception& e) {
            LOG_APP_ERROR("UploadWorker: Upload '{}' threw exception: {}", job.name, e.what());
            status = UploadStatus::Failed;
        }

        finish(job, status);
    }

    LOG_APP_TRACE("UploadWorker: Worker exiting");
}

void UploadWorker::finish(UploadJob& job, UploadStatus status) {
    // The key is free before the completion runs, so the completion may resubmit
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_busy_keys.erase(job.key);
        ++m_posting;
    }

    if (job.on_complete) {
        if (m_completion_queue != nullptr) {
            uint64_t key = job.key;
            m_completion_queue->enqueue(job.name, [callback = std::move(job.on_complete), key, status]() {
                callback(key, status);
            });
        } else {
            try {
                job.on_complete(job.key, status);
            } catch (const std::exception& e) {
                LOG_APP_ERROR("UploadWorker: Completion of '{}' threw exception: {}", job.name, e.what());
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_posting;
    }
    m_idle_condition.notify_all();
}

} // namespace Spraynet::Threading
