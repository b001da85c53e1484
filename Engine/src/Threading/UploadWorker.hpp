#pragma once

#include <thread>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <string>
#include <unordered_set>
#include <cstdint>

namespace Spraynet::Threading {

class MainThreadQueue;

enum class UploadStatus : uint8_t {
    Completed,
    Cancelled,
    Failed
};

// Polled by upload work between packets; set when the worker is shutting down
class CancelToken {
public:
    explicit CancelToken(const std::atomic<bool>& flag) : m_flag(flag) {}
    bool isCancelled() const { return m_flag.load(std::memory_order_acquire); }

private:
    const std::atomic<bool>& m_flag;
};

// Returns Cancelled when it stopped early because the token was cancelled,
// Failed when the data could not be sent
using UploadWork = std::function<UploadStatus(const CancelToken&)>;
using UploadCallback = std::function<void(uint64_t key, UploadStatus status)>;

// Single background thread that runs slow uploads off the simulation thread.
// At most one upload per key is queued or running at any time.
class UploadWorker {
public:
    explicit UploadWorker(MainThreadQueue* completion_queue = nullptr);
    ~UploadWorker();

    UploadWorker(const UploadWorker&) = delete;
    UploadWorker& operator=(const UploadWorker&) = delete;

    // Returns false if an upload for this key is already in flight or the worker is stopped.
    // on_complete runs on the completion queue when one was given, otherwise on the worker thread.
    bool submit(uint64_t key, std::string name, UploadWork work, UploadCallback on_complete = {});

    bool isBusy(uint64_t key) const;
    size_t getPendingCount() const;

    // Returns once nothing is queued or running and every completion has been posted
    void waitForIdle();

    // Drops queued uploads, cancels the running one and joins the thread
    void shutdown();

private:
    struct UploadJob {
        uint64_t key = 0;
        std::string name;
        UploadWork work;
        UploadCallback on_complete;
    };

    void workerThread();
    void finish(UploadJob& job, UploadStatus status);

    MainThreadQueue* m_completion_queue = nullptr;

    std::thread m_worker;
    std::deque<UploadJob> m_queue;
    std::unordered_set<uint64_t> m_busy_keys;
    size_t m_posting = 0;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::condition_variable m_idle_condition;

    std::atomic<bool> m_shutdown{false};
};

} // namespace Spraynet::Threading
