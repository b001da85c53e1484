#include <catch2/catch_test_macros.hpp>

#include "Threading/MainThreadQueue.hpp"
#include "Threading/UploadWorker.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace Spraynet::Threading {

TEST_CASE("One upload per key at a time", "[worker]")
{
    MainThreadQueue completions;
    UploadWorker worker(&completions);

    std::atomic<bool> release{false};
    REQUIRE(worker.submit(1, "first", [&](const CancelToken&) {
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return UploadStatus::Completed;
    }));

    REQUIRE(worker.isBusy(1));
    REQUIRE(worker.getPendingCount() == 1);
    REQUIRE_FALSE(worker.submit(1, "second", [](const CancelToken&) { return UploadStatus::Completed; }));
    REQUIRE(worker.submit(2, "other key", [](const CancelToken&) { return UploadStatus::Completed; }));

    release = true;
    worker.waitForIdle();
    REQUIRE_FALSE(worker.isBusy(1));
    REQUIRE(worker.submit(1, "third", [](const CancelToken&) { return UploadStatus::Completed; }));
    worker.waitForIdle();
}

TEST_CASE("Completions run on the main thread queue", "[worker]")
{
    MainThreadQueue completions;
    UploadWorker worker(&completions);

    const std::thread::id main_thread = std::this_thread::get_id();
    std::thread::id callback_thread;
    UploadStatus seen = UploadStatus::Failed;

    REQUIRE(worker.submit(7, "upload", [](const CancelToken&) { return UploadStatus::Completed; },
        [&](uint64_t key, UploadStatus status) {
            REQUIRE(key == 7);
            seen = status;
            callback_thread = std::this_thread::get_id();
        }));

    worker.waitForIdle();
    REQUIRE(completions.getPendingCount() == 1);
    REQUIRE(completions.processAll() == 1);

    REQUIRE(seen == UploadStatus::Completed);
    REQUIRE(callback_thread == main_thread);
}

TEST_CASE("Failed uploads are reported, not thrown", "[worker]")
{
    MainThreadQueue completions;
    UploadWorker worker(&completions);

    std::atomic<int> status{-1};
    REQUIRE(worker.submit(3, "throws", [](const CancelToken&) -> UploadStatus { throw std::runtime_error("socket gone"); },
        [&](uint64_t, UploadStatus s) { status = static_cast<int>(s); }));

    worker.waitForIdle();
    completions.processAll();
    REQUIRE(status == static_cast<int>(UploadStatus::Failed));
}

TEST_CASE("Work can report a failure without throwing", "[worker]")
{
    MainThreadQueue completions;
    UploadWorker worker(&completions);

    UploadStatus seen = UploadStatus::Completed;
    REQUIRE(worker.submit(4, "refused", [](const CancelToken&) { return UploadStatus::Failed; },
        [&](uint64_t, UploadStatus s) { seen = s; }));

    worker.waitForIdle();
    REQUIRE(completions.processAll() == 1);
    REQUIRE(seen == UploadStatus::Failed);
}

TEST_CASE("Shutdown cancels queued uploads and refuses new ones", "[worker]")
{
    UploadWorker worker;
    std::atomic<bool> release{false};
    std::atomic<int> cancelled{0};

    worker.submit(1, "blocking", [&](const CancelToken& token) {
        while (!release && !token.isCancelled()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return token.isCancelled() ? UploadStatus::Cancelled : UploadStatus::Completed;
    }, [&](uint64_t, UploadStatus s) {
        if (s == UploadStatus::Cancelled) {
            ++cancelled;
        }
    });
    worker.submit(2, "queued", [](const CancelToken&) { return UploadStatus::Completed; }, [&](uint64_t, UploadStatus s) {
        if (s == UploadStatus::Cancelled) {
            ++cancelled;
        }
    });

    worker.shutdown();
    REQUIRE(cancelled == 2);
    REQUIRE_FALSE(worker.submit(3, "late", [](const CancelToken&) { return UploadStatus::Completed; }));
}

} // namespace Spraynet::Threading
