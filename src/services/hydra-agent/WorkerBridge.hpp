#pragma once

#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

// Runs a blocking call on a dedicated thread and hands its result back to
// the caller once the thread has been joined. Calls through one bridge
// never overlap: a second caller waits until the first has finished.
class WorkerBridge {
public:
    WorkerBridge() = default;
    WorkerBridge(const WorkerBridge&) = delete;
    WorkerBridge& operator=(const WorkerBridge&) = delete;

    template <typename Task>
    auto Run(Task task) -> decltype(task()) {
        using Result = decltype(task());

        std::lock_guard<std::mutex> batchLock(batchMutex_);

        std::mutex slotMutex;
        std::optional<Result> slot;
        std::exception_ptr failure;

        std::thread worker([&]() {
            try {
                Result value = task();
                std::lock_guard<std::mutex> lock(slotMutex);
                slot.emplace(std::move(value));
            } catch (...) {
                std::lock_guard<std::mutex> lock(slotMutex);
                failure = std::current_exception();
            }
        });
        worker.join();

        std::lock_guard<std::mutex> lock(slotMutex);
        if (failure) {
            std::rethrow_exception(failure);
        }
        return std::move(*slot);
    }

private:
    std::mutex batchMutex_;
};
