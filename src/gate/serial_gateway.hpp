#pragma once

#include "errors.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>

// Single-worker task queue. Tasks run one at a time, strictly in submission
// order, on a thread owned by the gateway. After shutdown() new submissions
// are rejected; tasks already queued still run before the worker exits.
class SerialGateway {
public:
    using Job = std::move_only_function<void()>;

    SerialGateway();
    ~SerialGateway();

    SerialGateway(const SerialGateway&) = delete;
    SerialGateway& operator=(const SerialGateway&) = delete;

    // Blocks until the task has run. Exceptions thrown by the task are
    // rethrown here.
    template <typename F>
    auto submit(F&& task) -> GateResult<std::invoke_result_t<std::decay_t<F>&>> {
        using R = std::invoke_result_t<std::decay_t<F>&>;

        if (on_worker_thread()) {
            return std::unexpected(GateError{
                .kind = ErrorKind::EngineInvocation,
                .message = "reentrant submission from the gateway worker",
            });
        }

        std::packaged_task<R()> packaged(std::forward<F>(task));
        auto future = packaged.get_future();
        if (!post([packaged = std::move(packaged)]() mutable { packaged(); })) {
            return std::unexpected(GateError{
                .kind = ErrorKind::SessionClosed,
                .message = "gateway is shut down",
            });
        }

        if constexpr (std::is_void_v<R>) {
            future.get();
            return {};
        } else {
            return future.get();
        }
    }

    // Enqueues without waiting. Returns false after shutdown.
    bool post(Job job);

    // Stops accepting work. Does not wait.
    void shutdown();

    // Waits for the worker to drain the queue and exit. No-op on the worker
    // itself or once joined.
    void join();

    bool is_shut_down() const;
    size_t pending() const;
    bool on_worker_thread() const;

private:
    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> queue_;
    bool closed_ = false;

    std::mutex join_mutex_;
    // Cleared once joined; thread ids are reused.
    std::atomic<std::thread::id> worker_id_;
    std::jthread worker_;
};
