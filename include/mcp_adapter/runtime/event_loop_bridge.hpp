#pragma once

#include <mcp_adapter/core/result.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace mcp_adapter {

using TimerId = uint64_t;

// ---------------------------------------------------------------------------
// EventLoopBridge: one background thread running a poll(2) loop shared by
// every server. All subprocess I/O, timers and protocol state machines run
// on it. Caller threads interact only through Post() and RunSync().
//
// Thread affinity:
//   Start, Stop, Post, RunSync, KeepAlive, IsRunning  any thread
//   ScheduleAfter, CancelTimer, WatchFd, UnwatchFd   loop thread only
// ---------------------------------------------------------------------------
class EventLoopBridge {
public:
    using Task = std::function<void()>;
    using FdCallback = std::function<void(short revents)>;

    // Completion handed to an asynchronous operation run by RunSync.
    template <typename T>
    using Completion = std::function<void(Result<T, Error>)>;
    template <typename T>
    using AsyncOp = std::function<void(Completion<T>)>;

    EventLoopBridge();
    ~EventLoopBridge();

    EventLoopBridge(const EventLoopBridge&) = delete;
    EventLoopBridge& operator=(const EventLoopBridge&) = delete;

    // Start the loop thread. Fails if already started once.
    [[nodiscard]] Result<void, Error> Start();

    // Ask the loop to exit after the tasks already posted, then wait up to
    // `bound` for the thread. Returns false if the thread had to be
    // detached. Idempotent.
    bool Stop(std::chrono::milliseconds bound);

    [[nodiscard]] bool IsRunning() const;
    [[nodiscard]] bool IsLoopThread() const;

    // Queue a task for the loop. Returns false (and drops the task) when the
    // loop is not running.
    bool Post(Task task);

    TimerId ScheduleAfter(std::chrono::milliseconds delay, Task task);
    void CancelTimer(TimerId id);

    void WatchFd(int fd, short events, FdCallback callback);
    void UnwatchFd(int fd);

    // Keep `object` alive until the loop state is destroyed. Used when the
    // loop thread could not be joined and still references it.
    void KeepAlive(std::shared_ptr<void> object);

    // Run `op` on the loop and block until it completes or `timeout` passes.
    // Timeout yields a CallTimeout error; a task dropped by shutdown yields
    // ServerNotReady; calling from the loop thread yields Internal.
    template <typename T>
    Result<T, Error> RunSync(AsyncOp<T> op, std::chrono::milliseconds timeout,
                             const std::string& operation = "RunSync");

private:
    struct State;

    static void Run(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
    std::thread thread_;
    std::shared_future<void> exited_;
};

template <typename T>
Result<T, Error> EventLoopBridge::RunSync(AsyncOp<T> op,
                                          std::chrono::milliseconds timeout,
                                          const std::string& operation) {
    using R = Result<T, Error>;
    if (IsLoopThread()) {
        return R::Err(Error::Make(ErrorCategory::Internal, operation, "",
                                  "RunSync called from the event loop thread"));
    }

    auto promise = std::make_shared<std::promise<R>>();
    auto future = promise->get_future();
    auto fulfilled = std::make_shared<std::atomic<bool>>(false);
    Completion<T> complete = [promise, fulfilled](R result) {
        if (!fulfilled->exchange(true)) {
            promise->set_value(std::move(result));
        }
    };
    // Only the completion owns the promise from here on, so a task discarded
    // by shutdown breaks the promise instead of leaving us waiting.
    promise.reset();

    bool posted = Post([op = std::move(op), complete = std::move(complete)]() mutable {
        op(std::move(complete));
    });
    if (!posted) {
        return R::Err(Error::Make(ErrorCategory::ServerNotReady, operation, "",
                                  "event loop is not running"));
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        return R::Err(Error::Make(ErrorCategory::CallTimeout, operation, "",
                                  "no result within " +
                                  std::to_string(timeout.count()) + " ms"));
    }
    try {
        return future.get();
    } catch (const std::future_error&) {
        return R::Err(Error::Make(ErrorCategory::ServerNotReady, operation, "",
                                  "operation dropped during shutdown"));
    }
}

} // namespace mcp_adapter
