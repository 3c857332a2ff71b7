#include <mcp_adapter/runtime/event_loop_bridge.hpp>

#include <mcp_adapter/core/log.hpp>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <unistd.h>

namespace mcp_adapter {

using Clock = std::chrono::steady_clock;

struct EventLoopBridge::State {
    // -- Shared with caller threads (guarded by mutex) --
    std::mutex mutex;
    std::deque<Task> tasks;
    bool started = false;
    bool running = false;
    std::vector<std::shared_ptr<void>> keep_alive;
    std::atomic<std::thread::id> loop_thread{std::thread::id()};
    int wake_read = -1;
    int wake_write = -1;

    // -- Loop thread only --
    struct Timer {
        Clock::time_point deadline;
        Task task;
    };
    struct Watch {
        short events = 0;
        FdCallback callback;
        uint64_t generation = 0;
    };
    bool exit_requested = false;
    TimerId next_timer_id = 1;
    std::map<TimerId, Timer> timers;
    std::set<std::pair<Clock::time_point, TimerId>> timer_order;
    std::map<int, Watch> watches;
    uint64_t next_generation = 1;

    ~State() {
        if (wake_read >= 0) ::close(wake_read);
        if (wake_write >= 0) ::close(wake_write);
    }

    void Wake() const {
        if (wake_write < 0) return;
        const char byte = 1;
        // A full pipe already guarantees a wakeup.
        ssize_t n = ::write(wake_write, &byte, 1);
        (void)n;
    }
};

namespace {

bool MakeWakePipe(int& read_end, int& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0) {
        return false;
    }
    read_end = fds[0];
    write_end = fds[1];
    return true;
}

void DrainWakePipe(int fd) {
    char buf[256];
    while (::read(fd, buf, sizeof(buf)) > 0) {
    }
}

void RunGuarded(const EventLoopBridge::Task& task, const char* what) {
    try {
        task();
    } catch (const std::exception& e) {
        LogError("bridge", std::string("Unhandled exception in ") + what + ": " + e.what());
    }
}

} // anonymous namespace

EventLoopBridge::EventLoopBridge() : state_(std::make_shared<State>()) {}

EventLoopBridge::~EventLoopBridge() {
    Stop(std::chrono::milliseconds(2000));
}

Result<void, Error> EventLoopBridge::Start() {
    std::promise<void> ready;
    auto ready_future = ready.get_future();
    std::promise<void> exited;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->started) {
            return Result<void, Error>::Err(Error::Make(
                ErrorCategory::Internal, "EventLoopBridge::Start", "",
                "event loop was already started"));
        }
        if (!MakeWakePipe(state_->wake_read, state_->wake_write)) {
            return Result<void, Error>::Err(Error::Make(
                ErrorCategory::Internal, "EventLoopBridge::Start", "",
                std::string("pipe2 failed: ") + std::strerror(errno)));
        }
        state_->started = true;
        state_->running = true;
    }

    exited_ = exited.get_future().share();
    thread_ = std::thread([state = state_, ready = std::move(ready),
                           exited = std::move(exited)]() mutable {
        state->loop_thread.store(std::this_thread::get_id());
        ready.set_value();
        Run(state);
        exited.set_value();
    });
    ready_future.wait();
    LogDebug("bridge", "Event loop started");
    return Result<void, Error>::Ok();
}

bool EventLoopBridge::Stop(std::chrono::milliseconds bound) {
    bool posted = Post([state = state_.get()]() { state->exit_requested = true; });
    if (!thread_.joinable()) {
        return true;
    }
    if (!posted) {
        // Loop already exited on its own; just reap the thread.
        thread_.join();
        return true;
    }
    if (exited_.wait_for(bound) == std::future_status::ready) {
        thread_.join();
        LogDebug("bridge", "Event loop stopped");
        return true;
    }
    LogWarn("bridge", "Event loop did not stop within " +
                      std::to_string(bound.count()) + " ms; detaching its thread");
    thread_.detach();
    return false;
}

bool EventLoopBridge::IsRunning() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->running;
}

bool EventLoopBridge::IsLoopThread() const {
    return state_->loop_thread.load() == std::this_thread::get_id();
}

bool EventLoopBridge::Post(Task task) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->running) {
            return false;
        }
        state_->tasks.push_back(std::move(task));
    }
    state_->Wake();
    return true;
}

TimerId EventLoopBridge::ScheduleAfter(std::chrono::milliseconds delay, Task task) {
    auto& s = *state_;
    TimerId id = s.next_timer_id++;
    auto deadline = Clock::now() + delay;
    s.timers.emplace(id, State::Timer{deadline, std::move(task)});
    s.timer_order.emplace(deadline, id);
    return id;
}

void EventLoopBridge::CancelTimer(TimerId id) {
    auto& s = *state_;
    auto it = s.timers.find(id);
    if (it == s.timers.end()) {
        return;
    }
    s.timer_order.erase({it->second.deadline, id});
    s.timers.erase(it);
}

void EventLoopBridge::WatchFd(int fd, short events, FdCallback callback) {
    auto& s = *state_;
    s.watches[fd] = State::Watch{events, std::move(callback), s.next_generation++};
}

void EventLoopBridge::UnwatchFd(int fd) {
    state_->watches.erase(fd);
}

void EventLoopBridge::KeepAlive(std::shared_ptr<void> object) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->keep_alive.push_back(std::move(object));
}

// ---------------------------------------------------------------------------
// Loop body
// ---------------------------------------------------------------------------
void EventLoopBridge::Run(std::shared_ptr<State> state) {
    // Writes to a pipe whose reader died must fail with EPIPE instead of
    // killing the process.
    sigset_t block;
    sigemptyset(&block);
    sigaddset(&block, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &block, nullptr);

    auto& s = *state;
    std::vector<pollfd> fds;
    std::vector<uint64_t> generations;

    while (!s.exit_requested) {
        bool have_tasks = false;
        {
            std::lock_guard<std::mutex> lock(s.mutex);
            have_tasks = !s.tasks.empty();
        }

        int timeout_ms = -1;
        if (have_tasks) {
            timeout_ms = 0;
        } else if (!s.timer_order.empty()) {
            auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
                s.timer_order.begin()->first - Clock::now());
            // Round up so a timer is never polled for just before its deadline.
            auto ms = std::min<long long>(std::max<long long>(wait.count(), 0), 60000);
            timeout_ms = static_cast<int>(ms) + 1;
        }

        fds.clear();
        generations.clear();
        fds.push_back({s.wake_read, POLLIN, 0});
        generations.push_back(0);
        for (const auto& [fd, watch] : s.watches) {
            fds.push_back({fd, watch.events, 0});
            generations.push_back(watch.generation);
        }

        int n = ::poll(fds.data(), fds.size(), timeout_ms);
        if (n < 0 && errno != EINTR) {
            LogError("bridge", std::string("poll failed: ") + std::strerror(errno));
            break;
        }

        if (n > 0) {
            if (fds[0].revents != 0) {
                DrainWakePipe(s.wake_read);
            }
            for (size_t i = 1; i < fds.size(); ++i) {
                if (fds[i].revents == 0) continue;
                // An earlier callback may have removed or replaced this watch.
                auto it = s.watches.find(fds[i].fd);
                if (it == s.watches.end() || it->second.generation != generations[i]) {
                    continue;
                }
                auto callback = it->second.callback;
                short revents = fds[i].revents;
                try {
                    callback(revents);
                } catch (const std::exception& e) {
                    LogError("bridge", std::string("Unhandled exception in fd callback: ") +
                                       e.what());
                }
            }
        }

        // Due timers.
        auto now = Clock::now();
        while (!s.timer_order.empty() && s.timer_order.begin()->first <= now) {
            auto id = s.timer_order.begin()->second;
            s.timer_order.erase(s.timer_order.begin());
            auto it = s.timers.find(id);
            if (it == s.timers.end()) continue;
            auto task = std::move(it->second.task);
            s.timers.erase(it);
            RunGuarded(task, "timer");
        }

        // Posted tasks, in FIFO order. Stop at the exit request so tasks
        // posted after Stop() are dropped.
        std::deque<Task> batch;
        {
            std::lock_guard<std::mutex> lock(s.mutex);
            batch.swap(s.tasks);
        }
        while (!batch.empty() && !s.exit_requested) {
            auto task = std::move(batch.front());
            batch.pop_front();
            RunGuarded(task, "task");
        }
    }

    // Discard whatever is left on the loop thread; dropping a RunSync
    // completion releases its waiting caller.
    std::deque<Task> leftover;
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        s.running = false;
        leftover.swap(s.tasks);
    }
    leftover.clear();
    s.timers.clear();
    s.timer_order.clear();
    s.watches.clear();
    s.loop_thread.store(std::thread::id());
}

} // namespace mcp_adapter
