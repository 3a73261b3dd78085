#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

class CancelToken;

// Owner side of a cancellation signal. Copies share the same signal.
class CancelSource {
public:
    CancelSource();

    void cancel();
    bool isCancelled() const;
    CancelToken token() const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    std::shared_ptr<State> state_;

    friend class CancelToken;
};

// Observer side handed to polling tasks
class CancelToken {
public:
    CancelToken() = default;

    bool isCancelled() const;

    // Blocks until the timeout elapses or the token is cancelled, whichever
    // comes first. Returns true when cancelled.
    bool waitFor(std::chrono::milliseconds timeout) const;

    // Runs fn only if not cancelled, holding off cancel() until fn returns.
    // Returns false when cancelled. fn must not cancel this token.
    bool runUnlessCancelled(const std::function<void()>& fn) const;

private:
    explicit CancelToken(std::shared_ptr<CancelSource::State> state) : state_(std::move(state)) {}

    std::shared_ptr<CancelSource::State> state_;

    friend class CancelSource;
};

// Tracks long-lived task threads so that shutdown can join all of them
class TaskGroup {
public:
    TaskGroup() = default;
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void spawn(const std::string& name, std::function<void()> task);

    // Joins every spawned task. Waits without a deadline.
    void wait();

    size_t activeCount() const;

private:
    struct Entry {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void reapFinished();

    mutable std::mutex mutex_;
    std::list<Entry> tasks_;
};
