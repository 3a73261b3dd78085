#include "task_group.h"
#include "logging.h"
#include <vector>

CancelSource::CancelSource() : state_(std::make_shared<State>()) {
}

void CancelSource::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancelSource::isCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancelToken CancelSource::token() const {
    return CancelToken(state_);
}

bool CancelToken::isCancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancelToken::waitFor(std::chrono::milliseconds timeout) const {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this]() { return state_->cancelled; });
}

bool CancelToken::runUnlessCancelled(const std::function<void()>& fn) const {
    if (!state_) {
        fn();
        return true;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        return false;
    }
    fn();
    return true;
}

TaskGroup::~TaskGroup() {
    wait();
}

void TaskGroup::spawn(const std::string& name, std::function<void()> task) {
    reapFinished();

    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([name, task = std::move(task), finished]() {
        try {
            task();
        } catch (const std::exception& e) {
            logError("TaskGroup", "Task " + name + " exited with error: " + e.what());
        }
        *finished = true;
    });

    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(Entry{std::move(thread), finished});
}

void TaskGroup::wait() {
    std::list<Entry> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(tasks_);
    }

    for (auto& entry : pending) {
        if (entry.thread.joinable()) {
            entry.thread.join();
        }
    }
}

size_t TaskGroup::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t active = 0;
    for (const auto& entry : tasks_) {
        if (!*entry.finished) {
            ++active;
        }
    }
    return active;
}

void TaskGroup::reapFinished() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if (*it->finished) {
                done.push_back(std::move(it->thread));
                it = tasks_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& thread : done) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}
