#include "streamdl/executor.hpp"

#include <utility>

namespace streamdl {

void InlineExecutor::execute(std::function<void()> task) {
    task();
}

void QueueExecutor::execute(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->tasks.push_back(std::move(task));
    }
    this->available.notify_one();
}

bool QueueExecutor::popLocked(std::function<void()> &task) {
    if (this->tasks.empty()) {
        return false;
    }
    task = std::move(this->tasks.front());
    this->tasks.pop_front();
    return true;
}

bool QueueExecutor::runOne() {
    std::function<void()> task;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (!this->popLocked(task)) {
            return false;
        }
    }
    // run outside the lock, the task may submit more work
    task();
    return true;
}

std::size_t QueueExecutor::runAll() {
    std::size_t count = 0;
    while (this->runOne()) {
        count++;
    }
    return count;
}

bool QueueExecutor::runFor(const std::chrono::milliseconds &timeout) {
    std::function<void()> task;
    {
        std::unique_lock<std::mutex> lock(this->mutex);
        if (!this->available.wait_for(lock, timeout, [this] { return !this->tasks.empty(); })) {
            return false;
        }
        this->popLocked(task);
    }
    task();
    return true;
}

std::size_t QueueExecutor::pending() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->tasks.size();
}

}
