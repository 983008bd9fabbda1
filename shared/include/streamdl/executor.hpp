#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace streamdl {

// execution context used to deliver transfer outcomes
class Executor {
public:
    virtual ~Executor() = default;

    virtual void execute(std::function<void()> task) = 0;
};

// runs each task right away on the submitting thread
class InlineExecutor : public Executor {
public:
    void execute(std::function<void()> task) override;
};

// FIFO of tasks drained by whoever owns it; an exception thrown by a task
// propagates out of the run call that executed it
class QueueExecutor : public Executor {
public:
    void execute(std::function<void()> task) override;

    // runs the oldest pending task, returns false if there was none
    bool runOne();
    // runs pending tasks until the queue is empty, returns how many ran
    std::size_t runAll();
    // waits up to timeout for a task and runs it
    bool runFor(const std::chrono::milliseconds &timeout);

    std::size_t pending() const;

private:
    mutable std::mutex mutex;
    std::condition_variable available;
    std::deque<std::function<void()>> tasks;

    bool popLocked(std::function<void()> &task);
};

}
