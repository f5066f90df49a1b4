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

// Shared cancellation flag observed by every task at its suspension points.
class StopSignal {
public:
    void requestStop();
    bool stopRequested() const;

    // Sleeps up to timeout, waking early on stop. Returns true if stop was requested.
    bool waitFor(std::chrono::milliseconds timeout);

    // Throws Cancelled once stop was requested
    void throwIfStopped() const;

private:
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool stopped = false;
};

// Owns a set of task threads. Every spawned task is joined before the group
// goes away; tasks end on their own once the stop signal fires.
class TaskGroup {
public:
    explicit TaskGroup(StopSignal& stop);
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    // Returns false when the group is already stopping
    bool spawn(const std::string& name, std::function<void()> task);

    void stopAndJoin();
    size_t running();

private:
    struct Task {
        std::string name;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reapFinished();

    StopSignal& stop;
    std::mutex tasks_mutex;
    std::list<Task> tasks;
};
