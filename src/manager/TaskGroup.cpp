#include "TaskGroup.hpp"
#include "../utils/Errors.hpp"
#include "../utils/Log.hpp"

void StopSignal::requestStop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopped = true;
    }
    cv.notify_all();
}

bool StopSignal::stopRequested() const {
    std::lock_guard<std::mutex> lock(mutex);
    return stopped;
}

bool StopSignal::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, timeout, [this]() { return stopped; });
}

void StopSignal::throwIfStopped() const {
    if (stopRequested()) {
        throw Cancelled();
    }
}

TaskGroup::TaskGroup(StopSignal& stop) : stop(stop) {
}

TaskGroup::~TaskGroup() {
    stopAndJoin();
}

bool TaskGroup::spawn(const std::string& name, std::function<void()> task) {
    std::lock_guard<std::mutex> lock(tasks_mutex);
    if (stop.stopRequested()) {
        return false;
    }
    reapFinished();

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([name, task = std::move(task), done]() {
        try {
            task();
        } catch (const Cancelled&) {
            Log::debug(name, " cancelled");
        } catch (const std::exception& e) {
            Log::error(name, " stopped: ", e.what());
        } catch (...) {
            Log::error(name, " stopped by a non-standard exception");
        }
        done->store(true);
    });
    tasks.push_back(Task{name, std::move(thread), std::move(done)});
    return true;
}

void TaskGroup::stopAndJoin() {
    stop.requestStop();

    std::list<Task> to_join;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex);
        to_join.swap(tasks);
    }
    for (auto& task : to_join) {
        if (task.thread.joinable()) {
            task.thread.join();
        }
        Log::debug("Task ", task.name, " joined");
    }
}

size_t TaskGroup::running() {
    std::lock_guard<std::mutex> lock(tasks_mutex);
    reapFinished();
    return tasks.size();
}

void TaskGroup::reapFinished() {
    for (auto it = tasks.begin(); it != tasks.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = tasks.erase(it);
        } else {
            ++it;
        }
    }
}
