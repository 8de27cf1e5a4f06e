/**
 * @file tasks.cpp
 * @brief Cancellable background tasks for geminiweb
 */

#include "geminiweb/tasks.hpp"
#include "geminiweb/logging.hpp"

namespace geminiweb {

BackgroundTask::BackgroundTask(const std::string& name, std::chrono::milliseconds interval, Step step)
    : name_(name),
      interval_(interval),
      step_(std::move(step)),
      cancelled_(false),
      finished_(false) {
    thread_ = std::thread([this]() { run(); });
}

BackgroundTask::~BackgroundTask() {
    cancel();
}

std::unique_ptr<BackgroundTask> BackgroundTask::periodic(
    const std::string& name,
    std::chrono::milliseconds interval,
    Step step
) {
    return std::make_unique<BackgroundTask>(name, interval, std::move(step));
}

std::unique_ptr<BackgroundTask> BackgroundTask::delayed(
    const std::string& name,
    std::chrono::milliseconds delay,
    std::function<void()> action
) {
    return std::make_unique<BackgroundTask>(name, delay, [action = std::move(action)]() {
        action();
        return false;
    });
}

void BackgroundTask::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, interval_, [this] { return cancelled_; });
            if (cancelled_) {
                break;
            }
        }

        if (!step_()) {
            break;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;
}

void BackgroundTask::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();

    if (!thread_.joinable()) {
        return;
    }

    // A step that ends up cancelling its own task cannot join itself
    if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
        return;
    }

    thread_.join();
    log::debug("Background task '" + name_ + "' stopped");
}

bool BackgroundTask::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool BackgroundTask::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

TaskRegistry::~TaskRegistry() {
    cancel_all();
}

void TaskRegistry::start_or_replace(const std::string& identity, std::unique_ptr<BackgroundTask> task) {
    std::unique_ptr<BackgroundTask> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(identity);
        if (it != tasks_.end()) {
            previous = std::move(it->second);
        }
        tasks_[identity] = std::move(task);
    }

    if (previous) {
        previous->cancel();
    }
}

void TaskRegistry::cancel(const std::string& identity) {
    std::unique_ptr<BackgroundTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(identity);
        if (it == tasks_.end()) {
            return;
        }
        task = std::move(it->second);
        tasks_.erase(it);
    }
    task->cancel();
}

void TaskRegistry::cancel_all() {
    std::map<std::string, std::unique_ptr<BackgroundTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(tasks_);
    }
    for (auto& [identity, task] : tasks) {
        task->cancel();
    }
}

bool TaskRegistry::active(const std::string& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(identity);
    return it != tasks_.end() && !it->second->finished() && !it->second->cancelled();
}

size_t TaskRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace geminiweb
