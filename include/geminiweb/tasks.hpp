/**
 * @file tasks.hpp
 * @brief Cancellable background tasks for geminiweb
 */

#ifndef GEMINIWEB_TASKS_HPP
#define GEMINIWEB_TASKS_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace geminiweb {

/**
 * Work running on its own thread, woken after a delay.
 * The step returns true to be scheduled again after `interval`,
 * false to finish.
 */
class BackgroundTask {
public:
    using Step = std::function<bool()>;

    BackgroundTask(const std::string& name, std::chrono::milliseconds interval, Step step);
    ~BackgroundTask();

    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    /**
     * Run `step` every `interval` until it returns false or the task is cancelled
     */
    static std::unique_ptr<BackgroundTask> periodic(
        const std::string& name,
        std::chrono::milliseconds interval,
        Step step
    );

    /**
     * Run `action` once after `delay` unless cancelled first
     */
    static std::unique_ptr<BackgroundTask> delayed(
        const std::string& name,
        std::chrono::milliseconds delay,
        std::function<void()> action
    );

    /**
     * Wake the task and wait for its thread to exit
     */
    void cancel();

    bool cancelled() const;
    bool finished() const;
    const std::string& name() const { return name_; }

private:
    void run();

    std::string name_;
    std::chrono::milliseconds interval_;
    Step step_;
    bool cancelled_;
    bool finished_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
};

/**
 * At most one task per identity; starting a new one cancels the old one
 */
class TaskRegistry {
public:
    TaskRegistry() = default;
    ~TaskRegistry();

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    void start_or_replace(const std::string& identity, std::unique_ptr<BackgroundTask> task);
    void cancel(const std::string& identity);
    void cancel_all();

    /**
     * True when a task for `identity` exists and has not finished
     */
    bool active(const std::string& identity) const;
    size_t size() const;

private:
    std::map<std::string, std::unique_ptr<BackgroundTask>> tasks_;
    mutable std::mutex mutex_;
};

} // namespace geminiweb

#endif // GEMINIWEB_TASKS_HPP
