/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background analysis tasks.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <future>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <algorithm>
#include <thread>
#include <type_traits>
#include <utility>

namespace worldpulse::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Clustering,
    Correlation,
    Refresh
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;
};

/**
 * @struct TaskHandle
 * @brief Status of a submitted task plus the future carrying its result.
 */
template<typename R>
struct TaskHandle {
    std::shared_ptr<TaskStatus> status;
    std::future<R> result;
};

/**
 * @class AsyncTaskManager
 * @brief Runs work off the orchestration thread and tracks what is still in flight.
 *
 * A task keeps running after its caller stops waiting on the future; it stays
 * listed as active until it really finishes. The destructor waits for every
 * task so no worker outlives the manager.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    ~AsyncTaskManager() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_idle.wait(lock, [this] { return m_activeTasks.empty(); });
    }

    /**
     * @brief Submits a new task to be executed in the background.
     * @param f Callable receiving the task status as its first argument.
     * @return Handle whose future yields f's result or rethrows its exception.
     */
    template<typename F, typename... Args>
    auto SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args)
        -> TaskHandle<std::invoke_result_t<std::decay_t<F>, std::shared_ptr<TaskStatus>, std::decay_t<Args>...>> {
        using Result = std::invoke_result_t<std::decay_t<F>, std::shared_ptr<TaskStatus>, std::decay_t<Args>...>;

        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        auto promise = std::make_shared<std::promise<Result>>();
        TaskHandle<Result> handle{status, promise->get_future()};

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
        }

        std::thread([this, status, promise](auto userFunc, auto... userArgs) {
            try {
                if constexpr (std::is_void_v<Result>) {
                    userFunc(status, std::move(userArgs)...);
                    promise->set_value();
                } else {
                    promise->set_value(userFunc(status, std::move(userArgs)...));
                }
                status->progress = 1.0f;
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
                promise->set_exception(std::current_exception());
            } catch (...) {
                status->failed = true;
                status->errorMessage = "Unknown error during task execution.";
                promise->set_exception(std::current_exception());
            }
            status->isCompleted = true;
            CleanupCompletedTasks();
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return handle;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief True while any task of the given type has not finished. */
    bool HasActiveTask(TaskType type) {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return std::any_of(m_activeTasks.begin(), m_activeTasks.end(),
                           [type](const auto& s) { return s->type == type; });
    }

    /** @brief Blocks until no task is running. */
    void WaitIdle() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_idle.wait(lock, [this] { return m_activeTasks.empty(); });
    }

private:
    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
        if (m_activeTasks.empty()) m_idle.notify_all();
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::mutex m_tasksMutex;
    std::condition_variable m_idle;
};

} // namespace worldpulse::application
