/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace worldpulse::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs atomic file writes sequentially.
 *
 * Every baseline write passes through this single queue, so a
 * file is never written by two threads at once and a reader never sees a
 * half-written file.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Asynchronously queues a text content to be saved to a file.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Blocks until every write queued so far has been performed.
     */
    void flush();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

    /** @brief Number of writes that failed since start. */
    int failedWrites() const { return m_failedWrites.load(); }

    /** @brief Number of files written since start. */
    int completedWrites() const { return m_completedWrites.load(); }

private:
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename).
     * @return False when the target was left untouched because of an error.
     */
    bool performAtomicWrite(const SaveTask& task);

    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_drained;
    bool m_writing = false;

    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<int> m_failedWrites{0};
    std::atomic<int> m_completedWrites{0};
};

} // namespace worldpulse::infrastructure
