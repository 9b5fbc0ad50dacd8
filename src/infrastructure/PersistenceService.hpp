/**
 * @file PersistenceService.hpp
 * @brief Serialized, atomic file writes on a background thread.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <functional>

namespace polyglot::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
    std::function<void(bool)> onComplete;   ///< Called from the worker thread.
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs atomic file writes sequentially.
 *
 * All result files pass through a single queue, so two results for the same
 * document never interleave on disk.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    /**
     * @brief Queues content to be written to a file.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     * @param onComplete Optional callback receiving the write status.
     * @return False if the service is already stopped.
     */
    bool saveTextAsync(const std::string& filename, const std::string& content,
                       std::function<void(bool)> onComplete = nullptr);

    /** @brief Blocks until every queued task has been written. */
    void flush();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

private:
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename).
     */
    bool performAtomicWrite(const SaveTask& task);

    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace polyglot::infrastructure
