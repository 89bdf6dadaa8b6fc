/**
 * @file AsyncTaskManager.hpp
 * @brief Runs keyed background tasks and lets callers wait on them.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace lextable::application {

/**
 * @struct TaskStatus
 * @brief Shared view of one background task.
 */
struct TaskStatus {
    int id = 0;
    std::string key;          ///< Caller-chosen lookup key, e.g. a job id.
    std::string description;
    std::atomic<bool> running{false};
    std::atomic<bool> failed{false};
    std::string errorMessage; ///< Valid once completion is ready.
    std::shared_future<void> completion;

    bool isFinished() const {
        return completion.valid() && waitFor(std::chrono::milliseconds(0));
    }

    /** @brief Blocks until the task has finished, successfully or not. */
    void wait() const { completion.wait(); }

    /** @return true if the task finished within the timeout. */
    bool waitFor(std::chrono::milliseconds timeout) const {
        return completion.wait_for(timeout) == std::future_status::ready;
    }
};

/**
 * @class AsyncTaskManager
 * @brief One thread per task, indexed by key.
 *
 * Finished tasks are reaped on the next submission: their threads are
 * joined and their keys forgotten. The rest are joined by JoinAll() or the
 * destructor.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() {
        JoinAll();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /**
     * @brief Starts f(status) on a new thread.
     *
     * A later task submitted under the same key replaces the earlier one in
     * FindTask(). Exceptions escaping f mark the task failed.
     */
    template<typename F>
    std::shared_ptr<TaskStatus> SubmitTask(const std::string& key, const std::string& description, F&& f) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->key = key;
        status->description = description;

        auto done = std::make_shared<std::promise<void>>();
        status->completion = done->get_future().share();

        std::lock_guard<std::mutex> lock(m_mutex);
        ReapFinishedLocked();
        if (!key.empty()) {
            m_tasksByKey[key] = status;
        }

        std::thread worker([status, done, task = std::forward<F>(f)]() mutable {
            status->running = true;
            try {
                task(status);
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
            }
            status->running = false;
            done->set_value();
        });
        m_workers.push_back(Worker{status, std::move(worker)});
        return status;
    }

    /** @brief Latest task submitted under key; finished tasks may already have been forgotten. */
    std::shared_ptr<TaskStatus> FindTask(const std::string& key) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_tasksByKey.find(key);
        return it == m_tasksByKey.end() ? nullptr : it->second;
    }

    /** @brief Number of tasks that have not finished yet. */
    std::size_t PendingCount() {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::size_t pending = 0;
        for (const auto& worker : m_workers) {
            if (!worker.status->isFinished()) ++pending;
        }
        return pending;
    }

    /** @brief Number of keys FindTask() can still resolve. */
    std::size_t KnownKeyCount() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_tasksByKey.size();
    }

    /** @brief Waits for every submitted task and joins its thread. */
    void JoinAll() {
        std::vector<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            workers.swap(m_workers);
        }
        for (auto& worker : workers) {
            if (worker.thread.joinable()) worker.thread.join();
        }
    }

private:
    struct Worker {
        std::shared_ptr<TaskStatus> status;
        std::thread thread;
    };

    void ReapFinishedLocked() {
        for (auto it = m_tasksByKey.begin(); it != m_tasksByKey.end();) {
            if (it->second->isFinished()) {
                it = m_tasksByKey.erase(it);
            } else {
                ++it;
            }
        }
        for (auto it = m_workers.begin(); it != m_workers.end();) {
            if (it->status->isFinished()) {
                if (it->thread.joinable()) it->thread.join();
                it = m_workers.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::atomic<int> m_nextId{0};
    std::unordered_map<std::string, std::shared_ptr<TaskStatus>> m_tasksByKey;
    std::vector<Worker> m_workers;
    std::mutex m_mutex;
};

} // namespace lextable::application
