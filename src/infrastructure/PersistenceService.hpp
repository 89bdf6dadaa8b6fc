/**
 * @file PersistenceService.hpp
 * @brief Write-behind store of whole files, each replaced atomically.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lextable::infrastructure {

/**
 * @struct PendingWrite
 * @brief Full new content of one file.
 */
struct PendingWrite {
    std::string path;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Background writer for job, cell and audit files.
 *
 * The writer takes everything queued so far as one batch. Within a batch
 * only the newest content of each path is written, so a file always ends
 * up holding its last submitted content.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /** @brief Queues content to replace the file at path. Ignored after stop(). */
    void enqueueWrite(const std::string& path, std::string content);

    /** @brief Blocks until every write queued so far has been performed. */
    void flush();

    /** @brief Drains the queue and stops the writer thread. */
    void stop();

    std::size_t failedWrites() const { return m_failedWrites.load(); }
    std::size_t completedWrites() const { return m_completedWrites.load(); }

private:
    void writerLoop();
    static std::vector<PendingWrite> Coalesce(std::vector<PendingWrite> batch);

    /**
     * @brief Writes to a sibling temp file and renames it over the target.
     * @return false when the file could not be written.
     */
    bool replaceFile(const PendingWrite& write);

    std::vector<PendingWrite> m_pending;
    std::mutex m_mutex;
    std::condition_variable m_wakeCv;
    std::condition_variable m_idleCv;
    bool m_writing = false;
    bool m_stopping = false;

    std::thread m_writer;
    std::atomic<std::size_t> m_failedWrites{0};
    std::atomic<std::size_t> m_completedWrites{0};
    std::atomic<unsigned long long> m_tempCounter{0};
};

} // namespace lextable::infrastructure
