/**
 * @file InMemoryCellRepository.hpp
 * @brief Mutex-guarded CellRepository held entirely in memory.
 */

#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include "domain/CellRepository.hpp"

namespace lextable::infrastructure {

/**
 * @class InMemoryCellRepository
 * @brief Reference repository. Also the cache under FsCellRepository.
 *
 * Every mutation runs under one mutex. Subclasses observe committed state
 * through the on* hooks, which are invoked while that mutex is held, so
 * they see commits in order.
 */
class InMemoryCellRepository : public domain::CellRepository {
public:
    InMemoryCellRepository() = default;
    ~InMemoryCellRepository() override = default;

    void saveJob(const domain::Job& job) override;
    std::optional<domain::Job> findJob(const std::string& jobId) override;
    std::vector<domain::Job> listJobs() override;

    void save(domain::review::Cell& cell) override;
    std::vector<domain::review::Cell> load(const std::string& jobId) override;
    std::optional<domain::review::Cell> findCell(const std::string& cellId) override;

    void append(const domain::review::AuditEntry& entry) override;
    std::vector<domain::review::AuditEntry> auditLog(const std::string& cellId) override;

    void update(domain::review::Cell& cell, int expectedVersion) override;

protected:
    virtual void onJobSaved(const domain::Job&) {}
    virtual void onCellCommitted(const domain::review::CellRecord&,
                                 const std::vector<domain::review::AuditEntry>&) {}

    // Rehydration entry points. They bypass the hooks.
    void restoreJob(domain::Job job);
    void restoreCell(domain::review::CellRecord record, std::vector<domain::review::AuditEntry> log);

private:
    struct StoredCell {
        domain::review::CellRecord record;
        std::vector<domain::review::AuditEntry> log;
    };

    void commitEntries(StoredCell& stored, domain::review::Cell& cell);

    std::mutex m_mutex;
    std::map<std::string, domain::Job> m_jobs;
    std::unordered_map<std::string, StoredCell> m_cells;
    std::unordered_map<std::string, std::vector<std::string>> m_jobCells;
};

} // namespace lextable::infrastructure
