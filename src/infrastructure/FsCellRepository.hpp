/**
 * @file FsCellRepository.hpp
 * @brief CellRepository persisted as JSON snapshots and NDJSON audit logs.
 */

#pragma once

#include <memory>
#include <string>
#include "infrastructure/InMemoryCellRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace lextable::infrastructure {

/**
 * @class FsCellRepository
 * @brief Write-through store under a root directory.
 *
 * Layout:
 *   <root>/jobs/<job_id>.json
 *   <root>/cells/<cell_id>.json
 *   <root>/audit/<cell_id>.ndjson
 *
 * The in-memory state is rehydrated from the root when the repository is
 * opened. Jobs still PENDING or RUNNING on disk are marked FAILED then. Writes go through PersistenceService; call flush() before
 * reading the files from another process.
 */
class FsCellRepository : public InMemoryCellRepository {
public:
    static constexpr const char* kInterruptedMessage = "interrupted by restart";

    FsCellRepository(std::string rootDir, std::shared_ptr<PersistenceService> persistence);

    void flush();

    const std::string& rootDir() const { return m_rootDir; }

protected:
    void onJobSaved(const domain::Job& job) override;
    void onCellCommitted(const domain::review::CellRecord& record,
                         const std::vector<domain::review::AuditEntry>& log) override;

private:
    void rehydrate();
    std::vector<domain::review::AuditEntry> readAuditLog(const std::string& cellId) const;

    std::string jobPath(const std::string& jobId) const;
    std::string cellPath(const std::string& cellId) const;
    std::string auditPath(const std::string& cellId) const;

    std::string m_rootDir;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace lextable::infrastructure
