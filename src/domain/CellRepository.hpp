/**
 * @file CellRepository.hpp
 * @brief Persistence capability injected into the orchestrator and review service.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "Job.hpp"
#include "review/AuditEntry.hpp"
#include "review/Cell.hpp"

namespace lextable::domain {

/**
 * @class CellRepository
 * @brief Abstract store for jobs, cells and the audit log.
 *
 * Implementations must serialize concurrent writes. update() is the only
 * way to change an existing cell and enforces the optimistic version check.
 */
class CellRepository {
public:
    virtual ~CellRepository() = default;

    virtual void saveJob(const Job& job) = 0;
    virtual std::optional<Job> findJob(const std::string& jobId) = 0;
    virtual std::vector<Job> listJobs() = 0;

    /** @brief Stores a new cell and commits its uncommitted audit entries. */
    virtual void save(review::Cell& cell) = 0;

    /** @brief All cells of a job, in the order they were saved. */
    virtual std::vector<review::Cell> load(const std::string& jobId) = 0;

    virtual std::optional<review::Cell> findCell(const std::string& cellId) = 0;

    virtual void append(const review::AuditEntry& entry) = 0;

    /** @brief Entries of one cell ordered by sequence. */
    virtual std::vector<review::AuditEntry> auditLog(const std::string& cellId) = 0;

    /**
     * @brief Commits a reviewed cell and its new audit entries atomically.
     * @throws ConcurrencyError if the stored version differs from expectedVersion.
     * @throws NotFoundError if the cell does not exist.
     */
    virtual void update(review::Cell& cell, int expectedVersion) = 0;
};

} // namespace lextable::domain
