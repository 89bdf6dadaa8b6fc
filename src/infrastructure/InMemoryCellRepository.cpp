/**
 * @file InMemoryCellRepository.cpp
 * @brief Implementation of InMemoryCellRepository.
 */

#include "infrastructure/InMemoryCellRepository.hpp"

#include <algorithm>
#include "domain/Errors.hpp"

namespace lextable::infrastructure {

using namespace lextable::domain;
using namespace lextable::domain::review;

void InMemoryCellRepository::saveJob(const Job& job) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_jobs[job.id] = job;
    onJobSaved(job);
}

std::optional<Job> InMemoryCellRepository::findJob(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) return std::nullopt;
    return it->second;
}

std::vector<Job> InMemoryCellRepository::listJobs() {
    std::vector<Job> jobs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, job] : m_jobs) {
            jobs.push_back(job);
        }
    }
    std::stable_sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
        return a.createdAt < b.createdAt;
    });
    return jobs;
}

void InMemoryCellRepository::save(Cell& cell) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_cells.count(cell.id())) {
        throw LexTableError("cell " + cell.id() + " is already stored");
    }
    StoredCell stored;
    stored.record = cell.record();
    commitEntries(stored, cell);

    m_jobCells[stored.record.jobId].push_back(stored.record.cellId);
    auto& slot = m_cells[stored.record.cellId];
    slot = std::move(stored);
    onCellCommitted(slot.record, slot.log);
}

std::vector<Cell> InMemoryCellRepository::load(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Cell> cells;
    auto it = m_jobCells.find(jobId);
    if (it == m_jobCells.end()) return cells;

    cells.reserve(it->second.size());
    for (const auto& cellId : it->second) {
        const auto& stored = m_cells.at(cellId);
        cells.emplace_back(stored.record, static_cast<int>(stored.log.size()));
    }
    return cells;
}

std::optional<Cell> InMemoryCellRepository::findCell(const std::string& cellId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_cells.find(cellId);
    if (it == m_cells.end()) return std::nullopt;
    return Cell(it->second.record, static_cast<int>(it->second.log.size()));
}

void InMemoryCellRepository::append(const AuditEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_cells.find(entry.cellId);
    if (it == m_cells.end()) {
        throw NotFoundError("cell " + entry.cellId);
    }
    auto& stored = it->second;
    const int next = static_cast<int>(stored.log.size()) + 1;
    if (entry.sequence != next) {
        throw LexTableError("audit sequence " + std::to_string(entry.sequence) +
                            " for cell " + entry.cellId + ", expected " + std::to_string(next));
    }
    stored.log.push_back(entry);
    onCellCommitted(stored.record, stored.log);
}

std::vector<AuditEntry> InMemoryCellRepository::auditLog(const std::string& cellId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_cells.find(cellId);
    if (it == m_cells.end()) {
        throw NotFoundError("cell " + cellId);
    }
    return it->second.log;
}

void InMemoryCellRepository::update(Cell& cell, int expectedVersion) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_cells.find(cell.id());
    if (it == m_cells.end()) {
        throw NotFoundError("cell " + cell.id());
    }
    auto& stored = it->second;
    if (stored.record.version != expectedVersion) {
        throw ConcurrencyError(cell.id(), expectedVersion, stored.record.version);
    }
    // The cell was read before a concurrent commit if its log is behind.
    const auto& pending = cell.getUncommittedEntries();
    if (!pending.empty() && pending.front().sequence != static_cast<int>(stored.log.size()) + 1) {
        throw ConcurrencyError(cell.id(), expectedVersion, stored.record.version);
    }

    stored.record = cell.record();
    commitEntries(stored, cell);
    onCellCommitted(stored.record, stored.log);
}

void InMemoryCellRepository::restoreJob(Job job) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string id = job.id;
    m_jobs[id] = std::move(job);
}

void InMemoryCellRepository::restoreCell(CellRecord record, std::vector<AuditEntry> log) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::sort(log.begin(), log.end(), [](const AuditEntry& a, const AuditEntry& b) {
        return a.sequence < b.sequence;
    });
    const std::string cellId = record.cellId;
    m_jobCells[record.jobId].push_back(cellId);
    m_cells[cellId] = StoredCell{std::move(record), std::move(log)};
}

void InMemoryCellRepository::commitEntries(StoredCell& stored, Cell& cell) {
    for (const auto& entry : cell.getUncommittedEntries()) {
        stored.log.push_back(entry);
    }
    cell.clearUncommittedEntries();
}

} // namespace lextable::infrastructure
