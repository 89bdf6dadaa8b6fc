/**
 * @file ReviewService.cpp
 * @brief Implementation of ReviewService.
 */

#include "application/ReviewService.hpp"

#include <iostream>
#include "domain/Errors.hpp"

namespace lextable::application {

using namespace lextable::domain;
using namespace lextable::domain::review;

ReviewService::ReviewService(std::shared_ptr<CellRepository> repository)
    : m_repository(std::move(repository)) {}

CellRecord ReviewService::review(const std::string& cellId, const ReviewAction& action) {
    action.validate();

    auto cell = m_repository->findCell(cellId);
    if (!cell) {
        throw NotFoundError("cell " + cellId);
    }
    if (cell->version() != action.expectedVersion) {
        throw ConcurrencyError(cellId, action.expectedVersion, cell->version());
    }

    cell->apply(action);
    m_repository->update(*cell, action.expectedVersion);

    std::cout << "[ReviewService] Cell " << cellId << " -> "
              << ReviewStateToString(cell->state()) << " by " << action.actor
              << " (v" << cell->version() << ")" << std::endl;
    return cell->record();
}

std::vector<AuditEntry> ReviewService::auditLog(const std::string& cellId) {
    if (!m_repository->findCell(cellId)) {
        throw NotFoundError("cell " + cellId);
    }
    return m_repository->auditLog(cellId);
}

CellRecord ReviewService::cell(const std::string& cellId) {
    auto found = m_repository->findCell(cellId);
    if (!found) {
        throw NotFoundError("cell " + cellId);
    }
    return found->record();
}

} // namespace lextable::application
