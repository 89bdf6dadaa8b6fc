/**
 * @file ReviewService.hpp
 * @brief Application service for reviewer actions on cells.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "domain/CellRepository.hpp"
#include "domain/review/ReviewAction.hpp"

namespace lextable::application {

/**
 * @class ReviewService
 * @brief Validates, applies and commits review actions.
 */
class ReviewService {
public:
    explicit ReviewService(std::shared_ptr<domain::CellRepository> repository);

    /**
     * @brief Applies one action and returns the committed cell state.
     * @throws ValidationError for malformed input, before anything is read.
     * @throws NotFoundError for an unknown cell.
     * @throws ConcurrencyError if the cell moved past action.expectedVersion.
     */
    domain::review::CellRecord review(const std::string& cellId, const domain::review::ReviewAction& action);

    /** @throws NotFoundError for an unknown cell. */
    std::vector<domain::review::AuditEntry> auditLog(const std::string& cellId);

    /** @throws NotFoundError for an unknown cell. */
    domain::review::CellRecord cell(const std::string& cellId);

private:
    std::shared_ptr<domain::CellRepository> m_repository;
};

} // namespace lextable::application
