/**
 * @file JobOrchestrator.hpp
 * @brief Runs the extraction pipeline for a job and tracks its lifecycle.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/AsyncTaskManager.hpp"
#include "application/CellMaterializer.hpp"
#include "domain/CellRepository.hpp"
#include "domain/DocumentSource.hpp"
#include "domain/EngineConfig.hpp"
#include "domain/Job.hpp"
#include "infrastructure/DocumentSegmenter.hpp"

namespace lextable::application {

/** @brief One field across all documents of a job. */
struct ResultRow {
    std::string fieldKey;
    std::string fieldLabel;
    domain::FieldType fieldType = domain::FieldType::Text;
    std::vector<domain::review::CellRecord> cells; ///< In job document order.
};

struct ResultTable {
    domain::Job job;
    std::vector<domain::DocumentRef> documents;
    std::vector<domain::FieldRef> fields;
    std::vector<ResultRow> rows; ///< In template field order.
};

/**
 * @class JobOrchestrator
 * @brief PENDING -> RUNNING -> SUCCEEDED | FAILED.
 *
 * Jobs run on the AsyncTaskManager; documents within a job fan out over at
 * most worker_count tasks. Cells are persisted in canonical order (field
 * order, then document order) whatever the completion order was.
 */
class JobOrchestrator {
public:
    JobOrchestrator(std::shared_ptr<domain::DocumentSource> documents,
                    std::shared_ptr<domain::CellRepository> repository,
                    std::shared_ptr<AsyncTaskManager> taskManager,
                    domain::EngineConfig config);

    /** @brief Waits for jobs still running on the task manager. */
    ~JobOrchestrator();

    /** @brief Creates a PENDING job and starts it in the background. */
    std::string submit(domain::JobMode mode, const std::optional<std::string>& templatePath = std::nullopt);

    /** @brief Submits and waits. Returns the job in its terminal state. */
    domain::Job run(domain::JobMode mode, const std::optional<std::string>& templatePath = std::nullopt);

    /** @throws NotFoundError for an unknown job. */
    domain::Job wait(const std::string& jobId);

    /** @throws NotFoundError for an unknown job. */
    domain::JobStatus status(const std::string& jobId);

    std::optional<domain::Job> job(const std::string& jobId);

    /** @throws NotFoundError for an unknown job. */
    ResultTable result(const std::string& jobId);

    std::optional<std::string> latestSucceededJobId();

    const domain::EngineConfig& config() const { return m_config; }

    /** @brief Keeps the first pageLimit page segments. Section documents pass unchanged. */
    static domain::Document LimitPages(const domain::Document& document, std::size_t pageLimit);

private:
    struct DocumentOutcome {
        std::vector<domain::review::Cell> cells; ///< In field order.
        std::optional<domain::DocumentError> error;
    };

    void execute(domain::Job job);
    void fail(domain::Job& job, const std::string& message);

    DocumentOutcome processDocument(const std::string& jobId,
                                    domain::JobMode mode,
                                    const domain::SourceDocument& source,
                                    const std::vector<domain::FieldDefinition>& fields) const;

    std::shared_ptr<domain::DocumentSource> m_documents;
    std::shared_ptr<domain::CellRepository> m_repository;
    std::shared_ptr<AsyncTaskManager> m_taskManager;
    domain::EngineConfig m_config;

    infrastructure::DocumentSegmenter m_segmenter;
    domain::extraction::Extractor m_extractor;
    CellMaterializer m_materializer;
};

} // namespace lextable::application
