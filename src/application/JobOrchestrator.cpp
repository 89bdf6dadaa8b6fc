/**
 * @file JobOrchestrator.cpp
 * @brief Implementation of JobOrchestrator.
 */

#include "application/JobOrchestrator.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <map>

#include "domain/Errors.hpp"
#include "domain/Identifiers.hpp"
#include "infrastructure/TemplateStore.hpp"

namespace lextable::application {

using namespace lextable::domain;
using namespace lextable::domain::extraction;
using namespace lextable::domain::review;

JobOrchestrator::JobOrchestrator(std::shared_ptr<DocumentSource> documents,
                                 std::shared_ptr<CellRepository> repository,
                                 std::shared_ptr<AsyncTaskManager> taskManager,
                                 EngineConfig config)
    : m_documents(std::move(documents)),
      m_repository(std::move(repository)),
      m_taskManager(std::move(taskManager)),
      m_config(std::move(config)),
      m_materializer(m_config.snippetRadius) {
    if (m_config.workerCount == 0) m_config.workerCount = 1;
}

JobOrchestrator::~JobOrchestrator() {
    m_taskManager->JoinAll();
}

std::string JobOrchestrator::submit(JobMode mode, const std::optional<std::string>& templatePath) {
    Job job;
    job.id = GenerateJobId();
    job.mode = mode;
    job.status = JobStatus::Pending;
    job.templatePath = templatePath.value_or(m_config.templatePath);
    job.createdAt = std::chrono::system_clock::now();
    m_repository->saveJob(job);

    std::cout << "[JobOrchestrator] Job " << job.id << " submitted (" << JobModeToString(mode) << ")" << std::endl;

    m_taskManager->SubmitTask(job.id, "Extraction job " + job.id,
        [this, job](const std::shared_ptr<TaskStatus>&) {
            execute(job);
        });
    return job.id;
}

Job JobOrchestrator::run(JobMode mode, const std::optional<std::string>& templatePath) {
    return wait(submit(mode, templatePath));
}

Job JobOrchestrator::wait(const std::string& jobId) {
    if (auto task = m_taskManager->FindTask(jobId)) {
        task->wait();
    }
    auto found = m_repository->findJob(jobId);
    if (!found) {
        throw NotFoundError("job " + jobId);
    }
    return *found;
}

JobStatus JobOrchestrator::status(const std::string& jobId) {
    auto found = m_repository->findJob(jobId);
    if (!found) {
        throw NotFoundError("job " + jobId);
    }
    return found->status;
}

std::optional<Job> JobOrchestrator::job(const std::string& jobId) {
    return m_repository->findJob(jobId);
}

std::optional<std::string> JobOrchestrator::latestSucceededJobId() {
    auto jobs = m_repository->listJobs();
    for (auto it = jobs.rbegin(); it != jobs.rend(); ++it) {
        if (it->status == JobStatus::Succeeded) return it->id;
    }
    return std::nullopt;
}

ResultTable JobOrchestrator::result(const std::string& jobId) {
    auto found = m_repository->findJob(jobId);
    if (!found) {
        throw NotFoundError("job " + jobId);
    }

    ResultTable table;
    table.job = *found;
    table.documents = found->documents;
    table.fields = found->fields;

    std::map<std::pair<std::string, std::string>, CellRecord> byKey;
    for (const auto& cell : m_repository->load(jobId)) {
        byKey[{cell.record().fieldKey, cell.record().documentId}] = cell.record();
    }

    for (const auto& field : table.fields) {
        ResultRow row;
        row.fieldKey = field.key;
        row.fieldLabel = field.label;
        row.fieldType = field.type;
        for (const auto& doc : table.documents) {
            auto it = byKey.find({field.key, doc.id});
            if (it != byKey.end()) {
                row.cells.push_back(it->second);
            }
        }
        table.rows.push_back(std::move(row));
    }
    return table;
}

Document JobOrchestrator::LimitPages(const Document& document, std::size_t pageLimit) {
    if (document.segments.size() <= pageLimit || document.segments.empty()) {
        return document;
    }
    if (document.segments.front().locationType != LocationType::Page) {
        return document;
    }

    Document limited = document;
    limited.segments.resize(pageLimit);
    const std::size_t end = pageLimit == 0 ? 0 : limited.segments.back().endOffset;
    limited.canonicalText = document.canonicalText.substr(0, end);
    return limited;
}

void JobOrchestrator::fail(Job& job, const std::string& message) {
    job.status = JobStatus::Failed;
    job.errorMessage = message;
    job.finishedAt = std::chrono::system_clock::now();
    m_repository->saveJob(job);
    std::cerr << "[JobOrchestrator] Job " << job.id << " failed: " << message << std::endl;
}

void JobOrchestrator::execute(Job job) {
    job.status = JobStatus::Running;
    job.startedAt = std::chrono::system_clock::now();
    m_repository->saveJob(job);

    try {
        auto store = infrastructure::TemplateStore::Load(job.templatePath);
        std::vector<FieldDefinition> fields = store->fields();
        std::vector<SourceDocument> sources = m_documents->listDocuments();

        if (sources.empty()) {
            fail(job, "no documents available");
            return;
        }

        if (job.mode == JobMode::Quick) {
            if (sources.size() > m_config.quickDocumentLimit) sources.resize(m_config.quickDocumentLimit);
            if (fields.size() > m_config.quickFieldLimit) fields.resize(m_config.quickFieldLimit);
        }

        for (const auto& src : sources) {
            job.documents.push_back({src.id, src.identifier});
        }
        for (const auto& field : fields) {
            job.fields.push_back({field.key, field.label, field.type});
        }
        m_repository->saveJob(job);

        std::cout << "[JobOrchestrator] Job " << job.id << ": " << sources.size() << " documents x "
                  << fields.size() << " fields" << std::endl;

        // Bounded fan-out: at most workerCount documents in flight.
        std::vector<DocumentOutcome> outcomes(sources.size());
        for (std::size_t batch = 0; batch < sources.size(); batch += m_config.workerCount) {
            const std::size_t end = std::min(sources.size(), batch + m_config.workerCount);
            std::vector<std::future<DocumentOutcome>> inflight;
            for (std::size_t i = batch; i < end; ++i) {
                inflight.push_back(std::async(std::launch::async, [this, &job, &sources, &fields, i] {
                    return processDocument(job.id, job.mode, sources[i], fields);
                }));
            }
            for (std::size_t i = batch; i < end; ++i) {
                outcomes[i] = inflight[i - batch].get();
            }
        }

        for (const auto& outcome : outcomes) {
            if (outcome.error) job.documentErrors.push_back(*outcome.error);
        }

        // Canonical order: field order, then document order.
        for (std::size_t f = 0; f < fields.size(); ++f) {
            for (auto& outcome : outcomes) {
                m_repository->save(outcome.cells[f]);
            }
        }

        job.status = JobStatus::Succeeded;
        job.finishedAt = std::chrono::system_clock::now();
        m_repository->saveJob(job);

        std::cout << "[JobOrchestrator] Job " << job.id << " succeeded with "
                  << job.documentErrors.size() << " document errors" << std::endl;
    } catch (const TemplateError& e) {
        fail(job, e.what());
    } catch (const std::exception& e) {
        fail(job, std::string("unexpected failure: ") + e.what());
    }
}

JobOrchestrator::DocumentOutcome JobOrchestrator::processDocument(const std::string& jobId,
                                                                  JobMode mode,
                                                                  const SourceDocument& source,
                                                                  const std::vector<FieldDefinition>& fields) const {
    DocumentOutcome outcome;
    outcome.cells.reserve(fields.size());

    Document document;
    try {
        document = m_segmenter.segment(source);
    } catch (const std::exception& e) {
        std::cerr << "[JobOrchestrator] " << source.identifier << ": " << e.what() << std::endl;
        outcome.error = DocumentError{source.id, source.identifier, e.what()};
        for (const auto& field : fields) {
            outcome.cells.push_back(m_materializer.materializeError(
                jobId, source.id, source.identifier, field, ReasonCode::ParseError));
        }
        return outcome;
    }

    if (mode == JobMode::Quick) {
        document = LimitPages(document, m_config.quickPageLimit);
    }

    for (const auto& field : fields) {
        try {
            FieldExtraction extraction = m_extractor.extract(document, field);
            outcome.cells.push_back(m_materializer.materialize(jobId, document, field, extraction));
        } catch (const ExtractionError& e) {
            std::cerr << "[JobOrchestrator] " << source.identifier << ": " << e.what() << std::endl;
            outcome.cells.push_back(m_materializer.materializeError(
                jobId, document.id, document.identifier, field, ReasonCode::ExtractionError));
        }
    }
    return outcome;
}

} // namespace lextable::application
