/**
 * @file Job.hpp
 * @brief One extraction run over a selected set of documents and fields.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "FieldTemplate.hpp"

namespace lextable::domain {

enum class JobMode {
    Quick, ///< First document, first pages, first fields.
    Full
};

inline std::string JobModeToString(JobMode mode) {
    return mode == JobMode::Quick ? "quick" : "full";
}

inline std::optional<JobMode> JobModeFromString(const std::string& value) {
    if (value == "quick") return JobMode::Quick;
    if (value == "full") return JobMode::Full;
    return std::nullopt;
}

enum class JobStatus {
    Pending,
    Running,
    Succeeded,
    Failed
};

inline std::string JobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::Pending: return "PENDING";
        case JobStatus::Running: return "RUNNING";
        case JobStatus::Succeeded: return "SUCCEEDED";
        case JobStatus::Failed: return "FAILED";
    }
    return "PENDING";
}

inline std::optional<JobStatus> JobStatusFromString(const std::string& value) {
    if (value == "PENDING") return JobStatus::Pending;
    if (value == "RUNNING") return JobStatus::Running;
    if (value == "SUCCEEDED") return JobStatus::Succeeded;
    if (value == "FAILED") return JobStatus::Failed;
    return std::nullopt;
}

inline bool IsTerminal(JobStatus status) {
    return status == JobStatus::Succeeded || status == JobStatus::Failed;
}

struct DocumentRef {
    std::string id;
    std::string identifier;
};

struct FieldRef {
    std::string key;
    std::string label;
    FieldType type = FieldType::Text;
};

/** @brief A document that could not be processed, recorded against the job. */
struct DocumentError {
    std::string documentId;
    std::string documentIdentifier;
    std::string message;
};

struct Job {
    std::string id;
    JobMode mode = JobMode::Quick;
    JobStatus status = JobStatus::Pending;
    std::string templatePath;
    std::chrono::system_clock::time_point createdAt;
    std::optional<std::chrono::system_clock::time_point> startedAt;
    std::optional<std::chrono::system_clock::time_point> finishedAt;
    std::optional<std::string> errorMessage;
    std::vector<DocumentError> documentErrors;

    // Selection actually processed, in canonical order.
    std::vector<DocumentRef> documents;
    std::vector<FieldRef> fields;
};

} // namespace lextable::domain
