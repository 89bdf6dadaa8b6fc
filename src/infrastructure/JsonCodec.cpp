/**
 * @file JsonCodec.cpp
 * @brief Implementation of the JSON mapping.
 */

#include "infrastructure/JsonCodec.hpp"

#include <stdexcept>

namespace lextable::infrastructure {

using json = nlohmann::json;
using namespace lextable::domain;
using namespace lextable::domain::review;

namespace {

json OptionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> ReadOptionalString(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

json SnapshotToJson(const CellSnapshot& snapshot) {
    return {
        {"value", OptionalString(snapshot.value)},
        {"value_raw", OptionalString(snapshot.valueRaw)},
        {"review_state", ReviewStateToString(snapshot.reviewState)}
    };
}

CellSnapshot SnapshotFromJson(const json& j) {
    CellSnapshot snapshot;
    snapshot.value = ReadOptionalString(j, "value");
    snapshot.valueRaw = ReadOptionalString(j, "value_raw");
    snapshot.reviewState = ReviewStateFromString(j.at("review_state").get<std::string>()).value_or(ReviewState::MissingData);
    return snapshot;
}

template <typename T>
T Require(const std::optional<T>& value, const std::string& what) {
    if (!value) throw std::invalid_argument("unknown " + what);
    return *value;
}

} // namespace

long long ToEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromEpochMillis(long long ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

json CitationToJson(const Citation& citation) {
    return {
        {"document_id", citation.documentId},
        {"document_identifier", citation.documentIdentifier},
        {"location_type", LocationTypeToString(citation.locationType)},
        {"location", citation.location},
        {"snippet", citation.snippet},
        {"char_start", citation.charStart},
        {"char_end", citation.charEnd},
        {"coordinates", nullptr}
    };
}

Citation CitationFromJson(const json& j) {
    Citation citation;
    citation.documentId = j.at("document_id").get<std::string>();
    citation.documentIdentifier = j.at("document_identifier").get<std::string>();
    citation.locationType = LocationTypeFromString(j.at("location_type").get<std::string>());
    citation.location = j.at("location").get<int>();
    citation.snippet = j.at("snippet").get<std::string>();
    citation.charStart = j.at("char_start").get<std::size_t>();
    citation.charEnd = j.at("char_end").get<std::size_t>();
    return citation;
}

json CellToJson(const CellRecord& cell) {
    json reasons = json::array();
    for (auto code : cell.confidenceReasons) {
        reasons.push_back(extraction::ReasonCodeToString(code));
    }
    return {
        {"cell_id", cell.cellId},
        {"job_id", cell.jobId},
        {"document_id", cell.documentId},
        {"document_identifier", cell.documentIdentifier},
        {"field_key", cell.fieldKey},
        {"field_label", cell.fieldLabel},
        {"field_type", FieldTypeToString(cell.fieldType)},
        {"value", OptionalString(cell.value)},
        {"value_raw", OptionalString(cell.valueRaw)},
        {"value_normalized", OptionalString(cell.valueNormalized)},
        {"review_state", ReviewStateToString(cell.reviewState)},
        {"confidence", cell.confidence},
        {"confidence_reasons", reasons},
        {"citation", cell.citation ? CitationToJson(*cell.citation) : json(nullptr)},
        {"version", cell.version}
    };
}

CellRecord CellFromJson(const json& j) {
    CellRecord cell;
    cell.cellId = j.at("cell_id").get<std::string>();
    cell.jobId = j.at("job_id").get<std::string>();
    cell.documentId = j.at("document_id").get<std::string>();
    cell.documentIdentifier = j.at("document_identifier").get<std::string>();
    cell.fieldKey = j.at("field_key").get<std::string>();
    cell.fieldLabel = j.value("field_label", cell.fieldKey);
    cell.fieldType = Require(FieldTypeFromString(j.value("field_type", "text")), "field_type");
    cell.value = ReadOptionalString(j, "value");
    cell.valueRaw = ReadOptionalString(j, "value_raw");
    cell.valueNormalized = ReadOptionalString(j, "value_normalized");
    cell.reviewState = Require(ReviewStateFromString(j.at("review_state").get<std::string>()), "review_state");
    cell.confidence = j.at("confidence").get<double>();
    for (const auto& reason : j.at("confidence_reasons")) {
        cell.confidenceReasons.push_back(
            Require(extraction::ReasonCodeFromString(reason.get<std::string>()), "reason code"));
    }
    if (j.contains("citation") && !j["citation"].is_null()) {
        cell.citation = CitationFromJson(j["citation"]);
    }
    cell.version = j.value("version", 1);
    return cell;
}

json AuditEntryToJson(const AuditEntry& entry) {
    return {
        {"cell_id", entry.cellId},
        {"sequence", entry.sequence},
        {"actor", entry.actor},
        {"ts", ToEpochMillis(entry.timestamp)},
        {"action", AuditActionToString(entry.action)},
        {"reason", OptionalString(entry.reason)},
        {"before", entry.before ? SnapshotToJson(*entry.before) : json(nullptr)},
        {"after", SnapshotToJson(entry.after)}
    };
}

AuditEntry AuditEntryFromJson(const json& j) {
    AuditEntry entry;
    entry.cellId = j.at("cell_id").get<std::string>();
    entry.sequence = j.at("sequence").get<int>();
    entry.actor = j.at("actor").get<std::string>();
    entry.timestamp = FromEpochMillis(j.value("ts", 0LL));
    entry.action = Require(AuditActionFromString(j.at("action").get<std::string>()), "audit action");
    entry.reason = ReadOptionalString(j, "reason");
    if (j.contains("before") && !j["before"].is_null()) {
        entry.before = SnapshotFromJson(j["before"]);
    }
    entry.after = SnapshotFromJson(j.at("after"));
    return entry;
}

json JobToJson(const Job& job) {
    json documents = json::array();
    for (const auto& doc : job.documents) {
        documents.push_back({{"id", doc.id}, {"identifier", doc.identifier}});
    }
    json fields = json::array();
    for (const auto& field : job.fields) {
        fields.push_back({{"key", field.key}, {"label", field.label}, {"type", FieldTypeToString(field.type)}});
    }
    json errors = json::array();
    for (const auto& err : job.documentErrors) {
        errors.push_back({
            {"document_id", err.documentId},
            {"document_identifier", err.documentIdentifier},
            {"message", err.message}
        });
    }
    return {
        {"id", job.id},
        {"mode", JobModeToString(job.mode)},
        {"status", JobStatusToString(job.status)},
        {"template_path", job.templatePath},
        {"created_at", ToEpochMillis(job.createdAt)},
        {"started_at", job.startedAt ? json(ToEpochMillis(*job.startedAt)) : json(nullptr)},
        {"finished_at", job.finishedAt ? json(ToEpochMillis(*job.finishedAt)) : json(nullptr)},
        {"error_message", OptionalString(job.errorMessage)},
        {"document_errors", errors},
        {"documents", documents},
        {"fields", fields}
    };
}

Job JobFromJson(const json& j) {
    Job job;
    job.id = j.at("id").get<std::string>();
    job.mode = Require(JobModeFromString(j.at("mode").get<std::string>()), "job mode");
    job.status = Require(JobStatusFromString(j.at("status").get<std::string>()), "job status");
    job.templatePath = j.value("template_path", "");
    job.createdAt = FromEpochMillis(j.value("created_at", 0LL));
    if (j.contains("started_at") && !j["started_at"].is_null()) {
        job.startedAt = FromEpochMillis(j["started_at"].get<long long>());
    }
    if (j.contains("finished_at") && !j["finished_at"].is_null()) {
        job.finishedAt = FromEpochMillis(j["finished_at"].get<long long>());
    }
    job.errorMessage = ReadOptionalString(j, "error_message");
    for (const auto& err : j.value("document_errors", json::array())) {
        job.documentErrors.push_back({
            err.at("document_id").get<std::string>(),
            err.value("document_identifier", ""),
            err.value("message", "")
        });
    }
    for (const auto& doc : j.value("documents", json::array())) {
        job.documents.push_back({doc.at("id").get<std::string>(), doc.value("identifier", "")});
    }
    for (const auto& field : j.value("fields", json::array())) {
        job.fields.push_back({
            field.at("key").get<std::string>(),
            field.value("label", ""),
            FieldTypeFromString(field.value("type", "text")).value_or(FieldType::Text)
        });
    }
    return job;
}

} // namespace lextable::infrastructure
