/**
 * @file CellMaterializer.cpp
 * @brief Implementation of CellMaterializer.
 */

#include "application/CellMaterializer.hpp"
#include "domain/Identifiers.hpp"

namespace lextable::application {

using namespace lextable::domain;
using namespace lextable::domain::extraction;
using namespace lextable::domain::review;

CellRecord CellMaterializer::BaseRecord(const std::string& jobId,
                                        const std::string& documentId,
                                        const std::string& documentIdentifier,
                                        const FieldDefinition& field) {
    CellRecord record;
    record.cellId = MakeCellId(jobId, documentId, field.key);
    record.jobId = jobId;
    record.documentId = documentId;
    record.documentIdentifier = documentIdentifier;
    record.fieldKey = field.key;
    record.fieldLabel = field.label;
    record.fieldType = field.type;
    record.reviewState = ReviewState::MissingData;
    return record;
}

Cell CellMaterializer::materialize(const std::string& jobId,
                                   const Document& document,
                                   const FieldDefinition& field,
                                   const FieldExtraction& extraction) const {
    CellRecord record = BaseRecord(jobId, document.id, document.identifier, field);

    ConfidenceScore score = m_scorer.score(field, extraction);
    record.confidence = score.value;
    record.confidenceReasons = std::move(score.reasons);

    if (const MatchCandidate* primary = extraction.primary()) {
        record.reviewState = ReviewState::Extracted;
        record.valueRaw = extraction.value;
        record.value = extraction.value;
        record.valueNormalized = extraction.valueNormalized;
        record.citation = m_citations.build(document, *primary);
    }

    return Cell::materialize(std::move(record), kSystemActor);
}

Cell CellMaterializer::materializeError(const std::string& jobId,
                                        const std::string& documentId,
                                        const std::string& documentIdentifier,
                                        const FieldDefinition& field,
                                        ReasonCode reason) const {
    CellRecord record = BaseRecord(jobId, documentId, documentIdentifier, field);
    record.confidence = 0.0;
    record.confidenceReasons = {reason};
    return Cell::materialize(std::move(record), kSystemActor);
}

} // namespace lextable::application
