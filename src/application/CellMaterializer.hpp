/**
 * @file CellMaterializer.hpp
 * @brief Turns one (document, field) extraction into a persisted-ready Cell.
 */

#pragma once

#include <string>
#include "domain/Document.hpp"
#include "domain/FieldTemplate.hpp"
#include "domain/extraction/CitationBuilder.hpp"
#include "domain/extraction/ConfidenceScorer.hpp"
#include "domain/extraction/Extractor.hpp"
#include "domain/review/Cell.hpp"

namespace lextable::application {

class CellMaterializer {
public:
    /** @brief Actor recorded on CREATED entries. */
    static constexpr const char* kSystemActor = "system";

    explicit CellMaterializer(std::size_t snippetRadius = domain::extraction::CitationBuilder::kDefaultRadius)
        : m_citations(snippetRadius) {}

    /**
     * @brief EXTRACTED when the extraction has a primary match, MISSING_DATA otherwise.
     *
     * value starts equal to value_raw; the normalized form is kept alongside.
     */
    domain::review::Cell materialize(const std::string& jobId,
                                     const domain::Document& document,
                                     const domain::FieldDefinition& field,
                                     const domain::extraction::FieldExtraction& extraction) const;

    /**
     * @brief MISSING_DATA cell with confidence 0 carrying the failure reason.
     * @param reason ParseError or ExtractionError.
     */
    domain::review::Cell materializeError(const std::string& jobId,
                                          const std::string& documentId,
                                          const std::string& documentIdentifier,
                                          const domain::FieldDefinition& field,
                                          domain::extraction::ReasonCode reason) const;

private:
    static domain::review::CellRecord BaseRecord(const std::string& jobId,
                                                 const std::string& documentId,
                                                 const std::string& documentIdentifier,
                                                 const domain::FieldDefinition& field);

    domain::extraction::ConfidenceScorer m_scorer;
    domain::extraction::CitationBuilder m_citations;
};

} // namespace lextable::application
