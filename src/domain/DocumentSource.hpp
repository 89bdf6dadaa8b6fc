/**
 * @file DocumentSource.hpp
 * @brief Ingestion capability: supplies the documents a job runs over.
 */

#pragma once

#include <vector>
#include "Document.hpp"

namespace lextable::domain {

class DocumentSource {
public:
    virtual ~DocumentSource() = default;

    /** @brief Documents in a stable order. Job document order follows it. */
    virtual std::vector<SourceDocument> listDocuments() = 0;
};

} // namespace lextable::domain
