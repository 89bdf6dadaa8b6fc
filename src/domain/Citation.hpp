/**
 * @file Citation.hpp
 * @brief Located, quoted evidence for a cell value.
 */

#pragma once

#include <cstddef>
#include <string>
#include "Document.hpp"

namespace lextable::domain {

/**
 * @struct Citation
 * @brief Immutable once built. Offsets index the canonical document text.
 *
 * Coordinates are reserved for bounding-box support and are always
 * serialized as null.
 */
struct Citation {
    std::string documentId;
    std::string documentIdentifier;
    LocationType locationType = LocationType::Page;
    int location = 1;
    std::string snippet;
    std::size_t charStart = 0;
    std::size_t charEnd = 0;

    bool operator==(const Citation& other) const {
        return documentId == other.documentId &&
               documentIdentifier == other.documentIdentifier &&
               locationType == other.locationType &&
               location == other.location &&
               snippet == other.snippet &&
               charStart == other.charStart &&
               charEnd == other.charEnd;
    }
    bool operator!=(const Citation& other) const { return !(*this == other); }
};

} // namespace lextable::domain
