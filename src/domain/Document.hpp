/**
 * @file Document.hpp
 * @brief Ingested documents and their page/section segments.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace lextable::domain {

/**
 * @enum DocumentFormat
 * @brief Declared format of the raw bytes supplied by ingestion.
 */
enum class DocumentFormat {
    Pdf,
    Html,
    Text ///< UTF-8 text, pages separated by form-feed (pdftotext output).
};

inline std::string DocumentFormatToString(DocumentFormat format) {
    switch (format) {
        case DocumentFormat::Pdf: return "pdf";
        case DocumentFormat::Html: return "html";
        case DocumentFormat::Text: return "text";
    }
    return "text";
}

enum class LocationType {
    Page,
    Section
};

inline std::string LocationTypeToString(LocationType type) {
    return type == LocationType::Page ? "page" : "section";
}

inline LocationType LocationTypeFromString(const std::string& value) {
    return value == "section" ? LocationType::Section : LocationType::Page;
}

/**
 * @struct SourceDocument
 * @brief What the ingestion collaborator hands to the engine.
 */
struct SourceDocument {
    std::string id;
    std::string identifier; ///< Human-readable name, usually the file name.
    std::string rawBytes;
    DocumentFormat format = DocumentFormat::Text;
};

/**
 * @struct Segment
 * @brief A page- or section-bounded slice of the canonical text.
 *
 * Offsets are byte offsets into Document::canonicalText, half-open.
 */
struct Segment {
    LocationType locationType = LocationType::Page;
    int location = 1;       ///< 1-based page or section index.
    std::string label;      ///< Section heading, empty for pages.
    std::string text;
    std::size_t startOffset = 0;
    std::size_t endOffset = 0;

    bool contains(std::size_t start, std::size_t end) const {
        return startOffset <= start && start <= end && end <= endOffset;
    }
};

/**
 * @struct Document
 * @brief Segmented, immutable view of one ingested document.
 */
struct Document {
    std::string id;
    std::string identifier;
    DocumentFormat format = DocumentFormat::Text;
    std::string canonicalText;
    std::vector<Segment> segments;
};

} // namespace lextable::domain
