/**
 * @file FileSystemDocumentSource.hpp
 * @brief Document source backed by the data and uploads directories.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/DocumentSource.hpp"

namespace lextable::infrastructure {

/**
 * @class FileSystemDocumentSource
 * @brief Scans each directory in order, files sorted by name within each.
 */
class FileSystemDocumentSource : public domain::DocumentSource {
public:
    explicit FileSystemDocumentSource(std::vector<std::string> directories);

    std::vector<domain::SourceDocument> listDocuments() override;

    /** @brief Maps a file extension (any case, with dot) to a format. */
    static std::optional<domain::DocumentFormat> ClassifyByExtension(const std::string& extension);

private:
    std::vector<std::string> m_directories;
};

} // namespace lextable::infrastructure
