/**
 * @file TestSupport.hpp
 * @brief Mocks and fixtures shared by the test programs.
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "domain/DocumentSource.hpp"
#include "domain/FieldTemplate.hpp"
#include "infrastructure/DocumentSegmenter.hpp"
#include "infrastructure/TemplateStore.hpp"

namespace lextable::test {

// Mock ingestion: serves a fixed list of documents.
class MockDocumentSource : public domain::DocumentSource {
public:
    explicit MockDocumentSource(std::vector<domain::SourceDocument> documents = {})
        : m_documents(std::move(documents)) {}

    std::vector<domain::SourceDocument> listDocuments() override {
        return m_documents;
    }

    std::vector<domain::SourceDocument> m_documents;
};

/** @brief A form-feed paginated text document, one entry per page. */
inline domain::SourceDocument TextDocument(const std::string& id,
                                           const std::string& identifier,
                                           const std::vector<std::string>& pages) {
    domain::SourceDocument doc;
    doc.id = id;
    doc.identifier = identifier;
    doc.format = domain::DocumentFormat::Text;
    for (std::size_t i = 0; i < pages.size(); ++i) {
        if (i > 0) doc.rawBytes += '\f';
        doc.rawBytes += pages[i];
    }
    return doc;
}

inline domain::Document Segmented(const domain::SourceDocument& source) {
    return infrastructure::DocumentSegmenter{}.segment(source);
}

/** @brief Parses one field through the template validator. */
inline domain::FieldDefinition FieldFromJson(const nlohmann::json& field) {
    auto store = infrastructure::TemplateStore::FromJson({
        {"template_id", "test"},
        {"fields", nlohmann::json::array({field})}
    });
    return store->fields().front();
}

inline std::filesystem::path FreshDirectory(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline std::string WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path.string();
}

} // namespace lextable::test
