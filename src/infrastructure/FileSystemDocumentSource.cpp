/**
 * @file FileSystemDocumentSource.cpp
 * @brief Implementation of the FileSystemDocumentSource.
 */

#include "infrastructure/FileSystemDocumentSource.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include "domain/Identifiers.hpp"

namespace fs = std::filesystem;

namespace lextable::infrastructure {

FileSystemDocumentSource::FileSystemDocumentSource(std::vector<std::string> directories)
    : m_directories(std::move(directories)) {}

std::vector<domain::SourceDocument> FileSystemDocumentSource::listDocuments() {
    std::vector<domain::SourceDocument> documents;

    for (const auto& dir : m_directories) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            continue;
        }

        std::vector<fs::path> files;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            if (entry.is_regular_file() && ClassifyByExtension(entry.path().extension().string())) {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
            return a.filename().string() < b.filename().string();
        });

        for (const auto& path : files) {
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                std::cerr << "[DocumentSource] Cannot read " << path << ", skipping" << std::endl;
                continue;
            }
            std::stringstream buffer;
            buffer << in.rdbuf();

            domain::SourceDocument doc;
            doc.id = domain::Fnv1a64Hex(fs::absolute(path).lexically_normal().string());
            doc.identifier = path.filename().string();
            doc.rawBytes = buffer.str();
            doc.format = *ClassifyByExtension(path.extension().string());
            documents.push_back(std::move(doc));
        }
    }

    return documents;
}

std::optional<domain::DocumentFormat> FileSystemDocumentSource::ClassifyByExtension(const std::string& extension) {
    std::string ext = extension;
    // Convert extension to lowercase for robust check
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });

    if (ext == ".pdf") return domain::DocumentFormat::Pdf;
    if (ext == ".html" || ext == ".htm") return domain::DocumentFormat::Html;
    if (ext == ".txt") return domain::DocumentFormat::Text;
    return std::nullopt;
}

} // namespace lextable::infrastructure
