/**
 * @file ExportService.cpp
 * @brief Implementation of ExportService.
 */

#include "application/ExportService.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace lextable::application {

using namespace lextable::domain;

namespace {

const char* kColumns[] = {
    "field_key", "field_label", "field_type", "document_identifier",
    "value", "value_raw", "value_normalized", "review_state", "confidence",
    "citation_location", "citation_location_type", "citation_char_start",
    "citation_char_end", "citation_snippet"
};

void WriteLine(std::ostream& out, const std::vector<std::string>& fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out << ',';
        out << ExportService::escapeCsv(fields[i]);
    }
    out << "\r\n";
}

} // namespace

std::string ExportService::escapeCsv(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string ExportService::toCsv(const ResultTable& table) {
    std::stringstream ss;
    WriteLine(ss, std::vector<std::string>(std::begin(kColumns), std::end(kColumns)));

    for (const auto& row : table.rows) {
        for (const auto& cell : row.cells) {
            std::ostringstream confidence;
            confidence << cell.confidence;

            std::vector<std::string> fields = {
                row.fieldKey,
                row.fieldLabel,
                FieldTypeToString(row.fieldType),
                cell.documentIdentifier,
                cell.value.value_or(""),
                cell.valueRaw.value_or(""),
                cell.valueNormalized.value_or(""),
                review::ReviewStateToString(cell.reviewState),
                confidence.str()
            };
            if (cell.citation) {
                fields.push_back(std::to_string(cell.citation->location));
                fields.push_back(LocationTypeToString(cell.citation->locationType));
                fields.push_back(std::to_string(cell.citation->charStart));
                fields.push_back(std::to_string(cell.citation->charEnd));
                fields.push_back(cell.citation->snippet);
            } else {
                fields.insert(fields.end(), 5, "");
            }
            WriteLine(ss, fields);
        }
    }
    return ss.str();
}

std::string ExportService::writeCsv(const ResultTable& table, const std::string& exportsDir) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(exportsDir, ec);
    if (ec) {
        throw std::runtime_error("cannot create " + exportsDir + ": " + ec.message());
    }

    fs::path path = fs::path(exportsDir) / ("lextable_" + table.job.id + ".csv");
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("cannot open " + path.string());
    }
    out << toCsv(table);
    if (!out) {
        throw std::runtime_error("write failed: " + path.string());
    }

    std::cout << "[ExportService] Wrote " << path.string() << std::endl;
    return path.string();
}

} // namespace lextable::application
