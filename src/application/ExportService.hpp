/**
 * @file ExportService.hpp
 * @brief Renders a job's result table as CSV.
 */

#pragma once

#include <string>
#include "application/JobOrchestrator.hpp"

namespace lextable::application {

class ExportService {
public:
    /** @brief One header line, then one line per cell in row order. CRLF line ends. */
    static std::string toCsv(const ResultTable& table);

    /**
     * @brief Writes toCsv() output to <exportsDir>/lextable_<job_id>.csv.
     * @return The path written.
     * @throws std::runtime_error if the file cannot be written.
     */
    static std::string writeCsv(const ResultTable& table, const std::string& exportsDir);

    /** @brief Quotes a field when it holds a comma, quote, CR or LF. */
    static std::string escapeCsv(const std::string& field);
};

} // namespace lextable::application
