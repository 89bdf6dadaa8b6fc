/**
 * @file ContentExtractor.hpp
 * @brief Extracts paginated text from PDF bytes through poppler's pdftotext.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "domain/Errors.hpp"

namespace lextable::infrastructure {

class ContentExtractor {
public:
    /**
     * @brief Runs pdftotext over the bytes and splits its output on form-feed.
     * @return One string per page, empty pages included.
     * @throws domain::ParseError when the bytes are not a PDF or pdftotext fails.
     */
    static std::vector<std::string> ExtractPdfPages(const std::string& documentId, const std::string& bytes) {
        if (bytes.compare(0, 5, "%PDF-") != 0) {
            throw domain::ParseError(documentId, "not a PDF (missing %PDF- header)");
        }
        if (!HasTool("pdftotext")) {
            throw domain::ParseError(documentId,
                "pdftotext not found. Please install poppler-utils (e.g., apt-get install -y poppler-utils).");
        }

        const std::string tempPdf = GetTempFilePath(".pdf");
        {
            std::ofstream out(tempPdf, std::ios::binary);
            if (!out.is_open()) {
                throw domain::ParseError(documentId, "cannot write temporary file " + tempPdf);
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        }

        std::string output;
        const int rc = RunCommand("pdftotext -layout -q \"" + tempPdf + "\" - 2>/dev/null", output);
        std::error_code ec;
        std::filesystem::remove(tempPdf, ec);

        if (rc != 0) {
            throw domain::ParseError(documentId, "pdftotext exited with code " + std::to_string(rc));
        }
        return SplitPages(output);
    }

    /** @brief Splits pdftotext-style output on form-feed, dropping the trailing empty page. */
    static std::vector<std::string> SplitPages(const std::string& text) {
        std::vector<std::string> pages;
        std::size_t start = 0;
        while (true) {
            std::size_t ff = text.find('\f', start);
            if (ff == std::string::npos) {
                pages.push_back(text.substr(start));
                break;
            }
            pages.push_back(text.substr(start, ff - start));
            start = ff + 1;
        }
        if (pages.size() > 1 && pages.back().find_first_not_of(" \t\r\n") == std::string::npos) {
            pages.pop_back();
        }
        return pages;
    }

private:
    static int RunCommand(const std::string& cmd, std::string& output) {
        FILE* pipe = popen(cmd.c_str(), "r");
        if (!pipe) return -1;
        char buffer[4096];
        std::size_t n = 0;
        while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
            output.append(buffer, n);
        }
        return pclose(pipe);
    }

    static bool HasTool(const std::string& tool) {
        std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
        int result = std::system(cmd.c_str());
        return result == 0;
    }

    static std::string GetTempFilePath(const std::string& suffix) {
        // Documents are segmented in parallel; the counter keeps names distinct.
        static std::atomic<unsigned> counter{0};
        auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        std::string name = "lextable_" + std::to_string(now) + "_" + std::to_string(counter++) + suffix;
        return (std::filesystem::temp_directory_path() / name).string();
    }
};

} // namespace lextable::infrastructure
