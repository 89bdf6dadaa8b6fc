/**
 * @file EngineConfig.hpp
 * @brief Tunables of the engine, loaded from settings.json.
 */

#pragma once

#include <cstddef>
#include <string>

namespace lextable::domain {

struct EngineConfig {
    std::string dataDir = "data";
    std::string uploadsDir = "artifacts/uploads";
    std::string exportsDir = "artifacts/exports";
    std::string storeDir = "artifacts/store";
    std::string templatePath = "templates/v1_template.json";

    std::size_t snippetRadius = 80;

    // Quick mode slice.
    std::size_t quickDocumentLimit = 1;
    std::size_t quickPageLimit = 3;
    std::size_t quickFieldLimit = 5;

    std::size_t workerCount = 4;

    std::string host = "127.0.0.1";
    int port = 8000;
};

} // namespace lextable::domain
