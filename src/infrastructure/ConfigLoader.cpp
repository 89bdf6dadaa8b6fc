/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace lextable::infrastructure {

using json = nlohmann::json;

namespace {

void ReadString(const json& j, const char* key, std::string& target) {
    if (!j.contains(key)) return;
    if (!j[key].is_string() || j[key].get<std::string>().empty()) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected a non-empty string" << std::endl;
        return;
    }
    target = j[key].get<std::string>();
}

void ReadCount(const json& j, const char* key, std::size_t& target, std::size_t minimum) {
    if (!j.contains(key)) return;
    if (!j[key].is_number_integer() || j[key].get<long long>() < static_cast<long long>(minimum)) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected an integer >= " << minimum << std::endl;
        return;
    }
    target = j[key].get<std::size_t>();
}

} // namespace

domain::EngineConfig ConfigLoader::Load(const std::string& path) {
    domain::EngineConfig config;
    if (!std::filesystem::exists(path)) {
        return config;
    }

    json j;
    try {
        std::ifstream f(path);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
        return config;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] " << path << " is not a JSON object, using defaults" << std::endl;
        return config;
    }

    ReadString(j, "data_dir", config.dataDir);
    ReadString(j, "uploads_dir", config.uploadsDir);
    ReadString(j, "exports_dir", config.exportsDir);
    ReadString(j, "store_dir", config.storeDir);
    ReadString(j, "template_path", config.templatePath);
    ReadCount(j, "snippet_radius", config.snippetRadius, 0);
    ReadCount(j, "quick_document_limit", config.quickDocumentLimit, 1);
    ReadCount(j, "quick_page_limit", config.quickPageLimit, 1);
    ReadCount(j, "quick_field_limit", config.quickFieldLimit, 1);
    ReadCount(j, "worker_count", config.workerCount, 1);
    ReadString(j, "host", config.host);

    std::size_t port = static_cast<std::size_t>(config.port);
    ReadCount(j, "port", port, 1);
    if (port > 65535) {
        std::cerr << "[ConfigLoader] Ignoring 'port': out of range" << std::endl;
    } else {
        config.port = static_cast<int>(port);
    }

    return config;
}

bool ConfigLoader::Save(const std::string& path, const domain::EngineConfig& config) {
    json j = json::object();

    // Load existing to preserve other settings
    if (std::filesystem::exists(path)) {
        try {
            std::ifstream f(path);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << path << ": " << e.what() << std::endl;
            j = json::object();
        }
        if (!j.is_object()) j = json::object();
    }

    j["data_dir"] = config.dataDir;
    j["uploads_dir"] = config.uploadsDir;
    j["exports_dir"] = config.exportsDir;
    j["store_dir"] = config.storeDir;
    j["template_path"] = config.templatePath;
    j["snippet_radius"] = config.snippetRadius;
    j["quick_document_limit"] = config.quickDocumentLimit;
    j["quick_page_limit"] = config.quickPageLimit;
    j["quick_field_limit"] = config.quickFieldLimit;
    j["worker_count"] = config.workerCount;
    j["host"] = config.host;
    j["port"] = config.port;

    std::ofstream f(path);
    if (!f) {
        std::cerr << "[ConfigLoader] Error writing " << path << std::endl;
        return false;
    }
    f << j.dump(4);
    return static_cast<bool>(f);
}

} // namespace lextable::infrastructure
