/**
 * @file FsCellRepository.cpp
 * @brief Implementation of FsCellRepository.
 */

#include "infrastructure/FsCellRepository.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "infrastructure/JsonCodec.hpp"

namespace lextable::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace lextable::domain;
using namespace lextable::domain::review;

namespace {

std::optional<json> ReadJsonFile(const fs::path& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    try {
        json j;
        in >> j;
        return j;
    } catch (const json::exception& e) {
        std::cerr << "[FsCellRepository] Skipping unreadable " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::vector<fs::path> JsonFilesIn(const fs::path& dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return files;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace

FsCellRepository::FsCellRepository(std::string rootDir, std::shared_ptr<PersistenceService> persistence)
    : m_rootDir(std::move(rootDir)), m_persistence(std::move(persistence)) {
    rehydrate();
}

void FsCellRepository::flush() {
    m_persistence->flush();
}

std::string FsCellRepository::jobPath(const std::string& jobId) const {
    return (fs::path(m_rootDir) / "jobs" / (jobId + ".json")).string();
}

std::string FsCellRepository::cellPath(const std::string& cellId) const {
    return (fs::path(m_rootDir) / "cells" / (cellId + ".json")).string();
}

std::string FsCellRepository::auditPath(const std::string& cellId) const {
    return (fs::path(m_rootDir) / "audit" / (cellId + ".ndjson")).string();
}

void FsCellRepository::onJobSaved(const Job& job) {
    m_persistence->enqueueWrite(jobPath(job.id), JobToJson(job).dump(2));
}

void FsCellRepository::onCellCommitted(const CellRecord& record, const std::vector<AuditEntry>& log) {
    m_persistence->enqueueWrite(cellPath(record.cellId), CellToJson(record).dump(2));

    // The whole log is rewritten so the file is always a complete, ordered log.
    std::stringstream content;
    for (const auto& entry : log) {
        content << AuditEntryToJson(entry).dump() << "\n";
    }
    m_persistence->enqueueWrite(auditPath(record.cellId), content.str());
}

std::vector<AuditEntry> FsCellRepository::readAuditLog(const std::string& cellId) const {
    std::vector<AuditEntry> entries;
    std::ifstream in(auditPath(cellId));
    if (!in) return entries;

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) continue;
        try {
            entries.push_back(AuditEntryFromJson(json::parse(line)));
        } catch (const std::exception& e) {
            std::cerr << "[FsCellRepository] Malformed audit line " << lineNo
                      << " for cell " << cellId << ": " << e.what() << std::endl;
        }
    }
    return entries;
}

void FsCellRepository::rehydrate() {
    const fs::path root(m_rootDir);
    std::size_t jobCount = 0;
    std::size_t cellCount = 0;

    for (const auto& path : JsonFilesIn(root / "jobs")) {
        auto j = ReadJsonFile(path);
        if (!j) continue;
        try {
            Job job = JobFromJson(*j);
            // No task survives a restart, so an unfinished job can never finish.
            if (!IsTerminal(job.status)) {
                std::cerr << "[FsCellRepository] Job " << job.id << " was "
                          << JobStatusToString(job.status) << " at shutdown, marking it FAILED" << std::endl;
                job.status = JobStatus::Failed;
                job.errorMessage = kInterruptedMessage;
                job.finishedAt = std::chrono::system_clock::now();
                onJobSaved(job);
            }
            restoreJob(std::move(job));
            ++jobCount;
        } catch (const std::exception& e) {
            std::cerr << "[FsCellRepository] Invalid job file " << path << ": " << e.what() << std::endl;
        }
    }

    for (const auto& path : JsonFilesIn(root / "cells")) {
        auto j = ReadJsonFile(path);
        if (!j) continue;
        try {
            CellRecord record = CellFromJson(*j);
            auto log = readAuditLog(record.cellId);
            restoreCell(std::move(record), std::move(log));
            ++cellCount;
        } catch (const std::exception& e) {
            std::cerr << "[FsCellRepository] Invalid cell file " << path << ": " << e.what() << std::endl;
        }
    }

    if (jobCount > 0 || cellCount > 0) {
        std::cout << "[FsCellRepository] Rehydrated " << jobCount << " jobs and "
                  << cellCount << " cells from " << m_rootDir << std::endl;
    }
}

} // namespace lextable::infrastructure
