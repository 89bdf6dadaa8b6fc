/**
 * @file JsonCodec.hpp
 * @brief JSON mapping of the records the engine exchanges with its collaborators.
 */

#pragma once

#include <chrono>
#include <nlohmann/json.hpp>

#include "domain/Citation.hpp"
#include "domain/Job.hpp"
#include "domain/review/AuditEntry.hpp"
#include "domain/review/Cell.hpp"

namespace lextable::infrastructure {

// Timestamps travel as milliseconds since the epoch.
long long ToEpochMillis(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point FromEpochMillis(long long ms);

nlohmann::json CitationToJson(const domain::Citation& citation);
domain::Citation CitationFromJson(const nlohmann::json& j);

nlohmann::json CellToJson(const domain::review::CellRecord& cell);
domain::review::CellRecord CellFromJson(const nlohmann::json& j);

nlohmann::json AuditEntryToJson(const domain::review::AuditEntry& entry);
domain::review::AuditEntry AuditEntryFromJson(const nlohmann::json& j);

nlohmann::json JobToJson(const domain::Job& job);
domain::Job JobFromJson(const nlohmann::json& j);

} // namespace lextable::infrastructure
