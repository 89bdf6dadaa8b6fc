/**
 * @file Identifiers.hpp
 * @brief Id generation for jobs, cells and documents.
 */

#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace lextable::domain {

inline std::string Fnv1a64Hex(const std::string& input) {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : input) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << hash;
    return ss.str();
}

// Cell ids are a pure function of (job, document, field).
inline std::string MakeCellId(const std::string& jobId, const std::string& documentId, const std::string& fieldKey) {
    return Fnv1a64Hex(jobId + '\x1f' + documentId + '\x1f' + fieldKey);
}

inline std::string GenerateJobId() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::ostringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(16) << engine()
       << std::setw(16) << engine();
    return ss.str();
}

} // namespace lextable::domain
