/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unordered_map>

namespace lextable::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() {
    m_writer = std::thread(&PersistenceService::writerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) return;
        m_stopping = true;
    }
    m_wakeCv.notify_all();

    if (m_writer.joinable()) {
        m_writer.join();
    }
}

void PersistenceService::enqueueWrite(const std::string& path, std::string content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            std::cerr << "[PersistenceService] Write after stop ignored: " << path << std::endl;
            return;
        }
        m_pending.push_back(PendingWrite{path, std::move(content)});
    }
    m_wakeCv.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] {
        return m_pending.empty() && !m_writing;
    });
}

std::vector<PendingWrite> PersistenceService::Coalesce(std::vector<PendingWrite> batch) {
    // Keep the last write per path, in the order of those last writes.
    std::unordered_map<std::string, std::size_t> last;
    for (std::size_t i = 0; i < batch.size(); ++i) {
        last[batch[i].path] = i;
    }
    std::vector<PendingWrite> result;
    result.reserve(last.size());
    for (std::size_t i = 0; i < batch.size(); ++i) {
        if (last[batch[i].path] == i) {
            result.push_back(std::move(batch[i]));
        }
    }
    return result;
}

void PersistenceService::writerLoop() {
    while (true) {
        std::vector<PendingWrite> batch;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_wakeCv.wait(lock, [this] {
                return !m_pending.empty() || m_stopping;
            });
            if (m_pending.empty()) {
                // Only reachable when stopping.
                m_idleCv.notify_all();
                return;
            }
            batch.swap(m_pending);
            m_writing = true;
        }

        for (const auto& write : Coalesce(std::move(batch))) {
            if (replaceFile(write)) {
                m_completedWrites++;
            } else {
                m_failedWrites++;
            }
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_writing = false;
        }
        m_idleCv.notify_all();
    }
}

bool PersistenceService::replaceFile(const PendingWrite& write) {
    const fs::path target = write.path;
    fs::path temp = target;
    temp += ".tmp" + std::to_string(m_tempCounter++);

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            std::cerr << "[PersistenceService] Cannot create " << target.parent_path() << ": " << ec.message() << std::endl;
            return false;
        }
    }

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            std::cerr << "[PersistenceService] Cannot open " << temp << std::endl;
            return false;
        }
        out << write.content;
        out.flush();
        if (!out) {
            std::cerr << "[PersistenceService] Write failed: " << temp << std::endl;
            out.close();
            fs::remove(temp, ec);
            return false;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename to " << target << " failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(temp, cleanup);
        return false;
    }
    return true;
}

} // namespace lextable::infrastructure
