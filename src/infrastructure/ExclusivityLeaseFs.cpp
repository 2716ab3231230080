/**
 * @file ExclusivityLeaseFs.cpp
 * @brief Implementation of ExclusivityLeaseFs.
 */

#include "infrastructure/ExclusivityLeaseFs.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace stenodesk::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

class FileLock {
public:
    explicit FileLock(const std::string& path) {
        m_fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (m_fd >= 0 && ::flock(m_fd, LOCK_EX) != 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }
    ~FileLock() {
        if (m_fd >= 0) {
            ::flock(m_fd, LOCK_UN);
            ::close(m_fd);
        }
    }
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool held() const { return m_fd >= 0; }

private:
    int m_fd = -1;
};

} // namespace

ExclusivityLeaseFs::ExclusivityLeaseFs(std::string dataRoot, std::chrono::seconds staleAfter, NowFn now)
    : m_leasePath((fs::path(dataRoot) / "scheduler_lease.json").string()),
      m_lockPath((fs::path(dataRoot) / "scheduler_lease.lock").string()),
      m_staleAfter(staleAfter),
      m_now(std::move(now)) {
    if (!m_now) {
        m_now = [] { return Clock::now(); };
    }
    std::error_code ec;
    fs::create_directories(dataRoot, ec);
}

ExclusivityLeaseFs::Row ExclusivityLeaseFs::readRow() const {
    Row row;
    std::ifstream in(m_leasePath);
    if (!in.is_open()) {
        return row;
    }
    try {
        json j;
        in >> j;
        if (j.contains("owner") && j["owner"].is_string()) {
            row.owner = j["owner"].get<std::string>();
        }
        if (j.contains("updated_at") && j["updated_at"].is_number_integer()) {
            row.updatedAt = Clock::time_point(std::chrono::milliseconds(j["updated_at"].get<long long>()));
        }
    } catch (const std::exception& e) {
        std::cerr << "[ExclusivityLeaseFs] Lease file unreadable, treating as unowned: " << e.what() << std::endl;
        row = Row{};
    }
    return row;
}

bool ExclusivityLeaseFs::writeRow(const Row& row) const {
    json j;
    j["owner"] = row.owner.empty() ? json(nullptr) : json(row.owner);
    j["updated_at"] = row.updatedAt
        ? json(std::chrono::duration_cast<std::chrono::milliseconds>(row.updatedAt->time_since_epoch()).count())
        : json(nullptr);

    std::string tempPath = m_leasePath + ".tmp";
    {
        std::ofstream out(tempPath, std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[ExclusivityLeaseFs] Failed to open " << tempPath << std::endl;
            return false;
        }
        out << j.dump();
        out.flush();
        if (out.fail()) {
            std::cerr << "[ExclusivityLeaseFs] Write failed: " << tempPath << std::endl;
            return false;
        }
    }
    std::error_code ec;
    fs::rename(tempPath, m_leasePath, ec);
    if (ec) {
        std::cerr << "[ExclusivityLeaseFs] Rename failed: " << ec.message() << std::endl;
        return false;
    }
    return true;
}

bool ExclusivityLeaseFs::withLockedRow(const std::function<bool(Row&)>& fn) {
    std::lock_guard<std::mutex> guard(m_mutex);
    FileLock lock(m_lockPath);
    if (!lock.held()) {
        std::cerr << "[ExclusivityLeaseFs] Could not lock " << m_lockPath << ": " << std::strerror(errno) << std::endl;
        return false;
    }
    Row row = readRow();
    if (!fn(row)) {
        return false;
    }
    return writeRow(row);
}

bool ExclusivityLeaseFs::tryAcquire(const std::string& ownerId) {
    return withLockedRow([&](Row& row) {
        auto now = m_now();
        bool stale = !row.updatedAt || now - *row.updatedAt > m_staleAfter;
        if (!row.owner.empty() && row.owner != ownerId && !stale) {
            return false;
        }
        if (!row.owner.empty() && row.owner != ownerId) {
            std::cout << "[ExclusivityLeaseFs] Taking over stale lease from " << row.owner << std::endl;
        }
        row.owner = ownerId;
        row.updatedAt = now;
        return true;
    });
}

bool ExclusivityLeaseFs::touch(const std::string& ownerId) {
    return withLockedRow([&](Row& row) {
        if (row.owner != ownerId) {
            return false;
        }
        row.updatedAt = m_now();
        return true;
    });
}

bool ExclusivityLeaseFs::release(const std::string& ownerId) {
    return withLockedRow([&](Row& row) {
        if (row.owner != ownerId) {
            return false;
        }
        row.owner.clear();
        row.updatedAt.reset();
        return true;
    });
}

std::string ExclusivityLeaseFs::owner() {
    std::lock_guard<std::mutex> guard(m_mutex);
    FileLock lock(m_lockPath);
    return readRow().owner;
}

} // namespace stenodesk::infrastructure
