/**
 * @file ExclusivityLeaseFs.hpp
 * @brief File-backed scheduler lease guarded by an advisory flock.
 */

#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include "domain/ExclusivityLease.hpp"

namespace stenodesk::infrastructure {

/**
 * @class ExclusivityLeaseFs
 * @brief Lease row stored in <root>/scheduler_lease.json.
 *
 * Each operation reads, compares and rewrites the row while holding an
 * exclusive flock(2) on <root>/scheduler_lease.lock, so two processes never
 * both win tryAcquire.
 */
class ExclusivityLeaseFs : public domain::ExclusivityLease {
public:
    using Clock = std::chrono::system_clock;
    using NowFn = std::function<Clock::time_point()>;

    ExclusivityLeaseFs(std::string dataRoot,
                       std::chrono::seconds staleAfter = std::chrono::seconds(30),
                       NowFn now = nullptr);

    bool tryAcquire(const std::string& ownerId) override;
    bool touch(const std::string& ownerId) override;
    bool release(const std::string& ownerId) override;
    std::string owner() override;

private:
    struct Row {
        std::string owner;
        std::optional<Clock::time_point> updatedAt;
    };

    /** @brief Runs fn with the row under the file lock; writes the row back if fn returns true. */
    bool withLockedRow(const std::function<bool(Row&)>& fn);
    Row readRow() const;
    bool writeRow(const Row& row) const;

    std::string m_leasePath;
    std::string m_lockPath;
    std::chrono::seconds m_staleAfter;
    NowFn m_now;
    std::mutex m_mutex;
};

} // namespace stenodesk::infrastructure
