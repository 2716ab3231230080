/**
 * @file ExclusivityLease.hpp
 * @brief Interface for the persisted single-scheduler lease.
 */

#pragma once

#include <string>

namespace stenodesk::domain {

/**
 * @class ExclusivityLease
 * @brief Heartbeat-renewed ownership record that keeps a second scheduler
 * process from driving the executor after an unclean restart.
 */
class ExclusivityLease {
public:
    virtual ~ExclusivityLease() = default;

    /**
     * @brief Atomic compare-and-set.
     * Succeeds when the lease is unowned, already owned by ownerId, or stale.
     */
    virtual bool tryAcquire(const std::string& ownerId) = 0;

    /** @brief Refreshes the heartbeat. No-op (returns false) if ownerId is not the owner. */
    virtual bool touch(const std::string& ownerId) = 0;

    /** @brief Clears owner and timestamp. No-op (returns false) if ownerId is not the owner. */
    virtual bool release(const std::string& ownerId) = 0;

    /** @brief Current owner, empty when unowned. */
    virtual std::string owner() = 0;
};

} // namespace stenodesk::domain
