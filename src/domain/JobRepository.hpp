/**
 * @file JobRepository.hpp
 * @brief Interface for durable job records.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/Job.hpp"

namespace stenodesk::domain {

/**
 * @class JobRepository
 * @brief Abstract storage of one durable row per media item.
 *
 * Writes throw PersistenceError when the backing store fails.
 */
class JobRepository {
public:
    virtual ~JobRepository() = default;

    /** @brief Stores a brand new job. Throws PersistenceError if the id already exists. */
    virtual void insert(const Job& job) = 0;

    virtual std::optional<Job> findById(const std::string& id) = 0;

    /** @brief All jobs ordered by creation time. */
    virtual std::vector<Job> findAll() = 0;

    virtual std::vector<Job> findByStatus(JobStatus status) = 0;

    /**
     * @brief Oldest job with status queued.
     * Ordered by updatedAt, then createdAt.
     */
    virtual std::optional<Job> findOldestQueued() = 0;

    /**
     * @brief Applies a partial update, last writer wins.
     * @throws NotFoundError if the id is unknown.
     */
    virtual void update(const std::string& id, const JobUpdate& fields) = 0;

    /** @return False if no such job existed. */
    virtual bool remove(const std::string& id) = 0;
};

} // namespace stenodesk::domain
