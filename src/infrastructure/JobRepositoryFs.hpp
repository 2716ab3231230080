/**
 * @file JobRepositoryFs.hpp
 * @brief File system implementation of the JobRepository.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include "domain/JobRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace stenodesk::infrastructure {

/**
 * @class JobRepositoryFs
 * @brief One JSON document per job under <root>/jobs/<id>.json.
 *
 * Documents are loaded into an in-memory index at construction. Every write
 * goes through the PersistenceService and is awaited, so a failed write
 * leaves the index untouched and surfaces as PersistenceError.
 */
class JobRepositoryFs : public domain::JobRepository {
public:
    JobRepositoryFs(std::string dataRoot, std::shared_ptr<PersistenceService> persistence);

    void insert(const domain::Job& job) override;
    std::optional<domain::Job> findById(const std::string& id) override;
    std::vector<domain::Job> findAll() override;
    std::vector<domain::Job> findByStatus(domain::JobStatus status) override;
    std::optional<domain::Job> findOldestQueued() override;
    void update(const std::string& id, const domain::JobUpdate& fields) override;
    bool remove(const std::string& id) override;

    static nlohmann::json ToJson(const domain::Job& job);
    static domain::Job FromJson(const nlohmann::json& j);

private:
    void loadAll();
    std::string pathFor(const std::string& id) const;
    void write(const domain::Job& job);

    std::string m_jobsDir;
    std::shared_ptr<PersistenceService> m_persistence;

    std::mutex m_mutex;
    std::map<std::string, domain::Job> m_jobs;
};

} // namespace stenodesk::infrastructure
