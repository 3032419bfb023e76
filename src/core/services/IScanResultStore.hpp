/**
 * @file IScanResultStore.hpp
 * @brief Interface for durable storage of scan jobs.
 */

#pragma once

#include "core/types/ScanJob.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace netsentry::core {

/**
 * @brief Durable store holding one record per scan job.
 */
class IScanResultStore {
public:
    virtual ~IScanResultStore() = default;

    /**
     * @brief Inserts or replaces the record of a job.
     * @param job Job to persist.
     * @throws std::runtime_error on storage failure.
     */
    virtual void save(const ScanJob& job) = 0;

    /**
     * @brief Loads a job as stored. Reads never modify records.
     * @param scanId Job identifier.
     * @return The job, or std::nullopt if no record exists.
     */
    virtual std::optional<ScanJob> findById(const std::string& scanId) = 0;

    /**
     * @brief Loads the most recent jobs, newest first.
     * @param limit Maximum number of jobs.
     */
    virtual std::vector<ScanJob> findAll(int limit) = 0;

    /**
     * @brief Deletes a job record.
     * @param scanId Job identifier.
     * @return True if a record was deleted.
     */
    virtual bool remove(const std::string& scanId) = 0;

    /**
     * @brief Deletes records older than a cutoff.
     * @param cutoff Records completed (or started, if never completed) before this are removed.
     * @return Number of records removed.
     */
    virtual int removeOlderThan(std::chrono::system_clock::time_point cutoff) = 0;
};

} // namespace netsentry::core
