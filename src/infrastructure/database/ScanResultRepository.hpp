#pragma once

#include "core/services/IScanResultStore.hpp"
#include "infrastructure/database/Database.hpp"

#include <memory>
#include <mutex>

namespace netsentry::infra {

/**
 * @brief SQLite-backed store of scan jobs.
 *
 * Each job is one row of the scan_jobs table. The indexed columns (network,
 * type, status, start and completion times) are kept beside a JSON payload
 * holding every ScanJob field; the payload is the source of truth on load.
 * Every save records the id of the process that wrote it, so a scan still
 * owned by a live process is never mistaken for an interrupted one.
 */
class ScanResultRepository : public core::IScanResultStore {
public:
    /**
     * @brief Constructs the repository.
     * @param db Open database with migrations applied.
     */
    explicit ScanResultRepository(std::shared_ptr<Database> db);

    void save(const core::ScanJob& job) override;
    std::optional<core::ScanJob> findById(const std::string& scanId) override;
    std::vector<core::ScanJob> findAll(int limit) override;
    bool remove(const std::string& scanId) override;
    int removeOlderThan(std::chrono::system_clock::time_point cutoff) override;

    /**
     * @brief Marks scans left running or pending by a dead process as failed.
     *
     * Run once at startup, before any scan is started. Rows owned by another
     * live process are left alone.
     *
     * @return Number of jobs rewritten as failed.
     */
    int recoverInterrupted();

    /**
     * @brief Counts stored jobs.
     */
    int count();

private:
    void saveLocked(const core::ScanJob& job);

    std::shared_ptr<Database> db_;
    std::mutex mutex_;
};

} // namespace netsentry::infra
