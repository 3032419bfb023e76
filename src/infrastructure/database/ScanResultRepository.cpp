#include "infrastructure/database/ScanResultRepository.hpp"

#include "infrastructure/serialization/JsonConvert.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <stdexcept>

#include <unistd.h>

namespace netsentry::infra {

namespace {

constexpr const char* RESTART_MESSAGE = "System restart during scan";

// Decodes a stored payload; corrupt rows are logged and skipped.
std::optional<core::ScanJob> decodePayload(const std::string& scanId, const std::string& payload) {
    auto parsed = nlohmann::json::parse(payload, nullptr, false);
    if (parsed.is_discarded()) {
        spdlog::warn("Scan job {} has a corrupt payload, skipping", scanId);
        return std::nullopt;
    }
    try {
        return parsed.get<core::ScanJob>();
    } catch (const std::exception& e) {
        spdlog::warn("Scan job {} could not be decoded: {}", scanId, e.what());
        return std::nullopt;
    }
}

bool ownedByLiveProcess(int64_t ownerPid) {
    if (ownerPid <= 0 || ownerPid == static_cast<int64_t>(getpid())) {
        return false;
    }
    return kill(static_cast<pid_t>(ownerPid), 0) == 0 || errno == EPERM;
}

} // namespace

ScanResultRepository::ScanResultRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("ScanResultRepository requires a database");
    }
}

void ScanResultRepository::save(const core::ScanJob& job) {
    std::lock_guard lock(mutex_);
    saveLocked(job);
}

void ScanResultRepository::saveLocked(const core::ScanJob& job) {
    nlohmann::json payload = job;
    SqlValue completedAt = nullptr;
    if (job.completedAt) {
        completedAt = core::toEpochMillis(*job.completedAt);
    }

    db_->run(R"(
        INSERT INTO scan_jobs (scan_id, network, scan_type, status, started_at, completed_at,
                               payload, owner_pid)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(scan_id) DO UPDATE SET
            network = excluded.network,
            scan_type = excluded.scan_type,
            status = excluded.status,
            started_at = excluded.started_at,
            completed_at = excluded.completed_at,
            payload = excluded.payload,
            owner_pid = excluded.owner_pid
    )",
             {job.scanId, job.network, core::scanTypeToString(job.scanType),
              core::scanStatusToString(job.status), core::toEpochMillis(job.startedAt),
              completedAt, payload.dump(), static_cast<int64_t>(getpid())});

    spdlog::debug("Saved scan job {} ({})", job.scanId, core::scanStatusToString(job.status));
}

std::optional<core::ScanJob> ScanResultRepository::findById(const std::string& scanId) {
    std::lock_guard lock(mutex_);

    auto stmt = db_->query("SELECT payload FROM scan_jobs WHERE scan_id = ?", {scanId});
    if (!stmt.step()) {
        return std::nullopt;
    }
    return decodePayload(scanId, stmt.columnText(0));
}

std::vector<core::ScanJob> ScanResultRepository::findAll(int limit) {
    std::lock_guard lock(mutex_);

    auto stmt = db_->query("SELECT scan_id, payload FROM scan_jobs ORDER BY started_at DESC LIMIT ?",
                           {static_cast<int64_t>(limit < 0 ? -1 : limit)});
    std::vector<core::ScanJob> jobs;
    while (stmt.step()) {
        if (auto job = decodePayload(stmt.columnText(0), stmt.columnText(1))) {
            jobs.push_back(std::move(*job));
        }
    }
    return jobs;
}

int ScanResultRepository::recoverInterrupted() {
    std::lock_guard lock(mutex_);

    std::vector<core::ScanJob> interrupted;
    {
        auto stmt = db_->query(
            "SELECT scan_id, payload, COALESCE(owner_pid, 0) FROM scan_jobs "
            "WHERE status IN ('running', 'pending')");
        while (stmt.step()) {
            auto scanId = stmt.columnText(0);
            auto ownerPid = stmt.columnInt64(2);
            if (ownedByLiveProcess(ownerPid)) {
                spdlog::debug("Scan job {} is still running in process {}", scanId, ownerPid);
                continue;
            }
            if (auto job = decodePayload(scanId, stmt.columnText(1))) {
                interrupted.push_back(std::move(*job));
            }
        }
    }

    auto now = std::chrono::system_clock::now();
    for (auto& job : interrupted) {
        spdlog::warn("Scan job {} was interrupted, marking as failed", job.scanId);
        job.status = core::ScanStatus::Failed;
        job.errorMessage = RESTART_MESSAGE;
        job.completedAt = now;
        saveLocked(job);
    }
    return static_cast<int>(interrupted.size());
}

bool ScanResultRepository::remove(const std::string& scanId) {
    std::lock_guard lock(mutex_);

    bool removed = db_->run("DELETE FROM scan_jobs WHERE scan_id = ?", {scanId}) > 0;
    if (removed) {
        spdlog::debug("Removed scan job {}", scanId);
    }
    return removed;
}

int ScanResultRepository::removeOlderThan(std::chrono::system_clock::time_point cutoff) {
    std::lock_guard lock(mutex_);

    int removed = db_->run("DELETE FROM scan_jobs WHERE COALESCE(completed_at, started_at) < ?",
                           {core::toEpochMillis(cutoff)});
    spdlog::info("Removed {} scan job(s) older than cutoff", removed);
    return removed;
}

int ScanResultRepository::count() {
    std::lock_guard lock(mutex_);
    auto stmt = db_->query("SELECT COUNT(*) FROM scan_jobs");
    return stmt.step() ? static_cast<int>(stmt.columnInt64(0)) : 0;
}

} // namespace netsentry::infra
