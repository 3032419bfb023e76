#include <catch2/catch_test_macros.hpp>

#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/ScanResultRepository.hpp"
#include "infrastructure/serialization/JsonConvert.hpp"

#include <filesystem>
#include <stdexcept>

#include <unistd.h>

using namespace netsentry::core;
using namespace netsentry::infra;

namespace {

class TestDatabase {
public:
    TestDatabase() : dbPath_(std::filesystem::temp_directory_path() / "netsentry_scan_jobs_test.db") {
        std::filesystem::remove(dbPath_);
        db_ = std::make_shared<Database>(dbPath_.string());
        db_->runMigrations();
    }

    ~TestDatabase() {
        db_.reset();
        std::filesystem::remove(dbPath_);
        std::filesystem::remove(dbPath_.string() + "-wal");
        std::filesystem::remove(dbPath_.string() + "-shm");
    }

    std::shared_ptr<Database> get() { return db_; }
    const std::filesystem::path& path() const { return dbPath_; }

private:
    std::filesystem::path dbPath_;
    std::shared_ptr<Database> db_;
};

ScanJob makeJob(const std::string& id, int64_t startedMillis, ScanStatus status) {
    ScanJob job;
    job.scanId = id;
    job.network = "192.168.1.0/24";
    job.scanType = ScanType::Ping;
    job.status = status;
    job.startedAt = fromEpochMillis(startedMillis);
    job.totalHosts = 254;
    if (status == ScanStatus::Completed || status == ScanStatus::Failed) {
        job.completedAt = fromEpochMillis(startedMillis + 60000);
        job.scannedHosts = 254;
    }
    if (status == ScanStatus::Failed) {
        job.errorMessage = "Host discovery of 192.168.1.0/24 failed";
    }
    return job;
}

} // namespace

TEST_CASE("Database schema", "[Database]") {
    TestDatabase testDb;
    auto db = testDb.get();

    REQUIRE(db->schemaVersion() == 2);
    REQUIRE_NOTHROW(db->runMigrations());
    REQUIRE(db->schemaVersion() == 2);

    SECTION("Transaction rollback") {
        REQUIRE_THROWS(db->transaction([&]() {
            db->run("INSERT INTO scan_jobs (scan_id, network, scan_type, status, started_at, "
                    "payload) VALUES (?, ?, ?, ?, ?, ?)",
                    {std::string("x"), std::string("n"), std::string("ping"),
                     std::string("running"), int64_t{0}, std::string("{}")});
            throw std::runtime_error("abort");
        }));
        auto stmt = db->query("SELECT COUNT(*) FROM scan_jobs");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnInt64(0) == 0);
    }

    SECTION("run reports changed rows") {
        REQUIRE(db->run("DELETE FROM scan_jobs") == 0);
    }

    SECTION("Invalid SQL throws") {
        REQUIRE_THROWS_AS(db->execute("SELECT FROM nowhere"), std::runtime_error);
        REQUIRE_THROWS_AS(db->query("SELECT nothing FROM nowhere"), std::runtime_error);
    }
}

TEST_CASE("ScanResultRepository operations", "[Database][ScanResultRepository]") {
    TestDatabase testDb;
    ScanResultRepository repo(testDb.get());

    SECTION("Save and load") {
        auto job = makeJob("a", 1700000000000, ScanStatus::Completed);
        DiscoveredDevice device;
        device.ip = "192.168.1.1";
        device.openPorts = {22};
        device.deviceType = DeviceType::Firewall;
        job.discoveredDevices.push_back(device);

        repo.save(job);
        auto loaded = repo.findById("a");
        REQUIRE(loaded.has_value());
        REQUIRE(*loaded == job);
        REQUIRE_FALSE(repo.findById("missing").has_value());
    }

    SECTION("Save replaces the existing record") {
        auto job = makeJob("a", 1700000000000, ScanStatus::Completed);
        repo.save(job);
        job.scannedHosts = 10;
        repo.save(job);
        REQUIRE(repo.count() == 1);
        REQUIRE(repo.findById("a")->scannedHosts == 10);
    }

    SECTION("findAll is newest first and limited") {
        repo.save(makeJob("old", 1700000000000, ScanStatus::Completed));
        repo.save(makeJob("new", 1700000200000, ScanStatus::Completed));
        repo.save(makeJob("mid", 1700000100000, ScanStatus::Failed));

        auto all = repo.findAll(10);
        REQUIRE(all.size() == 3);
        REQUIRE(all[0].scanId == "new");
        REQUIRE(all[1].scanId == "mid");
        REQUIRE(all[2].scanId == "old");

        REQUIRE(repo.findAll(2).size() == 2);
        REQUIRE(repo.findAll(-1).size() == 3);
    }

    SECTION("Remove") {
        repo.save(makeJob("a", 1700000000000, ScanStatus::Completed));
        REQUIRE(repo.remove("a"));
        REQUIRE_FALSE(repo.remove("a"));
        REQUIRE(repo.count() == 0);
    }

    SECTION("removeOlderThan uses completion, then start time") {
        repo.save(makeJob("done-early", 1000000, ScanStatus::Completed)); // completed at 1060000
        repo.save(makeJob("done-late", 2000000, ScanStatus::Completed));  // completed at 2060000
        repo.save(makeJob("running", 1500000, ScanStatus::Running));

        REQUIRE(repo.removeOlderThan(fromEpochMillis(1600000)) == 2);
        REQUIRE(repo.count() == 1);
        REQUIRE(repo.findAll(10)[0].scanId == "done-late");
    }
}

TEST_CASE("ScanResultRepository recovers interrupted scans", "[Database][ScanResultRepository]") {
    TestDatabase testDb;
    ScanResultRepository repo(testDb.get());

    repo.save(makeJob("interrupted", 1700000000000, ScanStatus::Running));
    repo.save(makeJob("queued", 1700000000500, ScanStatus::Pending));
    repo.save(makeJob("done", 1700000001000, ScanStatus::Completed));

    SECTION("Reads leave running records untouched") {
        REQUIRE(repo.findById("interrupted")->status == ScanStatus::Running);
        repo.findAll(10);
        auto stmt = testDb.get()->query("SELECT status FROM scan_jobs WHERE scan_id = ?",
                                        {std::string("interrupted")});
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnText(0) == "running");
    }

    SECTION("Recovery rewrites them as failed") {
        REQUIRE(repo.recoverInterrupted() == 2);

        auto job = repo.findById("interrupted");
        REQUIRE(job->status == ScanStatus::Failed);
        REQUIRE(job->errorMessage == "System restart during scan");
        REQUIRE(job->completedAt.has_value());
        REQUIRE(repo.findById("queued")->status == ScanStatus::Failed);
        REQUIRE(repo.findById("done")->status == ScanStatus::Completed);

        auto stmt = testDb.get()->query("SELECT status FROM scan_jobs WHERE scan_id = ?",
                                        {std::string("interrupted")});
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnText(0) == "failed");

        REQUIRE(repo.recoverInterrupted() == 0);
    }

    SECTION("Scans owned by another live process are kept") {
        // The parent of the test process is alive for the whole run.
        testDb.get()->run("UPDATE scan_jobs SET owner_pid = ? WHERE scan_id = ?",
                          {static_cast<int64_t>(getppid()), std::string("interrupted")});

        REQUIRE(repo.recoverInterrupted() == 1);
        REQUIRE(repo.findById("interrupted")->status == ScanStatus::Running);
        REQUIRE(repo.findById("queued")->status == ScanStatus::Failed);
    }

    SECTION("Rows written before owners were recorded are recovered") {
        testDb.get()->run("UPDATE scan_jobs SET owner_pid = NULL");
        REQUIRE(repo.recoverInterrupted() == 2);
    }
}

TEST_CASE("ScanResultRepository skips corrupt rows", "[Database][ScanResultRepository]") {
    TestDatabase testDb;
    auto db = testDb.get();
    ScanResultRepository repo(db);

    repo.save(makeJob("good", 1700000000000, ScanStatus::Completed));
    db->run("INSERT INTO scan_jobs (scan_id, network, scan_type, status, started_at, payload) "
            "VALUES (?, ?, ?, ?, ?, ?)",
            {std::string("bad"), std::string("10.0.0.0/24"), std::string("ping"),
             std::string("completed"), int64_t{1700000001000}, std::string("{not json")});

    REQUIRE_FALSE(repo.findById("bad").has_value());
    auto all = repo.findAll(10);
    REQUIRE(all.size() == 1);
    REQUIRE(all[0].scanId == "good");
}

TEST_CASE("ScanResultRepository requires a database", "[ScanResultRepository]") {
    REQUIRE_THROWS_AS(ScanResultRepository(nullptr), std::invalid_argument);
}
