#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/ProcessRunner.hpp"

#include <chrono>

#include <sys/wait.h>

using namespace netsentry::infra;
using namespace std::chrono_literals;

TEST_CASE("ProcessRunner runs commands", "[ProcessRunner]") {
    ProcessRunner runner;

    SECTION("Standard output is captured") {
        auto result = runner.run("/bin/sh", {"-c", "printf 'up\\n10.0.0.1\\n'"}, 5s);
        REQUIRE(result.started);
        REQUIRE_FALSE(result.timedOut);
        REQUIRE(result.exitCode == 0);
        REQUIRE(result.succeeded());
        REQUIRE(result.output == "up\n10.0.0.1\n");
    }

    SECTION("Standard error is discarded") {
        auto result = runner.run("/bin/sh", {"-c", "echo noise >&2; echo data"}, 5s);
        REQUIRE(result.output == "data\n");
    }

    SECTION("Arguments are passed without a shell") {
        auto result = runner.run("/bin/sh", {"-c", "printf '%s' \"$0\"", "a b;c"}, 5s);
        REQUIRE(result.output == "a b;c");
    }

    SECTION("Names are resolved on PATH") {
        REQUIRE(runner.findExecutable("sh").has_value());
        auto result = runner.run("sh", {"-c", "exit 0"}, 5s);
        REQUIRE(result.succeeded());
    }
}

TEST_CASE("ProcessRunner reports failures", "[ProcessRunner]") {
    ProcessRunner runner;

    SECTION("Non-zero exit") {
        auto result = runner.run("/bin/sh", {"-c", "exit 1"}, 5s);
        REQUIRE(result.started);
        REQUIRE(result.exitCode == 1);
        REQUIRE_FALSE(result.succeeded());

        REQUIRE(runner.run("/bin/sh", {"-c", "exit 3"}, 5s).exitCode == 3);
    }

    SECTION("Missing executable") {
        auto result = runner.run("/nonexistent/netsentry-no-such-tool", {}, 5s);
        REQUIRE_FALSE(result.started);
        REQUIRE_FALSE(result.errorMessage.empty());

        REQUIRE_FALSE(runner.findExecutable("netsentry-no-such-tool").has_value());
        REQUIRE_FALSE(runner.run("netsentry-no-such-tool", {}, 5s).started);
    }

    SECTION("Wall-clock timeout kills and reaps the child") {
        auto start = std::chrono::steady_clock::now();
        auto result = runner.run("/bin/sh", {"-c", "sleep 5"}, 100ms);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(result.started);
        REQUIRE(result.timedOut);
        REQUIRE(result.exitCode == -1);
        REQUIRE_FALSE(result.succeeded());
        REQUIRE(result.errorMessage.find("timed out") != std::string::npos);
        REQUIRE(elapsed < 2s);

        int status = 0;
        REQUIRE(waitpid(-1, &status, WNOHANG) == -1);
    }

    SECTION("Output written before the timeout is kept") {
        auto result = runner.run("/bin/sh", {"-c", "echo partial; sleep 5"}, 300ms);
        REQUIRE(result.timedOut);
        REQUIRE(result.output == "partial\n");
    }
}
