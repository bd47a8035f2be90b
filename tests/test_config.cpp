/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/config.hpp"
#include "scriba/scanner.hpp"
#include "scriba/store.hpp"
#include "test_support.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdlib>

using namespace scriba;
using namespace scriba::test;

namespace {
// Sets an environment variable for one scope.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* name_;
};
}

TEST_CASE("splitCommand") {
    CHECK(splitCommand("").empty());
    CHECK(splitCommand("   ").empty());
    CHECK(splitCommand("python3") == std::vector<std::string>{"python3"});
    CHECK(splitCommand("  python3   worker.py --fast ") ==
          std::vector<std::string>{"python3", "worker.py", "--fast"});
    CHECK(splitCommand("\"/opt/my models/run\" -v") ==
          std::vector<std::string>{"/opt/my models/run", "-v"});
    CHECK(splitCommand("a\tb") == std::vector<std::string>{"a", "b"});
    CHECK(splitCommand("--name \"\"") == std::vector<std::string>{"--name", ""});
}

TEST_CASE("Config::fromEnv") {
    SUBCASE("defaults") {
        auto config = Config::fromEnv();
        CHECK(config.workerCommand == std::vector<std::string>{"scriba-worker"});
        CHECK(config.diarizerCommand.empty());
        CHECK(config.chunkSeconds == doctest::Approx(30.0));
        CHECK(config.overlapSeconds == doctest::Approx(1.0));
        CHECK(config.startupTimeout == std::chrono::milliseconds(10000));
        CHECK(config.scanInterval == std::chrono::milliseconds(5000));
    }

    SUBCASE("overrides") {
        ScopedEnv worker("SCRIBA_WORKER", "python3 -u worker.py");
        ScopedEnv diarizer("SCRIBA_DIARIZER", "diarize-worker");
        ScopedEnv models("SCRIBA_MODELS_DIR", "/srv/models");
        ScopedEnv startup("SCRIBA_STARTUP_TIMEOUT_MS", "2500");
        ScopedEnv chunk("SCRIBA_CHUNK_SECONDS", "20");
        ScopedEnv overlap("SCRIBA_OVERLAP_SECONDS", "0.5");

        auto config = Config::fromEnv();
        CHECK(config.workerCommand == std::vector<std::string>{"python3", "-u", "worker.py"});
        CHECK(config.diarizerCommand == std::vector<std::string>{"diarize-worker"});
        CHECK(config.modelsDir == std::filesystem::path("/srv/models"));
        CHECK(config.startupTimeout == std::chrono::milliseconds(2500));
        CHECK(config.chunkSeconds == doctest::Approx(20.0));
        CHECK(config.overlapSeconds == doctest::Approx(0.5));

        auto options = config.transcriberOptions();
        CHECK(options.chunkSeconds == doctest::Approx(20.0));
        auto workerOptions = config.workerOptions("transcriber", config.workerCommand);
        CHECK(workerOptions.name == "transcriber");
        CHECK(workerOptions.startupTimeout == std::chrono::milliseconds(2500));
    }

    SUBCASE("invalid values keep the defaults") {
        ScopedEnv startup("SCRIBA_STARTUP_TIMEOUT_MS", "soon");
        ScopedEnv scan("SCRIBA_SCAN_INTERVAL_MS", "5");
        ScopedEnv chunk("SCRIBA_CHUNK_SECONDS", "1");
        ScopedEnv overlap("SCRIBA_OVERLAP_SECONDS", "2");

        auto config = Config::fromEnv();
        CHECK(config.startupTimeout == std::chrono::milliseconds(10000));
        CHECK(config.scanInterval == std::chrono::milliseconds(5000));
        CHECK(config.chunkSeconds == doctest::Approx(30.0));
        CHECK(config.overlapSeconds == doctest::Approx(1.0));
    }
}

TEST_CASE("Config::validate") {
    TempDir dir("config");
    Config config;
    config.workspace = dir.path();
    std::string error;
    CHECK(config.validate(error));

    SUBCASE("workspace") {
        config.workspace.clear();
        CHECK_FALSE(config.validate(error));
        CHECK(error == "No workspace directory given");
    }

    SUBCASE("worker command") {
        config.workerCommand.clear();
        CHECK_FALSE(config.validate(error));
        CHECK(error == "No worker command configured");
    }

    SUBCASE("chunking") {
        config.overlapSeconds = 30.0;
        CHECK_FALSE(config.validate(error));
        CHECK(error == "Chunk overlap must be shorter than the chunk length");
    }

    SUBCASE("worker directory") {
        config.workerDirectory = dir.path() / "missing";
        CHECK_FALSE(config.validate(error));
        CHECK(error.find("Worker directory does not exist") == 0);
    }
}

TEST_CASE("Scanner") {
    TempDir dir("scanner");
    Scanner scanner(dir.path());

    // No workspace yet
    CHECK(scanner.scan().empty());
    CHECK_FALSE(scanner.hasNewJobs());

    FileStore store(dir.path());
    for (const char* id : {"300_1_0", "100_1_0", "200_1_0"}) {
        Job job;
        job.id = id;
        job.fileName = "a.wav";
        REQUIRE(store.create(job));
    }
    // Half-written directories are not jobs yet
    std::filesystem::create_directories(dir.path() / "pending" / "400_1_0");
    std::ofstream(dir.path() / "pending" / "500_1_0.json") << "{}";

    CHECK(scanner.scan() == std::vector<JobId>{"100_1_0", "200_1_0", "300_1_0"});
    CHECK(scanner.hasNewJobs());
    CHECK(scanner.pendingJobCount() == 3);

    auto job = *store.get("100_1_0");
    job.status = Status::Completed;
    REQUIRE(store.update(job));
    CHECK(scanner.pendingJobCount() == 2);
}
