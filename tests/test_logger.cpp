/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/logger.hpp"
#include "test_support.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <sstream>

using namespace scriba;
using namespace scriba::test;

namespace {
std::string slurp(const std::filesystem::path& file) {
    std::ifstream in(file);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}
}

TEST_CASE("Logger file sink") {
    TempDir dir("logger");
    auto file = dir.path() / "logs" / "scriba.log";
    Logger::setLevel(LogLevel::INFO);

    SUBCASE("lines above the threshold reach the file") {
        Logger::setLogFile(file, 1024 * 1024);
        setThreadName("Tester");
        LOG_INFO("job queued");
        LOG_DEBUG("not shown");
        LOG_ERROR("job failed");
        Logger::setLogFile({}, 0);

        auto text = slurp(file);
        CHECK(text.find("[INFO ] [Tester] job queued") != std::string::npos);
        CHECK(text.find("[ERROR] [Tester] job failed") != std::string::npos);
        CHECK(text.find("not shown") == std::string::npos);
    }

    SUBCASE("the file rotates past its size limit") {
        Logger::setLogFile(file, 200);
        for (int i = 0; i < 10; ++i) {
            LOG_WARN("line " + std::to_string(i));
        }
        Logger::setLogFile({}, 0);

        auto rotated = file;
        rotated += ".1";
        CHECK(std::filesystem::exists(rotated));
        CHECK((slurp(rotated) + slurp(file)).find("line 9") != std::string::npos);
        CHECK(std::filesystem::file_size(file) < 400);
    }

    SUBCASE("the threshold can be changed") {
        Logger::setLevel(LogLevel::TRACE);
        CHECK(Logger::level() == LogLevel::TRACE);
        Logger::setLevel(LogLevel::INFO);
    }
}
