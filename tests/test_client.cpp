/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/client.hpp"
#include "test_support.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <atomic>
#include <future>
#include <thread>
#include <vector>

using namespace scriba;
using namespace scriba::test;

namespace {
CallOptions within(std::chrono::milliseconds timeout) {
    CallOptions options;
    options.timeout = timeout;
    return options;
}
}

TEST_CASE("Client calls") {
    Worker worker(fakeWorkerOptions());
    Client client(worker);

    SUBCASE("the first call starts the worker") {
        CHECK_FALSE(worker.isRunning());
        auto pong = client.ping();
        REQUIRE(pong.ok);
        CHECK(pong.message.type == "pong");
        CHECK(worker.isRunning());
        CHECK(client.session() == 1);
        CHECK(client.pendingCount() == 0);
    }

    SUBCASE("progress is routed to the caller and does not resolve") {
        std::vector<int> seen;
        CallOptions options;
        options.onProgress = [&seen](const Progress& p) { seen.push_back(p.percent); };
        auto result = client.call(Json{{"type", "progressDemo"}}, options);
        REQUIRE(result.ok);
        CHECK(result.message.payload["value"] == "done");
        CHECK(seen == std::vector<int>{25, 50, 75});
    }

    SUBCASE("error replies reject with the worker's message") {
        auto result = client.call(Json{{"type", "bogus"}}, within(std::chrono::milliseconds(5000)));
        CHECK_FALSE(result.ok);
        CHECK(result.error == ErrorKind::Remote);
        CHECK(result.errorMessage == "Unknown request type: bogus");
    }

    SUBCASE("unrecognised reply types are ignored") {
        auto result = client.call(Json{{"type", "unknownReply"}}, within(std::chrono::milliseconds(5000)));
        REQUIRE(result.ok);
        CHECK(result.message.payload["value"] == "after mystery");
    }

    SUBCASE("requests must carry a type") {
        auto result = client.call(Json{{"value", 1}}, {});
        CHECK_FALSE(result.ok);
        CHECK(result.error == ErrorKind::Protocol);
        CHECK_FALSE(worker.isRunning());
    }

    SUBCASE("concurrent calls resolve out of order") {
        auto slow = std::async(std::launch::async, [&client] {
            return client.call(Json{{"type", "echo"}, {"delayMs", 400}, {"value", "slow"}},
                               within(std::chrono::milliseconds(5000)));
        });
        auto fast = std::async(std::launch::async, [&client] {
            return client.call(Json{{"type", "echo"}, {"delayMs", 10}, {"value", "fast"}},
                               within(std::chrono::milliseconds(5000)));
        });

        auto fastResult = fast.get();
        REQUIRE(fastResult.ok);
        CHECK(fastResult.message.payload["value"] == "fast");
        CHECK(slow.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready);

        auto slowResult = slow.get();
        REQUIRE(slowResult.ok);
        CHECK(slowResult.message.payload["value"] == "slow");
        CHECK(client.pendingCount() == 0);
    }

    SUBCASE("timeouts are bounded and forget the request") {
        auto begin = std::chrono::steady_clock::now();
        auto result = client.call(Json{{"type", "hang"}}, within(std::chrono::milliseconds(200)));
        auto elapsed = std::chrono::steady_clock::now() - begin;
        CHECK_FALSE(result.ok);
        CHECK(result.error == ErrorKind::Timeout);
        CHECK(result.errorMessage == "Request timeout");
        CHECK(elapsed >= std::chrono::milliseconds(200));
        CHECK(elapsed < std::chrono::milliseconds(2000));
        CHECK(client.pendingCount() == 0);

        // The worker is still usable
        CHECK(client.ping().ok);
    }

    SUBCASE("a crash rejects every pending request") {
        auto waiting = std::async(std::launch::async, [&client] {
            return client.call(Json{{"type", "hang"}}, within(std::chrono::milliseconds(10000)));
        });
        REQUIRE(waitFor([&client] { return client.pendingCount() == 1; }));

        auto crash = client.call(Json{{"type", "crash"}}, within(std::chrono::milliseconds(5000)));
        CHECK_FALSE(crash.ok);
        CHECK(crash.error == ErrorKind::WorkerExited);
        CHECK(crash.errorMessage == "Worker exited unexpectedly (exit code 3)");

        auto hung = waiting.get();
        CHECK_FALSE(hung.ok);
        CHECK(hung.error == ErrorKind::WorkerExited);

        // Restarted transparently
        REQUIRE(client.ping().ok);
        CHECK(client.session() == 2);
    }

    SUBCASE("cancel rejects pending requests and stops the worker") {
        REQUIRE(client.ping().ok);
        auto waiting = std::async(std::launch::async, [&client] {
            return client.call(Json{{"type", "hang"}}, within(std::chrono::milliseconds(10000)));
        });
        REQUIRE(waitFor([&client] { return client.pendingCount() == 1; }));

        auto begin = std::chrono::steady_clock::now();
        client.cancel();
        auto hung = waiting.get();
        CHECK(std::chrono::steady_clock::now() - begin < std::chrono::milliseconds(3000));
        CHECK_FALSE(hung.ok);
        CHECK(hung.error == ErrorKind::Cancelled);
        CHECK(hung.errorMessage == "Transcription cancelled");
        CHECK_FALSE(worker.isRunning());

        // Refused without restarting the worker until resumed
        auto refused = client.ping();
        CHECK(refused.error == ErrorKind::Cancelled);
        CHECK_FALSE(worker.isRunning());
        CHECK(client.session() == 1);

        client.resume();
        REQUIRE(client.ping().ok);
        CHECK(client.session() == 2);
    }

    SUBCASE("a timed out call waits for its running progress callback") {
        std::atomic<int> entered{0};
        std::atomic<bool> finished{false};
        CallOptions options = within(std::chrono::milliseconds(100));
        options.onProgress = [&entered, &finished](const Progress&) {
            if (entered++ == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
                finished = true;
            }
        };

        auto result = client.call(Json{{"type", "progressDemo"}}, options);
        CHECK_FALSE(result.ok);
        CHECK(result.error == ErrorKind::Timeout);
        CHECK(finished.load());

        // Later progress for the abandoned request is dropped
        REQUIRE(client.ping().ok);
        CHECK(entered.load() == 1);
    }
}

TEST_CASE("Client startup failures") {
    auto options = fakeWorkerOptions("noready");
    options.startupTimeout = std::chrono::milliseconds(200);
    Worker worker(options);
    Client client(worker);

    auto result = client.ping();
    CHECK_FALSE(result.ok);
    CHECK(result.error == ErrorKind::Startup);
    CHECK(result.errorMessage.find("did not become ready") != std::string::npos);

    std::string error;
    CHECK_FALSE(client.ensureRunning(error));
    CHECK(error.find("Worker failed to start") == 0);
    CHECK(std::string(errorKindName(ErrorKind::Startup)) == "startup");
}
