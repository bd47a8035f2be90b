/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/codec.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace scriba;

TEST_CASE("encode") {
    SUBCASE("one line terminated by a newline") {
        auto line = encode(Json{{"type", "transcribe"}, {"text", "a\nb"}}, "7");
        REQUIRE(!line.empty());
        CHECK(line.back() == '\n');
        CHECK(line.find('\n') == line.size() - 1);

        auto decoded = decodeLine(line.substr(0, line.size() - 1));
        REQUIRE(decoded.ok);
        CHECK(decoded.message.type == "transcribe");
        CHECK(decoded.message.id == "7");
        CHECK(decoded.message.payload["text"] == "a\nb");
    }

    SUBCASE("no id when none is given") {
        auto decoded = decodeLine(encode(Json{{"type", "ping"}}));
        REQUIRE(decoded.ok);
        CHECK_FALSE(decoded.message.hasId());
        CHECK_FALSE(decoded.message.payload.contains("id"));
    }
}

TEST_CASE("decodeLine") {
    SUBCASE("rejects invalid json") {
        auto decoded = decodeLine("{not json");
        CHECK_FALSE(decoded.ok);
        CHECK(decoded.error.find("Invalid JSON") == 0);
    }

    SUBCASE("rejects non-objects") {
        CHECK_FALSE(decodeLine("[1,2]").ok);
        CHECK_FALSE(decodeLine("42").ok);
    }

    SUBCASE("requires a string type") {
        CHECK_FALSE(decodeLine(R"({"id":"1"})").ok);
        CHECK_FALSE(decodeLine(R"({"type":3})").ok);
    }

    SUBCASE("numeric ids become strings") {
        auto decoded = decodeLine(R"({"type":"pong","id":12})");
        REQUIRE(decoded.ok);
        CHECK(decoded.message.id == "12");
    }
}

TEST_CASE("messageKind") {
    CHECK(messageKind("ready") == MessageKind::Ready);
    CHECK(messageKind("progress") == MessageKind::Progress);
    CHECK(messageKind("error") == MessageKind::Error);
    CHECK(messageKind("pong") == MessageKind::Pong);
    for (const char* type : {"result", "modelLoaded", "prepared", "diarizationResult", "availableModels"}) {
        CHECK(messageKind(type) == MessageKind::Result);
    }
    CHECK(messageKind("mystery") == MessageKind::Unknown);
    CHECK(messageKind("") == MessageKind::Unknown);
}

TEST_CASE("progressFrom") {
    auto decoded = decodeLine(R"({"type":"progress","id":"1","percent":150.4,"stage":"decoding","message":"hi"})");
    REQUIRE(decoded.ok);
    auto progress = progressFrom(decoded.message);
    CHECK(progress.percent == 100);
    CHECK(progress.stage == "decoding");
    CHECK(progress.message == "hi");

    auto bare = progressFrom(decodeLine(R"({"type":"progress","id":"1"})").message);
    CHECK(bare.percent == -1);
    CHECK(bare.stage.empty());
}

TEST_CASE("LineDecoder") {
    SUBCASE("buffers partial lines across feeds") {
        LineDecoder decoder;
        CHECK(decoder.feed(R"({"type":"re)").empty());
        CHECK(decoder.buffered() > 0);
        auto out = decoder.feed("ady\"}\n{\"type\":\"pong\",\"id\":\"1\"}\n");
        REQUIRE(out.size() == 2);
        CHECK(out[0].message.type == "ready");
        CHECK(out[1].message.type == "pong");
        CHECK(decoder.buffered() == 0);
    }

    SUBCASE("skips blank lines and strips carriage returns") {
        LineDecoder decoder;
        auto out = decoder.feed("\n  \r\n{\"type\":\"ready\"}\r\n\n");
        REQUIRE(out.size() == 1);
        CHECK(out[0].ok);
        CHECK(out[0].message.type == "ready");
    }

    SUBCASE("a bad line does not lose its neighbours") {
        LineDecoder decoder;
        auto out = decoder.feed("{\"type\":\"a\"}\ngarbage\n{\"type\":\"b\"}\n");
        REQUIRE(out.size() == 3);
        CHECK(out[0].ok);
        CHECK_FALSE(out[1].ok);
        CHECK(out[2].ok);
        CHECK(out[2].message.type == "b");
    }

    SUBCASE("flush decodes an unterminated tail") {
        LineDecoder decoder;
        CHECK(decoder.feed(R"({"type":"result","id":"3"})").empty());
        auto tail = decoder.flush();
        REQUIRE(tail.has_value());
        CHECK(tail->ok);
        CHECK(tail->message.id == "3");
        CHECK_FALSE(decoder.flush().has_value());
    }

    SUBCASE("oversized lines are dropped and decoding resumes") {
        LineDecoder decoder(32);
        auto out = decoder.feed(std::string(40, 'x'));
        REQUIRE(out.size() == 1);
        CHECK_FALSE(out[0].ok);

        out = decoder.feed(std::string(20, 'y') + "\n{\"type\":\"ready\"}\n");
        REQUIRE(out.size() == 1);
        CHECK(out[0].ok);
        CHECK(out[0].message.type == "ready");
    }
}

TEST_CASE("IdGenerator") {
    IdGenerator ids;
    CHECK(ids.next() == "1");
    CHECK(ids.next() == "2");

    std::set<std::string> seen;
    std::mutex mutex;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 250; ++i) {
                auto id = ids.next();
                std::lock_guard<std::mutex> lock(mutex);
                seen.insert(id);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    CHECK(seen.size() == 1000);
}
