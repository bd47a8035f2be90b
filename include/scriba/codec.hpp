/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace scriba {

using Json = nlohmann::json;

// Wire format: one JSON object per line, `type` required, `id` echoed back on
// every response to a request.
inline constexpr std::size_t kDefaultMaxLineBytes = 16 * 1024 * 1024;

enum class MessageKind : uint8_t {
    Ready,
    Progress,
    Result,
    Error,
    Pong,
    Unknown
};

struct Message {
    std::string type;
    std::string id;     // empty when the message carries none
    Json payload;       // the whole decoded object

    [[nodiscard]] bool hasId() const noexcept { return !id.empty(); }
};

struct Decoded {
    bool ok = false;
    Message message;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

struct Progress {
    int percent = -1;   // -1 when the worker did not send one
    std::string stage;
    std::string message;
};

// Serialises `payload` (a JSON object with a string `type`) as one line,
// attaching `id` when non-empty.
[[nodiscard]] std::string encode(const Json& payload, const std::string& id = {});

[[nodiscard]] Decoded decodeLine(const std::string& line);

[[nodiscard]] MessageKind messageKind(const std::string& type) noexcept;

[[nodiscard]] Progress progressFrom(const Message& message);

// Splits a byte stream into messages. Partial lines are buffered across
// feed() calls; a bad line yields an error entry and decoding carries on.
class LineDecoder final {
public:
    explicit LineDecoder(std::size_t maxLineBytes = kDefaultMaxLineBytes) noexcept;

    [[nodiscard]] std::vector<Decoded> feed(const char* data, std::size_t size);
    [[nodiscard]] std::vector<Decoded> feed(const std::string& chunk) {
        return feed(chunk.data(), chunk.size());
    }

    // End of stream: decode whatever is left in the buffer.
    [[nodiscard]] std::optional<Decoded> flush();

    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size(); }

private:
    std::string buffer_;
    std::size_t maxLineBytes_;
    bool discarding_ = false;

    void decodeInto(std::string line, std::vector<Decoded>& out);
};

class IdGenerator final {
public:
    [[nodiscard]] std::string next();

private:
    std::atomic<uint64_t> counter_{0};
};

}
