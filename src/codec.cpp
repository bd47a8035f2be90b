/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/codec.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace scriba {

namespace {
std::string preview(const std::string& line) {
    constexpr std::size_t kMax = 120;
    if (line.size() <= kMax) {
        return line;
    }
    return line.substr(0, kMax) + "...";
}
}

std::string encode(const Json& payload, const std::string& id) {
    Json message = payload;
    if (!id.empty()) {
        message["id"] = id;
    }
    // dump() escapes control characters, so the line holds no raw newline
    std::string line = message.dump(-1, ' ', false, Json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

Decoded decodeLine(const std::string& line) {
    Decoded decoded;
    Json parsed = Json::parse(line, nullptr, false);
    if (parsed.is_discarded()) {
        decoded.error = "Invalid JSON: " + preview(line);
        return decoded;
    }
    if (!parsed.is_object()) {
        decoded.error = "Message is not an object: " + preview(line);
        return decoded;
    }
    auto type = parsed.find("type");
    if (type == parsed.end() || !type->is_string()) {
        decoded.error = "Message has no type: " + preview(line);
        return decoded;
    }

    decoded.message.type = type->get<std::string>();
    if (auto id = parsed.find("id"); id != parsed.end()) {
        if (id->is_string()) {
            decoded.message.id = id->get<std::string>();
        } else if (id->is_number_integer()) {
            decoded.message.id = std::to_string(id->get<long long>());
        }
    }
    decoded.message.payload = std::move(parsed);
    decoded.ok = true;
    return decoded;
}

MessageKind messageKind(const std::string& type) noexcept {
    if (type == "ready") return MessageKind::Ready;
    if (type == "progress") return MessageKind::Progress;
    if (type == "error") return MessageKind::Error;
    if (type == "pong") return MessageKind::Pong;
    if (type == "result" || type == "modelLoaded" || type == "prepared" ||
        type == "diarizationResult" || type == "availableModels") {
        return MessageKind::Result;
    }
    return MessageKind::Unknown;
}

Progress progressFrom(const Message& message) {
    Progress progress;
    const Json& body = message.payload;
    if (auto it = body.find("percent"); it != body.end() && it->is_number()) {
        double value = it->get<double>();
        progress.percent = static_cast<int>(std::lround(std::clamp(value, 0.0, 100.0)));
    }
    if (auto it = body.find("stage"); it != body.end() && it->is_string()) {
        progress.stage = it->get<std::string>();
    }
    if (auto it = body.find("message"); it != body.end() && it->is_string()) {
        progress.message = it->get<std::string>();
    }
    return progress;
}

LineDecoder::LineDecoder(std::size_t maxLineBytes) noexcept
    : maxLineBytes_(maxLineBytes == 0 ? kDefaultMaxLineBytes : maxLineBytes) {
}

std::vector<Decoded> LineDecoder::feed(const char* data, std::size_t size) {
    std::vector<Decoded> out;
    std::size_t pos = 0;

    while (pos < size) {
        const char* newline = static_cast<const char*>(std::memchr(data + pos, '\n', size - pos));
        std::size_t end = newline ? static_cast<std::size_t>(newline - data) : size;

        if (discarding_) {
            // Skip the remainder of an oversized line
            if (newline) {
                discarding_ = false;
            }
            pos = newline ? end + 1 : size;
            continue;
        }

        buffer_.append(data + pos, end - pos);
        pos = newline ? end + 1 : size;

        if (buffer_.size() > maxLineBytes_) {
            Decoded overflow;
            overflow.error = "Line exceeds " + std::to_string(maxLineBytes_) + " bytes, dropped";
            out.push_back(std::move(overflow));
            buffer_.clear();
            discarding_ = newline == nullptr;
            continue;
        }

        if (newline) {
            decodeInto(std::move(buffer_), out);
            buffer_.clear();
        }
    }
    return out;
}

std::optional<Decoded> LineDecoder::flush() {
    discarding_ = false;
    if (buffer_.empty()) {
        return std::nullopt;
    }
    std::vector<Decoded> out;
    decodeInto(std::move(buffer_), out);
    buffer_.clear();
    if (out.empty()) {
        return std::nullopt;
    }
    return std::move(out.front());
}

void LineDecoder::decodeInto(std::string line, std::vector<Decoded>& out) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    bool blank = std::all_of(line.begin(), line.end(),
        [](unsigned char c) { return c == ' ' || c == '\t' || c == '\r'; });
    if (blank) {
        return;
    }
    out.push_back(decodeLine(line));
}

std::string IdGenerator::next() {
    return std::to_string(counter_.fetch_add(1) + 1);
}

}
