/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/client.hpp"
#include "scriba/logger.hpp"

namespace scriba {

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:         return "none";
        case ErrorKind::Startup:      return "startup";
        case ErrorKind::NotRunning:   return "not-running";
        case ErrorKind::Timeout:      return "timeout";
        case ErrorKind::WorkerExited: return "worker-exited";
        case ErrorKind::Cancelled:    return "cancelled";
        case ErrorKind::Remote:       return "remote";
        case ErrorKind::Protocol:     return "protocol";
        case ErrorKind::Config:       return "config";
        default:                      return "unknown";
    }
}

Client::Client(Worker& worker)
    : worker_(worker) {
    subscription_ = worker_.subscribe(
        [this](const Message& message) { handleMessage(message); },
        [this](const WorkerExit& exit) { handleExit(exit); });
}

Client::~Client() {
    worker_.unsubscribe(subscription_);
    rejectAll(ErrorKind::Cancelled, "Client shut down");
}

bool Client::ensureRunning(std::string& error) {
    if (worker_.isRunning() || worker_.start()) {
        return true;
    }
    error = "Worker failed to start: " + worker_.lastError();
    return false;
}

CallResult Client::call(const Json& payload, const CallOptions& options) {
    auto type = payload.is_object() ? payload.find("type") : payload.end();
    if (!payload.is_object() || type == payload.end() || !type->is_string()) {
        return {false, {}, ErrorKind::Protocol, "Request must be an object with a string type"};
    }

    // A cancelled client must not bring a fresh worker up behind the caller's back
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            LOG_DEBUG("Refusing " + type->get<std::string>() + " after cancel");
            return {false, {}, ErrorKind::Cancelled, "Transcription cancelled"};
        }
    }

    std::string error;
    if (!ensureRunning(error)) {
        LOG_ERROR(error);
        return {false, {}, ErrorKind::Startup, error};
    }

    std::string id = ids_.next();
    auto request = std::make_shared<PendingRequest>();
    request->type = type->get<std::string>();
    request->onProgress = options.onProgress;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // cancel() may have landed while the worker was starting
        if (cancelled_) {
            return {false, {}, ErrorKind::Cancelled, "Transcription cancelled"};
        }
        pending_[id] = request;
    }

    auto deadline = std::chrono::steady_clock::now() + options.timeout;
    LOG_DEBUG("Request #" + id + " " + request->type);

    if (!worker_.send(encode(payload, id))) {
        std::unique_lock<std::mutex> lock(mutex_);
        // The exit handler may already have settled it
        CallResult result = request->result;
        if (!request->done) {
            pending_.erase(id);
            result = {false, {}, ErrorKind::NotRunning, "Worker not running"};
        }
        lock.unlock();
        return finish(request, std::move(result));
    }

    std::unique_lock<std::mutex> lock(mutex_);
    CallResult result;
    if (resolved_.wait_until(lock, deadline, [&request] { return request->done; })) {
        result = request->result;
    } else {
        pending_.erase(id);
        LOG_WARN("Request #" + id + " " + request->type + " timed out after " +
                 std::to_string(options.timeout.count()) + "ms");
        result = {false, {}, ErrorKind::Timeout, "Request timeout"};
    }
    lock.unlock();
    return finish(request, std::move(result));
}

CallResult Client::finish(const std::shared_ptr<PendingRequest>& request, CallResult result) {
    // Waits out a progress callback the reader thread is running right now
    std::lock_guard<std::mutex> guard(request->callbackMutex);
    request->onProgress = nullptr;
    return result;
}

CallResult Client::ping(std::chrono::milliseconds timeout) {
    CallOptions options;
    options.timeout = timeout;
    auto result = call(Json{{"type", "ping"}}, options);
    if (result && result.message.type != "pong") {
        return {false, result.message, ErrorKind::Protocol, "Unexpected reply to ping: " + result.message.type};
    }
    return result;
}

void Client::cancel() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    try {
        LOG_INFO("Cancelling outstanding requests");
        rejectAll(ErrorKind::Cancelled, "Transcription cancelled");
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Cancel failed: ") + e.what());
    }
    worker_.stop();
}

void Client::resume() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = false;
}

std::uint64_t Client::session() const noexcept {
    return worker_.generation();
}

std::size_t Client::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void Client::handleMessage(const Message& message) {
    MessageKind kind = messageKind(message.type);
    // Readiness is the worker's concern
    if (kind == MessageKind::Ready) {
        return;
    }
    if (!message.hasId()) {
        LOG_DEBUG("Dropping " + message.type + " message without id");
        return;
    }

    std::shared_ptr<PendingRequest> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(message.id);
        if (it == pending_.end()) {
            LOG_DEBUG("Dropping " + message.type + " for unknown request #" + message.id);
            return;
        }
        auto& request = it->second;

        switch (kind) {
            // Progress never settles a request
            case MessageKind::Progress:
                listener = request;
                break;
            case MessageKind::Unknown:
                LOG_WARN("Ignoring unrecognized message type: " + message.type);
                return;
            case MessageKind::Error: {
                auto text = message.payload.find("error");
                request->result = {false, message, ErrorKind::Remote,
                    text != message.payload.end() && text->is_string()
                        ? text->get<std::string>() : "Worker reported an error"};
                request->done = true;
                pending_.erase(it);
                resolved_.notify_all();
                return;
            }
            default:
                request->result = {true, message, ErrorKind::None, ""};
                request->done = true;
                pending_.erase(it);
                resolved_.notify_all();
                return;
        }
    }

    // Outside mutex_ so the callback may call back into the client
    std::lock_guard<std::mutex> guard(listener->callbackMutex);
    if (listener->onProgress) {
        listener->onProgress(progressFrom(message));
    }
}

void Client::handleExit(const WorkerExit& exit) {
    // Nothing in flight survives the process that was answering it
    if (exit.requested) {
        rejectAll(ErrorKind::Cancelled, "Transcription cancelled");
    } else {
        rejectAll(ErrorKind::WorkerExited, "Worker exited unexpectedly (" + exit.describe() + ")");
    }
}

void Client::rejectAll(ErrorKind kind, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_.empty()) {
        LOG_DEBUG("Rejecting " + std::to_string(pending_.size()) + " pending requests: " + message);
    }
    for (auto& [id, request] : pending_) {
        request->result = {false, {}, kind, message};
        request->done = true;
    }
    pending_.clear();
    resolved_.notify_all();
}

}
