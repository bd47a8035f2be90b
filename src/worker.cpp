/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/worker.hpp"
#include "scriba/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace scriba {

namespace {
#ifdef __APPLE__
constexpr const char* kLibraryPathVar = "DYLD_LIBRARY_PATH";
#else
constexpr const char* kLibraryPathVar = "LD_LIBRARY_PATH";
#endif

std::once_flag g_sigpipe_once;

bool makePipe(int fds[2]) {
    if (::pipe(fds) != 0) {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::map<std::string, std::string> buildEnvironment(const WorkerOptions& options) {
    std::map<std::string, std::string> vars;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        vars[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    if (!options.libraryPath.empty()) {
        auto& current = vars[kLibraryPathVar];
        current = current.empty()
            ? options.libraryPath.string()
            : options.libraryPath.string() + ":" + current;
    }
    for (const auto& [key, value] : options.environment) {
        vars[key] = value;
    }
    return vars;
}

// execve() does no PATH lookup, so resolve against the child's PATH here.
std::string resolveExecutable(const std::string& name, const std::map<std::string, std::string>& env) {
    if (name.find('/') != std::string::npos) {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(name, ec);
        return ec ? name : absolute.string();
    }
    auto path = env.find("PATH");
    std::string dirs = path == env.end() ? "/usr/local/bin:/usr/bin:/bin" : path->second;
    std::size_t begin = 0;
    while (begin <= dirs.size()) {
        std::size_t end = dirs.find(':', begin);
        if (end == std::string::npos) {
            end = dirs.size();
        }
        std::string dir = dirs.substr(begin, end - begin);
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + name;
        std::error_code ec;
        if (::access(candidate.c_str(), X_OK) == 0 && std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
        begin = end + 1;
    }
    return {};
}
}

std::string WorkerExit::describe() const {
    if (signal != 0) {
        return "signal " + std::to_string(signal);
    }
    return "exit code " + std::to_string(code);
}

Worker::Worker(WorkerOptions options)
    : options_(std::move(options)) {
}

Worker::~Worker() {
    stop();
}

bool Worker::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);

    {
        std::unique_lock<std::mutex> lock(stateMutex_);
        if (running_ && ready_) {
            return true;
        }
        // A previous process may still be delivering its exit notification
        stateCv_.wait(lock, [this] { return exited_; });
    }
    joinReaper();

    if (options_.command.empty()) {
        setError("No command configured for " + options_.name);
        LOG_ERROR(lastError());
        return false;
    }

    std::call_once(g_sigpipe_once, [] { ::signal(SIGPIPE, SIG_IGN); });

    if (!spawn()) {
        LOG_ERROR(lastError());
        return false;
    }

    std::unique_lock<std::mutex> lock(stateMutex_);
    LOG_INFO(options_.name + " started (pid " + std::to_string(pid_) + "), waiting for ready");
    stateCv_.wait_for(lock, options_.startupTimeout, [this] { return ready_ || !running_; });

    if (ready_ && running_) {
        ++generation_;
        lastError_.clear();
        auto versionField = readyInfo_.find("version");
        std::string version = versionField != readyInfo_.end() && versionField->is_string()
            ? versionField->get<std::string>() : std::string{};
        LOG_INFO(options_.name + " ready" + (version.empty() ? "" : " (version " + version + ")"));
        return true;
    }

    lastError_ = running_
        ? options_.name + " did not become ready within " +
              std::to_string(options_.startupTimeout.count()) + "ms"
        : options_.name + " exited during startup (" + lastExit_.describe() + ")";
    std::string error = lastError_;
    lock.unlock();

    LOG_ERROR(error);
    stopLocked();
    setError(error);
    return false;
}

bool Worker::spawn() {
    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (!makePipe(inPipe) || !makePipe(outPipe) || !makePipe(errPipe)) {
        setError("Failed to create pipes for " + options_.name + ": " + std::strerror(errno));
        for (int* fd : {&inPipe[0], &inPipe[1], &outPipe[0], &outPipe[1], &errPipe[0], &errPipe[1]}) {
            closeFd(*fd);
        }
        return false;
    }

    // Everything the child needs is built before fork()
    auto vars = buildEnvironment(options_);
    std::string executable = resolveExecutable(options_.command.front(), vars);
    if (executable.empty()) {
        setError("Worker command not found: " + options_.command.front());
        for (int* fd : {&inPipe[0], &inPipe[1], &outPipe[0], &outPipe[1], &errPipe[0], &errPipe[1]}) {
            closeFd(*fd);
        }
        return false;
    }

    std::vector<std::string> envStrings;
    envStrings.reserve(vars.size());
    for (const auto& [key, value] : vars) {
        envStrings.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : envStrings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::vector<std::string> args = options_.command;
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::string cwd = options_.workingDirectory.string();

    pid_t child = ::fork();
    if (child < 0) {
        setError("fork failed for " + options_.name + ": " + std::strerror(errno));
        for (int* fd : {&inPipe[0], &inPipe[1], &outPipe[0], &outPipe[1], &errPipe[0], &errPipe[1]}) {
            closeFd(*fd);
        }
        return false;
    }

    if (child == 0) {
        // Async-signal-safe calls only from here on
        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            const char msg[] = "cannot change to worker directory\n";
            ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            ::_exit(127);
        }
        ::execve(executable.c_str(), argv.data(), envp.data());
        const char msg[] = "exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        ::_exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        stdinFd_ = inPipe[1];
    }
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        pid_ = child;
        running_ = true;
        ready_ = false;
        exited_ = false;
        stopRequested_ = false;
        readyInfo_ = Json::object();
    }

    stdoutThread_ = std::thread(&Worker::readStdout, this, outPipe[0]);
    stderrThread_ = std::thread(&Worker::readStderr, this, errPipe[0]);
    reaperThread_ = std::thread(&Worker::reap, this, child);
    return true;
}

void Worker::stop() noexcept {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    stopLocked();
}

void Worker::stopLocked() noexcept {
    bool alive = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!exited_) {
            stopRequested_ = true;
            alive = running_;
        }
    }

    if (alive) {
        LOG_DEBUG("Stopping " + options_.name);
        closeStdin();
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (running_ && pid_ > 0) {
                ::kill(pid_, SIGTERM);
            }
        }
        if (!waitExited(options_.stopGrace)) {
            LOG_WARN(options_.name + " ignored SIGTERM, sending SIGKILL");
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                if (running_ && pid_ > 0) {
                    ::kill(pid_, SIGKILL);
                }
            }
            if (!waitExited(std::chrono::milliseconds(5000))) {
                LOG_ERROR(options_.name + " still running after SIGKILL");
            }
        }
    }
    joinReaper();
}

bool Worker::waitExited(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(stateMutex_);
    return stateCv_.wait_for(lock, timeout, [this] { return exited_; });
}

void Worker::joinReaper() noexcept {
    if (reaperThread_.joinable() && reaperThread_.get_id() != std::this_thread::get_id()) {
        reaperThread_.join();
    }
}

void Worker::closeStdin() noexcept {
    std::lock_guard<std::mutex> lock(writeMutex_);
    closeFd(stdinFd_);
}

void Worker::setError(const std::string& error) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    lastError_ = error;
}

bool Worker::send(const std::string& line) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (stdinFd_ < 0 || !isRunning()) {
        setError(options_.name + " is not running");
        return false;
    }

    std::size_t offset = 0;
    while (offset < line.size()) {
        ssize_t n = ::write(stdinFd_, line.data() + offset, line.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            setError("Write to " + options_.name + " failed: " + std::strerror(errno));
            LOG_WARN(lastError());
            return false;
        }
        offset += static_cast<std::size_t>(n);
    }
    LOG_TRACE(options_.name + " <- " + line.substr(0, line.size() - 1));
    return true;
}

Subscription Worker::subscribe(MessageHandler onMessage, ExitHandler onExit) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    Subscription id = nextSubscription_++;
    listeners_.push_back({id, std::move(onMessage), std::move(onExit)});
    return id;
}

void Worker::unsubscribe(Subscription id) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
        [id](const Listener& l) { return l.id == id; }), listeners_.end());
}

bool Worker::isRunning() const noexcept {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return running_ && ready_;
}

pid_t Worker::pid() const noexcept {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return pid_;
}

Json Worker::readyInfo() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return readyInfo_;
}

std::string Worker::lastError() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastError_;
}

WorkerExit Worker::lastExit() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastExit_;
}

std::uint64_t Worker::generation() const noexcept {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return generation_;
}

void Worker::readStdout(int fd) {
    setThreadName(options_.name + "-out");
    LineDecoder decoder(options_.maxLineBytes);
    char buffer[8192];

    for (;;) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN(options_.name + " stdout read failed: " + std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;
        }
        for (const auto& decoded : decoder.feed(buffer, static_cast<std::size_t>(n))) {
            dispatch(decoded);
        }
    }
    if (auto tail = decoder.flush()) {
        dispatch(*tail);
    }
    ::close(fd);
}

void Worker::readStderr(int fd) {
    setThreadName(options_.name + "-err");
    std::string pending;
    char buffer[4096];

    auto emit = [this](const std::string& line) {
        if (!line.empty()) {
            LOG_DEBUG("[" + options_.name + "] " + line);
        }
    };

    for (;;) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }
        pending.append(buffer, static_cast<std::size_t>(n));
        std::size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            emit(line);
            pending.erase(0, pos + 1);
        }
        if (pending.size() > options_.maxLineBytes) {
            emit(pending.substr(0, 256) + "...");
            pending.clear();
        }
    }
    emit(pending);
    ::close(fd);
}

void Worker::reap(pid_t pid) {
    setThreadName(options_.name + "-reaper");

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    WorkerExit exit;
    if (result > 0) {
        if (WIFEXITED(status)) {
            exit.code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit.signal = WTERMSIG(status);
        }
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        running_ = false;
        exit.requested = stopRequested_;
        lastExit_ = exit;
        pid_ = -1;
    }
    stateCv_.notify_all();
    closeStdin();

    // Drain output so every message precedes the exit notification
    if (stdoutThread_.joinable()) {
        stdoutThread_.join();
    }
    if (stderrThread_.joinable()) {
        stderrThread_.join();
    }

    if (exit.requested) {
        LOG_INFO(options_.name + " stopped (" + exit.describe() + ")");
    } else {
        LOG_WARN(options_.name + " exited unexpectedly (" + exit.describe() + ")");
    }

    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        for (const auto& listener : listeners_) {
            if (!listener.onExit) {
                continue;
            }
            try {
                listener.onExit(exit);
            } catch (const std::exception& e) {
                LOG_ERROR(options_.name + " exit handler failed: " + e.what());
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        exited_ = true;
    }
    stateCv_.notify_all();
}

void Worker::dispatch(const Decoded& decoded) {
    if (!decoded.ok) {
        LOG_WARN(options_.name + " protocol error: " + decoded.error);
        return;
    }
    const Message& message = decoded.message;
    LOG_TRACE(options_.name + " -> " + message.type + (message.hasId() ? " #" + message.id : ""));

    if (messageKind(message.type) == MessageKind::Ready) {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            ready_ = true;
            readyInfo_ = message.payload;
        }
        stateCv_.notify_all();
    }

    std::lock_guard<std::mutex> lock(listenersMutex_);
    for (const auto& listener : listeners_) {
        if (!listener.onMessage) {
            continue;
        }
        try {
            listener.onMessage(message);
        } catch (const std::exception& e) {
            LOG_ERROR(options_.name + " message handler failed: " + e.what());
        }
    }
}

}
