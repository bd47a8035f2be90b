/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/store.hpp"
#include "scriba/codec.hpp"
#include "scriba/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace scriba {

namespace {
constexpr const char* kJobFile = "job.json";
constexpr const char* kSegmentsFile = "segments.json";
constexpr const char* kSpeakersFile = "speakers.json";

constexpr Status kPhases[] = {
    Status::Pending, Status::Processing, Status::Completed, Status::Failed, Status::Cancelled
};

long long toMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromMillis(long long ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

Json jobToJson(const Job& job) {
    Json j = {
        {"id", job.id},
        {"filePath", job.filePath},
        {"fileName", job.fileName},
        {"status", statusName(job.status)},
        {"config", {
            {"model", job.config.model},
            {"language", job.config.language},
            {"diarize", job.config.diarize},
            {"speakerCount", job.config.speakerCount},
        }},
        {"createdAt", toMillis(job.createdAt)},
        {"updatedAt", toMillis(job.updatedAt)},
        {"error", job.error},
        {"language", job.language},
    };
    if (job.fileSize) j["fileSize"] = *job.fileSize;
    if (job.completedAt) j["completedAt"] = toMillis(*job.completedAt);
    if (job.duration) j["duration"] = *job.duration;
    return j;
}

Job jobFromJson(const Json& j) {
    Job job;
    job.id = j.value("id", std::string{});
    job.filePath = j.value("filePath", std::string{});
    job.fileName = j.value("fileName", std::string{});
    if (auto status = parseStatus(j.value("status", std::string{}))) {
        job.status = *status;
    }
    if (auto config = j.find("config"); config != j.end() && config->is_object()) {
        job.config.model = config->value("model", std::string{});
        job.config.language = config->value("language", std::string{});
        job.config.diarize = config->value("diarize", false);
        job.config.speakerCount = config->value("speakerCount", 0);
    }
    job.createdAt = fromMillis(j.value("createdAt", 0LL));
    job.updatedAt = fromMillis(j.value("updatedAt", 0LL));
    job.error = j.value("error", std::string{});
    job.language = j.value("language", std::string{});
    if (auto size = j.find("fileSize"); size != j.end() && size->is_number_unsigned()) {
        job.fileSize = size->get<std::uintmax_t>();
    }
    if (auto done = j.find("completedAt"); done != j.end() && done->is_number_integer()) {
        job.completedAt = fromMillis(done->get<long long>());
    }
    if (auto duration = j.find("duration"); duration != j.end() && duration->is_number()) {
        job.duration = duration->get<double>();
    }
    return job;
}

Json segmentToJson(const Segment& segment) {
    Json j = {{"start", segment.start}, {"end", segment.end}, {"text", segment.text}};
    if (segment.speaker) j["speaker"] = *segment.speaker;
    if (segment.confidence) j["confidence"] = *segment.confidence;
    return j;
}

Segment segmentFromJson(const Json& j) {
    Segment segment;
    segment.start = j.value("start", 0.0);
    segment.end = j.value("end", segment.start);
    segment.text = j.value("text", std::string{});
    if (auto speaker = j.find("speaker"); speaker != j.end() && speaker->is_string()) {
        segment.speaker = speaker->get<std::string>();
    }
    if (auto confidence = j.find("confidence"); confidence != j.end() && confidence->is_number()) {
        segment.confidence = confidence->get<double>();
    }
    return segment;
}

Json speakerToJson(const Speaker& speaker) {
    Json j = {{"id", speaker.id}};
    if (speaker.displayName) j["displayName"] = *speaker.displayName;
    if (speaker.color) j["color"] = *speaker.color;
    return j;
}

Speaker speakerFromJson(const Json& j) {
    Speaker speaker;
    speaker.id = j.value("id", std::string{});
    if (auto name = j.find("displayName"); name != j.end() && name->is_string()) {
        speaker.displayName = name->get<std::string>();
    }
    if (auto color = j.find("color"); color != j.end() && color->is_string()) {
        speaker.color = color->get<std::string>();
    }
    return speaker;
}

// Write to a temp file and rename over the target so readers never see half a file
bool writeJsonAtomic(const std::filesystem::path& path, const Json& value) {
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            LOG_ERROR("Cannot open for writing: " + tmp.string());
            return false;
        }
        file << value.dump(2, ' ', false, Json::error_handler_t::replace);
        file.flush();
        if (!file.good()) {
            LOG_ERROR("Write failed: " + tmp.string());
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        LOG_ERROR("Cannot publish " + path.string() + ": " + ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

std::optional<Json> readJson(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    Json value = Json::parse(file, nullptr, false);
    if (value.is_discarded()) {
        LOG_WARN("Corrupt record: " + path.string());
        return std::nullopt;
    }
    return value;
}
}

FileStore::FileStore(const std::filesystem::path& workspace, bool createIfMissing)
    : workspace_(workspace) {
    ready_ = createWorkspace(createIfMissing);
    if (!ready_) {
        LOG_ERROR("Failed to initialize workspace: " + workspace_.string());
    }
}

bool FileStore::createWorkspace(bool createIfMissing) noexcept {
    try {
        if (!std::filesystem::exists(workspace_)) {
            if (!createIfMissing) {
                return false;
            }
            std::filesystem::create_directories(workspace_);
        }
        std::filesystem::create_directories(workspace_ / "incoming");
        for (Status phase : kPhases) {
            std::filesystem::create_directories(phaseDirectory(phase));
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }
}

std::filesystem::path FileStore::phaseDirectory(Status status) const {
    return workspace_ / statusName(status);
}

std::optional<std::pair<Status, std::filesystem::path>> FileStore::locate(const JobId& id) const {
    if (id.empty() || id.find('/') != std::string::npos || id == "." || id == "..") {
        return std::nullopt;
    }
    for (Status phase : kPhases) {
        auto dir = phaseDirectory(phase) / id;
        std::error_code ec;
        if (std::filesystem::is_directory(dir, ec)) {
            return std::make_pair(phase, dir);
        }
    }
    return std::nullopt;
}

std::optional<Job> FileStore::readJob(const std::filesystem::path& dir, Status status) const {
    auto value = readJson(dir / kJobFile);
    if (!value || !value->is_object()) {
        return std::nullopt;
    }
    try {
        Job job = jobFromJson(*value);
        job.id = dir.filename().string();
        job.status = status;
        return job;
    } catch (const std::exception& e) {
        LOG_WARN("Unreadable job record " + dir.string() + ": " + e.what());
        return std::nullopt;
    }
}

std::vector<Segment> FileStore::readSegments(const std::filesystem::path& dir) const {
    std::vector<Segment> out;
    auto value = readJson(dir / kSegmentsFile);
    if (!value || !value->is_array()) {
        return out;
    }
    try {
        for (const auto& entry : *value) {
            out.push_back(segmentFromJson(entry));
        }
    } catch (const std::exception& e) {
        LOG_WARN("Unreadable segments in " + dir.string() + ": " + e.what());
        out.clear();
    }
    return out;
}

std::vector<Speaker> FileStore::readSpeakers(const std::filesystem::path& dir) const {
    std::vector<Speaker> out;
    auto value = readJson(dir / kSpeakersFile);
    if (!value || !value->is_array()) {
        return out;
    }
    try {
        for (const auto& entry : *value) {
            out.push_back(speakerFromJson(entry));
        }
    } catch (const std::exception& e) {
        LOG_WARN("Unreadable speakers in " + dir.string() + ": " + e.what());
        out.clear();
    }
    return out;
}

bool FileStore::create(const Job& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (job.id.empty() || locate(job.id)) {
        LOG_ERROR("Job already exists or has no id: " + job.id);
        return false;
    }

    auto writing = workspace_ / "incoming" / job.id;
    try {
        std::filesystem::create_directories(writing);
        Job record = job;
        record.status = Status::Pending;
        if (!writeJsonAtomic(writing / kJobFile, jobToJson(record))) {
            std::filesystem::remove_all(writing);
            return false;
        }
        std::filesystem::rename(writing, phaseDirectory(Status::Pending) / job.id);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create job " + job.id + ": " + e.what());
        std::error_code ec;
        std::filesystem::remove_all(writing, ec);
        return false;
    }
}

std::optional<Job> FileStore::get(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto where = locate(id);
    if (!where) {
        return std::nullopt;
    }
    return readJob(where->second, where->first);
}

std::vector<Job> FileStore::list(const JobFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listLocked(filter);
}

std::vector<Job> FileStore::listLocked(const JobFilter& filter) const {
    std::vector<Job> jobs;
    try {
        for (Status phase : kPhases) {
            if (filter.status && *filter.status != phase) {
                continue;
            }
            auto dir = phaseDirectory(phase);
            if (!std::filesystem::exists(dir)) {
                continue;
            }
            for (const auto& entry : std::filesystem::directory_iterator(dir)) {
                if (!entry.is_directory()) {
                    continue;
                }
                if (auto job = readJob(entry.path(), phase)) {
                    jobs.push_back(std::move(*job));
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing jobs: " + std::string(e.what()));
    }

    std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
        if (a.createdAt != b.createdAt) {
            return a.createdAt > b.createdAt;
        }
        return a.id > b.id;
    });
    if (filter.limit > 0 && jobs.size() > filter.limit) {
        jobs.resize(filter.limit);
    }
    return jobs;
}

bool FileStore::update(const Job& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto where = locate(job.id);
    if (!where) {
        LOG_ERROR("Cannot update missing job: " + job.id);
        return false;
    }
    auto [current, dir] = *where;

    if (!writeJsonAtomic(dir / kJobFile, jobToJson(job))) {
        return false;
    }
    if (current == job.status) {
        return true;
    }

    std::error_code ec;
    auto target = phaseDirectory(job.status) / job.id;
    std::filesystem::rename(dir, target, ec);
    if (ec) {
        LOG_ERROR("Failed to move job " + job.id + " to " + statusName(job.status) + ": " + ec.message());
        return false;
    }
    LOG_DEBUG("Job " + job.id + ": " + statusName(current) + " -> " + statusName(job.status));
    return true;
}

bool FileStore::remove(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto where = locate(id);
    if (!where) {
        return false;
    }
    std::error_code ec;
    std::filesystem::remove_all(where->second, ec);
    if (ec) {
        LOG_ERROR("Failed to remove job " + id + ": " + ec.message());
        return false;
    }
    return true;
}

bool FileStore::saveSegments(const JobId& id, const std::vector<Segment>& segments) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto where = locate(id);
    if (!where) {
        LOG_ERROR("Cannot save segments for missing job: " + id);
        return false;
    }
    Json array = Json::array();
    for (const auto& segment : segments) {
        array.push_back(segmentToJson(segment));
    }
    return writeJsonAtomic(where->second / kSegmentsFile, array);
}

std::vector<Segment> FileStore::segments(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto where = locate(id);
    return where ? readSegments(where->second) : std::vector<Segment>{};
}

bool FileStore::saveSpeakers(const JobId& id, const std::vector<Speaker>& speakers) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto where = locate(id);
    if (!where) {
        LOG_ERROR("Cannot save speakers for missing job: " + id);
        return false;
    }
    Json array = Json::array();
    for (const auto& speaker : speakers) {
        array.push_back(speakerToJson(speaker));
    }
    return writeJsonAtomic(where->second / kSpeakersFile, array);
}

std::vector<Speaker> FileStore::speakers(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto where = locate(id);
    return where ? readSpeakers(where->second) : std::vector<Speaker>{};
}

bool FileStore::renameSpeaker(const JobId& id, const std::string& speakerId, const std::string& displayName) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto where = locate(id);
    if (!where) {
        return false;
    }
    auto speakers = readSpeakers(where->second);
    auto it = std::find_if(speakers.begin(), speakers.end(),
        [&speakerId](const Speaker& s) { return s.id == speakerId; });
    if (it == speakers.end()) {
        LOG_DEBUG("No speaker " + speakerId + " in job " + id);
        return false;
    }
    it->displayName = displayName;

    Json array = Json::array();
    for (const auto& speaker : speakers) {
        array.push_back(speakerToJson(speaker));
    }
    return writeJsonAtomic(where->second / kSpeakersFile, array);
}

std::vector<SearchHit> FileStore::search(const std::string& query, std::size_t limit) const {
    std::vector<SearchHit> hits;
    std::string needle = toLowerCopy(query);
    if (needle.empty()) {
        return hits;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t matched = 0;
    for (auto& job : listLocked({})) {
        if (limit > 0 && matched >= limit) {
            break;
        }
        auto where = locate(job.id);
        if (!where) {
            continue;
        }
        SearchHit hit;
        for (auto& segment : readSegments(where->second)) {
            if (limit > 0 && matched >= limit) {
                break;
            }
            if (toLowerCopy(segment.text).find(needle) != std::string::npos) {
                hit.segments.push_back(std::move(segment));
                ++matched;
            }
        }
        if (!hit.segments.empty()) {
            hit.job = std::move(job);
            hits.push_back(std::move(hit));
        }
    }
    return hits;
}

}
