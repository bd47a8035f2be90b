/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/store.hpp"
#include "scriba/work.hpp"
#include "test_support.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <fstream>

using namespace scriba;
using namespace scriba::test;

namespace {
Job makeJob(const std::string& id, long long createdMs) {
    Job job;
    job.id = id;
    job.filePath = "/media/" + id + ".wav";
    job.fileName = id + ".wav";
    job.fileSize = 1234;
    job.config.model = "base.en";
    job.createdAt = TimePoint(std::chrono::milliseconds(createdMs));
    job.updatedAt = job.createdAt;
    return job;
}

Segment segment(double start, double end, const std::string& text) {
    return {start, end, text, std::nullopt, std::nullopt};
}
}

TEST_CASE("FileStore jobs") {
    TempDir dir("store-jobs");
    FileStore store(dir.path() / "ws");
    REQUIRE(store.ready());
    CHECK(std::filesystem::is_directory(store.phaseDirectory(Status::Pending)));
    CHECK(std::filesystem::is_directory(store.phaseDirectory(Status::Cancelled)));

    SUBCASE("create then get") {
        auto job = makeJob("job-a", 1000);
        job.config.diarize = true;
        job.config.speakerCount = 2;
        job.config.language = "en";
        REQUIRE(store.create(job));

        auto loaded = store.get("job-a");
        REQUIRE(loaded.has_value());
        CHECK(loaded->status == Status::Pending);
        CHECK(loaded->fileName == "job-a.wav");
        CHECK(loaded->fileSize.value() == 1234);
        CHECK(loaded->config.model == "base.en");
        CHECK(loaded->config.language == "en");
        CHECK(loaded->config.diarize);
        CHECK(loaded->config.speakerCount == 2);
        CHECK(loaded->createdAt == job.createdAt);
        CHECK_FALSE(loaded->completedAt.has_value());
        CHECK(std::filesystem::exists(store.phaseDirectory(Status::Pending) / "job-a" / "job.json"));

        // Ids are unique
        CHECK_FALSE(store.create(job));
    }

    SUBCASE("unknown and malformed ids") {
        CHECK_FALSE(store.get("nope").has_value());
        CHECK_FALSE(store.get("").has_value());
        CHECK_FALSE(store.get("../ws").has_value());
        CHECK_FALSE(store.get("..").has_value());
        CHECK(store.segments("nope").empty());
        CHECK_FALSE(store.remove("nope"));
    }

    SUBCASE("update moves the job between phases") {
        REQUIRE(store.create(makeJob("job-b", 1000)));
        auto job = *store.get("job-b");

        job.status = Status::Processing;
        REQUIRE(store.update(job));
        CHECK(store.get("job-b")->status == Status::Processing);
        CHECK_FALSE(std::filesystem::exists(store.phaseDirectory(Status::Pending) / "job-b"));
        CHECK(std::filesystem::exists(store.phaseDirectory(Status::Processing) / "job-b"));

        job.status = Status::Completed;
        job.completedAt = TimePoint(std::chrono::milliseconds(5000));
        job.duration = 61.5;
        job.language = "en";
        REQUIRE(store.update(job));
        auto done = store.get("job-b");
        REQUIRE(done.has_value());
        CHECK(done->status == Status::Completed);
        CHECK(done->completedAt.value() == TimePoint(std::chrono::milliseconds(5000)));
        CHECK(done->duration.value() == doctest::Approx(61.5));
        CHECK(done->language == "en");
    }

    SUBCASE("only created jobs can be updated") {
        CHECK_FALSE(store.update(makeJob("never-created", 1)));
        CHECK_FALSE(store.get("never-created").has_value());
    }

    SUBCASE("list is newest first with filter and limit") {
        REQUIRE(store.create(makeJob("old", 1000)));
        REQUIRE(store.create(makeJob("mid", 2000)));
        REQUIRE(store.create(makeJob("new", 3000)));
        auto mid = *store.get("mid");
        mid.status = Status::Failed;
        mid.error = "boom";
        REQUIRE(store.update(mid));

        auto all = store.list();
        REQUIRE(all.size() == 3);
        CHECK(all[0].id == "new");
        CHECK(all[1].id == "mid");
        CHECK(all[2].id == "old");

        JobFilter pending;
        pending.status = Status::Pending;
        auto onlyPending = store.list(pending);
        REQUIRE(onlyPending.size() == 2);
        CHECK(onlyPending[0].id == "new");
        CHECK(onlyPending[1].id == "old");

        JobFilter failed;
        failed.status = Status::Failed;
        auto onlyFailed = store.list(failed);
        REQUIRE(onlyFailed.size() == 1);
        CHECK(onlyFailed[0].error == "boom");

        JobFilter limited;
        limited.limit = 2;
        CHECK(store.list(limited).size() == 2);
    }

    SUBCASE("same creation time falls back to id order") {
        REQUIRE(store.create(makeJob("a", 1000)));
        REQUIRE(store.create(makeJob("b", 1000)));
        auto all = store.list();
        REQUIRE(all.size() == 2);
        CHECK(all[0].id == "b");
    }

    SUBCASE("corrupt records are skipped") {
        REQUIRE(store.create(makeJob("good", 1000)));
        auto bad = store.phaseDirectory(Status::Pending) / "bad";
        std::filesystem::create_directories(bad);
        std::ofstream(bad / "job.json") << "{ not json";
        auto all = store.list();
        REQUIRE(all.size() == 1);
        CHECK(all[0].id == "good");
        CHECK_FALSE(store.get("bad").has_value());
    }

    SUBCASE("remove deletes the job and its data") {
        REQUIRE(store.create(makeJob("gone", 1000)));
        REQUIRE(store.saveSegments("gone", {segment(0, 1, "x")}));
        REQUIRE(store.remove("gone"));
        CHECK_FALSE(store.get("gone").has_value());
        CHECK(store.segments("gone").empty());
    }
}

TEST_CASE("FileStore segments and speakers") {
    TempDir dir("store-data");
    FileStore store(dir.path());
    REQUIRE(store.create(makeJob("one", 1000)));
    REQUIRE(store.create(makeJob("two", 2000)));

    SUBCASE("segments replace what was stored") {
        std::vector<Segment> first = {segment(0.0, 1.0, "first")};
        REQUIRE(store.saveSegments("one", first));

        auto withSpeaker = segment(0.5, 2.0, "second");
        withSpeaker.speaker = "SPEAKER_00";
        withSpeaker.confidence = 0.9;
        REQUIRE(store.saveSegments("one", {segment(0.0, 0.5, "zero"), withSpeaker}));

        auto loaded = store.segments("one");
        REQUIRE(loaded.size() == 2);
        CHECK(loaded[0].text == "zero");
        CHECK_FALSE(loaded[0].speaker.has_value());
        CHECK(loaded[1].start == doctest::Approx(0.5));
        CHECK(loaded[1].end == doctest::Approx(2.0));
        CHECK(loaded[1].speaker.value() == "SPEAKER_00");
        CHECK(loaded[1].confidence.value() == doctest::Approx(0.9));

        CHECK_FALSE(store.saveSegments("nope", first));
    }

    SUBCASE("segments follow the job across phases") {
        REQUIRE(store.saveSegments("one", {segment(0.0, 1.0, "kept")}));
        auto job = *store.get("one");
        job.status = Status::Completed;
        REQUIRE(store.update(job));
        auto loaded = store.segments("one");
        REQUIRE(loaded.size() == 1);
        CHECK(loaded[0].text == "kept");
    }

    SUBCASE("speakers can be renamed") {
        REQUIRE(store.saveSpeakers("one", {{"SPEAKER_00", std::string("Speaker 1"), std::string("#3B82F6")},
                                           {"SPEAKER_01", std::nullopt, std::nullopt}}));
        REQUIRE(store.renameSpeaker("one", "SPEAKER_01", "Alice"));
        CHECK_FALSE(store.renameSpeaker("one", "SPEAKER_09", "Bob"));
        CHECK_FALSE(store.renameSpeaker("nope", "SPEAKER_00", "Bob"));

        auto speakers = store.speakers("one");
        REQUIRE(speakers.size() == 2);
        CHECK(speakers[0].displayName.value() == "Speaker 1");
        CHECK(speakers[0].color.value() == "#3B82F6");
        CHECK(speakers[1].displayName.value() == "Alice");
        CHECK_FALSE(speakers[1].color.has_value());
        CHECK(store.speakers("two").empty());
    }

    SUBCASE("search is case-insensitive and grouped by job") {
        REQUIRE(store.saveSegments("one", {segment(0, 1, "Hello World"), segment(1, 2, "nothing here"),
                                           segment(2, 3, "world peace")}));
        REQUIRE(store.saveSegments("two", {segment(0, 1, "WORLDWIDE")}));

        auto hits = store.search("world");
        REQUIRE(hits.size() == 2);
        CHECK(hits[0].job.id == "two");
        CHECK(hits[0].segments.size() == 1);
        CHECK(hits[1].job.id == "one");
        REQUIRE(hits[1].segments.size() == 2);
        CHECK(hits[1].segments[0].text == "Hello World");

        auto limited = store.search("world", 2);
        REQUIRE(limited.size() == 2);
        CHECK(limited[1].segments.size() == 1);

        CHECK(store.search("absent").empty());
        CHECK(store.search("").empty());
    }
}

TEST_CASE("FileStore workspace") {
    TempDir dir("store-ws");
    FileStore missing(dir.path() / "not-there", false);
    CHECK_FALSE(missing.ready());
    CHECK_FALSE(std::filesystem::exists(dir.path() / "not-there"));
}

TEST_CASE("Work submission") {
    TempDir dir("work");
    FileStore store(dir.path() / "ws");
    Work work(store);
    auto media = writeMedia(dir.path(), "talk.wav", 12.0);

    SUBCASE("a valid file becomes a pending job") {
        EngineConfig config;
        config.model = "base.en";
        config.diarize = true;
        auto result = work.submit(media, config);
        REQUIRE(result.ok);
        CHECK_FALSE(result.id.empty());

        auto job = store.get(result.id);
        REQUIRE(job.has_value());
        CHECK(job->status == Status::Pending);
        CHECK(job->fileName == "talk.wav");
        CHECK(std::filesystem::path(job->filePath).is_absolute());
        CHECK(job->fileSize.value() == std::filesystem::file_size(media));
        CHECK(job->config.diarize);
    }

    SUBCASE("ids are unique") {
        auto a = work.submit(media);
        auto b = work.submit(media);
        REQUIRE(a.ok);
        REQUIRE(b.ok);
        CHECK(a.id != b.id);
        CHECK(store.list().size() == 2);
    }

    SUBCASE("rejections") {
        auto missingFile = work.submit(dir.path() / "absent.wav");
        CHECK_FALSE(missingFile.ok);
        CHECK(missingFile.error == SubmissionError::NotFound);

        auto text = dir.path() / "notes.txt";
        std::ofstream(text) << "hello";
        auto unsupported = work.submit(text);
        CHECK(unsupported.error == SubmissionError::InvalidContent);
        CHECK(unsupported.message.find("Unsupported media type") == 0);

        auto directory = work.submit(dir.path());
        CHECK(directory.error == SubmissionError::InvalidContent);

        EngineConfig negative;
        negative.speakerCount = -1;
        CHECK(work.submit(media, negative).error == SubmissionError::InvalidContent);

        work.setMaxSize(4);
        auto tooBig = work.submit(media);
        CHECK(tooBig.error == SubmissionError::InvalidSize);

        CHECK(store.list().empty());
    }

    SUBCASE("extension check ignores case") {
        CHECK(Work::isSupportedMedia("a.MP3"));
        CHECK(Work::isSupportedMedia("b.mkv"));
        CHECK_FALSE(Work::isSupportedMedia("c.pdf"));
        CHECK_FALSE(Work::isSupportedMedia("noext"));
    }
}

TEST_CASE("Work directory scan") {
    TempDir dir("work-scan");
    FileStore store(dir.path() / "ws");
    Work work(store);

    auto media = dir.path() / "media";
    std::filesystem::create_directories(media / "sub");
    std::filesystem::create_directories(media / ".cache");
    writeMedia(media, "b.wav", 5.0);
    writeMedia(media, "a.MP3", 5.0);
    writeMedia(media, ".hidden.wav", 5.0);
    writeMedia(media / "sub", "c.flac", 5.0);
    writeMedia(media / ".cache", "d.wav", 5.0);
    std::ofstream(media / "notes.txt") << "not media";

    SUBCASE("top level only by default") {
        auto scan = work.scanDirectory(media);
        REQUIRE(scan.ok);
        CHECK(scan.errors.empty());
        REQUIRE(scan.files.size() == 2);
        CHECK(scan.files[0].path.filename() == "a.MP3");
        CHECK(scan.files[1].path.filename() == "b.wav");
        CHECK(scan.files[0].path.is_absolute());
        CHECK(scan.files[1].size == std::filesystem::file_size(media / "b.wav"));
    }

    SUBCASE("recursive scans skip hidden directories") {
        auto scan = work.scanDirectory(media, true);
        REQUIRE(scan.ok);
        REQUIRE(scan.files.size() == 3);
        CHECK(scan.files[2].path.filename() == "c.flac");
        CHECK(scan.files[2].path.parent_path().filename() == "sub");
    }

    SUBCASE("completed transcripts are flagged") {
        auto done = work.submit(media / "b.wav");
        REQUIRE(done.ok);
        auto job = *store.get(done.id);
        job.status = Status::Completed;
        REQUIRE(store.update(job));
        // Pending work does not count
        REQUIRE(work.submit(media / "a.MP3").ok);

        auto scan = work.scanDirectory(media);
        REQUIRE(scan.files.size() == 2);
        CHECK_FALSE(scan.files[0].alreadyTranscribed);
        CHECK(scan.files[1].alreadyTranscribed);
    }

    SUBCASE("a missing directory is an error") {
        auto scan = work.scanDirectory(dir.path() / "absent");
        CHECK_FALSE(scan.ok);
        REQUIRE(scan.errors.size() == 1);
        CHECK(scan.errors[0].find("Not a directory") == 0);
        CHECK(scan.files.empty());
    }
}
