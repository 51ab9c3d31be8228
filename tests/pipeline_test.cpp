// CUE sheet / lossless audio to MP3 converter
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "cueconv/cueconv.h"
#include "test_support.h"

using namespace cueconv::test;

namespace {

std::mutex events_lock;
std::vector<std::pair<CueConvEventKind, std::string>> events;
std::vector<std::string> job_errors;

void record_event(CueConvEventKind kind, const char* message) {
    std::lock_guard<std::mutex> guard(events_lock);
    events.emplace_back(kind, message ? message : "");
}

void record_job(const CueConvJobResult* result) {
    std::lock_guard<std::mutex> guard(events_lock);
    if (!result->success) job_errors.push_back(result->error ? result->error : "");
}

bool has_event(CueConvEventKind kind, const std::string& text) {
    std::lock_guard<std::mutex> guard(events_lock);
    return std::any_of(events.begin(), events.end(), [&](const auto& e) {
        return e.first == kind && e.second.find(text) != std::string::npos;
    });
}

std::string sheet(const std::string& audio, const std::vector<std::string>& titles) {
    std::string s =
        "PERFORMER \"Disc Artist\"\n"
        "TITLE \"Disc Title\"\n"
        "FILE \"" + audio + "\" FLAC\n";
    for (size_t i = 0; i < titles.size(); ++i) {
        const std::string n = (i + 1 < 10 ? "0" : "") + std::to_string(i + 1);
        s += "  TRACK " + n + " AUDIO\n";
        s += "    TITLE \"" + titles[i] + "\"\n";
        s += "    INDEX 01 0" + std::to_string(i) + ":00:00\n";
    }
    return s;
}

using SummaryPtr = std::unique_ptr<CueConvSummary, decltype(&cueconv_release_summary)>;

}  // namespace

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        {
            std::lock_guard<std::mutex> guard(events_lock);
            events.clear();
            job_errors.clear();
        }
        source_ = tmp_ / "source";
        output_ = tmp_ / "out";
        work_ = tmp_ / "work";
        std::filesystem::create_directories(source_);

        holder_.artist = "";
        holder_.output_dir = output_.string();
        holder_.temp_dir = work_.string();
        holder_.parallel = 2;
        holder_.ffmpeg = write_fake_encoder(tmp_.path(), tmp_ / "ffmpeg.log").string();
        holder_.shnsplit = write_fake_splitter(tmp_.path()).string();
        holder_.cueprint = write_fake_cueprint(tmp_.path(), tmp_ / "cueprint.log").string();
    }

    SummaryPtr run() {
        const CueConvSettings settings = holder_.settings();
        const char* err = nullptr;
        SummaryPtr summary(
            cueconv_run_pipeline(source_.c_str(), &settings, record_event, record_job, &err),
            &cueconv_release_summary);
        if (err) {
            ADD_FAILURE() << err;
            cueconv_release_error(err);
        }
        return summary;
    }

    std::vector<std::string> encoder_calls() const {
        return read_lines(tmp_ / "ffmpeg.log");
    }

    TempDir tmp_;
    std::filesystem::path source_;
    std::filesystem::path output_;
    std::filesystem::path work_;
    SettingsHolder holder_;
};

TEST_F(PipelineTest, ConvertsCueTracksWithFallbackNames) {
    write_file(source_ / "album.cue", sheet("album.flac", {"Intro", "", "Finale"}));
    write_file(source_ / "album.flac", "pcm");

    auto summary = run();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary->cue_sheets, 1u);
    EXPECT_EQ(summary->standalone, 0u);
    EXPECT_EQ(summary->succeeded, 3u);
    EXPECT_EQ(summary->failed, 0u);
    EXPECT_EQ(std::string(summary->output_dir), output_.string());

    const std::vector<std::string> expected = {
        "01 - Intro.mp3",
        "02 - Track 02.mp3",
        "03 - Finale.mp3",
    };
    EXPECT_EQ(list_files(output_), expected);

    // Album from the disc title; artist from the disc performer.
    const auto calls = encoder_calls();
    ASSERT_EQ(calls.size(), 3u);
    for (const auto& call : calls) {
        EXPECT_NE(call.find("album=Disc Title"), std::string::npos) << call;
        EXPECT_NE(call.find("artist=Disc Artist"), std::string::npos) << call;
        EXPECT_NE(call.find("/3 "), std::string::npos) << call;
    }

    EXPECT_TRUE(has_event(EVENT_INFO, "Found 1 CUE file(s)"));
    EXPECT_TRUE(has_event(EVENT_INFO, "Processing CUE: album.cue"));
    EXPECT_TRUE(has_event(EVENT_INFO, "Splitting audio into 3 tracks..."));
    EXPECT_TRUE(has_event(EVENT_INFO, "Converting 3 tracks to MP3 (using 2 parallel jobs)..."));
}

TEST_F(PipelineTest, ConfiguredTagsOverrideSheet) {
    holder_.artist = "Debussy";
    holder_.album = "Complete Works";
    holder_.genre = "Classical";
    holder_.disc = "2";
    write_file(source_ / "album.cue", sheet("album.flac", {"Reverie"}));
    write_file(source_ / "album.flac", "pcm");

    auto summary = run();
    ASSERT_TRUE(summary);
    const auto calls = encoder_calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_NE(calls[0].find("artist=Debussy"), std::string::npos);
    EXPECT_NE(calls[0].find("album=Complete Works"), std::string::npos);
    EXPECT_NE(calls[0].find("title=Reverie"), std::string::npos);
    EXPECT_NE(calls[0].find("genre=Classical"), std::string::npos);
    EXPECT_NE(calls[0].find("disc=2"), std::string::npos);
    EXPECT_NE(calls[0].find("track=1/1"), std::string::npos);
}

TEST_F(PipelineTest, ClaimedAudioIsNotConvertedAgain) {
    write_file(source_ / "a.cue", sheet("a.flac", {"One", "Two"}));
    write_file(source_ / "a.flac", "pcm-a");
    write_file(source_ / "b.flac", "pcm-b");

    auto summary = run();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary->standalone, 1u);
    EXPECT_EQ(summary->succeeded, 3u);

    const std::vector<std::string> expected = {"01 - One.mp3", "02 - Two.mp3", "b.mp3"};
    EXPECT_EQ(list_files(output_), expected);
    EXPECT_EQ(read_file(output_ / "b.mp3"), "pcm-b");
    EXPECT_TRUE(has_event(EVENT_INFO, "Processing standalone: b.flac"));
}

TEST_F(PipelineTest, ClaimsAudioReferencedFromOtherDirectory) {
    write_file(source_ / "sheets" / "live.cue", sheet("../audio/live.flac", {"Opening"}));
    write_file(source_ / "audio" / "live.flac", "pcm");

    auto summary = run();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary->standalone, 0u);
    EXPECT_EQ(summary->succeeded, 1u);
    EXPECT_EQ(list_files(output_ / "sheets"), std::vector<std::string>{"01 - Opening.mp3"});
    EXPECT_TRUE(list_files(output_ / "audio").empty());
}

TEST_F(PipelineTest, MirrorsSourceDirectories) {
    write_file(source_ / "Artist" / "Album" / "disc.cue", sheet("disc.flac", {"A"}));
    write_file(source_ / "Artist" / "Album" / "disc.flac", "pcm");
    write_file(source_ / "Singles" / "Hit.FLAC", "pcm");

    auto summary = run();
    ASSERT_TRUE(summary);
    EXPECT_EQ(list_files(output_ / "Artist" / "Album"), std::vector<std::string>{"01 - A.mp3"});
    EXPECT_EQ(list_files(output_ / "Singles"), std::vector<std::string>{"Hit.mp3"});
}

TEST_F(PipelineTest, StandaloneFilesSharingAStemKeepBothOutputs) {
    write_file(source_ / "song.ape", "pcm-ape");
    write_file(source_ / "song.flac", "pcm-flac");

    auto summary = run();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary->standalone, 2u);
    EXPECT_EQ(summary->succeeded, 2u);
    const std::vector<std::string> expected = {"song (2).mp3", "song.mp3"};
    EXPECT_EQ(list_files(output_), expected);
    EXPECT_EQ(read_file(output_ / "song.mp3"), "pcm-ape");
    EXPECT_EQ(read_file(output_ / "song (2).mp3"), "pcm-flac");
}

TEST_F(PipelineTest, MissingAudioCountsOneErrorAndContinues) {
    write_file(source_ / "c.cue", sheet("missing.flac", {"Lost"}));
    write_file(source_ / "d.flac", "pcm");

    auto summary = run();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary->cue_sheets, 1u);
    EXPECT_EQ(summary->failed, 1u);
    EXPECT_EQ(summary->succeeded, 1u);
    EXPECT_EQ(summary->standalone, 1u);
    EXPECT_TRUE(has_event(EVENT_FAILURE, "No audio file found for: c.cue"));
    EXPECT_EQ(list_files(output_), std::vector<std::string>{"d.mp3"});
}

TEST_F(PipelineTest, MissingSplitTrackIsWarnedAndCounted) {
    holder_.shnsplit = write_fake_splitter(tmp_.path(), 2).string();
    write_file(source_ / "album.cue", sheet("album.flac", {"One", "Two", "Three"}));
    write_file(source_ / "album.flac", "pcm");

    auto summary = run();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary->succeeded, 2u);
    EXPECT_EQ(summary->failed, 1u);
    EXPECT_TRUE(has_event(EVENT_WARNING, "Track 2 not found, skipping"));
    const std::vector<std::string> expected = {"01 - One.mp3", "03 - Three.mp3"};
    EXPECT_EQ(list_files(output_), expected);
}

TEST_F(PipelineTest, SplitFailureCountsOneError) {
    holder_.shnsplit = write_failing_tool(tmp_.path(), "broken-shnsplit", "bad cue").string();
    write_file(source_ / "album.cue", sheet("album.flac", {"One", "Two"}));
    write_file(source_ / "album.flac", "pcm");

    auto summary = run();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary->succeeded, 0u);
    EXPECT_EQ(summary->failed, 1u);
    EXPECT_TRUE(has_event(EVENT_FAILURE, "Failed to split audio file: bad cue"));
}

TEST_F(PipelineTest, EmptySheetCountsOneError) {
    write_file(source_ / "empty.cue", "TITLE \"Nothing\"\nFILE \"empty.flac\" FLAC\n");
    write_file(source_ / "empty.flac", "pcm");

    auto summary = run();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary->failed, 1u);
    EXPECT_EQ(summary->standalone, 0u);
    EXPECT_TRUE(has_event(EVENT_FAILURE, "No tracks found in CUE file: empty.cue"));
}

TEST_F(PipelineTest, EncoderFailureIsReportedPerJob) {
    write_file(source_ / "failme.flac", "pcm");
    write_file(source_ / "good.flac", "pcm");

    auto summary = run();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary->standalone, 2u);
    EXPECT_EQ(summary->succeeded, 1u);
    EXPECT_EQ(summary->failed, 1u);
    ASSERT_EQ(job_errors.size(), 1u);
    EXPECT_EQ(job_errors[0], "Failed: failme.mp3: fake encoder failure");
}

TEST_F(PipelineTest, DecodesLegacySheetForNames) {
    write_file(source_ / "legacy.cue", sheet("legacy.flac", {"Caf\xE9"}));
    write_file(source_ / "legacy.flac", "pcm");
    const std::string original = read_file(source_ / "legacy.cue");

    auto summary = run();
    ASSERT_TRUE(summary);
    EXPECT_EQ(list_files(output_), std::vector<std::string>{"01 - Café.mp3"});
    EXPECT_EQ(read_file(source_ / "legacy.cue"), original);
}

TEST_F(PipelineTest, ApeSheetIsDecodedThenSplit) {
    write_file(source_ / "x.cue", sheet("x.ape", {"First", "Second"}));
    write_file(source_ / "x.ape", "monkey");

    auto summary = run();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary->succeeded, 2u);
    EXPECT_EQ(summary->standalone, 0u);
    const std::vector<std::string> expected = {"01 - First.mp3", "02 - Second.mp3"};
    EXPECT_EQ(list_files(output_), expected);
    // One decode plus one encode per track.
    EXPECT_EQ(encoder_calls().size(), 3u);
}

TEST_F(PipelineTest, RemovesWorkingFiles) {
    write_file(source_ / "album.cue", sheet("album.flac", {"One", "Two"}));
    write_file(source_ / "album.flac", "pcm");
    write_file(source_ / "solo.ape", "pcm");

    auto summary = run();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary->succeeded, 3u);
    EXPECT_TRUE(std::filesystem::is_directory(work_));
    EXPECT_TRUE(is_empty_dir(work_));
    EXPECT_EQ(list_files(source_), (std::vector<std::string>{"album.cue", "album.flac", "solo.ape"}));
}

TEST_F(PipelineTest, EmptySourceTree) {
    auto summary = run();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary->cue_sheets, 0u);
    EXPECT_EQ(summary->standalone, 0u);
    EXPECT_EQ(summary->succeeded, 0u);
    EXPECT_EQ(summary->failed, 0u);
    EXPECT_TRUE(has_event(EVENT_INFO, "No CUE files found"));
    EXPECT_TRUE(std::filesystem::is_directory(output_));
}

TEST(CollectCueSheetsTest, FindsSheetsRecursivelyInOrder) {
    TempDir tmp;
    write_file(tmp / "b" / "two.cue", "");
    write_file(tmp / "a" / "one.CUE", "");
    write_file(tmp / "a" / "notes.txt", "");

    const char* err = nullptr;
    CueConvPathList* list = cueconv_collect_cue_sheets(tmp.path().c_str(), &err);
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(err, nullptr);
    ASSERT_EQ(list->count, 2u);
    EXPECT_EQ(std::string(list->paths[0]), (tmp / "a" / "one.CUE").string());
    EXPECT_EQ(std::string(list->paths[1]), (tmp / "b" / "two.cue").string());
    cueconv_release_path_list(list);
}

TEST(CollectCueSheetsTest, ReportsMissingRoot) {
    TempDir tmp;
    const char* err = nullptr;
    CueConvPathList* list = cueconv_collect_cue_sheets((tmp / "absent").c_str(), &err);
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(list->count, 0u);
    ASSERT_NE(err, nullptr);
    EXPECT_NE(std::string(err).find("Path not found or not a directory"), std::string::npos);
    cueconv_release_error(err);
    cueconv_release_path_list(list);
}

TEST(StandaloneJobsTest, GivesCollidingOutputsDistinctNames) {
    TempDir tmp;
    write_file(tmp / "a.ape", "");
    write_file(tmp / "a.flac", "");
    write_file(tmp / "x?.flac", "");
    write_file(tmp / "x_.flac", "");

    SettingsHolder holder;
    holder.output_dir = (tmp / "out").string();
    const CueConvSettings settings = holder.settings();

    const char* err = nullptr;
    CueConvJobList* list = cueconv_build_standalone_jobs(tmp.path().c_str(), nullptr, &settings, &err);
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(err, nullptr);
    ASSERT_EQ(list->count, 4u);

    std::vector<std::string> names;
    for (size_t i = 0; i < list->count; ++i) {
        names.push_back(std::filesystem::path(list->jobs[i].destination).filename().string());
    }
    const std::vector<std::string> expected = {"a.mp3", "a (2).mp3", "x_.mp3", "x_ (2).mp3"};
    EXPECT_EQ(names, expected);
    cueconv_release_job_list(list);
}

TEST(StandaloneJobsTest, SkipsClaimedPaths) {
    TempDir tmp;
    write_file(tmp / "a.flac", "");
    write_file(tmp / "b.ape", "");
    write_file(tmp / "c.wav", "");

    SettingsHolder holder;
    holder.artist = "Someone";
    holder.genre = "Jazz";
    holder.output_dir = (tmp / "out").string();
    const CueConvSettings settings = holder.settings();

    // Claims are compared canonically.
    const std::string claim = (tmp / "." / "a.flac").string();
    const char* claimed_paths[] = {claim.c_str()};
    const CueConvPathList claimed{claimed_paths, 1};

    const char* err = nullptr;
    CueConvJobList* list = cueconv_build_standalone_jobs(tmp.path().c_str(), &claimed, &settings, &err);
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(err, nullptr);
    ASSERT_EQ(list->count, 1u);
    const CueConvJob& job = list->jobs[0];
    EXPECT_EQ(std::string(job.source), (tmp / "b.ape").string());
    EXPECT_EQ(std::string(job.destination), (tmp / "out" / "b.mp3").string());
    EXPECT_EQ(std::string(job.artist), "Someone");
    EXPECT_EQ(std::string(job.genre), "Jazz");
    EXPECT_EQ(job.album, nullptr);
    EXPECT_EQ(job.title, nullptr);
    EXPECT_EQ(job.track_number, 0);
    cueconv_release_job_list(list);
}
