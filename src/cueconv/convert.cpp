// CUE sheet / lossless audio to MP3 converter
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "internal.h"

using namespace cueconv::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static void add_metadata(
    std::vector<std::string>& argv,
    const char* key,
    const std::string& value) {

    if (value.empty()) return;
    argv.push_back("-metadata");
    argv.push_back(std::string(key) + "=" + value);
}

static std::vector<std::string> build_encoder_args(
    const CueConvJob& job,
    const CueConvSettings& settings) {

    std::vector<std::string> argv = {
        program_or_default(settings.ffmpeg, "ffmpeg"),
        "-hide_banner", "-nostdin", "-loglevel", "error", "-y",
        "-i", job.source,
        "-q:a", std::to_string(settings.quality),
    };
    add_metadata(argv, "artist", to_string_or_empty(job.artist));
    add_metadata(argv, "album", to_string_or_empty(job.album));
    add_metadata(argv, "title", to_string_or_empty(job.title));
    add_metadata(argv, "genre", to_string_or_empty(job.genre));
    add_metadata(argv, "disc", to_string_or_empty(job.disc));
    if (job.track_number > 0 && job.total_tracks > 0) {
        add_metadata(argv, "track",
            std::to_string(job.track_number) + "/" + std::to_string(job.total_tracks));
    }
    argv.push_back(job.destination);
    return argv;
}

static void count_result(
    CueConvCounters* counters,
    bool success) {

    if (!counters) return;
    std::lock_guard<std::mutex> guard(counters->lock);
    if (success) {
        ++counters->succeeded;
    } else {
        ++counters->failed;
    }
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

CueConvCounters* cueconv_counters_new() {
    return new CueConvCounters{};
}

void cueconv_release_counters(
    CueConvCounters* p) {

    delete p;
}

void cueconv_counters_add_error(
    CueConvCounters* p) {

    count_result(p, false);
}

size_t cueconv_counters_succeeded(
    const CueConvCounters* p) {

    if (!p) return 0;
    std::lock_guard<std::mutex> guard(p->lock);
    return p->succeeded;
}

size_t cueconv_counters_failed(
    const CueConvCounters* p) {

    if (!p) return 0;
    std::lock_guard<std::mutex> guard(p->lock);
    return p->failed;
}

int cueconv_convert(
    const CueConvJob* job,
    const CueConvSettings* settings,
    CueConvCounters* counters,
    const char** error) {

    clear_error(error);
    if (!job || !job->source || !job->destination || !settings) {
        set_error(error, "Invalid arguments to cueconv_convert");
        count_result(counters, false);
        return 0;
    }

    const ProcessResult r = run_process(build_encoder_args(*job, *settings));
    if (!r.launched || !r.exited_ok) {
        const std::string detail = first_line(r.err);
        set_error(error,
            "Failed: "
            + std::filesystem::path(job->destination).filename().string()
            + ": " + (detail.empty() ? r.message : detail));
        count_result(counters, false);
        return 0;
    }

    count_result(counters, true);
    return 1;
}

};
