// CUE sheet / lossless audio to MP3 converter
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

#include <glib.h>

#include "internal.h"

using namespace cueconv::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static const char* const cue_extensions[] = {".cue"};
static const char* const standalone_extensions[] = {".flac", ".ape"};

template <size_t N>
static bool has_any_extension(
    const std::filesystem::path& path,
    const char* const (&exts)[N]) {

    for (const char* ext : exts) {
        if (is_extension(path, ext)) return true;
    }
    return false;
}

template <size_t N>
static bool collect_files(
    const std::string& root,
    const char* const (&exts)[N],
    std::vector<std::filesystem::path>& out,
    std::string& err_out) {

    out.clear();
    err_out.clear();
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        err_out = "Path not found or not a directory: " + root;
        return false;
    }

    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    const std::filesystem::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (it->is_regular_file(fec) && has_any_extension(it->path(), exts)) {
            out.push_back(it->path());
        }
    }
    std::sort(out.begin(), out.end());
    return true;
}

// Parent of `file` relative to the scan root; empty at the root itself.
static std::filesystem::path output_subdir(
    const std::filesystem::path& file,
    const std::filesystem::path& root) {

    const std::filesystem::path rel = file.parent_path().lexically_relative(root);
    if (rel.empty() || rel == ".") return {};
    return rel;
}

static std::string make_temp_dir(
    const std::filesystem::path& parent,
    const char* prefix,
    std::string& err_out) {

    err_out.clear();
    std::string tmpl = (parent / (std::string(prefix) + "XXXXXX")).string();
    if (!g_mkdtemp(tmpl.data())) {
        err_out = "Failed to create working directory under " + parent.string()
            + ": " + g_strerror(errno);
        return {};
    }
    return tmpl;
}

static void remove_tree(
    const std::string& path) {

    if (path.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

static void print_event(
    CueConvEventKind kind,
    const char* message) {

    switch (kind) {
        case EVENT_INFO:
            std::cout << message << "\n";
            break;
        case EVENT_WARNING:
            std::cerr << "WARNING: " << message << "\n";
            break;
        case EVENT_FAILURE:
            std::cerr << message << "\n";
            break;
    }
}

// Owned strings behind one CUE track job.
struct TrackJobStrings {
    std::string source;
    std::string destination;
    std::string artist;
    std::string album;
    std::string title;
};

struct PipelineContext {
    std::filesystem::path root;
    const CueConvSettings* settings{nullptr};
    CueConvCounters* counters{nullptr};
    CueConvEventCallback on_event{nullptr};
    CueConvJobCallback on_job{nullptr};
    std::string run_dir;

    void emit(CueConvEventKind kind, const std::string& message) const {
        if (on_event) {
            on_event(kind, message.c_str());
        } else {
            print_event(kind, message.c_str());
        }
    }

    void fail(const std::string& message) const {
        emit(EVENT_FAILURE, message);
        cueconv_counters_add_error(counters);
    }
};

static std::string take_string(
    char* s) {

    std::string out = to_string_or_empty(s);
    cueconv_release_string(s);
    return out;
}

static void process_cue_sheet(
    const PipelineContext& ctx,
    const std::filesystem::path& cue_path,
    const CueConvAudioSource& source) {

    const CueConvSettings& settings = *ctx.settings;
    const std::string cue_name = cue_path.filename().string();
    ctx.emit(EVENT_INFO, "Processing CUE: " + cue_name);

    const std::filesystem::path full_output =
        std::filesystem::path(settings.output_dir) / output_subdir(cue_path, ctx.root);
    std::string dir_err;
    if (!ensure_directory(full_output.string(), dir_err)) {
        ctx.fail(dir_err);
        return;
    }

    const std::string sheet_dir = make_temp_dir(ctx.run_dir, "sheet", dir_err);
    if (sheet_dir.empty()) {
        ctx.fail(dir_err);
        return;
    }

    CueConvCue* cue = cueconv_open_cue(cue_path.c_str(), sheet_dir.c_str(), &settings, nullptr);
    CueConvTrackFiles* files = nullptr;
    auto cleanup = [&]() {
        cueconv_release_track_files(files);
        cueconv_close_cue(cue);
        remove_tree(sheet_dir);
    };

    const int total_tracks = cueconv_cue_track_count(cue);
    if (total_tracks <= 0) {
        ctx.fail("No tracks found in CUE file: " + cue_name);
        cleanup();
        return;
    }

    ctx.emit(EVENT_INFO, "Splitting audio into " + std::to_string(total_tracks) + " tracks...");
    const char* split_err = nullptr;
    files = cueconv_split_tracks(cue, &source, total_tracks, sheet_dir.c_str(), &settings, &split_err);
    if (!files) {
        ctx.fail(split_err ? split_err : "Failed to split audio file");
        cueconv_release_error(split_err);
        cleanup();
        return;
    }

    const std::string cfg_artist = to_string_or_empty(settings.artist);
    const std::string cfg_album = to_string_or_empty(settings.album);
    const std::string album = !cfg_album.empty()
        ? cfg_album
        : take_string(cueconv_cue_metadata(cue, 0, CUE_FIELD_TITLE));
    bool disc_performer_loaded = false;
    std::string disc_performer;

    std::vector<TrackJobStrings> strings;
    strings.reserve(files->count);
    std::vector<int> numbers;
    for (int n = 1; n <= total_tracks; ++n) {
        const char* track_file = files->paths[n - 1];
        if (!track_file) {
            ctx.emit(EVENT_WARNING, "Track " + std::to_string(n) + " not found, skipping");
            cueconv_counters_add_error(ctx.counters);
            continue;
        }

        TrackJobStrings s;
        s.source = track_file;
        s.title = take_string(cueconv_cue_metadata(cue, n, CUE_FIELD_TITLE));
        s.artist = cfg_artist;
        if (s.artist.empty()) {
            s.artist = take_string(cueconv_cue_metadata(cue, n, CUE_FIELD_PERFORMER));
        }
        if (s.artist.empty()) {
            if (!disc_performer_loaded) {
                disc_performer = take_string(cueconv_cue_metadata(cue, 0, CUE_FIELD_PERFORMER));
                disc_performer_loaded = true;
            }
            s.artist = disc_performer;
        }
        s.album = album;
        s.destination = (full_output / track_filename(n, s.title)).string();
        strings.push_back(std::move(s));
        numbers.push_back(n);
    }

    std::vector<CueConvJob> jobs;
    jobs.reserve(strings.size());
    for (size_t i = 0; i < strings.size(); ++i) {
        const auto& s = strings[i];
        CueConvJob job{};
        job.source = s.source.c_str();
        job.destination = s.destination.c_str();
        job.artist = s.artist.empty() ? nullptr : s.artist.c_str();
        job.album = s.album.empty() ? nullptr : s.album.c_str();
        job.title = s.title.empty() ? nullptr : s.title.c_str();
        job.genre = settings.genre;
        job.disc = settings.disc;
        job.track_number = numbers[i];
        job.total_tracks = total_tracks;
        jobs.push_back(job);
    }

    if (!jobs.empty()) {
        const int parallel = settings.parallel <= 0 ? 1 : settings.parallel;
        ctx.emit(EVENT_INFO,
            "Converting " + std::to_string(jobs.size()) + " tracks to MP3 (using "
            + std::to_string(parallel) + " parallel jobs)...");
        cueconv_run_jobs(jobs.data(), jobs.size(), settings.parallel,
                         &settings, ctx.counters, ctx.on_job);
    }

    cleanup();
}

static size_t process_standalone(
    const PipelineContext& ctx,
    const std::unordered_set<std::string>& claimed) {

    ctx.emit(EVENT_INFO, "Scanning for standalone audio files...");

    std::vector<std::string> claimed_storage(claimed.begin(), claimed.end());
    std::vector<const char*> claimed_paths;
    claimed_paths.reserve(claimed_storage.size());
    for (const auto& p : claimed_storage) claimed_paths.push_back(p.c_str());
    CueConvPathList claimed_list{};
    claimed_list.paths = claimed_paths.data();
    claimed_list.count = claimed_paths.size();

    const char* err = nullptr;
    std::unique_ptr<CueConvJobList, decltype(&cueconv_release_job_list)> list(
        cueconv_build_standalone_jobs(ctx.root.c_str(), &claimed_list, ctx.settings, &err),
        &cueconv_release_job_list);
    if (err) {
        ctx.emit(EVENT_WARNING, err);
        cueconv_release_error(err);
    }
    if (!list || list->count == 0) {
        ctx.emit(EVENT_INFO, "No standalone audio files found");
        return 0;
    }
    ctx.emit(EVENT_INFO, "Found " + std::to_string(list->count) + " audio file(s)");

    std::vector<CueConvJob> jobs;
    jobs.reserve(list->count);
    for (size_t i = 0; i < list->count; ++i) {
        const CueConvJob& job = list->jobs[i];
        const std::filesystem::path dest(job.destination);
        std::string dir_err;
        if (!ensure_directory(dest.parent_path().string(), dir_err)) {
            ctx.fail(dir_err);
            continue;
        }
        ctx.emit(EVENT_INFO,
            "Processing standalone: " + std::filesystem::path(job.source).filename().string());
        jobs.push_back(job);
    }

    cueconv_run_jobs(jobs.data(), jobs.size(), ctx.settings->parallel,
                     ctx.settings, ctx.counters, ctx.on_job);
    return jobs.size();
}

/* ------------------------------------------------------------------- */

namespace cueconv::detail {

bool is_extension(
    const std::filesystem::path& path,
    const char* ext) {

    return to_lower(path.extension().string()) == ext;
}

std::string track_filename(
    int track_number,
    const std::string& title) {

    std::ostringstream oss;
    oss << std::setw(2) << std::setfill('0') << track_number << " - ";
    const std::string safe_title = sanitize_filename(title);
    if (safe_title.empty()) {
        oss << "Track " << std::setw(2) << std::setfill('0') << track_number;
    } else {
        oss << safe_title;
    }
    oss << ".mp3";
    return oss.str();
}

std::string standalone_filename(
    const std::filesystem::path& source) {

    std::string safe_name = sanitize_filename(source.stem().string());
    if (safe_name.empty()) safe_name = "audio";
    return safe_name + ".mp3";
}

// Suffixes " (2)", " (3)", ... until the path is not already taken in this batch.
std::filesystem::path unique_destination(
    const std::filesystem::path& directory,
    const std::string& filename,
    std::unordered_set<std::string>& taken) {

    std::filesystem::path candidate = directory / filename;
    if (taken.insert(candidate.string()).second) return candidate;

    const std::filesystem::path name(filename);
    const std::string stem = name.stem().string();
    const std::string extension = name.extension().string();
    for (int n = 2;; ++n) {
        candidate = directory / (stem + " (" + std::to_string(n) + ")" + extension);
        if (taken.insert(candidate.string()).second) return candidate;
    }
}

}  // namespace cueconv::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

char* cueconv_track_filename(
    int track_number,
    const char* title) {

    return make_mutable_cstr_copy(track_filename(track_number, to_string_or_empty(title)));
}

char* cueconv_standalone_filename(
    const char* source_path) {

    return make_mutable_cstr_copy(standalone_filename(to_string_or_empty(source_path)));
}

CueConvPathList* cueconv_collect_cue_sheets(
    const char* root,
    const char** error) {

    clear_error(error);
    auto* list = new CueConvPathList{};
    if (!root) {
        set_error(error, "Path is null");
        return list;
    }

    std::vector<std::filesystem::path> found;
    std::string err;
    if (!collect_files(root, cue_extensions, found, err)) {
        set_error(error, err);
        return list;
    }
    if (!found.empty()) {
        list->count = found.size();
        list->paths = new const char*[list->count]{};
        for (size_t i = 0; i < list->count; ++i) {
            list->paths[i] = make_cstr_copy(found[i].string());
        }
    }
    return list;
}

void cueconv_release_path_list(
    CueConvPathList* p) {

    if (!p) return;
    if (p->paths) {
        for (size_t i = 0; i < p->count; ++i) {
            release_cstr(p->paths[i]);
        }
        delete[] p->paths;
        p->paths = nullptr;
    }
    p->count = 0;
    delete p;
}

CueConvJobList* cueconv_build_standalone_jobs(
    const char* root,
    const CueConvPathList* claimed,
    const CueConvSettings* settings,
    const char** error) {

    clear_error(error);
    auto* list = new CueConvJobList{};
    if (!root || !settings || !settings->output_dir) {
        set_error(error, "Invalid arguments to cueconv_build_standalone_jobs");
        return list;
    }

    std::unordered_set<std::string> claimed_set;
    if (claimed && claimed->paths) {
        for (size_t i = 0; i < claimed->count; ++i) {
            if (claimed->paths[i]) claimed_set.insert(canonical_path(claimed->paths[i]));
        }
    }

    std::vector<std::filesystem::path> found;
    std::string err;
    if (!collect_files(root, standalone_extensions, found, err)) {
        set_error(error, err);
        return list;
    }

    std::vector<CueConvJob> jobs;
    std::unordered_set<std::string> destinations;
    const std::filesystem::path root_path(root);
    for (const auto& path : found) {
        if (claimed_set.count(canonical_path(path)) > 0) continue;

        const std::filesystem::path destination = unique_destination(
            std::filesystem::path(settings->output_dir) / output_subdir(path, root_path),
            standalone_filename(path),
            destinations);

        CueConvJob job{};
        job.source = make_cstr_copy(path.string());
        job.destination = make_cstr_copy(destination.string());
        job.artist = make_cstr_copy_nullable(settings->artist);
        job.album = make_cstr_copy_nullable(settings->album);
        job.title = nullptr;
        job.genre = make_cstr_copy_nullable(settings->genre);
        job.disc = make_cstr_copy_nullable(settings->disc);
        job.track_number = 0;
        job.total_tracks = 0;
        jobs.push_back(job);
    }

    if (!jobs.empty()) {
        list->count = jobs.size();
        list->jobs = new CueConvJob[list->count]{};
        for (size_t i = 0; i < list->count; ++i) {
            list->jobs[i] = jobs[i];
        }
    }
    return list;
}

void cueconv_release_job_list(
    CueConvJobList* p) {

    if (!p) return;
    if (p->jobs) {
        for (size_t i = 0; i < p->count; ++i) {
            auto& job = p->jobs[i];
            release_cstr(job.source);
            release_cstr(job.destination);
            release_cstr(job.artist);
            release_cstr(job.album);
            release_cstr(job.title);
            release_cstr(job.genre);
            release_cstr(job.disc);
        }
        delete[] p->jobs;
        p->jobs = nullptr;
    }
    p->count = 0;
    delete p;
}

CueConvSummary* cueconv_run_pipeline(
    const char* root,
    const CueConvSettings* settings,
    CueConvEventCallback on_event,
    CueConvJobCallback on_job,
    const char** error) {

    clear_error(error);
    if (!root || !settings || !settings->output_dir) {
        set_error(error, "Invalid arguments to cueconv_run_pipeline");
        return nullptr;
    }

    std::string err;
    if (!ensure_directory(settings->output_dir, err)) {
        set_error(error, err);
        return nullptr;
    }

    const std::filesystem::path temp_base = settings->temp_dir && *settings->temp_dir
        ? std::filesystem::path(settings->temp_dir)
        : std::filesystem::path(g_get_tmp_dir());
    if (!ensure_directory(temp_base.string(), err)) {
        set_error(error, err);
        return nullptr;
    }

    std::unique_ptr<CueConvCounters, decltype(&cueconv_release_counters)> counters(
        cueconv_counters_new(), &cueconv_release_counters);

    PipelineContext ctx;
    ctx.root = root;
    ctx.settings = settings;
    ctx.counters = counters.get();
    ctx.on_event = on_event;
    ctx.on_job = on_job;
    ctx.run_dir = make_temp_dir(temp_base, "cueconv", err);
    if (ctx.run_dir.empty()) {
        set_error(error, err);
        return nullptr;
    }

    // Phase 1: CUE sheets. Claims must be complete before the standalone scan.
    ctx.emit(EVENT_INFO, "Scanning for CUE files...");
    const char* collect_err = nullptr;
    std::unique_ptr<CueConvPathList, decltype(&cueconv_release_path_list)> sheets(
        cueconv_collect_cue_sheets(root, &collect_err), &cueconv_release_path_list);
    if (collect_err) {
        ctx.emit(EVENT_WARNING, collect_err);
        cueconv_release_error(collect_err);
    }

    std::unordered_set<std::string> claimed;
    if (sheets->count == 0) {
        ctx.emit(EVENT_INFO, "No CUE files found");
    } else {
        ctx.emit(EVENT_INFO, "Found " + std::to_string(sheets->count) + " CUE file(s)");
    }
    for (size_t i = 0; i < sheets->count; ++i) {
        const std::filesystem::path cue_path(sheets->paths[i]);
        const char* resolve_err = nullptr;
        CueConvAudioSource* source = cueconv_resolve_audio_for_cue(cue_path.c_str(), &resolve_err);
        if (!source) {
            ctx.fail(resolve_err
                ? std::string{resolve_err}
                : "No audio file found for: " + cue_path.filename().string());
            cueconv_release_error(resolve_err);
            continue;
        }
        claimed.insert(source->canonical_path);
        process_cue_sheet(ctx, cue_path, *source);
        cueconv_release_audio_source(source);
    }

    // Phase 2: standalone lossless files not consumed above.
    const size_t standalone = process_standalone(ctx, claimed);

    remove_tree(ctx.run_dir);

    auto* summary = new CueConvSummary{};
    summary->succeeded = cueconv_counters_succeeded(counters.get());
    summary->failed = cueconv_counters_failed(counters.get());
    summary->cue_sheets = sheets->count;
    summary->standalone = standalone;
    summary->output_dir = make_cstr_copy(settings->output_dir);
    return summary;
}

void cueconv_release_summary(
    CueConvSummary* p) {

    if (!p) return;
    release_cstr(p->output_dir);
    delete p;
}

};
