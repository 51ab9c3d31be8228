// CUE sheet / lossless audio to MP3 converter
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <filesystem>
#include <string>
#include <vector>

#include <glib.h>

#include "internal.h"

using namespace cueconv::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

// Same-basename sibling extensions, in priority order.
static const char* const sibling_extensions[] = {
    ".flac",
    ".ape",
    ".wav",
};

static CueConvAudioFormat format_from_path(
    const std::filesystem::path& path) {

    const std::string ext = to_lower(path.extension().string());
    if (ext == ".flac") return AUDIO_FORMAT_FLAC;
    if (ext == ".ape") return AUDIO_FORMAT_APE;
    if (ext == ".wav") return AUDIO_FORMAT_WAV;
    return AUDIO_FORMAT_UNKNOWN;
}

static bool is_existing_file(
    const std::filesystem::path& path) {

    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

static CueConvAudioSource* make_audio_source(
    const std::filesystem::path& path) {

    auto* source = new CueConvAudioSource{};
    source->path = make_cstr_copy(path.string());
    source->canonical_path = make_cstr_copy(canonical_path(path));
    source->format = format_from_path(path);
    return source;
}

// First `FILE "<name>" WAVE|APE|FLAC` directive in the sheet text.
static std::string find_file_directive(
    const std::string& text) {

    GError* gerr = nullptr;
    GRegex* regex = g_regex_new(
        "^FILE \"(.*)\" (WAVE|APE|FLAC)",
        static_cast<GRegexCompileFlags>(G_REGEX_MULTILINE | G_REGEX_RAW),
        static_cast<GRegexMatchFlags>(0),
        &gerr);
    if (!regex) {
        g_clear_error(&gerr);
        return {};
    }

    std::string result;
    GMatchInfo* match = nullptr;
    if (g_regex_match_full(regex, text.data(), static_cast<gssize>(text.size()),
                           0, static_cast<GRegexMatchFlags>(0), &match, nullptr)) {
        gchar* name = g_match_info_fetch(match, 1);
        result = to_string_or_empty(name);
        g_free(name);
    }
    g_match_info_free(match);
    g_regex_unref(regex);
    return result;
}

static std::string query_cueprint(
    const CueConvCue* cue,
    const std::vector<std::string>& template_args) {

    std::vector<std::string> argv;
    argv.push_back(cue->cueprint);
    argv.insert(argv.end(), template_args.begin(), template_args.end());
    argv.push_back(cue->read_path);

    const ProcessResult r = run_process(argv);
    if (!r.launched || !r.exited_ok) return {};
    return trim(r.out);
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

CueConvAudioSource* cueconv_resolve_audio_for_cue(
    const char* cue_path,
    const char** error) {

    clear_error(error);
    if (!cue_path) {
        set_error(error, "Path is null");
        return nullptr;
    }

    const std::filesystem::path cue(cue_path);
    const std::filesystem::path dir = cue.parent_path();
    const std::string stem = cue.stem().string();

    for (const char* ext : sibling_extensions) {
        const std::filesystem::path candidate = dir / (stem + ext);
        if (is_existing_file(candidate)) {
            return make_audio_source(candidate);
        }
    }

    std::string bytes;
    std::string read_err;
    if (!read_file_bytes(cue_path, bytes, read_err)) {
        set_error(error, "Cannot read CUE sheet " + cue.filename().string() + ": " + read_err);
        return nullptr;
    }

    const std::string ref = find_file_directive(decode_cue_bytes(bytes));
    if (ref.empty()) {
        set_error(error, "No audio file found for: " + cue.filename().string());
        return nullptr;
    }

    const std::filesystem::path ref_path(ref);
    const std::filesystem::path candidate = ref_path.is_absolute() ? ref_path : dir / ref_path;
    if (!is_existing_file(candidate)) {
        set_error(error,
            "No audio file found for: " + cue.filename().string()
            + " (FILE \"" + ref + "\" does not exist)");
        return nullptr;
    }
    return make_audio_source(candidate);
}

void cueconv_release_audio_source(
    CueConvAudioSource* p) {

    if (!p) return;
    release_cstr(p->path);
    release_cstr(p->canonical_path);
    delete p;
}

CueConvCue* cueconv_open_cue(
    const char* cue_path,
    const char* work_dir,
    const CueConvSettings* settings,
    const char** error) {

    clear_error(error);
    if (!cue_path || !settings) {
        set_error(error, "Invalid arguments to cueconv_open_cue");
        return nullptr;
    }

    auto* cue = new CueConvCue{};
    cue->cue_path = cue_path;
    cue->read_path = cue_path;
    cue->cueprint = program_or_default(settings->cueprint, "cueprint");

    if (!work_dir) return cue;

    // The metadata reader misreads legacy encodings; hand it a UTF-8 copy.
    std::string bytes;
    std::string read_err;
    if (!read_file_bytes(cue_path, bytes, read_err)) return cue;

    const std::string text = decode_cue_bytes(bytes);
    const std::filesystem::path copy =
        std::filesystem::path(work_dir) /
        (std::filesystem::path(cue_path).stem().string() + ".utf8.cue");
    GError* gerr = nullptr;
    if (g_file_set_contents(copy.c_str(), text.data(), static_cast<gssize>(text.size()), &gerr)) {
        cue->read_path = copy.string();
        cue->owns_copy = true;
    }
    g_clear_error(&gerr);
    return cue;
}

void cueconv_close_cue(
    CueConvCue* cue) {

    if (!cue) return;
    if (cue->owns_copy) {
        std::error_code ec;
        std::filesystem::remove(cue->read_path, ec);
    }
    delete cue;
}

const char* cueconv_cue_path(
    const CueConvCue* cue) {

    return cue ? cue->cue_path.c_str() : nullptr;
}

int cueconv_cue_track_count(
    const CueConvCue* cue) {

    if (!cue) return 0;
    const std::string out = query_cueprint(cue, {"-d", "%N", "-t", ""});
    int count = 0;
    if (!parse_int(out, count) || count < 0) return 0;
    return count;
}

char* cueconv_cue_metadata(
    const CueConvCue* cue,
    int track_number,
    CueConvCueField field) {

    if (!cue || track_number < 0) return make_mutable_cstr_copy(std::string{});

    std::string value;
    if (track_number == 0) {
        const char* tmpl = (field == CUE_FIELD_TITLE) ? "%T" : "%P";
        value = query_cueprint(cue, {"-d", tmpl, "-t", ""});
    } else {
        const char* tmpl = (field == CUE_FIELD_TITLE) ? "%t" : "%p";
        value = query_cueprint(cue, {"-n", std::to_string(track_number), "-d", "", "-t", tmpl});
    }
    return make_mutable_cstr_copy(value);
}

};
