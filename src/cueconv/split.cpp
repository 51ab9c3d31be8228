// CUE sheet / lossless audio to MP3 converter
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "internal.h"

using namespace cueconv::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

// shnsplit names its outputs with "%n": the track number, zero-padded to two digits.
static std::string split_output_name(
    int track_number) {

    std::ostringstream oss;
    oss << std::setw(2) << std::setfill('0') << track_number << ".wav";
    return oss.str();
}

static void remove_quietly(
    const std::string& path) {

    if (path.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

static bool decode_to_wav(
    const std::string& ffmpeg,
    const std::string& source,
    const std::string& destination,
    std::string& err_out) {

    const ProcessResult r = run_process({
        ffmpeg,
        "-hide_banner", "-nostdin", "-loglevel", "error", "-y",
        "-i", source,
        "-acodec", "pcm_s16le",
        destination,
    });
    if (r.launched && r.exited_ok) return true;

    const std::string detail = first_line(r.err);
    err_out = !detail.empty() ? detail : r.message;
    return false;
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

CueConvTrackFiles* cueconv_split_tracks(
    const CueConvCue* cue,
    const CueConvAudioSource* source,
    int total_tracks,
    const char* work_dir,
    const CueConvSettings* settings,
    const char** error) {

    clear_error(error);
    if (!cue || !source || !source->path || !work_dir || !settings) {
        set_error(error, "Invalid arguments to cueconv_split_tracks");
        return nullptr;
    }
    if (total_tracks <= 0) {
        set_error(error, "No tracks found in CUE file");
        return nullptr;
    }

    const std::filesystem::path work(work_dir);
    std::string audio = source->path;
    std::string decoded;

    if (source->format == AUDIO_FORMAT_APE) {
        decoded = (work / "source.wav").string();
        std::string decode_err;
        if (!decode_to_wav(program_or_default(settings->ffmpeg, "ffmpeg"),
                           audio, decoded, decode_err)) {
            remove_quietly(decoded);
            set_error(error,
                "Failed to convert APE file: "
                + std::filesystem::path(audio).filename().string()
                + (decode_err.empty() ? std::string{} : ": " + decode_err));
            return nullptr;
        }
        audio = decoded;
    }

    const std::string split_dir = (work / "tracks").string();
    std::string dir_err;
    if (!ensure_directory(split_dir, dir_err)) {
        remove_quietly(decoded);
        set_error(error, dir_err);
        return nullptr;
    }

    const ProcessResult r = run_process({
        program_or_default(settings->shnsplit, "shnsplit"),
        "-f", cue->read_path,
        "-t", "%n",
        "-o", "wav",
        "-d", split_dir,
        "-O", "never",
        audio,
    });
    if (!r.launched || !r.exited_ok) {
        remove_quietly(split_dir);
        remove_quietly(decoded);
        const std::string detail = first_line(r.err);
        set_error(error,
            "Failed to split audio file"
            + (detail.empty() ? (r.message.empty() ? std::string{} : ": " + r.message)
                              : ": " + detail));
        return nullptr;
    }

    auto* list = new CueConvTrackFiles{};
    list->count = static_cast<size_t>(total_tracks);
    list->paths = new const char*[list->count]{};
    for (int n = 1; n <= total_tracks; ++n) {
        const std::filesystem::path track = std::filesystem::path(split_dir) / split_output_name(n);
        std::error_code ec;
        if (std::filesystem::is_regular_file(track, ec)) {
            list->paths[n - 1] = make_cstr_copy(track.string());
        }
    }
    list->directory = make_cstr_copy(split_dir);
    list->decoded_path = decoded.empty() ? nullptr : make_cstr_copy(decoded);
    return list;
}

void cueconv_release_track_files(
    CueConvTrackFiles* p) {

    if (!p) return;
    if (p->paths) {
        for (size_t i = 0; i < p->count; ++i) {
            release_cstr(p->paths[i]);
        }
        delete[] p->paths;
        p->paths = nullptr;
    }
    if (p->directory) remove_quietly(p->directory);
    if (p->decoded_path) remove_quietly(p->decoded_path);
    release_cstr(p->directory);
    release_cstr(p->decoded_path);
    p->count = 0;
    delete p;
}

};
