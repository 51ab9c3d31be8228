// CUE sheet / lossless audio to MP3 converter
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <string>
#include <vector>

#include <gio/gio.h>
#include <glib.h>

#include "internal.h"

using namespace cueconv::detail;

/* ------------------------------------------------------------------- */

namespace cueconv::detail {

ProcessResult run_process(
    const std::vector<std::string>& argv) {

    ProcessResult result;
    if (argv.empty()) {
        result.message = "No program specified";
        return result;
    }

    // g_spawn_sync wants mutable argv; keep private copies alive for the call.
    std::vector<std::string> storage = argv;
    std::vector<gchar*> args;
    args.reserve(storage.size() + 1);
    for (auto& a : storage) args.push_back(a.data());
    args.push_back(nullptr);

    gchar* out = nullptr;
    gchar* err = nullptr;
    gint wait_status = 0;
    GError* gerr = nullptr;
    if (!g_spawn_sync(
            nullptr,
            args.data(),
            nullptr,
            G_SPAWN_SEARCH_PATH,
            nullptr,
            nullptr,
            &out,
            &err,
            &wait_status,
            &gerr)) {
        result.message = "Failed to launch " + argv.front() + ": "
            + gerror_message(gerr, "unknown error");
        g_clear_error(&gerr);
        return result;
    }

    result.launched = true;
    result.out = to_string_or_empty(out);
    result.err = to_string_or_empty(err);
    g_free(out);
    g_free(err);

#if GLIB_CHECK_VERSION(2, 70, 0)
    result.exited_ok = g_spawn_check_wait_status(wait_status, &gerr);
#else
    result.exited_ok = g_spawn_check_exit_status(wait_status, &gerr);
#endif
    if (!result.exited_ok) {
        result.message = argv.front() + ": " + gerror_message(gerr, "abnormal exit");
        g_clear_error(&gerr);
    }
    return result;
}

std::string first_line(
    const std::string& s) {

    size_t start = 0;
    while (start < s.size()) {
        size_t end = s.find('\n', start);
        if (end == std::string::npos) end = s.size();
        const std::string line = trim(s.substr(start, end - start));
        if (!line.empty()) return line;
        start = end + 1;
    }
    return {};
}

bool read_file_bytes(
    const std::string& path,
    std::string& out,
    std::string& err_out) {

    out.clear();
    err_out.clear();
    gchar* contents = nullptr;
    gsize length = 0;
    GError* gerr = nullptr;
    if (!g_file_get_contents(path.c_str(), &contents, &length, &gerr)) {
        err_out = gerror_message(gerr, "Failed to read file");
        g_clear_error(&gerr);
        return false;
    }
    out.assign(contents, length);
    g_free(contents);
    return true;
}

bool ensure_directory(
    const std::string& path,
    std::string& err_out) {

    err_out.clear();
    if (path.empty()) return true;

    GFile* dir = g_file_new_for_path(path.c_str());
    GError* gerr = nullptr;
    bool ok = true;
    if (!g_file_make_directory_with_parents(dir, nullptr, &gerr)) {
        if (gerr && !g_error_matches(gerr, G_IO_ERROR, G_IO_ERROR_EXISTS)) {
            err_out = "Failed to create directory " + path + ": "
                + gerror_message(gerr, "unknown");
            ok = false;
        }
        g_clear_error(&gerr);
    }
    g_object_unref(dir);
    return ok;
}

}  // namespace cueconv::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

void cueconv_release_error(const char* p) {
    delete[] p;
}

void cueconv_release_string(char* p) {
    delete[] p;
}

int cueconv_check_tools(
    const CueConvSettings* settings,
    const char** error) {

    clear_error(error);
    if (!settings) {
        set_error(error, "Invalid arguments to cueconv_check_tools");
        return 0;
    }

    const std::vector<std::string> programs = {
        program_or_default(settings->ffmpeg, "ffmpeg"),
        program_or_default(settings->shnsplit, "shnsplit"),
        program_or_default(settings->cueprint, "cueprint"),
    };

    std::string missing;
    for (const auto& program : programs) {
        gchar* found = g_find_program_in_path(program.c_str());
        if (!found) {
            if (!missing.empty()) missing += " ";
            missing += program;
            continue;
        }
        g_free(found);
    }

    if (!missing.empty()) {
        set_error(error, "Missing required dependencies: " + missing);
        return 0;
    }
    return 1;
}

};
