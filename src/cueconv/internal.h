#pragma once

// CUE sheet / lossless audio to MP3 converter
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#include <cctype>
#include <cstring>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <glib.h>

#include "cueconv/cueconv.h"

struct CueConvCue {
    std::string cue_path;
    // UTF-8 copy handed to the metadata reader; equals cue_path when no copy was written.
    std::string read_path;
    bool owns_copy{false};
    std::string cueprint;
};

struct CueConvCounters {
    mutable std::mutex lock;
    size_t succeeded{0};
    size_t failed{0};
};

/* ------------------------------------------------------------------- */

namespace cueconv::detail {

static inline const char* make_cstr_copy(const std::string& s) {
    auto* buf = new char[s.size() + 1];
    std::memcpy(buf, s.c_str(), s.size() + 1);
    return buf;
}

static inline const char* make_cstr_copy(const char* s) {
    return make_cstr_copy(s ? std::string{s} : std::string{});
}

static inline char* make_mutable_cstr_copy(const std::string& s) {
    return const_cast<char*>(make_cstr_copy(s));
}

static inline const char* make_cstr_copy_nullable(const char* s) {
    return s ? make_cstr_copy(s) : nullptr;
}

static inline std::string to_string_or_empty(const char* s) {
    return s ? std::string{s} : std::string{};
}

static inline std::string to_lower(const std::string& s) {
    std::string r;
    r.reserve(s.size());
    for (unsigned char c : s) r.push_back(static_cast<char>(std::tolower(c)));
    return r;
}

static inline std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

static inline bool parse_int(const std::string& s, int& out) {
    try {
        out = std::stoi(s);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static inline void release_cstr(const char*& s) {
    delete[] s;
    s = nullptr;
}

static inline void set_error(const char** error, const std::string& message) {
    if (!error || *error) return;
    *error = make_cstr_copy(message);
}

static inline void clear_error(const char** error) {
    if (!error) return;
    cueconv_release_error(*error);
    *error = nullptr;
}

static inline std::string gerror_message(GError* gerr, const char* fallback) {
    return (gerr && gerr->message) ? std::string{gerr->message} : std::string{fallback};
}

static inline std::string program_or_default(const char* program, const char* fallback) {
    return (program && *program) ? std::string{program} : std::string{fallback};
}

// Claim key for audio files: absolute, symlink- and dot-free where the file exists.
static inline std::string canonical_path(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::path out = std::filesystem::weakly_canonical(
        std::filesystem::absolute(p, ec), ec);
    if (ec) {
        out = std::filesystem::absolute(p, ec).lexically_normal();
        if (ec) return p.lexically_normal().string();
    }
    return out.string();
}

/* ------------------------------------------------------------------- */

/** Captured result of an external program. */
struct ProcessResult {
    bool launched{false};
    bool exited_ok{false};
    std::string out;
    std::string err;
    // Launch failure or abnormal exit description.
    std::string message;
};

/**
 * Run a program with an argument vector (no shell), searching PATH.
 * Blocks until the program exits.
 */
ProcessResult run_process(
    const std::vector<std::string>& argv);

/** First non-empty line of program diagnostics, for operator messages. */
std::string first_line(
    const std::string& s);

/** Filename sanitizer shared by the naming helpers. */
std::string sanitize_filename(
    const std::string& input);

/** Pure CUE text decoder shared by the resolver and the metadata reader. */
std::string decode_cue_bytes(
    const std::string& bytes);

/** Read a file into memory without modifying it. */
bool read_file_bytes(
    const std::string& path,
    std::string& out,
    std::string& err_out);

/** Make a directory and its parents. */
bool ensure_directory(
    const std::string& path,
    std::string& err_out);

std::string track_filename(
    int track_number,
    const std::string& title);

std::string standalone_filename(
    const std::filesystem::path& source);

std::filesystem::path unique_destination(
    const std::filesystem::path& directory,
    const std::string& filename,
    std::unordered_set<std::string>& taken);

bool is_extension(
    const std::filesystem::path& path,
    const char* ext);

}  // namespace cueconv::detail
