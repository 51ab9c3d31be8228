// CUE sheet / lossless audio to MP3 converter
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <glib.h>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "internal.h"

using namespace cueconv::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static constexpr const char* default_output_dir = "MP3_Export";
static constexpr int default_parallel = 8;
// VBR ~245 kbps
static constexpr int default_quality = 0;

static void replace_cstr(
    const char*& target,
    const std::string& value) {

    release_cstr(target);
    target = make_cstr_copy(value);
}

static std::string strip_inline_comment_value(
    const std::string& raw) {

    bool in_single = false;
    bool in_double = false;
    bool escaped = false;
    for (size_t i = 0; i < raw.size(); ++i) {
        const char ch = raw[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (ch == '\\') {
            escaped = true;
            continue;
        }
        if (ch == '\'' && !in_double) {
            in_single = !in_single;
            continue;
        }
        if (ch == '"' && !in_single) {
            in_double = !in_double;
            continue;
        }
        if (!in_single && !in_double && (ch == '#' || ch == ';')) {
            if (i == 0 || std::isspace(static_cast<unsigned char>(raw[i - 1]))) {
                return trim(raw.substr(0, i));
            }
        }
    }
    return trim(raw);
}

static bool parse_int_strict_value(
    const std::string& raw,
    int& out) {

    const std::string value = trim(raw);
    if (value.empty()) return false;

    size_t idx = 0;
    try {
        const int v = std::stoi(value, &idx);
        if (idx != value.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

enum class KeyState {
    Absent,
    Loaded,
    Failed,
};

static KeyState read_key(
    GKeyFile* key_file,
    const char* group,
    const char* key,
    std::string& out,
    std::string& err_out) {

    if (!g_key_file_has_key(key_file, group, key, nullptr)) return KeyState::Absent;

    GError* gerr = nullptr;
    char* value = g_key_file_get_string(key_file, group, key, &gerr);
    if (!value) {
        err_out = gerror_message(gerr, (std::string("Failed to parse ") + key).c_str());
        g_clear_error(&gerr);
        return KeyState::Failed;
    }
    out = strip_inline_comment_value(value);
    g_free(value);
    return KeyState::Loaded;
}

static CueConvConfig* make_default_config() {
    auto* cfg = new CueConvConfig{};
    cfg->output_dir = make_cstr_copy(default_output_dir);
    cfg->parallel = default_parallel;
    cfg->quality = default_quality;
    cfg->genre = nullptr;
    cfg->disc = nullptr;
    cfg->temp_dir = nullptr;
    cfg->ffmpeg = make_cstr_copy("ffmpeg");
    cfg->shnsplit = make_cstr_copy("shnsplit");
    cfg->cueprint = make_cstr_copy("cueprint");
    cfg->config_path = nullptr;
    return cfg;
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

CueConvConfig* cueconv_load_config(
    const char* path,
    const char** error) {

    clear_error(error);

    auto* cfg = make_default_config();
    GKeyFile* key_file = g_key_file_new();
    bool loaded = false;
    std::string loaded_path;

    auto fail = [&](const std::string& message) -> CueConvConfig* {
        set_error(error, message);
        cueconv_release_config(cfg);
        g_key_file_unref(key_file);
        return nullptr;
    };

    std::vector<std::string> candidates;
    if (path) {
        candidates.emplace_back(path);
    } else {
        candidates.emplace_back("cueconv.conf");
        const char* home = std::getenv("HOME");
        if (home) {
            const std::filesystem::path home_path = std::filesystem::path(home) / ".cueconv.conf";
            candidates.emplace_back(home_path.string());
        }
    }

    for (const auto& candidate : candidates) {
        GError* gerr = nullptr;
        if (g_key_file_load_from_file(key_file, candidate.c_str(), G_KEY_FILE_NONE, &gerr)) {
            loaded = true;
            loaded_path = candidate;
            break;
        }
        if (gerr) {
            if (path) {
                const std::string message = gerror_message(gerr, "Failed to load config");
                g_error_free(gerr);
                return fail(message);
            }
            g_error_free(gerr);
        }
    }

    if (!loaded) {
        g_key_file_unref(key_file);
        return cfg;
    }

    std::string value;
    std::string err;

    // [cueconv] group
    switch (read_key(key_file, "cueconv", "output", value, err)) {
        case KeyState::Failed: return fail(err);
        case KeyState::Loaded:
            if (!value.empty()) replace_cstr(cfg->output_dir, value);
            break;
        case KeyState::Absent: break;
    }

    switch (read_key(key_file, "cueconv", "parallel", value, err)) {
        case KeyState::Failed: return fail(err);
        case KeyState::Loaded: {
            int parsed = 0;
            if (!parse_int_strict_value(value, parsed)) {
                return fail("Invalid parallel value");
            }
            cfg->parallel = parsed;
            break;
        }
        case KeyState::Absent: break;
    }

    switch (read_key(key_file, "cueconv", "quality", value, err)) {
        case KeyState::Failed: return fail(err);
        case KeyState::Loaded: {
            int parsed = 0;
            if (!parse_int_strict_value(value, parsed) || parsed < 0 || parsed > 9) {
                return fail("Invalid quality value");
            }
            cfg->quality = parsed;
            break;
        }
        case KeyState::Absent: break;
    }

    switch (read_key(key_file, "cueconv", "genre", value, err)) {
        case KeyState::Failed: return fail(err);
        case KeyState::Loaded:
            if (!value.empty()) replace_cstr(cfg->genre, value);
            break;
        case KeyState::Absent: break;
    }

    switch (read_key(key_file, "cueconv", "disc", value, err)) {
        case KeyState::Failed: return fail(err);
        case KeyState::Loaded:
            if (!value.empty()) replace_cstr(cfg->disc, value);
            break;
        case KeyState::Absent: break;
    }

    switch (read_key(key_file, "cueconv", "temp_dir", value, err)) {
        case KeyState::Failed: return fail(err);
        case KeyState::Loaded:
            if (!value.empty()) replace_cstr(cfg->temp_dir, value);
            break;
        case KeyState::Absent: break;
    }

    // [tools] group
    const std::pair<const char*, const char**> tools[] = {
        {"ffmpeg", &cfg->ffmpeg},
        {"shnsplit", &cfg->shnsplit},
        {"cueprint", &cfg->cueprint},
    };
    for (const auto& [key, target] : tools) {
        switch (read_key(key_file, "tools", key, value, err)) {
            case KeyState::Failed: return fail(err);
            case KeyState::Loaded:
                if (!value.empty()) replace_cstr(*target, value);
                break;
            case KeyState::Absent: break;
        }
    }

    g_key_file_unref(key_file);
    cfg->config_path = make_cstr_copy(loaded_path);
    return cfg;
}

void cueconv_release_config(
    CueConvConfig* cfg) {

    if (!cfg) return;
    release_cstr(cfg->output_dir);
    release_cstr(cfg->genre);
    release_cstr(cfg->disc);
    release_cstr(cfg->temp_dir);
    release_cstr(cfg->ffmpeg);
    release_cstr(cfg->shnsplit);
    release_cstr(cfg->cueprint);
    release_cstr(cfg->config_path);
    delete cfg;
}

};
