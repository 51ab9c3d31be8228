// CUE sheet / lossless audio to MP3 converter
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <cerrno>
#include <string>

#include <glib.h>

#include "internal.h"

using namespace cueconv::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static const std::string reserved = "<>:\"|?*/\\";

// Legacy encodings tried after UTF-8, in priority order.
static const char* const cue_charsets[] = {
    "WINDOWS-1252",
    "ISO-8859-1",
};

static std::string strip_utf8_bom(
    const std::string& s) {

    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        return s.substr(3);
    }
    return s;
}

// Converts with a private converter, skipping bytes the charset cannot map.
// dropped reports whether any input was skipped.
static bool convert_dropping_invalid(
    const std::string& bytes,
    const char* charset,
    std::string& out,
    bool& dropped) {

    GIConv cd = g_iconv_open("UTF-8", charset);
    if (cd == reinterpret_cast<GIConv>(-1)) return false;

    out.clear();
    dropped = false;
    out.reserve(bytes.size() * 2);
    gchar* inbuf = const_cast<gchar*>(bytes.data());
    gsize inleft = bytes.size();
    gchar chunk[1024];

    while (inleft > 0) {
        gchar* outbuf = chunk;
        gsize outleft = sizeof(chunk);
        const gsize r = g_iconv(cd, &inbuf, &inleft, &outbuf, &outleft);
        out.append(chunk, sizeof(chunk) - outleft);
        if (r != static_cast<gsize>(-1)) continue;
        if (errno == E2BIG) continue;
        if (errno == EILSEQ) {
            dropped = true;
            ++inbuf;
            --inleft;
            continue;
        }
        // EINVAL: truncated sequence at the end of input.
        dropped = true;
        break;
    }

    gchar* outbuf = chunk;
    gsize outleft = sizeof(chunk);
    g_iconv(cd, nullptr, nullptr, &outbuf, &outleft);
    out.append(chunk, sizeof(chunk) - outleft);
    g_iconv_close(cd);
    return true;
}

/* ------------------------------------------------------------------- */

namespace cueconv::detail {

std::string sanitize_filename(
    const std::string& input) {

    std::string replaced;
    replaced.reserve(input.size());
    for (unsigned char uch : input) {
        const char ch = static_cast<char>(uch);
        // Only ASCII control bytes; UTF-8 lead/continuation bytes are >= 0x80.
        if (uch < 0x20 || uch == 0x7F) continue;
        if (reserved.find(ch) != std::string::npos) {
            replaced.push_back('_');
        } else {
            replaced.push_back(ch);
        }
    }

    std::string result;
    result.reserve(replaced.size());
    bool pending_space = false;
    for (char ch : replaced) {
        if (ch == ' ') {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(ch);
    }
    return result;
}

std::string decode_cue_bytes(
    const std::string& bytes) {

    if (g_utf8_validate(bytes.data(), static_cast<gssize>(bytes.size()), nullptr)) {
        return strip_utf8_bom(bytes);
    }
    // A charset that had to skip bytes is rejected unless it is the last one.
    const size_t candidates = sizeof(cue_charsets) / sizeof(cue_charsets[0]);
    for (size_t i = 0; i < candidates; ++i) {
        std::string decoded;
        bool dropped = false;
        if (!convert_dropping_invalid(bytes, cue_charsets[i], decoded, dropped)) continue;
        if (!dropped || i + 1 == candidates) {
            return decoded;
        }
    }
    return bytes;
}

}  // namespace cueconv::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

char* cueconv_sanitize_filename(
    const char* s) {

    return make_mutable_cstr_copy(sanitize_filename(to_string_or_empty(s)));
}

char* cueconv_decode_cue_bytes(
    const char* data,
    size_t size) {

    const std::string bytes = (data && size > 0) ? std::string(data, size) : std::string{};
    return make_mutable_cstr_copy(decode_cue_bytes(bytes));
}

char* cueconv_decode_cue_text(
    const char* path,
    const char** error) {

    clear_error(error);
    if (!path) {
        set_error(error, "Path is null");
        return nullptr;
    }

    std::string bytes;
    std::string read_err;
    if (!read_file_bytes(path, bytes, read_err)) {
        set_error(error, read_err);
        return nullptr;
    }
    return make_mutable_cstr_copy(decode_cue_bytes(bytes));
}

};
