// CUE sheet / lossless audio to MP3 converter
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <string>

#include <glib.h>

#include "internal.h"

using namespace cueconv::detail;

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

char* cueconv_current_timestamp_iso() {
    GDateTime* now = g_date_time_new_now_local();
    if (!now) return make_mutable_cstr_copy(std::string{});

    // e.g. 2024-05-01T12:34:56+09:00
    gchar* formatted = g_date_time_format(now, "%Y-%m-%dT%H:%M:%S%:z");
    g_date_time_unref(now);
    const std::string ts = to_string_or_empty(formatted);
    g_free(formatted);
    return make_mutable_cstr_copy(ts);
}

void cueconv_release_timestamp(char* p) {
    delete[] p;
}

};
