// CUE sheet / lossless audio to MP3 converter
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <algorithm>
#include <mutex>

#include <glib.h>

#include "internal.h"

using namespace cueconv::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

struct BatchContext {
    const CueConvJob* jobs{nullptr};
    size_t total{0};
    const CueConvSettings* settings{nullptr};
    CueConvCounters* counters{nullptr};
    CueConvJobCallback callback{nullptr};
    // Serializes completion reports so callback output never interleaves.
    std::mutex report_lock;
    size_t completed{0};
};

static void run_one(
    BatchContext& ctx,
    size_t index) {

    const CueConvJob& job = ctx.jobs[index];
    const char* err = nullptr;
    const int ok = cueconv_convert(&job, ctx.settings, ctx.counters, &err);
    {
        std::lock_guard<std::mutex> guard(ctx.report_lock);
        ++ctx.completed;
        if (ctx.callback) {
            CueConvJobResult result{};
            result.job = &job;
            result.success = ok;
            result.error = err;
            result.completed = ctx.completed;
            result.total = ctx.total;
            ctx.callback(&result);
        }
    }
    cueconv_release_error(err);
}

// Task payloads are index + 1: the pool rejects null tasks.
static void pool_worker(
    gpointer data,
    gpointer user_data) {

    auto* ctx = static_cast<BatchContext*>(user_data);
    run_one(*ctx, GPOINTER_TO_SIZE(data) - 1);
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

void cueconv_run_jobs(
    const CueConvJob* jobs,
    size_t count,
    int parallelism,
    const CueConvSettings* settings,
    CueConvCounters* counters,
    CueConvJobCallback callback) {

    if (!jobs || count == 0) return;

    BatchContext ctx;
    ctx.jobs = jobs;
    ctx.total = count;
    ctx.settings = settings;
    ctx.counters = counters;
    ctx.callback = callback;

    const size_t clamped = parallelism <= 0 ? 1 : static_cast<size_t>(parallelism);
    const size_t workers = std::min(clamped, count);

    if (workers == 1) {
        for (size_t i = 0; i < count; ++i) run_one(ctx, i);
        return;
    }

    GError* gerr = nullptr;
    GThreadPool* pool = g_thread_pool_new(
        pool_worker, &ctx, static_cast<gint>(workers), TRUE, &gerr);
    if (!pool) {
        // Could not start the workers; still run every job exactly once.
        g_clear_error(&gerr);
        for (size_t i = 0; i < count; ++i) run_one(ctx, i);
        return;
    }

    for (size_t i = 0; i < count; ++i) {
        // A failed thread start still leaves the task queued for the existing workers.
        if (!g_thread_pool_push(pool, GSIZE_TO_POINTER(i + 1), &gerr)) {
            g_warning("cueconv: thread pool push failed: %s", gerr ? gerr->message : "unknown error");
            g_clear_error(&gerr);
        }
    }

    // Waits for every queued task before returning.
    g_thread_pool_free(pool, FALSE, TRUE);
}

};
