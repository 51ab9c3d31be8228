#pragma once

// CUE sheet / lossless audio to MP3 converter
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#ifndef __CUECONV_H
#define __CUECONV_H

#include <stddef.h>
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ------------------------------------------------------------------- */

/**
 * Release error string allocated by library functions.
 * @param p Pointer returned via error out-parameters (nullable).
 */
void cueconv_release_error(const char* p);

/**
 * Release a string returned by library functions.
 * @param p Pointer to free (nullable).
 */
void cueconv_release_string(char* p);

/* ------------------------------------------------------------------- */

/**
 * Get current timestamp in ISO-8601 format with timezone offset.
 * Caller must free with cueconv_release_timestamp.
 * @return Newly allocated string with timestamp.
 */
char* cueconv_current_timestamp_iso();
/**
 * Release a timestamp string allocated by cueconv_current_timestamp_iso.
 * @param p Pointer to free (nullable).
 */
void cueconv_release_timestamp(char* p);

/* ------------------------------------------------------------------- */

/** Configuration loaded from INI or defaults. */
typedef struct CueConvConfig {
    /** Output root directory. */
    const char* output_dir;
    /** Parallel conversion jobs. */
    int parallel;
    /** Encoder VBR quality (0 = best, 9 = worst). */
    int quality;
    /** Genre tag (nullable). */
    const char* genre;
    /** Disc number tag (nullable). */
    const char* disc;
    /** Base directory for working files (nullable => system temp). */
    const char* temp_dir;
    /** Encoder/decoder program. */
    const char* ffmpeg;
    /** CUE-aware splitter program. */
    const char* shnsplit;
    /** CUE metadata reader program. */
    const char* cueprint;
    /** Loaded config file path, or null when defaults. */
    const char* config_path;
} CueConvConfig;

/**
 * Load configuration from INI file.
 * Search order when path is null: ./cueconv.conf then ~/.cueconv.conf.
 * Returns defaults if no file found; returns null on parse/load error.
 * @param path Optional explicit config path.
 * @param error Optional error string out-parameter.
 * @return Newly allocated config, must free with cueconv_release_config; null on failure.
 */
CueConvConfig* cueconv_load_config(
    const char* path /* nullable */,
    const char** error /* nullable */);
/**
 * Release configuration and owned members.
 * @param cfg Config pointer (nullable).
 */
void cueconv_release_config(
    CueConvConfig* cfg);

/** Per-run settings shared by every component. Members are not owned. */
typedef struct CueConvSettings {
    /** Artist tag; overrides CUE performers when non-empty. */
    const char* artist;
    /** Album tag; overrides CUE disc title when non-empty. */
    const char* album;
    /** Genre tag (nullable). */
    const char* genre;
    /** Disc number tag (nullable). */
    const char* disc;
    /** Output root directory. */
    const char* output_dir;
    /** Parallel conversion jobs (<= 0 => 1). */
    int parallel;
    /** Encoder VBR quality. */
    int quality;
    /** Base directory for working files (nullable => system temp). */
    const char* temp_dir;
    /** Encoder/decoder program (nullable => "ffmpeg"). */
    const char* ffmpeg;
    /** CUE-aware splitter program (nullable => "shnsplit"). */
    const char* shnsplit;
    /** CUE metadata reader program (nullable => "cueprint"). */
    const char* cueprint;
} CueConvSettings;

/**
 * Check that every external program named by the settings is runnable.
 * @param settings Settings holding the program names.
 * @param error Optional error string out-parameter listing missing programs.
 * @return Non-zero when all programs were found.
 */
int cueconv_check_tools(
    const CueConvSettings* settings,
    const char** error /* nullable */);

/* ------------------------------------------------------------------- */

/**
 * Make a string safe for use as a file name.
 * Replaces < > : " | ? * / \ with '_', drops control characters,
 * trims and collapses whitespace. Non-ASCII characters are kept as is.
 * @param s Input string (nullable => empty).
 * @return Newly allocated string; free with cueconv_release_string.
 */
char* cueconv_sanitize_filename(
    const char* s);

/**
 * Decode CUE sheet bytes into UTF-8.
 * Tries UTF-8, then WINDOWS-1252, then ISO-8859-1, dropping invalid
 * sequences; falls back to the raw bytes.
 * @param data Raw bytes.
 * @param size Number of bytes.
 * @return Newly allocated UTF-8 string; free with cueconv_release_string.
 */
char* cueconv_decode_cue_bytes(
    const char* data,
    size_t size);

/**
 * Read and decode a CUE sheet file. The file is not modified.
 * @param path CUE sheet path.
 * @param error Optional error string out-parameter.
 * @return Newly allocated UTF-8 text; null when the file cannot be read.
 */
char* cueconv_decode_cue_text(
    const char* path,
    const char** error /* nullable */);

/* ------------------------------------------------------------------- */

/** Lossless source format hint. */
typedef enum CueConvAudioFormat {
    AUDIO_FORMAT_UNKNOWN = 0,
    AUDIO_FORMAT_FLAC = 1,
    AUDIO_FORMAT_APE = 2,
    AUDIO_FORMAT_WAV = 3,
} CueConvAudioFormat;

/** Audio file referenced by a CUE sheet. */
typedef struct CueConvAudioSource {
    /** Path as found on disk. */
    const char* path;
    /** Canonical absolute path (claim key). */
    const char* canonical_path;
    /** Format derived from the file extension. */
    CueConvAudioFormat format;
} CueConvAudioSource;

/**
 * Locate the audio file for a CUE sheet.
 * Same-basename siblings (.flac, .ape, .wav) win over the FILE directive.
 * @param cue_path CUE sheet path.
 * @param error Optional error string out-parameter.
 * @return Newly allocated source; null when no audio file exists.
 */
CueConvAudioSource* cueconv_resolve_audio_for_cue(
    const char* cue_path,
    const char** error /* nullable */);
/**
 * Release audio source.
 * @param p Source pointer (nullable).
 */
void cueconv_release_audio_source(
    CueConvAudioSource* p);

/** Opaque CUE metadata reader. */
typedef struct CueConvCue CueConvCue;

/** Metadata field selector. */
typedef enum CueConvCueField {
    CUE_FIELD_TITLE = 0,
    CUE_FIELD_PERFORMER = 1,
} CueConvCueField;

/**
 * Open a CUE sheet for metadata queries.
 * A UTF-8 normalized copy is written into work_dir when possible.
 * @param cue_path CUE sheet path.
 * @param work_dir Directory for the normalized copy (nullable => read the sheet directly).
 * @param settings Settings naming the metadata reader program.
 * @param error Optional error string out-parameter.
 * @return Handle; free with cueconv_close_cue. Null on invalid arguments.
 */
CueConvCue* cueconv_open_cue(
    const char* cue_path,
    const char* work_dir /* nullable */,
    const CueConvSettings* settings,
    const char** error /* nullable */);
/**
 * Close CUE reader and remove its normalized copy.
 * @param cue Handle (nullable).
 */
void cueconv_close_cue(
    CueConvCue* cue);

/**
 * Path of the CUE sheet as given to cueconv_open_cue.
 */
const char* cueconv_cue_path(
    const CueConvCue* cue);

/**
 * Total track count of the sheet.
 * @return Track count; 0 on any extraction failure.
 */
int cueconv_cue_track_count(
    const CueConvCue* cue);

/**
 * Extract one metadata field.
 * @param cue Handle.
 * @param track_number Track number (1-based); 0 selects disc-level fields.
 * @param field Field selector.
 * @return Newly allocated string, empty on failure; free with cueconv_release_string.
 */
char* cueconv_cue_metadata(
    const CueConvCue* cue,
    int track_number,
    CueConvCueField field);

/* ------------------------------------------------------------------- */

/** Per-track intermediate files produced by the splitter. */
typedef struct CueConvTrackFiles {
    /** Track file paths; index 0 is track 1. Null where the splitter produced nothing. */
    const char** paths;
    /** Number of expected tracks. */
    size_t count;
    /** Directory holding the track files. */
    const char* directory;
    /** Decoded intermediate of the whole source (nullable). */
    const char* decoded_path;
} CueConvTrackFiles;

/**
 * Split a whole-album audio file into per-track WAV files.
 * APE sources are decoded to WAV inside work_dir first.
 * @param cue CUE reader handle (its UTF-8 copy drives the split).
 * @param source Resolved audio source.
 * @param total_tracks Expected track count.
 * @param work_dir Directory receiving the track files.
 * @param settings Settings naming the decoder/splitter programs.
 * @param error Optional error string out-parameter.
 * @return Newly allocated list; null when decode or split fails.
 */
CueConvTrackFiles* cueconv_split_tracks(
    const CueConvCue* cue,
    const CueConvAudioSource* source,
    int total_tracks,
    const char* work_dir,
    const CueConvSettings* settings,
    const char** error /* nullable */);
/**
 * Remove the intermediate files and release the list.
 * @param p List pointer (nullable).
 */
void cueconv_release_track_files(
    CueConvTrackFiles* p);

/* ------------------------------------------------------------------- */

/** One conversion unit. Only source and destination are required. */
typedef struct CueConvJob {
    const char* source;
    const char* destination;
    const char* artist;
    const char* album;
    const char* title;
    const char* genre;
    const char* disc;
    /** Track number (0 => none). */
    int track_number;
    /** Total tracks (0 => none). */
    int total_tracks;
} CueConvJob;

/** List of jobs. */
typedef struct CueConvJobList {
    CueConvJob* jobs;
    size_t count;
} CueConvJobList;

/**
 * Release job list and owned strings.
 * @param p List pointer (nullable).
 */
void cueconv_release_job_list(
    CueConvJobList* p);

/** Opaque success/error counters shared by concurrent workers. */
typedef struct CueConvCounters CueConvCounters;

/**
 * Create zeroed counters.
 * @return Newly allocated counters; free with cueconv_release_counters.
 */
CueConvCounters* cueconv_counters_new();
/**
 * Release counters.
 * @param p Counters pointer (nullable).
 */
void cueconv_release_counters(
    CueConvCounters* p);
/** Record one failure outside a conversion job (sheet or track level). */
void cueconv_counters_add_error(
    CueConvCounters* p);
/** Number of successful conversions. */
size_t cueconv_counters_succeeded(
    const CueConvCounters* p);
/** Number of recorded failures. */
size_t cueconv_counters_failed(
    const CueConvCounters* p);

/**
 * Convert one job to MP3. Increments exactly one counter.
 * The destination is overwritten; a failed destination is left as is.
 * @param job Job to run.
 * @param settings Settings naming the encoder program and quality.
 * @param counters Counters to update (nullable).
 * @param error Optional error string out-parameter.
 * @return Non-zero on success.
 */
int cueconv_convert(
    const CueConvJob* job,
    const CueConvSettings* settings,
    CueConvCounters* counters /* nullable */,
    const char** error /* nullable */);

/** Completion information passed to the job callback. */
typedef struct CueConvJobResult {
    /** Completed job. */
    const CueConvJob* job;
    /** Non-zero on success. */
    int success;
    /** Failure reason (nullable). */
    const char* error;
    /** Jobs completed in this batch so far, including this one. */
    size_t completed;
    /** Jobs in this batch. */
    size_t total;
} CueConvJobResult;

/** Job completion callback signature. Calls are serialized. */
typedef void (*CueConvJobCallback)(const CueConvJobResult*);

/**
 * Run jobs on a bounded worker pool and wait for all of them.
 * Dispatch follows array order; at most `parallelism` jobs run at once.
 * @param jobs Job array.
 * @param count Number of jobs.
 * @param parallelism Worker count (<= 0 => 1).
 * @param settings Settings for the conversion.
 * @param counters Counters to update.
 * @param callback Completion callback (nullable).
 */
void cueconv_run_jobs(
    const CueConvJob* jobs,
    size_t count,
    int parallelism,
    const CueConvSettings* settings,
    CueConvCounters* counters,
    CueConvJobCallback callback /* nullable */);

/* ------------------------------------------------------------------- */

/**
 * Output file name for a CUE track: "NN - <title>.mp3" or "NN - Track NN.mp3".
 * @param track_number Track number (1-based).
 * @param title Track title (nullable).
 * @return Newly allocated string; free with cueconv_release_string.
 */
char* cueconv_track_filename(
    int track_number,
    const char* title /* nullable */);

/**
 * Output file name for a standalone file: "<sanitized basename>.mp3".
 * @param source_path Source audio path.
 * @return Newly allocated string; free with cueconv_release_string.
 */
char* cueconv_standalone_filename(
    const char* source_path);

/** List of paths. */
typedef struct CueConvPathList {
    const char** paths;
    size_t count;
} CueConvPathList;

/**
 * Recursively collect CUE sheets under root, sorted by path.
 * @param root Scan root.
 * @param error Optional error string out-parameter.
 * @return Newly allocated list; free with cueconv_release_path_list.
 */
CueConvPathList* cueconv_collect_cue_sheets(
    const char* root,
    const char** error /* nullable */);
/**
 * Release path list.
 * @param p List pointer (nullable).
 */
void cueconv_release_path_list(
    CueConvPathList* p);

/**
 * Recursively collect standalone lossless files under root and build one
 * job per file that is not claimed.
 * @param root Scan root.
 * @param claimed Canonical paths of audio already consumed by CUE sheets.
 * @param settings Settings for tags and output root.
 * @param error Optional error string out-parameter.
 * @return Newly allocated list; free with cueconv_release_job_list.
 */
CueConvJobList* cueconv_build_standalone_jobs(
    const char* root,
    const CueConvPathList* claimed /* nullable */,
    const CueConvSettings* settings,
    const char** error /* nullable */);

/** Orchestration event kind. */
typedef enum CueConvEventKind {
    EVENT_INFO = 0,
    EVENT_WARNING = 1,
    EVENT_FAILURE = 2,
} CueConvEventKind;

/** Orchestration event callback signature. */
typedef void (*CueConvEventCallback)(CueConvEventKind kind, const char* message);

/** Result of a whole run. */
typedef struct CueConvSummary {
    /** Successful conversions. */
    size_t succeeded;
    /** Recorded failures (sheet, track and conversion level). */
    size_t failed;
    /** CUE sheets discovered. */
    size_t cue_sheets;
    /** Standalone jobs dispatched. */
    size_t standalone;
    /** Output root. */
    const char* output_dir;
} CueConvSummary;

/**
 * Run both phases: CUE-driven conversion, then standalone files.
 * @param root Scan root.
 * @param settings Run settings.
 * @param on_event Event callback (nullable => stdout/stderr).
 * @param on_job Job completion callback (nullable).
 * @param error Optional error string out-parameter.
 * @return Newly allocated summary; null on fatal failure.
 */
CueConvSummary* cueconv_run_pipeline(
    const char* root,
    const CueConvSettings* settings,
    CueConvEventCallback on_event /* nullable */,
    CueConvJobCallback on_job /* nullable */,
    const char** error /* nullable */);
/**
 * Release summary.
 * @param p Summary pointer (nullable).
 */
void cueconv_release_summary(
    CueConvSummary* p);

#ifdef __cplusplus
}
#endif

#endif
