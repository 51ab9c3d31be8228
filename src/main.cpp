// CUE sheet / lossless audio to MP3 converter
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include "cueconv/cueconv.h"
#include "version.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

std::string view_string(const char* s) {
    return s ? std::string{s} : std::string{};
}

std::string take_timestamp() {
    char* ts = cueconv_current_timestamp_iso();
    std::string out = view_string(ts);
    cueconv_release_timestamp(ts);
    return out;
}

void job_cb(const CueConvJobResult* result) {
    if (!result || !result->job) return;
    const std::string name =
        std::filesystem::path(view_string(result->job->destination)).filename().string();
    std::cout << "[" << result->completed << "/" << result->total << "] ";
    if (result->success) {
        std::cout << "OK " << name << "\n";
    } else {
        std::string reason = view_string(result->error);
        const std::string prefix = "Failed: " + name + ": ";
        if (reason.compare(0, prefix.size(), prefix) == 0) reason.erase(0, prefix.size());
        std::cout << "FAILED " << name;
        if (!reason.empty()) std::cout << ": " << reason;
        std::cout << "\n";
    }
    std::cout.flush();
}

void print_usage() {
    std::cout << "Usage: cueconv --artist \"Artist Name\" [--album name] [--genre name] [--disc N] [--output dir] [--parallel N] [--source dir] [-i config]\n";
    std::cout << "  --artist: Artist name for metadata (required)\n";
    std::cout << "  --album: Album name for metadata (default: CUE disc title)\n";
    std::cout << "  --genre: Genre for metadata\n";
    std::cout << "  --disc: Disc number for metadata\n";
    std::cout << "  --output: Output directory (default: \"MP3_Export\")\n";
    std::cout << "  --parallel: Number of parallel conversion jobs (default: 8)\n";
    std::cout << "  --source: Directory scanned for *.cue, *.flac and *.ape (default: current directory)\n";
    std::cout << "  -i / --input: cueconv config file path (default search: ./cueconv.conf --> ~/.cueconv.conf)\n";
    std::cout << "\nExample:\n";
    std::cout << "  cueconv --artist \"Debussy\" --album \"Complete Works\" --genre \"Classical\" --parallel 8\n";
}

}  // namespace

struct Options {
    std::string artist;
    std::optional<std::string> album;
    std::optional<std::string> genre;
    std::optional<std::string> disc;
    std::optional<std::string> output_dir;
    std::optional<int> parallel;
    std::string source_dir{"."};
    std::string config_file;
};

Options parse_args(int argc, char** argv) {
    if (argc <= 1) {
        print_usage();
        std::exit(0);
    }

    Options opts;
    auto require_value = [&](int& i, const std::string& arg) -> std::string {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value\n";
            std::exit(1);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--artist") {
            opts.artist = require_value(i, arg);
        } else if (arg == "--album") {
            opts.album = require_value(i, arg);
        } else if (arg == "--genre") {
            opts.genre = require_value(i, arg);
        } else if (arg == "--disc") {
            opts.disc = require_value(i, arg);
        } else if (arg == "--output") {
            opts.output_dir = require_value(i, arg);
        } else if (arg == "--parallel") {
            const std::string v = require_value(i, arg);
            size_t idx = 0;
            try {
                opts.parallel = std::stoi(v, &idx);
            } catch (const std::exception&) {
                idx = 0;
            }
            if (idx == 0 || idx != v.size()) {
                std::cerr << "Error: --parallel requires an integer\n";
                std::exit(1);
            }
        } else if (arg == "--source") {
            opts.source_dir = require_value(i, arg);
        } else if (arg == "-i" || arg == "--input") {
            opts.config_file = require_value(i, arg);
        } else if (arg == "-?" || arg == "-h" || arg == "--help") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            std::exit(1);
        }
    }

    if (opts.artist.empty()) {
        std::cerr << "Error: Artist name is required. Use --artist \"Artist Name\"\n";
        std::exit(1);
    }
    return opts;
}

int main(int argc, char** argv) {
    std::cout << "\nCUE sheet / lossless audio to MP3 converter [" << VERSION << "-" << COMMIT_ID << "]\n";
    std::cout << "Copyright (c) Kouji Matsui (@kekyo@mi.kekyo.net)\n";
    std::cout << "Licence: Under MIT.\n\n";

    Options cli_opts = parse_args(argc, argv);

    const char* config_err = nullptr;
    CueConvConfig* cfg_raw = cueconv_load_config(
        cli_opts.config_file.empty() ? nullptr : cli_opts.config_file.c_str(),
        &config_err);
    if (!cfg_raw) {
        std::cerr << (config_err ? view_string(config_err) : "Failed to load config") << "\n";
        cueconv_release_error(config_err);
        return 1;
    }
    cueconv_release_error(config_err);
    std::unique_ptr<CueConvConfig, decltype(&cueconv_release_config)> cfg(cfg_raw, &cueconv_release_config);

    const std::string album = cli_opts.album.value_or(std::string{});
    const std::string genre = cli_opts.genre.value_or(view_string(cfg->genre));
    const std::string disc = cli_opts.disc.value_or(view_string(cfg->disc));
    const std::string output_dir = cli_opts.output_dir.value_or(view_string(cfg->output_dir));
    const int parallel = cli_opts.parallel.value_or(cfg->parallel);

    CueConvSettings settings{};
    settings.artist = cli_opts.artist.c_str();
    settings.album = album.empty() ? nullptr : album.c_str();
    settings.genre = genre.empty() ? nullptr : genre.c_str();
    settings.disc = disc.empty() ? nullptr : disc.c_str();
    settings.output_dir = output_dir.c_str();
    settings.parallel = parallel;
    settings.quality = cfg->quality;
    settings.temp_dir = cfg->temp_dir;
    settings.ffmpeg = cfg->ffmpeg;
    settings.shnsplit = cfg->shnsplit;
    settings.cueprint = cfg->cueprint;

    std::cout << "Checking dependencies...\n";
    const char* tools_err = nullptr;
    if (!cueconv_check_tools(&settings, &tools_err)) {
        std::cerr << view_string(tools_err) << "\n\n";
        std::cerr << "Installation instructions:\n";
        std::cerr << "  Ubuntu/Debian: sudo apt-get install ffmpeg cuetools shntool\n";
        std::cerr << "  macOS: brew install ffmpeg cuetools shntool\n";
        std::cerr << "  Fedora: sudo dnf install ffmpeg cuetools shntool\n";
        cueconv_release_error(tools_err);
        return 1;
    }
    std::cout << "All dependencies found\n\n";

    if (cfg->config_path) std::cout << "Config: " << cfg->config_path << "\n";
    std::cout << "Artist: " << cli_opts.artist << "\n";
    if (!album.empty()) std::cout << "Album: " << album << "\n";
    if (!genre.empty()) std::cout << "Genre: " << genre << "\n";
    if (!disc.empty()) std::cout << "Disc: " << disc << "\n";
    std::cout << "Output: " << output_dir << "\n";
    std::cout << "Parallel Jobs: " << (parallel <= 0 ? 1 : parallel) << "\n";
    std::cout << "Started at: " << take_timestamp() << "\n\n";

    const char* run_err = nullptr;
    CueConvSummary* summary_raw = cueconv_run_pipeline(
        cli_opts.source_dir.c_str(), &settings, nullptr, job_cb, &run_err);
    if (!summary_raw) {
        std::cerr << "ERROR: " << (run_err ? view_string(run_err) : "Conversion failed") << "\n";
        cueconv_release_error(run_err);
        return 1;
    }
    std::unique_ptr<CueConvSummary, decltype(&cueconv_release_summary)> summary(
        summary_raw, &cueconv_release_summary);

    std::cout << "\n=== Conversion Complete ===\n";
    std::cout << "CUE sheets: " << summary->cue_sheets << ", standalone files: " << summary->standalone << "\n";
    std::cout << "Successfully converted: " << summary->succeeded << " file(s)\n";
    if (summary->failed > 0) {
        std::cout << "Failed to convert: " << summary->failed << " file(s)\n";
    }
    std::cout << "Output directory: " << view_string(summary->output_dir) << "\n";
    std::cout << "Finished at: " << take_timestamp() << "\n";
    return 0;
}
