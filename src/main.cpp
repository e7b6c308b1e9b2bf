//
//  main.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "event_emitter.hpp"
#include "logging.hpp"
#include "narrateforge.hpp"
#include "narrateforge_version.hpp"

namespace {

std::optional<int64_t> parse_int(const std::string &s) {
    if (s.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char *end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int64_t>(v);
}

std::optional<double> parse_double(const std::string &s) {
    if (s.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char *end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    return v;
}

void print_usage() {
    std::cerr << "NarrateForge " << NARRATEFORGE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  narrateforge --input <book.json> --output <out.mp3|out.m4b> [options]\n"
              << "Options:\n"
              << "  --voice NAME             Voice (default: af_heart).\n"
              << "  --lang CODE              Language code (default: a).\n"
              << "  --speed X                Speech speed (default: 1.0).\n"
              << "  --chunk-chars N          Max characters per chunk (default: backend).\n"
              << "  --split-pattern REGEX    Paragraph split pattern (default: \\n+).\n"
              << "  --backend NAME           auto|mlx|pytorch|mock (default: auto).\n"
              << "  --format FMT             mp3|m4b (default: mp3).\n"
              << "  --bitrate RATE           128k|192k|320k (default: 192k).\n"
              << "  --normalize              Apply loudness normalization.\n"
              << "  --title/--author TEXT    Override book tags (m4b).\n"
              << "  --cover PATH             Override cover image (m4b).\n"
              << "  --checkpoint             Persist per-chunk audio for resume.\n"
              << "  --resume                 Resume from a matching checkpoint.\n"
              << "  --check-checkpoint       Report checkpoint status and exit.\n"
              << "  --extract-metadata       Report book tags and exit.\n"
              << "  --pipeline-mode MODE     sequential|overlap3.\n"
              << "  --prefetch-chunks N      Inference queue depth (default: 2).\n"
              << "  --pcm-queue-size N       PCM queue depth (default: 4).\n"
              << "  --event-format FMT       text|json (default: text).\n"
              << "  --log-file PATH          Append every event line to PATH.\n"
              << "  --log-level LEVEL        error|warn|info|debug (default: info).\n"
              << "  --engine-dir DIR         Engine plugin directory (or NARRATEFORGE_ENGINE_DIR).\n"
              << "  --model-dir DIR          Model directory handed to engine plugins.\n"
              << "  --encoder PATH           Encoder executable (default: ffmpeg on PATH).\n";
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "NarrateForge " << NARRATEFORGE_VERSION_DISPLAY << "\n";
        return 0;
    }

    narrateforge::JobOptions opts;
    narrateforge::EventFormat event_format = narrateforge::EventFormat::Text;
    std::string log_file;
    if (const char *env = std::getenv("NARRATEFORGE_ENGINE_DIR")) {
        opts.backend_options.engine_dir = env;
    }

    auto usage_error = [](const std::string &msg) {
        std::cerr << msg << "\n";
        return 2;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        auto next = [&]() { return std::string(argv[++i]); };

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--normalize") {
            opts.normalize = true;
        } else if (arg == "--checkpoint") {
            opts.checkpoint = true;
        } else if (arg == "--resume") {
            opts.resume = true;
        } else if (arg == "--check-checkpoint") {
            opts.check_checkpoint = true;
        } else if (arg == "--extract-metadata") {
            opts.extract_metadata = true;
        } else if (!has_value && !arg.empty() && arg[0] == '-') {
            return usage_error("Missing value for option: " + arg);
        } else if (arg == "--input") {
            opts.input_path = next();
        } else if (arg == "--output") {
            opts.output_path = next();
        } else if (arg == "--voice") {
            opts.voice = next();
        } else if (arg == "--lang") {
            opts.lang = next();
        } else if (arg == "--speed") {
            auto v = parse_double(next());
            if (!v || *v <= 0.0) {
                return usage_error("--speed expects a positive number");
            }
            opts.speed = *v;
        } else if (arg == "--chunk-chars") {
            // Non-positive values are left to the planner, which rejects them.
            auto v = parse_int(next());
            if (!v) {
                return usage_error("--chunk-chars expects an integer");
            }
            opts.chunk_chars = *v;
        } else if (arg == "--split-pattern") {
            opts.split_pattern = next();
        } else if (arg == "--backend") {
            opts.backend = next();
            if (opts.backend != "auto" && !narrateforge::parse_backend_kind(opts.backend)) {
                return usage_error("Unknown backend: " + opts.backend);
            }
        } else if (arg == "--format") {
            auto v = narrateforge::parse_export_format(next());
            if (!v) {
                return usage_error("--format expects mp3 or m4b");
            }
            opts.format = *v;
        } else if (arg == "--bitrate") {
            opts.bitrate = next();
            if (opts.bitrate != "128k" && opts.bitrate != "192k" && opts.bitrate != "320k") {
                return usage_error("--bitrate expects 128k, 192k or 320k");
            }
        } else if (arg == "--title") {
            opts.title = next();
        } else if (arg == "--author") {
            opts.author = next();
        } else if (arg == "--cover") {
            opts.cover = next();
        } else if (arg == "--pipeline-mode") {
            auto v = narrateforge::parse_pipeline_mode(next());
            if (!v) {
                return usage_error("--pipeline-mode expects sequential or overlap3");
            }
            opts.pipeline_mode = *v;
        } else if (arg == "--prefetch-chunks") {
            auto v = parse_int(next());
            if (!v) {
                return usage_error("--prefetch-chunks expects an integer");
            }
            opts.prefetch_chunks = *v;
        } else if (arg == "--pcm-queue-size") {
            auto v = parse_int(next());
            if (!v) {
                return usage_error("--pcm-queue-size expects an integer");
            }
            opts.pcm_queue_size = *v;
        } else if (arg == "--event-format") {
            auto v = narrateforge::parse_event_format(next());
            if (!v) {
                return usage_error("--event-format expects text or json");
            }
            event_format = *v;
        } else if (arg == "--log-file") {
            log_file = next();
        } else if (arg == "--log-level") {
            narrateforge::set_log_verbosity(narrateforge::parse_log_verbosity(next()));
        } else if (arg == "--engine-dir") {
            opts.backend_options.engine_dir = next();
        } else if (arg == "--model-dir") {
            opts.backend_options.model_dir = next();
        } else if (arg == "--encoder") {
            opts.encoder = next();
        } else {
            return usage_error("Unknown option: " + arg);
        }
    }

    if (opts.input_path.empty() || opts.output_path.empty()) {
        print_usage();
        return 2;
    }

    const auto job_id = std::filesystem::path(opts.output_path).filename().string();
    narrateforge::EventEmitter events(event_format, job_id.empty() ? "job" : job_id);
    if (!log_file.empty()) {
        auto st = events.open_log_file(log_file);
        if (!st) {
            NF_LOG("error", "narrateforge: " << st.message);
            return 1;
        }
    }

    auto status = narrateforge::run_job(opts, events);
    events.close();
    if (!status.ok) {
        NF_LOG("error", "narrateforge: " << narrateforge::error_kind_name(status.kind)
                                         << " failure: " << status.message);
        return 1;
    }
    return 0;
}
