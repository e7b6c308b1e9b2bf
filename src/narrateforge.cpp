//
//  narrateforge.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "narrateforge.hpp"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "audio_assembler.hpp"
#include "book_source.hpp"
#include "chapter_timing.hpp"
#include "checkpoint_store.hpp"
#include "encoder_process.hpp"
#include "logging.hpp"
#include "narrateforge_version.hpp"
#include "pcm_sink.hpp"
#include "source_hash.hpp"
#include "temp_file.hpp"

namespace narrateforge {

std::string version_string() { return NARRATEFORGE_VERSION_DISPLAY; }

namespace {

// Releases engine resources on every exit path.
struct BackendSession {
    std::unique_ptr<SynthesisBackend> backend;
    bool initialized = false;

    ~BackendSession() {
        if (backend && initialized) {
            backend->cleanup();
        }
    }
};

class JobRunner {
public:
    JobRunner(const JobOptions &options, EventEmitter &events)
        : opts_(options), events_(events) {}

    RunStatus run();

private:
    RunStatus fail(RunStatus status);
    RunStatus validate_options() const;
    RunStatus extract_metadata(const BookSource &book);
    RunStatus check_checkpoint();
    RunStatus prepare_checkpoint(CheckpointStore &store, const ChunkPlan &plan,
                                 const CheckpointConfig &config);
    RunStatus apply_overrides(BookMetadata &meta) const;

    const JobOptions &opts_;
    EventEmitter &events_;
};

RunStatus JobRunner::fail(RunStatus status) {
    NF_LOG("error", error_kind_name(status.kind) << ": " << status.message);
    events_.error(status.message);
    return status;
}

RunStatus JobRunner::validate_options() const {
    if (opts_.output_path.empty()) {
        return make_error(ErrorKind::Config, "an output path is required");
    }
    if (opts_.prefetch_chunks < 1) {
        return make_error(ErrorKind::Config, "--prefetch-chunks must be >= 1");
    }
    if (opts_.pcm_queue_size < 1) {
        return make_error(ErrorKind::Config, "--pcm-queue-size must be >= 1");
    }
    if (opts_.chunk_chars && *opts_.chunk_chars <= 0) {
        return make_error(ErrorKind::Planning,
                          "chunk_chars must be positive, got " + std::to_string(*opts_.chunk_chars));
    }
    return ok_status();
}

RunStatus JobRunner::extract_metadata(const BookSource &book) {
    events_.metadata("title", book.metadata.title);
    events_.metadata("author", book.metadata.author);
    events_.metadata("has_cover", book.metadata.cover.empty() ? "false" : "true");
    return ok_status();
}

RunStatus JobRunner::check_checkpoint() {
    CheckpointStore store(CheckpointStore::dir_for_output(opts_.output_path));
    auto hash = sha256_file(opts_.input_path);
    if (!hash) {
        return make_error(ErrorKind::Io, "failed to hash input " + opts_.input_path);
    }
    const auto probe = store.probe(*hash);
    switch (probe.outcome) {
    case ProbeOutcome::None:
        events_.checkpoint("NONE");
        break;
    case ProbeOutcome::HashMismatch:
        events_.checkpoint("INVALID", "hash_mismatch");
        break;
    case ProbeOutcome::Found:
        events_.checkpoint("FOUND", std::to_string(probe.total_chunks) + ":" +
                                        std::to_string(probe.completed));
        break;
    }
    return ok_status();
}

RunStatus JobRunner::apply_overrides(BookMetadata &meta) const {
    if (!opts_.title.empty()) {
        meta.title = opts_.title;
    }
    if (!opts_.author.empty()) {
        meta.author = opts_.author;
    }
    if (!opts_.cover.empty()) {
        return load_cover_file(std::filesystem::absolute(opts_.cover).string(), meta);
    }
    return ok_status();
}

RunStatus JobRunner::prepare_checkpoint(CheckpointStore &store, const ChunkPlan &plan,
                                        const CheckpointConfig &config) {
    auto hash = sha256_file(opts_.input_path);
    if (!hash) {
        return make_error(ErrorKind::Io, "failed to hash input " + opts_.input_path);
    }
    const auto total = static_cast<uint32_t>(plan.chunks.size());

    if (opts_.resume) {
        const auto v = store.load(*hash, config, total);
        if (v == CheckpointValidation::Valid) {
            events_.checkpoint("RESUMING", store.state().completed_chunks.size());
            return ok_status();
        }
        if (v == CheckpointValidation::Absent) {
            events_.checkpoint("NONE");
        } else {
            events_.checkpoint("INVALID", validation_detail(v));
        }
        NF_LOG("info", "starting a fresh checkpoint in " << store.dir().string());
    }

    CheckpointState initial;
    initial.source_hash = *hash;
    initial.config = config;
    initial.total_chunks = total;
    for (const auto &b : plan.boundaries) {
        initial.chapter_starts.push_back(ChapterStart{b.first_chunk, b.title});
    }
    return store.create(std::move(initial),
                        opts_.resume ? CreateMode::ReplaceExisting : CreateMode::FailIfExists);
}

RunStatus JobRunner::run() {
    auto st = validate_options();
    if (!st) {
        return fail(st);
    }

    BookSource book;
    st = load_book_json(opts_.input_path, book);
    if (!st) {
        return fail(st);
    }

    if (opts_.extract_metadata) {
        return extract_metadata(book);
    }
    if (opts_.check_checkpoint) {
        st = check_checkpoint();
        return st ? st : fail(st);
    }

    const bool use_checkpoint = opts_.use_checkpoint();

    const auto kind = resolve_backend(opts_.backend, opts_.backend_options);
    if (!kind) {
        return fail(make_error(ErrorKind::Config, "Unknown backend: " + opts_.backend));
    }
    events_.metadata("backend_resolved", backend_name(*kind));

    const bool streaming = is_streamable(opts_.format) && !use_checkpoint;
    const auto requested =
        opts_.pipeline_mode.value_or(default_pipeline_mode(opts_.format, use_checkpoint));
    const auto selection = select_pipeline_mode(requested, streaming, use_checkpoint);
    if (selection.fell_back) {
        events_.warn(kOverlapFallbackWarning);
    }
    events_.metadata("pipeline_mode", pipeline_mode_name(selection.mode));

    const int64_t chunk_chars = opts_.chunk_chars.value_or(default_chunk_chars(*kind));

    events_.phase("PARSING");
    ChunkPlan plan;
    st = plan_chunks(book.chapters, chunk_chars, opts_.split_pattern, plan);
    if (!st) {
        return fail(st);
    }
    if (opts_.format == ExportFormat::M4b) {
        st = apply_overrides(book.metadata);
        if (!st) {
            return fail(st);
        }
    }
    events_.metadata("total_chars", plan.total_chars());
    events_.metadata("chapter_count", plan.boundaries.size());
    const auto total_chunks = static_cast<uint32_t>(plan.chunks.size());

    auto encoder = find_executable(opts_.encoder);
    if (!encoder) {
        return fail(make_error(ErrorKind::Export, "encoder not found: " + opts_.encoder));
    }

    CheckpointConfig config;
    config.voice = opts_.voice;
    config.speed = opts_.speed;
    config.lang = opts_.lang;
    config.backend = backend_name(*kind);
    config.chunk_chars = chunk_chars;
    config.split_pattern = opts_.split_pattern;
    config.format = format_name(opts_.format);
    config.bitrate = opts_.bitrate;
    config.normalize = opts_.normalize;

    std::optional<CheckpointStore> store;
    if (use_checkpoint) {
        store.emplace(CheckpointStore::dir_for_output(opts_.output_path));
        st = prepare_checkpoint(*store, plan, config);
        if (!st) {
            return fail(st);
        }
    }

    BackendSession session;
    session.backend = make_backend(*kind, opts_.backend_options);
    st = session.backend->initialize(opts_.lang);
    if (!st) {
        return fail(make_error(ErrorKind::Backend, "Failed to initialize '" +
                                                       session.backend->name() +
                                                       "' backend: " + st.message));
    }
    session.initialized = true;

    std::error_code ec;
    const auto out_dir = std::filesystem::absolute(opts_.output_path, ec).parent_path();
    if (!ec && !out_dir.empty()) {
        std::filesystem::create_directories(out_dir, ec);
        if (ec) {
            return fail(make_error(ErrorKind::Io, "failed to create output directory " +
                                                      out_dir.string() + ": " + ec.message()));
        }
    }

    ExportJob job;
    job.format = opts_.format;
    job.bitrate = opts_.bitrate;
    job.normalize = opts_.normalize;
    job.sample_rate = session.backend->sample_rate();
    job.output_path = opts_.output_path;
    job.metadata = book.metadata;

    std::unique_ptr<StreamingExport> stream;
    std::optional<TempFile> spool_file;
    std::unique_ptr<SpoolFileSink> spool;
    PcmSink *sink = nullptr;
    if (streaming) {
        stream = std::make_unique<StreamingExport>(*encoder, job);
        st = stream->open();
        if (!st) {
            return fail(st);
        }
        sink = stream.get();
    } else {
        spool_file = TempFile::create(".pcm");
        if (!spool_file) {
            return fail(make_error(ErrorKind::Io, "failed to create spool file"));
        }
        spool = std::make_unique<SpoolFileSink>(spool_file->path());
        st = spool->open();
        if (!st) {
            return fail(st);
        }
        sink = spool.get();
    }

    events_.info("Processing " + std::to_string(total_chunks) + " chunks with " +
                 session.backend->name() + " backend (" + pipeline_mode_name(selection.mode) +
                 " pipeline + " + (streaming ? "streaming MP3 export" : "disk spooling") + ")");

    events_.phase("INFERENCE");
    AudioAssembler assembler(plan.boundaries, total_chunks, *sink);
    CoordinatorOptions copts;
    copts.mode = selection.mode;
    copts.streaming_output = streaming;
    if (streaming) {
        copts.output_sample_rate = job.sample_rate;
    }
    copts.voice.voice = opts_.voice;
    copts.voice.speed = opts_.speed;
    copts.voice.split_pattern = opts_.split_pattern;
    copts.prefetch_chunks = static_cast<size_t>(opts_.prefetch_chunks);
    copts.pcm_queue_size = static_cast<size_t>(opts_.pcm_queue_size);
    copts.heartbeat_interval = opts_.heartbeat_interval;
    SynthesisCoordinator coordinator(*session.backend, events_, copts,
                                     store ? &*store : nullptr);
    st = coordinator.run(plan.chunks, assembler);
    if (!st) {
        if (stream) {
            stream->abort();
        }
        return fail(st);
    }

    events_.phase("CONCATENATING");
    events_.info("Concatenating audio segments...");
    if (spool) {
        st = spool->close();
        if (!st) {
            return fail(st);
        }
    }
    if (!streaming) {
        job.sample_rate = session.backend->sample_rate();
    }
    if (opts_.format == ExportFormat::M4b) {
        job.chapters = chapter_marks_ms(assembler.chapter_spans(), job.sample_rate);
    }

    events_.phase("EXPORTING");
    if (stream) {
        st = stream->finish();
    } else {
        st = export_spooled(*encoder, job, spool_file->path());
    }
    if (!st) {
        return fail(st);
    }

    if (store) {
        st = store->cleanup();
        if (!st) {
            return fail(st);
        }
        events_.checkpoint("CLEANED");
    }

    const auto &stats = coordinator.stats();
    char avg[64];
    std::snprintf(avg, sizeof(avg), "%.2fs", stats.average_chunk_seconds());
    events_.done(opts_.output_path, total_chunks);
    events_.info("Done.");
    events_.info("Output: " + opts_.output_path);
    events_.info("Chunks: " + std::to_string(total_chunks));
    events_.info(std::string("Average chunk time: ") + avg);
    NF_LOG("info", "synthesized=" << stats.synthesized << " reused=" << stats.reused
                                  << " regenerated=" << stats.regenerated);
    return ok_status();
}

}  // namespace

RunStatus run_job(const JobOptions &options, EventEmitter &events) {
    JobRunner runner(options, events);
    return runner.run();
}

}  // namespace narrateforge
