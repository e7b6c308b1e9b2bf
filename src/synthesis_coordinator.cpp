//
//  synthesis_coordinator.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "synthesis_coordinator.hpp"

#include <mutex>
#include <numeric>
#include <thread>
#include <utility>

#include "bounded_channel.hpp"
#include "logging.hpp"
#include "pcm_sink.hpp"

namespace narrateforge {

namespace {

constexpr int kInferenceWorker = 0;
constexpr int kConversionWorker = 1;
constexpr int kEncodeWorker = 2;

std::string chunk_label(uint32_t index, size_t total) {
    return "Chunk " + std::to_string(index + 1) + "/" + std::to_string(total);
}

int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
}

struct RawItem {
    uint32_t index = 0;
    RawAudio audio;
    int64_t infer_ms = 0;
};

struct PcmItem {
    uint32_t index = 0;
    std::vector<int16_t> samples;
    int64_t infer_ms = 0;
};

// First failure wins; later ones are only logged.
class PipelineFailure {
public:
    void set(RunStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (first_) {
            NF_LOG("debug", "suppressed follow-up failure: " << status.message);
            return;
        }
        first_ = std::move(status);
    }

    std::optional<RunStatus> get() {
        std::lock_guard<std::mutex> lock(mutex_);
        return first_;
    }

private:
    std::mutex mutex_;
    std::optional<RunStatus> first_;
};

}  // namespace

const char *pipeline_mode_name(PipelineMode mode) {
    switch (mode) {
    case PipelineMode::Sequential:
        return "sequential";
    case PipelineMode::Overlap3:
        return "overlap3";
    }
    return "sequential";
}

std::optional<PipelineMode> parse_pipeline_mode(std::string_view name) {
    if (name == "sequential") {
        return PipelineMode::Sequential;
    }
    if (name == "overlap3") {
        return PipelineMode::Overlap3;
    }
    return std::nullopt;
}

PipelineMode default_pipeline_mode(ExportFormat format, bool use_checkpoint) {
#if defined(__APPLE__) && defined(__aarch64__)
    if (is_streamable(format) && !use_checkpoint) {
        return PipelineMode::Overlap3;
    }
#else
    (void)format;
    (void)use_checkpoint;
#endif
    return PipelineMode::Sequential;
}

ModeSelection select_pipeline_mode(PipelineMode requested, bool streaming_output,
                                   bool use_checkpoint) {
    ModeSelection sel;
    sel.mode = requested;
    if (requested == PipelineMode::Overlap3 && (!streaming_output || use_checkpoint)) {
        sel.mode = PipelineMode::Sequential;
        sel.fell_back = true;
    }
    return sel;
}

double SynthesisStats::average_chunk_seconds() const {
    if (chunk_ms.empty()) {
        return 0.0;
    }
    const auto total = std::accumulate(chunk_ms.begin(), chunk_ms.end(), int64_t{0});
    return static_cast<double>(total) / 1000.0 / static_cast<double>(chunk_ms.size());
}

SynthesisCoordinator::SynthesisCoordinator(SynthesisBackend &backend, EventEmitter &events,
                                           CoordinatorOptions options, CheckpointStore *checkpoint)
    : backend_(backend), events_(events), options_(std::move(options)), checkpoint_(checkpoint) {}

RunStatus SynthesisCoordinator::run(const std::vector<TextChunk> &chunks,
                                    AudioAssembler &assembler) {
    const auto sel =
        select_pipeline_mode(options_.mode, options_.streaming_output, checkpoint_ != nullptr);
    if (sel.fell_back) {
        NF_LOG("warn", kOverlapFallbackWarning);
        events_.warn(kOverlapFallbackWarning);
    }
    stats_ = SynthesisStats{};
    stats_.mode = sel.mode;

    Heartbeat heartbeat(events_, options_.heartbeat_interval);
    NF_LOG("info", "synthesizing " << chunks.size() << " chunks with " << backend_.name() << " ("
                                   << pipeline_mode_name(sel.mode) << ")");
    if (sel.mode == PipelineMode::Overlap3) {
        return run_overlap3(chunks, assembler);
    }
    return run_sequential(chunks, assembler);
}

RunStatus SynthesisCoordinator::synthesize(const TextChunk &chunk, RawAudio &raw, int64_t &ms) {
    const auto start = std::chrono::steady_clock::now();
    auto st = backend_.generate(chunk.text, options_.voice, raw);
    ms = elapsed_ms(start);
    if (!st) {
        NF_LOG("error", "chunk " << chunk.index << " failed: " << st.message);
        if (st.kind != ErrorKind::Backend) {
            st.kind = ErrorKind::Backend;
        }
        return st;
    }
    if (raw.sample_rate == 0) {
        raw.sample_rate = backend_.sample_rate();
    }
    const uint32_t expected = options_.output_sample_rate != 0 ? options_.output_sample_rate
                                                               : backend_.sample_rate();
    if (raw.sample_rate != expected) {
        return make_error(ErrorKind::Backend,
                          "chunk " + std::to_string(chunk.index) + " returned " +
                              std::to_string(raw.sample_rate) + " Hz, expected " +
                              std::to_string(expected) + " Hz");
    }
    return ok_status();
}

RunStatus SynthesisCoordinator::run_sequential(const std::vector<TextChunk> &chunks,
                                               AudioAssembler &assembler) {
    const size_t total = chunks.size();
    uint32_t processed = 0;
    for (const auto &chunk : chunks) {
        const uint32_t idx = chunk.index;
        bool reused = false;

        if (checkpoint_ && checkpoint_->state().completed_chunks.count(idx) > 0) {
            auto audio = checkpoint_->chunk_audio(idx);
            if (audio) {
                auto st = assembler.append(idx, *audio);
                if (!st) {
                    return st;
                }
                events_.worker(kInferenceWorker, "ENCODE",
                               "Reused checkpoint chunk " + std::to_string(idx + 1) + "/" +
                                   std::to_string(total));
                events_.checkpoint("REUSED", idx);
                ++stats_.reused;
                reused = true;
            } else {
                NF_LOG("warn", "checkpoint audio for chunk " << idx << " missing, regenerating");
                auto st = checkpoint_->forget_chunk(idx);
                if (!st) {
                    return st;
                }
                events_.checkpoint("MISSING_AUDIO", idx);
                ++stats_.regenerated;
            }
        }

        if (!reused) {
            events_.worker(kInferenceWorker, "INFER", chunk_label(idx, total));
            RawAudio raw;
            int64_t ms = 0;
            auto st = synthesize(chunk, raw, ms);
            if (!st) {
                return st;
            }
            const auto pcm = to_pcm16(raw.samples);
            if (checkpoint_) {
                st = checkpoint_->record_chunk(idx, pcm);
                if (!st) {
                    return st;
                }
                events_.checkpoint("SAVED", idx);
            }
            st = assembler.append(idx, pcm);
            if (!st) {
                return st;
            }
            stats_.chunk_ms.push_back(ms);
            ++stats_.synthesized;
            events_.timing(idx, ms, "infer");
        }

        ++processed;
        events_.progress(processed, static_cast<uint32_t>(total));
    }
    return ok_status();
}

RunStatus SynthesisCoordinator::run_overlap3(const std::vector<TextChunk> &chunks,
                                             AudioAssembler &assembler) {
    const size_t total = chunks.size();
    BoundedChannel<RawItem> raw_channel(options_.prefetch_chunks);
    BoundedChannel<PcmItem> pcm_channel(options_.pcm_queue_size);
    PipelineFailure failure;

    auto teardown = [&](RunStatus status) {
        failure.set(std::move(status));
        raw_channel.cancel();
        pcm_channel.cancel();
    };

    // Sole caller of the backend while the pipeline runs.
    std::thread inference([&] {
        for (const auto &chunk : chunks) {
            events_.worker(kInferenceWorker, "INFER", chunk_label(chunk.index, total));
            RawItem item;
            item.index = chunk.index;
            auto st = synthesize(chunk, item.audio, item.infer_ms);
            if (!st) {
                teardown(std::move(st));
                return;
            }
            if (!raw_channel.push(std::move(item))) {
                return;
            }
        }
        raw_channel.close();
    });

    std::thread conversion([&] {
        while (auto item = raw_channel.pop()) {
            events_.worker(kConversionWorker, "CONVERT", chunk_label(item->index, total));
            PcmItem out;
            out.index = item->index;
            out.infer_ms = item->infer_ms;
            out.samples = to_pcm16(item->audio.samples);
            if (!pcm_channel.push(std::move(out))) {
                return;
            }
        }
        if (!raw_channel.cancelled()) {
            pcm_channel.close();
        }
    });

    uint32_t processed = 0;
    while (auto item = pcm_channel.pop()) {
        auto st = assembler.append(item->index, item->samples);
        if (!st) {
            teardown(std::move(st));
            break;
        }
        events_.worker(kEncodeWorker, "ENCODE", chunk_label(item->index, total));
        events_.timing(item->index, item->infer_ms, "infer");
        stats_.chunk_ms.push_back(item->infer_ms);
        ++stats_.synthesized;
        ++processed;
        events_.progress(processed, static_cast<uint32_t>(total));
    }

    inference.join();
    conversion.join();

    if (auto err = failure.get()) {
        return *err;
    }
    if (processed != total) {
        return make_error(ErrorKind::Backend, "pipeline ended after " + std::to_string(processed) +
                                                  " of " + std::to_string(total) + " chunks");
    }
    return ok_status();
}

}  // namespace narrateforge
