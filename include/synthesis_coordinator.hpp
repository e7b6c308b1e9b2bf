//
//  synthesis_coordinator.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "audio_assembler.hpp"
#include "checkpoint_store.hpp"
#include "event_emitter.hpp"
#include "exporter.hpp"
#include "run_status.hpp"
#include "synthesis_backend.hpp"
#include "text_chunk.hpp"

namespace narrateforge {

enum class PipelineMode { Sequential, Overlap3 };

const char *pipeline_mode_name(PipelineMode mode);
std::optional<PipelineMode> parse_pipeline_mode(std::string_view name);

// overlap3 on Apple Silicon for streamable output without checkpointing, sequential elsewhere.
PipelineMode default_pipeline_mode(ExportFormat format, bool use_checkpoint);

struct ModeSelection {
    PipelineMode mode = PipelineMode::Sequential;
    bool fell_back = false;  // overlap3 was requested for an unsupported combination
};

// overlap3 needs a streaming sink and no checkpoint; anything else runs sequentially.
ModeSelection select_pipeline_mode(PipelineMode requested, bool streaming_output,
                                   bool use_checkpoint);

inline constexpr const char *kOverlapFallbackWarning =
    "pipeline mode overlap3 is supported only for streamed MP3 without checkpointing; "
    "falling back to sequential.";

struct CoordinatorOptions {
    PipelineMode mode = PipelineMode::Sequential;
    bool streaming_output = false;  // assembler sink feeds an encoder pipe
    uint32_t output_sample_rate = 0;  // rate the sink was opened at; 0 follows the backend
    VoiceSettings voice;
    size_t prefetch_chunks = 2;  // inference -> conversion queue depth
    size_t pcm_queue_size = 4;   // conversion -> encoder queue depth
    std::chrono::milliseconds heartbeat_interval{5000};
};

struct SynthesisStats {
    uint32_t synthesized = 0;
    uint32_t reused = 0;
    uint32_t regenerated = 0;  // chunks whose checkpoint audio was missing
    std::vector<int64_t> chunk_ms;
    PipelineMode mode = PipelineMode::Sequential;

    double average_chunk_seconds() const;
};

/**
 * @brief Drives planned chunks through the backend into the assembler in index order.
 *
 * Sequential mode reuses, synthesizes, converts, persists and appends one chunk at a time.
 * Overlap3 runs inference and conversion on their own threads joined by bounded channels while
 * the calling thread feeds the assembler; it is only legal with a streaming sink and no
 * checkpoint store, and degrades to sequential with a warning otherwise.
 *
 * Backend, checkpoint and export failures end the run and are returned unchanged; checkpoint
 * state on disk is left as it was.
 */
class SynthesisCoordinator {
public:
    SynthesisCoordinator(SynthesisBackend &backend, EventEmitter &events,
                         CoordinatorOptions options, CheckpointStore *checkpoint = nullptr);

    RunStatus run(const std::vector<TextChunk> &chunks, AudioAssembler &assembler);

    const SynthesisStats &stats() const { return stats_; }

private:
    RunStatus run_sequential(const std::vector<TextChunk> &chunks, AudioAssembler &assembler);
    RunStatus run_overlap3(const std::vector<TextChunk> &chunks, AudioAssembler &assembler);

    // Backend call plus rate check; `ms` receives the wall time of generate().
    RunStatus synthesize(const TextChunk &chunk, RawAudio &raw, int64_t &ms);

    SynthesisBackend &backend_;
    EventEmitter &events_;
    CoordinatorOptions options_;
    CheckpointStore *checkpoint_;
    SynthesisStats stats_;
};

}  // namespace narrateforge
