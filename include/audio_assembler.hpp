//
//  audio_assembler.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pcm_sink.hpp"
#include "run_status.hpp"
#include "text_chunk.hpp"

namespace narrateforge {

/// Chapter extent in the sample domain of the assembled output.
struct ChapterSpan {
    std::string title;
    uint64_t start_sample = 0;
    uint64_t end_sample = 0;
};

/**
 * @brief Accepts converted chunk audio strictly in index order and forwards it to a sink.
 *
 * Tracks the running sample cursor so every chunk and chapter boundary gets an exact sample
 * offset. A chunk arriving out of order is rejected; the caller owns reordering.
 */
class AudioAssembler {
public:
    AudioAssembler(std::vector<ChapterBoundary> boundaries, uint32_t total_chunks, PcmSink &sink);

    RunStatus append(uint32_t chunk_index, const std::vector<int16_t> &samples);

    uint32_t next_chunk() const { return next_chunk_; }
    bool complete() const { return next_chunk_ == total_chunks_; }
    uint64_t total_samples() const { return cursor_; }
    const std::vector<uint64_t> &chunk_offsets() const { return chunk_offsets_; }

    // Spans for every boundary whose first chunk has been appended. Untitled chapters become
    // "Chapter N" (1-based position among the boundaries).
    std::vector<ChapterSpan> chapter_spans() const;

private:
    std::vector<ChapterBoundary> boundaries_;
    std::vector<uint64_t> chapter_starts_;
    uint32_t total_chunks_;
    PcmSink &sink_;
    uint32_t next_chunk_ = 0;
    uint64_t cursor_ = 0;
    std::vector<uint64_t> chunk_offsets_;
};

}  // namespace narrateforge
