//
//  audio_assembler.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "audio_assembler.hpp"

#include <utility>

#include "logging.hpp"

namespace narrateforge {

AudioAssembler::AudioAssembler(std::vector<ChapterBoundary> boundaries, uint32_t total_chunks,
                               PcmSink &sink)
    : boundaries_(std::move(boundaries)), total_chunks_(total_chunks), sink_(sink) {
    chunk_offsets_.reserve(total_chunks_);
    chapter_starts_.reserve(boundaries_.size());
}

RunStatus AudioAssembler::append(uint32_t chunk_index, const std::vector<int16_t> &samples) {
    if (chunk_index != next_chunk_) {
        return make_error(ErrorKind::Export, "chunk " + std::to_string(chunk_index) +
                                                 " arrived out of order, expected " +
                                                 std::to_string(next_chunk_));
    }
    if (chunk_index >= total_chunks_) {
        return make_error(ErrorKind::Export,
                          "chunk " + std::to_string(chunk_index) + " beyond planned total");
    }
    while (chapter_starts_.size() < boundaries_.size() &&
           boundaries_[chapter_starts_.size()].first_chunk == chunk_index) {
        NF_LOG("pipeline", "chapter " << chapter_starts_.size() << " starts at sample " << cursor_);
        chapter_starts_.push_back(cursor_);
    }
    auto st = sink_.write(samples);
    if (!st) {
        return st;
    }
    chunk_offsets_.push_back(cursor_);
    cursor_ += samples.size();
    ++next_chunk_;
    return ok_status();
}

std::vector<ChapterSpan> AudioAssembler::chapter_spans() const {
    std::vector<ChapterSpan> spans;
    spans.reserve(chapter_starts_.size());
    for (size_t i = 0; i < chapter_starts_.size(); ++i) {
        ChapterSpan span;
        span.title = boundaries_[i].title.empty() ? "Chapter " + std::to_string(i + 1)
                                                  : boundaries_[i].title;
        span.start_sample = chapter_starts_[i];
        span.end_sample = (i + 1 < chapter_starts_.size()) ? chapter_starts_[i + 1] : cursor_;
        spans.push_back(std::move(span));
    }
    return spans;
}

}  // namespace narrateforge
