//
//  chapter_timing.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "logging.hpp"

/// Chapter extent expressed in milliseconds, as written into container metadata.
struct ChapterMarkMs {
    std::string title;
    uint64_t start_ms = 0;
    uint64_t end_ms = 0;
};

// Sample offset to milliseconds, truncated.
inline uint64_t samples_to_ms(uint64_t samples, uint32_t sample_rate) {
    if (sample_rate == 0) {
        return 0;
    }
    return samples * 1000 / sample_rate;
}

// Convert sample-domain spans (start_sample/end_sample/title) into millisecond marks. Each end
// is the next chapter's start; the last one ends at the total duration.
template <typename Span>
inline std::vector<ChapterMarkMs> chapter_marks_ms(const std::vector<Span> &spans,
                                                   uint32_t sample_rate) {
    std::vector<ChapterMarkMs> marks;
    marks.reserve(spans.size());
    if (spans.empty()) {
        return marks;
    }
    if (spans.front().start_sample != 0) {
        NF_LOG("warn", "first chapter starts at sample " << spans.front().start_sample
                                                         << "; players expect 0ms.");
    }
    for (size_t i = 0; i < spans.size(); ++i) {
        ChapterMarkMs mark;
        mark.title = spans[i].title;
        mark.start_ms = samples_to_ms(spans[i].start_sample, sample_rate);
        if (i + 1 < spans.size()) {
            mark.end_ms = samples_to_ms(spans[i + 1].start_sample, sample_rate);
        } else {
            mark.end_ms = samples_to_ms(spans[i].end_sample, sample_rate);
        }
        mark.end_ms = std::max(mark.end_ms, mark.start_ms);
        marks.push_back(std::move(mark));
    }
    return marks;
}
