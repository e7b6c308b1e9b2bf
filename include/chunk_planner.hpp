//
//  chunk_planner.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "run_status.hpp"
#include "text_chunk.hpp"

namespace narrateforge {

inline constexpr const char *kDefaultSplitPattern = "\\n+";

struct ChunkPlan {
    std::vector<TextChunk> chunks;
    std::vector<ChapterBoundary> boundaries;

    // Total code points across all chunks.
    size_t total_chars() const;
};

/**
 * @brief Split ordered chapters into bounded chunks.
 *
 * Each chapter is split on its own: `split_pattern` matches mark paragraph breaks, oversized
 * paragraphs break at sentence ends and oversized sentences are cut at `max_chars` code points.
 * Pieces are then packed greedily (space-joined) up to `max_chars`. Identical inputs always give
 * an identical plan.
 *
 * Fails with ErrorKind::Planning when `max_chars <= 0`, the pattern is empty or invalid, or no
 * chapter carries any text.
 */
RunStatus plan_chunks(const std::vector<ChapterText> &chapters, int64_t max_chars,
                      const std::string &split_pattern, ChunkPlan &out);

// UTF-8 aware length (code points; continuation bytes are not counted).
size_t utf8_length(std::string_view s);

// Byte length of the first `count` code points of `s`.
size_t utf8_prefix_bytes(std::string_view s, size_t count);

}  // namespace narrateforge
