//
//  text_chunk.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>

/// One chapter as delivered by the text extractor, in reading order.
struct ChapterText {
    std::string title;  ///< UTF-8 title, may be empty
    std::string text;   ///< UTF-8 body text
};

/// A bounded unit of text submitted to the backend in one call.
struct TextChunk {
    uint32_t index = 0;          ///< Position in the final audio
    std::string text;            ///< UTF-8 text, at most max_chars code points
    uint32_t chapter_index = 0;  ///< Index into the chapter list passed to the planner
};

/// First chunk of a chapter; drives chapter sample offsets after synthesis.
struct ChapterBoundary {
    uint32_t chapter_index = 0;
    uint32_t first_chunk = 0;
    std::string title;
};
