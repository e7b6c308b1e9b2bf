//
//  book_source.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "book_metadata.hpp"
#include "run_status.hpp"
#include "text_chunk.hpp"

namespace narrateforge {

/// Extracted book as handed over by the text extractor: ordered chapters plus tags.
struct BookSource {
    BookMetadata metadata;
    std::vector<ChapterText> chapters;
};

/**
 * @brief Load a book JSON document.
 *
 * Shape: `{"title", "author", "cover", "chapters": [{"title", "text"}]}`. `cover` is a path
 * relative to the JSON file. Missing optional fields default to empty.
 */
RunStatus load_book_json(const std::string &json_path, BookSource &out);

/// Replace the cover with the image at `path`; MIME is taken from the image signature.
RunStatus load_cover_file(const std::string &path, BookMetadata &meta);

std::optional<std::vector<uint8_t>> read_file_bytes(const std::string &path);

}  // namespace narrateforge
