//
//  book_metadata.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Top-level tags embedded into chaptered output.
 *
 * Fields are UTF-8; cover holds the raw image file (JPEG, PNG or GIF).
 */
struct BookMetadata {
    std::string title;           ///< Book title (also used as album)
    std::string author;          ///< Author, exported as artist
    std::vector<uint8_t> cover;  ///< Cover image bytes
    std::string cover_mime;      ///< MIME type sniffed from the cover bytes
};
