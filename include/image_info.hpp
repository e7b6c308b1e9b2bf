//
//  image_info.hpp
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

struct ImageInfo {
    std::string mime;       // image/jpeg, image/png or image/gif
    std::string extension;  // ".jpg", ".png", ".gif"
    uint32_t width = 0;
    uint32_t height = 0;
};

// Minimal signature/header inspection for cover art. Returns nullopt for anything that is not a
// JPEG, PNG or GIF. Dimensions stay 0 when the header is present but truncated.
std::optional<ImageInfo> sniff_image(const std::vector<uint8_t> &data);
