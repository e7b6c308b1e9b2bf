//
//  image_info.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "image_info.hpp"

#include <algorithm>

namespace {

uint32_t read_u32be(const std::vector<uint8_t> &d, size_t pos) {
    return (static_cast<uint32_t>(d[pos]) << 24) | (static_cast<uint32_t>(d[pos + 1]) << 16) |
           (static_cast<uint32_t>(d[pos + 2]) << 8) | d[pos + 3];
}

// Walk JPEG markers up to SOS looking for a start-of-frame segment.
void jpeg_dimensions(const std::vector<uint8_t> &data, ImageInfo &info) {
    size_t i = 2;
    while (i + 3 < data.size()) {
        if (data[i] != 0xFF) {
            ++i;
            continue;
        }
        uint8_t marker = data[i + 1];
        // Skip padding FFs.
        if (marker == 0xFF) {
            ++i;
            continue;
        }
        if (marker == 0xD9 || marker == 0xDA) {
            return;
        }
        uint16_t seg_len = static_cast<uint16_t>((data[i + 2] << 8) | data[i + 3]);
        if (seg_len < 2 || i + 2 + seg_len > data.size()) {
            return;
        }
        bool is_sof = (marker >= 0xC0 && marker <= 0xC3) || (marker >= 0xC5 && marker <= 0xC7) ||
                      (marker >= 0xC9 && marker <= 0xCB) || (marker >= 0xCD && marker <= 0xCF);
        if (is_sof && seg_len >= 7) {
            info.height = static_cast<uint32_t>((data[i + 5] << 8) | data[i + 6]);
            info.width = static_cast<uint32_t>((data[i + 7] << 8) | data[i + 8]);
            return;
        }
        i += 2 + seg_len;
    }
}

}  // namespace

std::optional<ImageInfo> sniff_image(const std::vector<uint8_t> &data) {
    static const uint8_t kPng[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

    if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        ImageInfo info{"image/jpeg", ".jpg"};
        jpeg_dimensions(data, info);
        return info;
    }
    if (data.size() >= 8 && std::equal(kPng, kPng + 8, data.begin())) {
        ImageInfo info{"image/png", ".png"};
        // IHDR is always the first chunk: length, type, width, height.
        if (data.size() >= 24) {
            info.width = read_u32be(data, 16);
            info.height = read_u32be(data, 20);
        }
        return info;
    }
    if (data.size() >= 6 && data[0] == 'G' && data[1] == 'I' && data[2] == 'F' &&
        data[3] == '8' && (data[4] == '7' || data[4] == '9') && data[5] == 'a') {
        ImageInfo info{"image/gif", ".gif"};
        if (data.size() >= 10) {
            info.width = static_cast<uint32_t>(data[6] | (data[7] << 8));
            info.height = static_cast<uint32_t>(data[8] | (data[9] << 8));
        }
        return info;
    }
    return std::nullopt;
}
