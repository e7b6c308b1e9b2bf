//
//  temp_file.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "temp_file.hpp"

#include <unistd.h>

#include <cstdlib>
#include <system_error>
#include <utility>
#include <vector>

#include "logging.hpp"

namespace narrateforge {

std::optional<TempFile> TempFile::create(const std::string &suffix) {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    std::string pattern = (dir / "narrateforge-XXXXXX").string() + suffix;
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    int fd = mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        NF_LOG("error", "mkstemps failed for " << pattern << " " << errno_text());
        return std::nullopt;
    }
    ::close(fd);
    return TempFile(std::filesystem::path(buf.data()));
}

TempFile::TempFile(TempFile &&other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempFile &TempFile::operator=(TempFile &&other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

TempFile::~TempFile() { remove(); }

void TempFile::remove() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        NF_LOG("warn", "could not remove temp file " << path_.string() << ": " << ec.message());
    }
    path_.clear();
}

}  // namespace narrateforge
