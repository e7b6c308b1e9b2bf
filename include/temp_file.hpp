//
//  temp_file.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace narrateforge {

// Uniquely named file under the system temp directory; removed when the owner goes away.
class TempFile {
public:
    static std::optional<TempFile> create(const std::string &suffix);

    TempFile(TempFile &&other) noexcept;
    TempFile &operator=(TempFile &&other) noexcept;
    TempFile(const TempFile &) = delete;
    TempFile &operator=(const TempFile &) = delete;
    ~TempFile();

    const std::filesystem::path &path() const { return path_; }

private:
    explicit TempFile(std::filesystem::path path) : path_(std::move(path)) {}
    void remove();

    std::filesystem::path path_;
};

}  // namespace narrateforge
