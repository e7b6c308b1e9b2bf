//
//  source_hash.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>

namespace narrateforge {

// Lower-case hex SHA-256 of a file's contents, read in 8 KiB blocks. nullopt on io failure.
std::optional<std::string> sha256_file(const std::string &path);

// Lower-case hex SHA-256 of an in-memory buffer.
std::string sha256_hex(const std::string &data);

}  // namespace narrateforge
