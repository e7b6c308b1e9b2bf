//
//  book_source.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "book_source.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <utility>

#include "image_info.hpp"
#include "logging.hpp"

using json = nlohmann::json;

namespace narrateforge {

namespace {

// Extension fallback for covers whose signature is not recognized.
std::string mime_from_extension(const std::string &path) {
    auto ext = std::filesystem::path(path).extension().string();
    for (auto &c : ext) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    if (ext == ".png") {
        return "image/png";
    }
    if (ext == ".gif") {
        return "image/gif";
    }
    return "image/jpeg";
}

}  // namespace

std::optional<std::vector<uint8_t>> read_file_bytes(const std::string &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        NF_LOG("error", "open failed for " << path << " " << errno_text());
        return std::nullopt;
    }
    f.seekg(0, std::ios::end);
    const auto sz = static_cast<size_t>(f.tellg());
    f.seekg(0, std::ios::beg);
    std::vector<uint8_t> out(sz);
    f.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(sz));
    if (!f.good() && sz > 0) {
        return std::nullopt;
    }
    return out;
}

RunStatus load_cover_file(const std::string &path, BookMetadata &meta) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return make_error(ErrorKind::Io, "Cover file not found: " + path);
    }
    auto bytes = read_file_bytes(path);
    if (!bytes) {
        return make_error(ErrorKind::Io, "Failed to read cover file: " + path);
    }
    if (auto info = sniff_image(*bytes)) {
        meta.cover_mime = info->mime;
        NF_LOG("debug", "cover " << info->mime << " " << info->width << "x" << info->height);
    } else {
        meta.cover_mime = mime_from_extension(path);
        NF_LOG("warn", "cover " << path << " has an unknown signature, assuming "
                                << meta.cover_mime);
    }
    meta.cover = std::move(*bytes);
    return ok_status();
}

RunStatus load_book_json(const std::string &json_path, BookSource &out) {
    std::error_code ec;
    if (!std::filesystem::exists(json_path, ec)) {
        return make_error(ErrorKind::Io, "Input book not found: " + json_path);
    }
    std::ifstream f(json_path);
    if (!f.is_open()) {
        NF_LOG("error", "open failed for " << json_path << " " << errno_text());
        return make_error(ErrorKind::Io, "Failed to open input book: " + json_path);
    }
    json j;
    try {
        f >> j;
    } catch (const json::exception &e) {
        return make_error(ErrorKind::Config,
                          "Failed to parse book JSON " + json_path + ": " + e.what());
    }
    if (!j.is_object()) {
        return make_error(ErrorKind::Config, "Book JSON must be an object: " + json_path);
    }

    BookSource book;
    std::string cover;
    try {
        cover = j.value("cover", "");
        book.metadata.title = j.value("title", "");
        book.metadata.author = j.value("author", "");
        if (j.contains("chapters") && j["chapters"].is_array()) {
            book.chapters.reserve(j["chapters"].size());
            for (const auto &c : j["chapters"]) {
                ChapterText ch;
                ch.title = c.value("title", "");
                ch.text = c.value("text", "");
                book.chapters.push_back(std::move(ch));
            }
        }
    } catch (const json::exception &e) {
        return make_error(ErrorKind::Config, "Malformed book JSON " + json_path + ": " + e.what());
    }

    if (!cover.empty()) {
        auto base = std::filesystem::path(json_path).parent_path();
        auto st = load_cover_file((base / cover).string(), book.metadata);
        if (!st) {
            return st;
        }
    }
    NF_LOG("debug", "book " << json_path << ": chapters=" << book.chapters.size()
                            << " cover=" << book.metadata.cover.size() << " bytes");
    out = std::move(book);
    return ok_status();
}

}  // namespace narrateforge
