//
//  chunk_planner.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "chunk_planner.hpp"

#include <regex>

#include "logging.hpp"

namespace narrateforge {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Collapse whitespace runs to a single space and trim both ends.
std::string collapse_whitespace(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    bool pending_space = false;
    for (char c : in) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

std::vector<std::string> split_paragraphs(const std::string &text, const std::regex &pattern) {
    std::vector<std::string> paragraphs;
    std::sregex_token_iterator it(text.begin(), text.end(), pattern, -1);
    for (std::sregex_token_iterator end; it != end; ++it) {
        auto p = collapse_whitespace(it->str());
        if (!p.empty()) {
            paragraphs.emplace_back(std::move(p));
        }
    }
    return paragraphs;
}

// Sentence ends are '.', '!' or '?' followed by whitespace (input is already collapsed).
std::vector<std::string> split_sentences(const std::string &paragraph) {
    std::vector<std::string> sentences;
    size_t start = 0;
    for (size_t i = 0; i + 1 < paragraph.size(); ++i) {
        char c = paragraph[i];
        if ((c == '.' || c == '!' || c == '?') && paragraph[i + 1] == ' ') {
            sentences.emplace_back(paragraph.substr(start, i + 1 - start));
            start = i + 2;
        }
    }
    if (start < paragraph.size()) {
        sentences.emplace_back(paragraph.substr(start));
    }
    return sentences;
}

void hard_cut(const std::string &sentence, size_t max_chars, std::vector<std::string> &pieces) {
    std::string_view rest(sentence);
    while (!rest.empty()) {
        size_t take = utf8_prefix_bytes(rest, max_chars);
        auto piece = collapse_whitespace(rest.substr(0, take));
        if (!piece.empty()) {
            pieces.emplace_back(std::move(piece));
        }
        rest.remove_prefix(take);
    }
}

std::vector<std::string> split_oversized_paragraph(const std::string &paragraph,
                                                   size_t max_chars) {
    if (utf8_length(paragraph) <= max_chars) {
        return {paragraph};
    }
    std::vector<std::string> pieces;
    std::string buffer;
    size_t buffer_len = 0;
    for (const auto &sentence : split_sentences(paragraph)) {
        const size_t len = utf8_length(sentence);
        if (len == 0) {
            continue;
        }
        if (len > max_chars) {
            if (!buffer.empty()) {
                pieces.emplace_back(std::move(buffer));
                buffer.clear();
                buffer_len = 0;
            }
            hard_cut(sentence, max_chars, pieces);
            continue;
        }
        const size_t candidate_len = buffer.empty() ? len : buffer_len + 1 + len;
        if (candidate_len <= max_chars) {
            if (!buffer.empty()) {
                buffer.push_back(' ');
            }
            buffer += sentence;
            buffer_len = candidate_len;
        } else {
            if (!buffer.empty()) {
                pieces.emplace_back(std::move(buffer));
            }
            buffer = sentence;
            buffer_len = len;
        }
    }
    if (!buffer.empty()) {
        pieces.emplace_back(std::move(buffer));
    }
    if (pieces.empty()) {
        pieces.push_back(paragraph);
    }
    return pieces;
}

}  // namespace

size_t utf8_length(std::string_view s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

size_t utf8_prefix_bytes(std::string_view s, size_t count) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (seen == count) {
                return i;
            }
            ++seen;
        }
    }
    return s.size();
}

size_t ChunkPlan::total_chars() const {
    size_t total = 0;
    for (const auto &c : chunks) {
        total += utf8_length(c.text);
    }
    return total;
}

RunStatus plan_chunks(const std::vector<ChapterText> &chapters, int64_t max_chars,
                      const std::string &split_pattern, ChunkPlan &out) {
    out = ChunkPlan{};
    if (max_chars <= 0) {
        return make_error(ErrorKind::Planning,
                          "chunk size must be positive (got " + std::to_string(max_chars) + ")");
    }
    if (split_pattern.empty()) {
        return make_error(ErrorKind::Planning, "split pattern must not be empty");
    }
    std::regex pattern;
    try {
        pattern = std::regex(split_pattern, std::regex::ECMAScript);
    } catch (const std::regex_error &e) {
        return make_error(ErrorKind::Planning,
                          "invalid split pattern '" + split_pattern + "': " + e.what());
    }
    const auto limit = static_cast<size_t>(max_chars);

    for (size_t ci = 0; ci < chapters.size(); ++ci) {
        const auto paragraphs = split_paragraphs(chapters[ci].text, pattern);
        if (paragraphs.empty()) {
            NF_LOG("planner", "chapter " << ci << " has no text; skipped");
            continue;
        }
        const auto chapter_index = static_cast<uint32_t>(ci);
        out.boundaries.push_back(ChapterBoundary{chapter_index,
                                                 static_cast<uint32_t>(out.chunks.size()),
                                                 chapters[ci].title});

        auto flush = [&](std::string &buffer) {
            TextChunk chunk;
            chunk.index = static_cast<uint32_t>(out.chunks.size());
            chunk.text = std::move(buffer);
            chunk.chapter_index = chapter_index;
            out.chunks.emplace_back(std::move(chunk));
            buffer.clear();
        };

        std::string buffer;
        size_t buffer_len = 0;
        for (const auto &paragraph : paragraphs) {
            for (auto &piece : split_oversized_paragraph(paragraph, limit)) {
                const size_t len = utf8_length(piece);
                if (!buffer.empty() && buffer_len + 1 + len <= limit) {
                    buffer.push_back(' ');
                    buffer += piece;
                    buffer_len += 1 + len;
                    continue;
                }
                if (!buffer.empty()) {
                    flush(buffer);
                }
                buffer = std::move(piece);
                buffer_len = len;
            }
        }
        if (!buffer.empty()) {
            flush(buffer);
        }
    }

    if (out.chunks.empty()) {
        return make_error(ErrorKind::Planning, "No readable text content found in input.");
    }
    NF_LOG("planner", "planned " << out.chunks.size() << " chunks across "
                                 << out.boundaries.size() << " chapters (max_chars="
                                 << max_chars << ")");
    return ok_status();
}

}  // namespace narrateforge
