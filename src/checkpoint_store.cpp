//
//  checkpoint_store.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "checkpoint_store.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <system_error>
#include <utility>

#include "logging.hpp"

using json = nlohmann::json;

namespace narrateforge {

namespace {

constexpr const char *kStateFile = "state.json";
constexpr std::array<char, 4> kChunkMagic = {'N', 'F', 'P', 'C'};
constexpr uint32_t kChunkVersion = 1;
constexpr size_t kChunkHeaderSize = 4 + 4 + 8;

void put_u32le(std::string &out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

void put_u64le(std::string &out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

uint64_t get_le(const unsigned char *p, int bytes) {
    uint64_t v = 0;
    for (int i = bytes - 1; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

// Write to "<path>.tmp", then rename over the target.
bool write_atomically(const std::filesystem::path &path, const std::string &bytes) {
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            NF_LOG("error", "open failed for " << tmp.string() << " " << errno_text());
            return false;
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out.good()) {
            NF_LOG("error", "write failed for " << tmp.string() << " " << errno_text());
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        NF_LOG("error", "rename " << tmp.string() << " -> " << path.string()
                                  << " failed: " << ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

json config_to_json(const CheckpointConfig &c) {
    return json{{"voice", c.voice},
                {"speed", c.speed},
                {"lang_code", c.lang},
                {"backend", c.backend},
                {"chunk_chars", c.chunk_chars},
                {"split_pattern", c.split_pattern},
                {"format", c.format},
                {"bitrate", c.bitrate},
                {"normalize", c.normalize}};
}

CheckpointConfig config_from_json(const json &j) {
    CheckpointConfig c;
    c.voice = j.at("voice").get<std::string>();
    c.speed = j.at("speed").get<double>();
    c.lang = j.at("lang_code").get<std::string>();
    c.backend = j.at("backend").get<std::string>();
    c.chunk_chars = j.at("chunk_chars").get<int64_t>();
    c.split_pattern = j.at("split_pattern").get<std::string>();
    c.format = j.at("format").get<std::string>();
    c.bitrate = j.at("bitrate").get<std::string>();
    c.normalize = j.at("normalize").get<bool>();
    return c;
}

}  // namespace

const char *validation_detail(CheckpointValidation v) {
    switch (v) {
    case CheckpointValidation::Absent:
        return "absent";
    case CheckpointValidation::Valid:
        return "valid";
    case CheckpointValidation::HashMismatch:
        return "hash_mismatch";
    case CheckpointValidation::ConfigMismatch:
        return "config_mismatch";
    case CheckpointValidation::ChunkCountMismatch:
        return "chunk_mismatch";
    }
    return "unknown";
}

std::string first_config_difference(const CheckpointConfig &a, const CheckpointConfig &b) {
    if (a.voice != b.voice) return "voice";
    if (a.speed != b.speed) return "speed";
    if (a.lang != b.lang) return "lang_code";
    if (a.backend != b.backend) return "backend";
    if (a.chunk_chars != b.chunk_chars) return "chunk_chars";
    if (a.split_pattern != b.split_pattern) return "split_pattern";
    if (a.format != b.format) return "format";
    if (a.bitrate != b.bitrate) return "bitrate";
    if (a.normalize != b.normalize) return "normalize";
    return {};
}

CheckpointStore::CheckpointStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

std::filesystem::path CheckpointStore::dir_for_output(const std::string &output_path) {
    return std::filesystem::path(output_path + ".checkpoint");
}

bool CheckpointStore::exists() const {
    std::error_code ec;
    return std::filesystem::is_directory(dir_, ec);
}

std::filesystem::path CheckpointStore::state_path() const { return dir_ / kStateFile; }

std::filesystem::path CheckpointStore::chunk_path(uint32_t index) const {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%06u.pcm", index);
    return dir_ / name;
}

RunStatus CheckpointStore::create(CheckpointState initial, CreateMode mode) {
    std::error_code ec;
    if (exists()) {
        if (mode == CreateMode::FailIfExists) {
            return make_error(ErrorKind::Io, "checkpoint directory already exists: " +
                                                 dir_.string() +
                                                 " (resume it or remove it first)");
        }
        std::filesystem::remove_all(dir_, ec);
        if (ec) {
            return make_error(ErrorKind::Io, "failed to clear checkpoint directory " +
                                                 dir_.string() + ": " + ec.message());
        }
    }
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        return make_error(ErrorKind::Io, "failed to create checkpoint directory " +
                                             dir_.string() + ": " + ec.message());
    }
    state_ = std::move(initial);
    for (auto it = state_.completed_chunks.begin(); it != state_.completed_chunks.end();) {
        it = (*it >= state_.total_chunks) ? state_.completed_chunks.erase(it) : std::next(it);
    }
    active_ = true;
    NF_LOG("checkpoint", "created " << dir_.string() << " total_chunks=" << state_.total_chunks);
    return save_state();
}

std::optional<CheckpointState> CheckpointStore::read_state() const {
    std::ifstream f(state_path());
    if (!f.is_open()) {
        return std::nullopt;
    }
    try {
        json j;
        f >> j;
        CheckpointState s;
        s.source_hash = j.at("source_hash").get<std::string>();
        s.config = config_from_json(j.at("config"));
        s.total_chunks = j.at("total_chunks").get<uint32_t>();
        for (const auto &idx : j.at("completed_chunks")) {
            s.completed_chunks.insert(idx.get<uint32_t>());
        }
        for (const auto &entry : j.at("chapter_start_indices")) {
            ChapterStart cs;
            cs.chunk_index = entry.at(0).get<uint32_t>();
            cs.title = entry.at(1).get<std::string>();
            s.chapter_starts.push_back(std::move(cs));
        }
        return s;
    } catch (const json::exception &e) {
        NF_LOG("warn", "unreadable checkpoint state " << state_path().string() << ": "
                                                      << e.what());
        return std::nullopt;
    }
}

RunStatus CheckpointStore::save_state() const {
    json chapters = json::array();
    for (const auto &cs : state_.chapter_starts) {
        chapters.push_back(json::array({cs.chunk_index, cs.title}));
    }
    json j;
    j["source_hash"] = state_.source_hash;
    j["config"] = config_to_json(state_.config);
    j["total_chunks"] = state_.total_chunks;
    j["completed_chunks"] = state_.completed_chunks;
    j["chapter_start_indices"] = chapters;
    if (!write_atomically(state_path(), j.dump(2))) {
        return make_error(ErrorKind::Io, "failed to write checkpoint state " +
                                             state_path().string());
    }
    return ok_status();
}

CheckpointValidation CheckpointStore::load(const std::string &source_hash,
                                           const CheckpointConfig &config,
                                           uint32_t total_chunks) {
    active_ = false;
    auto persisted = read_state();
    if (!persisted) {
        return CheckpointValidation::Absent;
    }
    if (persisted->source_hash != source_hash) {
        NF_LOG("checkpoint", "source hash differs: " << persisted->source_hash << " vs "
                                                     << source_hash);
        return CheckpointValidation::HashMismatch;
    }
    if (persisted->config != config) {
        NF_LOG("checkpoint", "config differs in '"
                                 << first_config_difference(persisted->config, config) << "'");
        return CheckpointValidation::ConfigMismatch;
    }
    if (persisted->total_chunks != total_chunks) {
        NF_LOG("checkpoint", "chunk count differs: " << persisted->total_chunks << " vs "
                                                     << total_chunks);
        return CheckpointValidation::ChunkCountMismatch;
    }
    state_ = std::move(*persisted);
    for (auto it = state_.completed_chunks.begin(); it != state_.completed_chunks.end();) {
        it = (*it >= state_.total_chunks) ? state_.completed_chunks.erase(it) : std::next(it);
    }
    active_ = true;
    return CheckpointValidation::Valid;
}

ProbeResult CheckpointStore::probe(const std::string &source_hash) const {
    ProbeResult res;
    auto persisted = read_state();
    if (!persisted) {
        return res;
    }
    if (persisted->source_hash != source_hash) {
        res.outcome = ProbeOutcome::HashMismatch;
        return res;
    }
    res.outcome = ProbeOutcome::Found;
    res.total_chunks = persisted->total_chunks;
    res.completed = static_cast<uint32_t>(persisted->completed_chunks.size());
    return res;
}

RunStatus CheckpointStore::record_chunk(uint32_t index, const std::vector<int16_t> &samples) {
    if (!active_) {
        return make_error(ErrorKind::Io, "checkpoint store is not initialized");
    }
    if (index >= state_.total_chunks) {
        return make_error(ErrorKind::Io, "chunk index " + std::to_string(index) +
                                             " outside checkpoint range");
    }
    std::string bytes;
    bytes.reserve(kChunkHeaderSize + samples.size() * 2);
    bytes.append(kChunkMagic.data(), kChunkMagic.size());
    put_u32le(bytes, kChunkVersion);
    put_u64le(bytes, samples.size());
    for (int16_t s : samples) {
        const auto u = static_cast<uint16_t>(s);
        bytes.push_back(static_cast<char>(u & 0xFF));
        bytes.push_back(static_cast<char>(u >> 8));
    }
    // Audio first, state second.
    if (!write_atomically(chunk_path(index), bytes)) {
        return make_error(ErrorKind::Io, "failed to write chunk audio " +
                                             chunk_path(index).string());
    }
    state_.completed_chunks.insert(index);
    return save_state();
}

std::optional<std::vector<int16_t>> CheckpointStore::chunk_audio(uint32_t index) const {
    std::ifstream f(chunk_path(index), std::ios::binary);
    if (!f.is_open()) {
        return std::nullopt;
    }
    std::array<unsigned char, kChunkHeaderSize> header{};
    f.read(reinterpret_cast<char *>(header.data()), static_cast<std::streamsize>(header.size()));
    if (f.gcount() != static_cast<std::streamsize>(header.size()) ||
        !std::equal(kChunkMagic.begin(), kChunkMagic.end(), header.begin()) ||
        get_le(header.data() + 4, 4) != kChunkVersion) {
        NF_LOG("checkpoint", "malformed chunk header in " << chunk_path(index).string());
        return std::nullopt;
    }
    const uint64_t count = get_le(header.data() + 8, 8);
    std::error_code ec;
    const auto file_size = std::filesystem::file_size(chunk_path(index), ec);
    // The payload must hold exactly `count` samples; count is never multiplied.
    if (ec || file_size < kChunkHeaderSize || (file_size - kChunkHeaderSize) % 2 != 0 ||
        count != (file_size - kChunkHeaderSize) / 2) {
        NF_LOG("checkpoint", "truncated chunk record " << chunk_path(index).string());
        return std::nullopt;
    }
    std::vector<unsigned char> raw(static_cast<size_t>(count * 2));
    f.read(reinterpret_cast<char *>(raw.data()), static_cast<std::streamsize>(raw.size()));
    if (f.gcount() != static_cast<std::streamsize>(raw.size())) {
        return std::nullopt;
    }
    std::vector<int16_t> samples(static_cast<size_t>(count));
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<int16_t>(static_cast<uint16_t>(raw[2 * i]) |
                                          (static_cast<uint16_t>(raw[2 * i + 1]) << 8));
    }
    return samples;
}

RunStatus CheckpointStore::forget_chunk(uint32_t index) {
    if (!active_) {
        return make_error(ErrorKind::Io, "checkpoint store is not initialized");
    }
    if (state_.completed_chunks.erase(index) == 0) {
        return ok_status();
    }
    std::error_code ec;
    std::filesystem::remove(chunk_path(index), ec);
    return save_state();
}

RunStatus CheckpointStore::cleanup() {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
    active_ = false;
    if (ec) {
        return make_error(ErrorKind::Io, "failed to remove checkpoint directory " +
                                             dir_.string() + ": " + ec.message());
    }
    NF_LOG("checkpoint", "removed " << dir_.string());
    return ok_status();
}

}  // namespace narrateforge
