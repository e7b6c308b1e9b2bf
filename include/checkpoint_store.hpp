//
//  checkpoint_store.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "run_status.hpp"

namespace narrateforge {

/// Settings that change the generated waveform or the exported file. A resume is only allowed
/// when every field matches the persisted copy.
struct CheckpointConfig {
    std::string voice;
    double speed = 1.0;
    std::string lang;
    std::string backend;  ///< resolved backend name, never "auto"
    int64_t chunk_chars = 0;
    std::string split_pattern;
    std::string format;
    std::string bitrate;
    bool normalize = false;

    bool operator==(const CheckpointConfig &) const = default;
};

struct ChapterStart {
    uint32_t chunk_index = 0;
    std::string title;

    bool operator==(const ChapterStart &) const = default;
};

struct CheckpointState {
    std::string source_hash;
    CheckpointConfig config;
    uint32_t total_chunks = 0;
    std::set<uint32_t> completed_chunks;
    std::vector<ChapterStart> chapter_starts;
};

enum class CheckpointValidation { Absent, Valid, HashMismatch, ConfigMismatch, ChunkCountMismatch };

enum class ProbeOutcome { None, Found, HashMismatch };

struct ProbeResult {
    ProbeOutcome outcome = ProbeOutcome::None;
    uint32_t total_chunks = 0;
    uint32_t completed = 0;
};

enum class CreateMode { FailIfExists, ReplaceExisting };

// Wire detail for INVALID checkpoint events ("hash_mismatch", "config_mismatch", ...).
const char *validation_detail(CheckpointValidation v);

// Name of the first differing config field, empty when equal.
std::string first_config_difference(const CheckpointConfig &a, const CheckpointConfig &b);

/**
 * @brief Per-output persistence of synthesized chunk audio and run metadata.
 *
 * Layout: `<output>.checkpoint/state.json` plus `chunk_<000000>.pcm` per completed chunk.
 * Chunk files are written before the state that references them, both via temp file and
 * rename, so the state never claims audio that is not on disk.
 * Not safe for concurrent use by more than one run.
 */
class CheckpointStore {
public:
    explicit CheckpointStore(std::filesystem::path dir);

    static std::filesystem::path dir_for_output(const std::string &output_path);

    const std::filesystem::path &dir() const { return dir_; }
    bool exists() const;

    /// Start fresh on-disk state. FailIfExists refuses to touch an existing directory.
    RunStatus create(CheckpointState initial, CreateMode mode);

    /// Read persisted state and compare hash, every config field and the chunk count. Only a
    /// Valid result makes the store usable for record_chunk() and chunk reuse.
    CheckpointValidation load(const std::string &source_hash, const CheckpointConfig &config,
                              uint32_t total_chunks);

    /// Cheap pre-run check: existence and source hash only (no config comparison).
    ProbeResult probe(const std::string &source_hash) const;

    RunStatus record_chunk(uint32_t index, const std::vector<int16_t> &samples);

    /// nullopt when the record is missing, truncated or malformed.
    std::optional<std::vector<int16_t>> chunk_audio(uint32_t index) const;

    /// Drop an index from the completed set (missing audio) and persist.
    RunStatus forget_chunk(uint32_t index);

    RunStatus cleanup();

    const CheckpointState &state() const { return state_; }
    std::filesystem::path chunk_path(uint32_t index) const;
    std::filesystem::path state_path() const;

private:
    RunStatus save_state() const;
    std::optional<CheckpointState> read_state() const;

    std::filesystem::path dir_;
    CheckpointState state_;
    bool active_ = false;
};

}  // namespace narrateforge
