//
//  synthesis_backend.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "run_status.hpp"

namespace narrateforge {

inline constexpr uint32_t kDefaultSampleRate = 24000;

/// Closed set of synthesis variants. Mlx is the fastest accelerated engine, Torch the baseline
/// accelerated engine, Mock the deterministic test backend.
enum class BackendKind { Mlx, Torch, Mock };

const char *backend_name(BackendKind kind);
std::optional<BackendKind> parse_backend_kind(std::string_view name);

// Preferred chunk size per backend (mlx 900, pytorch 600).
int64_t default_chunk_chars(BackendKind kind);

struct VoiceSettings {
    std::string voice = "af_heart";
    double speed = 1.0;
    std::string split_pattern = "\\n+";
};

/// Raw backend output for one chunk: mono float samples, nominally in [-1, 1].
struct RawAudio {
    std::vector<float> samples;
    uint32_t sample_rate = 0;
};

/**
 * @brief Text chunk in, PCM audio out.
 *
 * Instances are owned by the job and handed to the coordinator; only one thread calls
 * generate() at a time.
 */
class SynthesisBackend {
public:
    virtual ~SynthesisBackend() = default;

    virtual BackendKind kind() const = 0;
    std::string name() const { return backend_name(kind()); }

    virtual RunStatus initialize(const std::string &lang_code) = 0;
    virtual RunStatus generate(const std::string &text, const VoiceSettings &voice,
                               RawAudio &out) = 0;
    virtual uint32_t sample_rate() const = 0;
    virtual void cleanup() {}
};

struct MockBackendOptions {
    uint32_t sample_rate = kDefaultSampleRate;
    uint32_t samples_per_char = 240;  // 10 ms of audio per character at 24 kHz
    uint32_t fail_on_call = 0;        // 1-based generate() call that fails; 0 never fails
    std::chrono::milliseconds delay{0};
};

struct BackendOptions {
    std::filesystem::path engine_dir;  // where libnarrateforge_engine_<variant> lives
    std::filesystem::path model_dir;   // forwarded to engines, may be empty
    MockBackendOptions mock;
};

std::unique_ptr<SynthesisBackend> make_backend(BackendKind kind, const BackendOptions &options);

std::filesystem::path engine_library_path(BackendKind kind,
                                          const std::filesystem::path &engine_dir);

/// Loads `library` in a child process and runs its probe; false on failure, crash or timeout.
bool probe_engine_in_child(const std::filesystem::path &library,
                           std::chrono::milliseconds timeout = std::chrono::seconds(8));

using EngineProbe = std::function<bool(const std::filesystem::path &)>;

/**
 * @brief Map a requested backend name to a concrete variant.
 *
 * "auto" picks Mlx when its engine library probes successfully, Torch otherwise. Explicit
 * names map directly; unknown names give nullopt.
 */
std::optional<BackendKind> resolve_backend(std::string_view requested,
                                           const BackendOptions &options,
                                           const EngineProbe &probe = {});

}  // namespace narrateforge
