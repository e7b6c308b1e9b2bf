//
//  plugin_backend.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <filesystem>
#include <string>

#include "engine_plugin.h"
#include "synthesis_backend.hpp"

namespace narrateforge {

// Accelerated backend backed by an engine plugin (see engine_plugin.h) loaded with dlopen.
class PluginBackend : public SynthesisBackend {
public:
    PluginBackend(BackendKind kind, std::filesystem::path library, std::filesystem::path model_dir);
    ~PluginBackend() override;

    PluginBackend(const PluginBackend &) = delete;
    PluginBackend &operator=(const PluginBackend &) = delete;

    BackendKind kind() const override { return kind_; }
    RunStatus initialize(const std::string &lang_code) override;
    RunStatus generate(const std::string &text, const VoiceSettings &voice,
                       RawAudio &out) override;
    uint32_t sample_rate() const override { return sample_rate_; }
    void cleanup() override;

private:
    RunStatus fail(const std::string &what);

    BackendKind kind_;
    std::filesystem::path library_;
    std::filesystem::path model_dir_;
    void *handle_ = nullptr;
    nf_engine *engine_ = nullptr;
    uint32_t sample_rate_ = kDefaultSampleRate;

    nf_engine_create_fn create_ = nullptr;
    nf_engine_sample_rate_fn sample_rate_fn_ = nullptr;
    nf_engine_synthesize_fn synthesize_ = nullptr;
    nf_engine_last_error_fn last_error_ = nullptr;
    nf_engine_free_fn free_ = nullptr;
};

}  // namespace narrateforge
