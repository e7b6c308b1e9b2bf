//
//  mock_backend.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>

#include "synthesis_backend.hpp"

namespace narrateforge {

// Deterministic backend: a tone whose pitch and phase derive from the chunk text, with a length
// proportional to the text. Identical text always yields identical samples.
class MockBackend : public SynthesisBackend {
public:
    explicit MockBackend(MockBackendOptions options = {});

    BackendKind kind() const override { return BackendKind::Mock; }
    RunStatus initialize(const std::string &lang_code) override;
    RunStatus generate(const std::string &text, const VoiceSettings &voice,
                       RawAudio &out) override;
    uint32_t sample_rate() const override { return options_.sample_rate; }
    void cleanup() override { initialized_ = false; }

    uint32_t calls() const { return calls_.load(); }

private:
    MockBackendOptions options_;
    bool initialized_ = false;
    std::atomic<uint32_t> calls_{0};
};

}  // namespace narrateforge
