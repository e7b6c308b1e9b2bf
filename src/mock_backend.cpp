//
//  mock_backend.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "mock_backend.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#include "logging.hpp"

namespace narrateforge {

namespace {

constexpr double kTwoPi = 6.283185307179586;
constexpr float kAmplitude = 0.4f;

uint32_t fnv1a(const std::string &text) {
    uint32_t h = 2166136261u;
    for (unsigned char c : text) {
        h ^= c;
        h *= 16777619u;
    }
    return h;
}

}  // namespace

MockBackend::MockBackend(MockBackendOptions options) : options_(options) {}

RunStatus MockBackend::initialize(const std::string &lang_code) {
    NF_LOG("backend", "mock backend initialized (lang=" << lang_code
                                                        << ", rate=" << options_.sample_rate
                                                        << ")");
    initialized_ = true;
    return ok_status();
}

RunStatus MockBackend::generate(const std::string &text, const VoiceSettings &voice,
                                RawAudio &out) {
    const uint32_t call = ++calls_;
    if (!initialized_) {
        return make_error(ErrorKind::Backend, "Backend not initialized. Call initialize() first.");
    }
    if (options_.delay.count() > 0) {
        std::this_thread::sleep_for(options_.delay);
    }
    if (options_.fail_on_call != 0 && call == options_.fail_on_call) {
        return make_error(ErrorKind::Backend,
                          "mock synthesis failure on call " + std::to_string(call));
    }
    const uint32_t h = fnv1a(text + '\x1f' + voice.voice);
    const double freq = 110.0 + static_cast<double>(h % 330u);
    const double phase = static_cast<double>((h >> 9) % 628u) / 100.0;
    const double per_char = options_.samples_per_char / std::max(voice.speed, 0.25);
    const auto count = static_cast<size_t>(static_cast<double>(text.size()) * per_char);

    out.sample_rate = options_.sample_rate;
    out.samples.resize(count);
    for (size_t i = 0; i < count; ++i) {
        const double t = static_cast<double>(i) / options_.sample_rate;
        out.samples[i] = kAmplitude * static_cast<float>(std::sin(kTwoPi * freq * t + phase));
    }
    return ok_status();
}

}  // namespace narrateforge
