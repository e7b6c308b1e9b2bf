//
//  plugin_backend.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "plugin_backend.hpp"

#include <dlfcn.h>

#include <utility>

#include "logging.hpp"

namespace narrateforge {

namespace {

template <typename Fn>
bool resolve_symbol(void *handle, const char *name, Fn &out, std::string &error) {
    dlerror();  // clear stale state
    out = reinterpret_cast<Fn>(dlsym(handle, name));
    const char *err = dlerror();
    if (err != nullptr || out == nullptr) {
        error = std::string("missing symbol ") + name + (err ? std::string(": ") + err : "");
        return false;
    }
    return true;
}

}  // namespace

PluginBackend::PluginBackend(BackendKind kind, std::filesystem::path library,
                             std::filesystem::path model_dir)
    : kind_(kind), library_(std::move(library)), model_dir_(std::move(model_dir)) {}

PluginBackend::~PluginBackend() { cleanup(); }

RunStatus PluginBackend::fail(const std::string &what) {
    std::string msg = "Failed to initialize '" + name() + "' backend: " + what;
    NF_LOG("error", msg);
    cleanup();
    return make_error(ErrorKind::Backend, msg);
}

RunStatus PluginBackend::initialize(const std::string &lang_code) {
    cleanup();
    handle_ = dlopen(library_.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle_ == nullptr) {
        const char *err = dlerror();
        return fail("cannot load " + library_.string() + (err ? std::string(": ") + err : ""));
    }
    std::string error;
    nf_engine_abi_version_fn abi_version = nullptr;
    if (!resolve_symbol(handle_, "nf_engine_abi_version", abi_version, error) ||
        !resolve_symbol(handle_, "nf_engine_create", create_, error) ||
        !resolve_symbol(handle_, "nf_engine_sample_rate", sample_rate_fn_, error) ||
        !resolve_symbol(handle_, "nf_engine_synthesize", synthesize_, error) ||
        !resolve_symbol(handle_, "nf_engine_last_error", last_error_, error) ||
        !resolve_symbol(handle_, "nf_engine_free", free_, error)) {
        return fail(error);
    }
    const int abi = abi_version();
    if (abi != NF_ENGINE_ABI_VERSION) {
        return fail("engine ABI " + std::to_string(abi) + " does not match " +
                    std::to_string(NF_ENGINE_ABI_VERSION));
    }
    const std::string model_dir = model_dir_.string();
    engine_ = create_(model_dir.empty() ? nullptr : model_dir.c_str(), lang_code.c_str());
    if (engine_ == nullptr) {
        return fail("engine creation failed for " + library_.string());
    }
    // The encoder may be started before the first chunk, so the rate is fixed here.
    const uint32_t rate = sample_rate_fn_(engine_);
    if (rate == 0) {
        return fail("engine reports no sample rate");
    }
    sample_rate_ = rate;
    NF_LOG("backend", name() << " engine loaded from " << library_.string() << " at " << rate
                             << " Hz");
    return ok_status();
}

RunStatus PluginBackend::generate(const std::string &text, const VoiceSettings &voice,
                                  RawAudio &out) {
    if (engine_ == nullptr) {
        return make_error(ErrorKind::Backend, "Backend not initialized. Call initialize() first.");
    }
    nf_engine_voice params{};
    params.voice = voice.voice.c_str();
    params.speed = static_cast<float>(voice.speed);
    params.split_pattern = voice.split_pattern.c_str();
    nf_engine_audio audio{};
    const int rc = synthesize_(engine_, text.c_str(), &params, &audio);
    if (rc != NF_ENGINE_OK) {
        const char *detail = last_error_(engine_);
        return make_error(ErrorKind::Backend,
                          name() + " synthesis failed (" + std::to_string(rc) +
                              "): " + (detail ? detail : "unknown error"));
    }
    if (audio.num_samples > 0 && audio.samples == nullptr) {
        return make_error(ErrorKind::Backend, name() + " returned no sample buffer");
    }
    const uint32_t rate = audio.sample_rate != 0 ? audio.sample_rate : sample_rate_;
    if (rate != sample_rate_) {
        return make_error(ErrorKind::Backend, name() + " produced " + std::to_string(rate) +
                                                  " Hz audio but announced " +
                                                  std::to_string(sample_rate_) + " Hz");
    }
    out.samples.assign(audio.samples, audio.samples + audio.num_samples);
    out.sample_rate = rate;
    return ok_status();
}

void PluginBackend::cleanup() {
    if (engine_ != nullptr && free_ != nullptr) {
        free_(engine_);
    }
    engine_ = nullptr;
    sample_rate_ = kDefaultSampleRate;
    if (handle_ != nullptr) {
        dlclose(handle_);
        handle_ = nullptr;
    }
    create_ = nullptr;
    sample_rate_fn_ = nullptr;
    synthesize_ = nullptr;
    last_error_ = nullptr;
    free_ = nullptr;
}

}  // namespace narrateforge
