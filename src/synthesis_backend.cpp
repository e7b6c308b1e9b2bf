//
//  synthesis_backend.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "synthesis_backend.hpp"

#include <dlfcn.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <thread>

#include "engine_plugin.h"
#include "logging.hpp"
#include "mock_backend.hpp"
#include "plugin_backend.hpp"

namespace narrateforge {

namespace {

#if defined(__APPLE__)
constexpr const char *kLibrarySuffix = ".dylib";
#else
constexpr const char *kLibrarySuffix = ".so";
#endif

constexpr auto kProbePollInterval = std::chrono::milliseconds(20);

// Runs in the forked child; only async-signal-tolerant work plus the plugin probe.
[[noreturn]] void run_probe_child(const char *library) {
    void *handle = dlopen(library, RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr) {
        _exit(2);
    }
    auto probe = reinterpret_cast<nf_engine_probe_fn>(dlsym(handle, "nf_engine_probe"));
    if (probe == nullptr) {
        _exit(3);
    }
    _exit(probe() == NF_ENGINE_OK ? 0 : 1);
}

}  // namespace

const char *backend_name(BackendKind kind) {
    switch (kind) {
    case BackendKind::Mlx:
        return "mlx";
    case BackendKind::Torch:
        return "pytorch";
    case BackendKind::Mock:
        return "mock";
    }
    return "unknown";
}

std::optional<BackendKind> parse_backend_kind(std::string_view name) {
    if (name == "mlx") return BackendKind::Mlx;
    if (name == "pytorch") return BackendKind::Torch;
    if (name == "mock") return BackendKind::Mock;
    return std::nullopt;
}

int64_t default_chunk_chars(BackendKind kind) {
    switch (kind) {
    case BackendKind::Mlx:
        return 900;
    case BackendKind::Torch:
    case BackendKind::Mock:
        return 600;
    }
    return 600;
}

std::filesystem::path engine_library_path(BackendKind kind,
                                          const std::filesystem::path &engine_dir) {
    std::string file = std::string("libnarrateforge_engine_") + backend_name(kind) +
                       kLibrarySuffix;
    return engine_dir.empty() ? std::filesystem::path(file) : engine_dir / file;
}

std::unique_ptr<SynthesisBackend> make_backend(BackendKind kind, const BackendOptions &options) {
    switch (kind) {
    case BackendKind::Mlx:
    case BackendKind::Torch:
        return std::make_unique<PluginBackend>(kind, engine_library_path(kind, options.engine_dir),
                                               options.model_dir);
    case BackendKind::Mock:
        return std::make_unique<MockBackend>(options.mock);
    }
    return nullptr;
}

bool probe_engine_in_child(const std::filesystem::path &library,
                           std::chrono::milliseconds timeout) {
    std::error_code ec;
    if (!std::filesystem::exists(library, ec)) {
        NF_LOG("backend", "no engine library at " << library.string());
        return false;
    }
    const std::string lib = library.string();
    const pid_t pid = fork();
    if (pid < 0) {
        NF_LOG("warn", "fork failed for engine probe " << errno_text());
        return false;
    }
    if (pid == 0) {
        run_probe_child(lib.c_str());
    }
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    for (;;) {
        const pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            NF_LOG("warn", "waitpid failed for engine probe " << errno_text());
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            NF_LOG("warn", "engine probe timed out for " << lib);
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            return false;
        }
        std::this_thread::sleep_for(kProbePollInterval);
    }
    const bool ok = WIFEXITED(status) && WEXITSTATUS(status) == 0;
    NF_LOG("backend", "engine probe " << lib << (ok ? " succeeded" : " failed"));
    return ok;
}

std::optional<BackendKind> resolve_backend(std::string_view requested,
                                           const BackendOptions &options,
                                           const EngineProbe &probe) {
    if (requested != "auto") {
        return parse_backend_kind(requested);
    }
    const auto fastest = engine_library_path(BackendKind::Mlx, options.engine_dir);
    const bool usable = probe ? probe(fastest) : probe_engine_in_child(fastest);
    return usable ? BackendKind::Mlx : BackendKind::Torch;
}

}  // namespace narrateforge
