// Backend variants: plugin loading through the test engine, isolated probing (ok, fail, crash,
// hang), auto resolution and the deterministic mock.
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "logging.hpp"
#include "mock_backend.hpp"
#include "pcm_sink.hpp"
#include "plugin_backend.hpp"
#include "synthesis_backend.hpp"
#include "test_utils.hpp"

namespace {

using narrateforge::BackendKind;
using narrateforge::BackendOptions;
using narrateforge::RawAudio;
using narrateforge::VoiceSettings;

int ok_probe_calls = 0;

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[backend_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_names() {
    bool ok = check(narrateforge::parse_backend_kind("pytorch") == BackendKind::Torch,
                    "pytorch name");
    ok &= check(!narrateforge::parse_backend_kind("auto"), "auto is not a concrete kind");
    ok &= check(std::string(narrateforge::backend_name(BackendKind::Mlx)) == "mlx", "mlx name");
    ok &= check(narrateforge::default_chunk_chars(BackendKind::Mlx) == 900 &&
                    narrateforge::default_chunk_chars(BackendKind::Torch) == 600,
                "default chunk sizes");
    const auto lib = narrateforge::engine_library_path(BackendKind::Torch, "/opt/engines");
    ok &= check(lib.parent_path() == "/opt/engines" &&
                    lib.filename().string().rfind("libnarrateforge_engine_pytorch", 0) == 0,
                "engine library naming");
    return ok;
}

bool test_plugin(const std::filesystem::path &engine) {
    narrateforge::PluginBackend backend(BackendKind::Torch, engine, {});
    RawAudio raw;
    bool ok = check(!backend.generate("hello", VoiceSettings{}, raw),
                    "generate before initialize fails");
    ok &= check(static_cast<bool>(backend.initialize("a")), "plugin initialize");
    ok &= check(static_cast<bool>(backend.generate("hello", VoiceSettings{}, raw)),
                "plugin generate");
    ok &= check(raw.samples.size() == 50 && raw.sample_rate == 24000, "plugin audio shape");
    ok &= check(backend.sample_rate() == 24000, "rate announced by the engine");
    const auto pcm = narrateforge::to_pcm16(raw.samples);
    bool clipped = false;
    for (auto s : pcm) {
        clipped |= s == -32767;
    }
    ok &= check(clipped, "overshooting engine output is clipped");

    auto st = backend.generate("please FAIL here", VoiceSettings{}, raw);
    ok &= check(!st && st.kind == narrateforge::ErrorKind::Backend &&
                    st.message.find("synthetic failure") != std::string::npos,
                "engine error text surfaced");

    backend.cleanup();
    ok &= check(!backend.generate("hello", VoiceSettings{}, raw), "generate after cleanup fails");

    narrateforge::PluginBackend missing(BackendKind::Mlx, "/nonexistent/libengine.so", {});
    st = missing.initialize("a");
    ok &= check(!st && st.message.rfind("Failed to initialize 'mlx' backend: ", 0) == 0,
                "missing library reported with backend name");
    return ok;
}

bool test_plugin_rate(const std::filesystem::path &engine) {
    setenv("NF_TEST_ENGINE_RATE", "22050", 1);
    narrateforge::PluginBackend backend(BackendKind::Torch, engine, {});
    bool ok = check(static_cast<bool>(backend.initialize("a")), "22050 Hz engine initializes");
    ok &= check(backend.sample_rate() == 22050, "rate known before the first chunk");
    RawAudio raw;
    ok &= check(backend.generate("hello", VoiceSettings{}, raw) && raw.sample_rate == 22050,
                "chunks arrive at the announced rate");
    backend.cleanup();

    setenv("NF_TEST_ENGINE_RATE", "0", 1);
    narrateforge::PluginBackend silent(BackendKind::Torch, engine, {});
    auto st = silent.initialize("a");
    ok &= check(!st && st.kind == narrateforge::ErrorKind::Backend &&
                    st.message.find("no sample rate") != std::string::npos,
                "engine without a rate rejected");
    unsetenv("NF_TEST_ENGINE_RATE");
    return ok;
}

bool test_probe(const std::filesystem::path &engine) {
    unsetenv("NF_TEST_ENGINE_PROBE");
    bool ok = check(narrateforge::probe_engine_in_child(engine), "probe ok");
    setenv("NF_TEST_ENGINE_PROBE", "fail", 1);
    ok &= check(!narrateforge::probe_engine_in_child(engine), "probe unavailable");
    setenv("NF_TEST_ENGINE_PROBE", "crash", 1);
    ok &= check(!narrateforge::probe_engine_in_child(engine), "crashing probe contained");
    setenv("NF_TEST_ENGINE_PROBE", "hang", 1);
    const auto start = std::chrono::steady_clock::now();
    ok &= check(!narrateforge::probe_engine_in_child(engine, std::chrono::milliseconds(300)),
                "hanging probe times out");
    ok &= check(std::chrono::steady_clock::now() - start < std::chrono::seconds(5),
                "timeout honored");
    unsetenv("NF_TEST_ENGINE_PROBE");
    ok &= check(!narrateforge::probe_engine_in_child("/nonexistent/libengine.so"),
                "missing library fails probe");
    return ok;
}

bool test_resolve(const std::filesystem::path &engine, const test_utils::TempDir &tmp) {
    BackendOptions options;
    options.engine_dir = tmp.path();

    ok_probe_calls = 0;
    auto kind = narrateforge::resolve_backend("auto", options, [](const std::filesystem::path &) {
        ++ok_probe_calls;
        return true;
    });
    bool ok = check(kind == BackendKind::Mlx && ok_probe_calls == 1, "auto prefers mlx");
    kind = narrateforge::resolve_backend("auto", options,
                                         [](const std::filesystem::path &) { return false; });
    ok &= check(kind == BackendKind::Torch, "auto falls back to pytorch");
    kind = narrateforge::resolve_backend("mock", options, [](const std::filesystem::path &) {
        ++ok_probe_calls;
        return true;
    });
    ok &= check(kind == BackendKind::Mock && ok_probe_calls == 1, "explicit name skips probe");
    ok &= check(!narrateforge::resolve_backend("onnx", options), "unknown name");

    // Real child probe against an engine dir without and with the mlx library.
    ok &= check(narrateforge::resolve_backend("auto", options) == BackendKind::Torch,
                "no mlx engine installed");
    std::error_code ec;
    std::filesystem::copy_file(engine,
                               narrateforge::engine_library_path(BackendKind::Mlx, tmp.path()), ec);
    ok &= check(!ec, "install test engine as mlx");
    ok &= check(narrateforge::resolve_backend("auto", options) == BackendKind::Mlx,
                "probed mlx engine selected");

    auto backend = narrateforge::make_backend(BackendKind::Mlx, options);
    ok &= check(backend && backend->name() == "mlx", "factory builds plugin backend");
    ok &= check(backend && static_cast<bool>(backend->initialize("a")),
                "factory backend loads engine from engine dir");
    return ok;
}

bool test_mock() {
    narrateforge::MockBackendOptions opts;
    opts.sample_rate = 16000;
    opts.samples_per_char = 4;
    opts.fail_on_call = 3;
    narrateforge::MockBackend a(opts);
    narrateforge::MockBackend b(opts);
    a.initialize("a");
    b.initialize("a");
    RawAudio ra;
    RawAudio rb;
    bool ok = check(a.generate("same text", VoiceSettings{}, ra) &&
                        b.generate("same text", VoiceSettings{}, rb),
                    "mock generate");
    ok &= check(ra.samples == rb.samples && ra.samples.size() == 36, "mock is deterministic");
    ok &= check(ra.sample_rate == 16000 && a.sample_rate() == 16000, "mock rate");
    a.generate("other text", VoiceSettings{}, rb);
    ok &= check(ra.samples != rb.samples, "different text differs");
    auto st = a.generate("third", VoiceSettings{}, ra);
    ok &= check(!st && st.kind == narrateforge::ErrorKind::Backend, "mock fails on chosen call");
    ok &= check(static_cast<bool>(a.generate("fourth", VoiceSettings{}, ra)),
                "mock recovers after the failing call");
    a.cleanup();
    ok &= check(!a.generate("x", VoiceSettings{}, ra), "mock refuses after cleanup");
    ok &= check(a.calls() == 5, "calls counted");

    auto factory = narrateforge::make_backend(BackendKind::Mock, BackendOptions{});
    ok &= check(factory && factory->kind() == BackendKind::Mock &&
                    factory->sample_rate() == narrateforge::kDefaultSampleRate,
                "factory builds mock");
    return ok;
}

}  // namespace

int main(int argc, char **argv) {
    narrateforge::set_log_verbosity(narrateforge::LogVerbosity::Error);
    if (argc < 2) {
        std::cerr << "usage: backend_unit <test engine library>\n";
        return 1;
    }
    const std::filesystem::path engine = argv[1];
    test_utils::TempDir tmp("backend");
    if (!check(tmp.ok(), "temp dir")) {
        return 1;
    }
    bool ok = true;
    ok &= test_names();
    ok &= test_plugin(engine);
    ok &= test_plugin_rate(engine);
    ok &= test_probe(engine);
    ok &= test_resolve(engine, tmp);
    ok &= test_mock();
    return ok ? 0 : 1;
}
