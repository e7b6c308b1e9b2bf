// Coordinator behavior: sequential vs overlap3 output equality, failure propagation, mode
// fallback and checkpoint reuse / missing-audio regeneration.
#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "audio_assembler.hpp"
#include "checkpoint_store.hpp"
#include "event_emitter.hpp"
#include "logging.hpp"
#include "mock_backend.hpp"
#include "pcm_sink.hpp"
#include "synthesis_coordinator.hpp"
#include "test_utils.hpp"

namespace {

using narrateforge::AudioAssembler;
using narrateforge::CoordinatorOptions;
using narrateforge::EventEmitter;
using narrateforge::EventFormat;
using narrateforge::MemorySink;
using narrateforge::MockBackend;
using narrateforge::MockBackendOptions;
using narrateforge::PipelineMode;
using narrateforge::SynthesisCoordinator;

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[coordinator_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::vector<TextChunk> make_chunks(size_t n) {
    std::vector<TextChunk> chunks;
    for (size_t i = 0; i < n; ++i) {
        TextChunk c;
        c.index = static_cast<uint32_t>(i);
        c.text = "Sentence number " + std::to_string(i) + " of the test book.";
        c.chapter_index = i < n / 2 ? 0 : 1;
        chunks.push_back(std::move(c));
    }
    return chunks;
}

std::vector<ChapterBoundary> boundaries_for(size_t n) {
    return {{0, 0, "First"}, {1, static_cast<uint32_t>(n / 2), "Second"}};
}

CoordinatorOptions options_for(PipelineMode mode, bool streaming) {
    CoordinatorOptions o;
    o.mode = mode;
    o.streaming_output = streaming;
    o.heartbeat_interval = std::chrono::milliseconds(60000);
    return o;
}

struct RunResult {
    narrateforge::RunStatus status;
    std::vector<int16_t> samples;
    std::vector<std::string> out_lines;
    std::vector<std::string> err_lines;
    narrateforge::SynthesisStats stats;
};

RunResult run_once(narrateforge::SynthesisBackend &backend, const CoordinatorOptions &options,
                   size_t n, narrateforge::CheckpointStore *store = nullptr) {
    std::ostringstream out;
    std::ostringstream err;
    EventEmitter events(EventFormat::Text, "job", out, err);
    MemorySink sink;
    AudioAssembler assembler(boundaries_for(n), static_cast<uint32_t>(n), sink);
    SynthesisCoordinator coordinator(backend, events, options, store);
    RunResult r;
    r.status = coordinator.run(make_chunks(n), assembler);
    r.stats = coordinator.stats();
    r.samples = sink.take_samples();
    events.close();
    r.out_lines = test_utils::lines_of(out.str());
    r.err_lines = test_utils::lines_of(err.str());
    return r;
}

// Backend whose reported rate changes after the first chunk.
class RateShiftBackend : public narrateforge::SynthesisBackend {
public:
    narrateforge::BackendKind kind() const override { return narrateforge::BackendKind::Mock; }
    narrateforge::RunStatus initialize(const std::string &) override {
        return narrateforge::ok_status();
    }
    narrateforge::RunStatus generate(const std::string &, const narrateforge::VoiceSettings &,
                                     narrateforge::RawAudio &out) override {
        out.samples.assign(10, 0.1f);
        out.sample_rate = calls_++ == 0 ? 24000 : 22050;
        return narrateforge::ok_status();
    }
    uint32_t sample_rate() const override { return 24000; }

private:
    int calls_ = 0;
};

bool test_modes_agree() {
    MockBackend seq_backend;
    seq_backend.initialize("a");
    auto seq = run_once(seq_backend, options_for(PipelineMode::Sequential, true), 12);

    MockBackendOptions slow;
    slow.delay = std::chrono::milliseconds(2);
    MockBackend ovl_backend(slow);
    ovl_backend.initialize("a");
    auto ovl_opts = options_for(PipelineMode::Overlap3, true);
    ovl_opts.prefetch_chunks = 1;
    ovl_opts.pcm_queue_size = 2;
    auto ovl = run_once(ovl_backend, ovl_opts, 12);

    bool ok = check(seq.status.ok && ovl.status.ok, "both modes succeed");
    ok &= check(!seq.samples.empty() && seq.samples == ovl.samples,
                "overlap3 output identical to sequential");
    ok &= check(seq.stats.mode == PipelineMode::Sequential &&
                    ovl.stats.mode == PipelineMode::Overlap3,
                "modes recorded");
    ok &= check(seq.stats.synthesized == 12 && ovl.stats.synthesized == 12, "all synthesized");
    ok &= check(seq.stats.chunk_ms.size() == 12, "one timing per chunk");

    ok &= check(test_utils::count_prefix(seq.out_lines, "WORKER:0:INFER:") == 12,
                "sequential infer events on worker 0");
    ok &= check(test_utils::count_prefix(seq.out_lines, "WORKER:1:") == 0,
                "sequential uses a single worker");
    ok &= check(test_utils::count_prefix(ovl.out_lines, "WORKER:0:INFER:") == 12 &&
                    test_utils::count_prefix(ovl.out_lines, "WORKER:1:CONVERT:") == 12 &&
                    test_utils::count_prefix(ovl.out_lines, "WORKER:2:ENCODE:") == 12,
                "overlap3 worker ids");
    ok &= check(test_utils::contains_line(seq.out_lines, "PROGRESS:12/12 chunks") &&
                    test_utils::contains_line(ovl.out_lines, "PROGRESS:12/12 chunks"),
                "final progress");
    ok &= check(test_utils::count_prefix(ovl.out_lines, "TIMING:") == 12, "overlap3 timings");

    // Progress is monotonic in both modes.
    for (const auto *lines : {&seq.out_lines, &ovl.out_lines}) {
        uint32_t last = 0;
        bool monotonic = true;
        for (const auto &l : *lines) {
            if (l.rfind("PROGRESS:", 0) == 0) {
                const auto current = static_cast<uint32_t>(std::stoul(l.substr(9)));
                monotonic &= current == last + 1;
                last = current;
            }
        }
        ok &= check(monotonic, "progress advances by one");
    }
    return ok;
}

bool test_failures() {
    MockBackendOptions failing;
    failing.fail_on_call = 4;
    MockBackend seq_backend(failing);
    seq_backend.initialize("a");
    auto seq = run_once(seq_backend, options_for(PipelineMode::Sequential, true), 10);
    bool ok = check(!seq.status.ok && seq.status.kind == narrateforge::ErrorKind::Backend,
                    "sequential backend failure");
    ok &= check(seq.status.message.find("call 4") != std::string::npos, "backend message kept");
    ok &= check(seq.stats.synthesized == 3, "chunks before the failure completed");
    ok &= check(seq_backend.calls() == 4, "no calls after the failure");

    MockBackend ovl_backend(failing);
    ovl_backend.initialize("a");
    auto ovl = run_once(ovl_backend, options_for(PipelineMode::Overlap3, true), 10);
    ok &= check(!ovl.status.ok && ovl.status.kind == narrateforge::ErrorKind::Backend,
                "overlap3 backend failure");
    ok &= check(ovl.stats.synthesized <= 3, "no chunk past the failure reaches the sink");
    ok &= check(ovl_backend.calls() == 4, "inference stops at the failure");

    MockBackend uninitialized;
    auto cold = run_once(uninitialized, options_for(PipelineMode::Sequential, true), 2);
    ok &= check(!cold.status.ok && cold.status.message.find("initialize") != std::string::npos,
                "uninitialized backend refuses");

    RateShiftBackend shifting;
    auto shifted = run_once(shifting, options_for(PipelineMode::Sequential, true), 3);
    ok &= check(!shifted.status.ok && shifted.status.message.find("22050") != std::string::npos,
                "sample rate change rejected");

    // Stream opened at 22050 Hz while the backend delivers 24 kHz.
    for (auto mode : {PipelineMode::Sequential, PipelineMode::Overlap3}) {
        MockBackend backend;
        backend.initialize("a");
        auto opts = options_for(mode, true);
        opts.output_sample_rate = 22050;
        auto r = run_once(backend, opts, 3);
        ok &= check(!r.status.ok && r.status.kind == narrateforge::ErrorKind::Backend &&
                        r.status.message.find("24000 Hz, expected 22050 Hz") != std::string::npos,
                    std::string("rate differing from the open stream rejected in ") +
                        narrateforge::pipeline_mode_name(mode));
        ok &= check(r.samples.empty(), "no audio reaches a mismatched stream");
    }
    return ok;
}

bool test_mode_fallback() {
    MockBackend backend;
    backend.initialize("a");
    auto r = run_once(backend, options_for(PipelineMode::Overlap3, false), 4);
    bool ok = check(r.status.ok, "fallback run succeeds");
    ok &= check(r.stats.mode == PipelineMode::Sequential, "spooled output runs sequentially");
    ok &= check(test_utils::contains_line(
                    r.err_lines, std::string("WARN: ") + narrateforge::kOverlapFallbackWarning),
                "fallback warning emitted");

    auto sel = narrateforge::select_pipeline_mode(PipelineMode::Overlap3, true, true);
    ok &= check(sel.fell_back && sel.mode == PipelineMode::Sequential,
                "checkpointing forces sequential");
    sel = narrateforge::select_pipeline_mode(PipelineMode::Overlap3, true, false);
    ok &= check(!sel.fell_back && sel.mode == PipelineMode::Overlap3, "overlap3 allowed");
    sel = narrateforge::select_pipeline_mode(PipelineMode::Sequential, false, true);
    ok &= check(!sel.fell_back, "sequential never falls back");
    ok &= check(narrateforge::default_pipeline_mode(narrateforge::ExportFormat::M4b, false) ==
                    PipelineMode::Sequential,
                "m4b defaults to sequential");
    ok &= check(narrateforge::parse_pipeline_mode("overlap3") == PipelineMode::Overlap3 &&
                    !narrateforge::parse_pipeline_mode("parallel"),
                "mode parsing");

    narrateforge::SynthesisStats stats;
    ok &= check(stats.average_chunk_seconds() == 0.0, "empty average");
    stats.chunk_ms = {1000, 3000};
    ok &= check(stats.average_chunk_seconds() == 2.0, "average chunk seconds");
    return ok;
}

narrateforge::CheckpointState fresh_state(uint32_t total) {
    narrateforge::CheckpointState s;
    s.source_hash = "abc";
    s.config.voice = "af_heart";
    s.config.backend = "mock";
    s.total_chunks = total;
    return s;
}

bool test_checkpoint_reuse(const test_utils::TempDir &tmp) {
    const auto dir = narrateforge::CheckpointStore::dir_for_output(tmp.file("c.mp3"));
    const uint32_t n = 8;

    // First run fails on the sixth chunk after saving five.
    narrateforge::CheckpointStore first_store(dir);
    first_store.create(fresh_state(n), narrateforge::CreateMode::FailIfExists);
    MockBackendOptions failing;
    failing.fail_on_call = 6;
    MockBackend failing_backend(failing);
    failing_backend.initialize("a");
    auto failed = run_once(failing_backend, options_for(PipelineMode::Sequential, false), n,
                           &first_store);
    bool ok = check(!failed.status.ok, "first run fails");
    ok &= check(test_utils::count_prefix(failed.out_lines, "CHECKPOINT:SAVED:") == 5,
                "five chunks saved before failure");

    // Reference output from an uninterrupted run.
    MockBackend clean_backend;
    clean_backend.initialize("a");
    auto clean = run_once(clean_backend, options_for(PipelineMode::Sequential, false), n);

    narrateforge::CheckpointStore resume_store(dir);
    ok &= check(resume_store.load("abc", fresh_state(n).config, n) ==
                    narrateforge::CheckpointValidation::Valid,
                "checkpoint survives failure");
    std::filesystem::remove(resume_store.chunk_path(2));
    // Chunk 3 keeps only a header claiming 2^63 samples.
    test_utils::write_text(
        resume_store.chunk_path(3),
        std::string("NFPC\x01\x00\x00\x00\x00\x00\x00\x00\x00\x00\x00\x80", 16));

    // Overlap3 is requested but the checkpoint forces sequential.
    MockBackend resume_backend;
    resume_backend.initialize("a");
    auto resumed = run_once(resume_backend, options_for(PipelineMode::Overlap3, true), n,
                            &resume_store);
    ok &= check(resumed.status.ok, "resumed run succeeds");
    ok &= check(resumed.stats.mode == PipelineMode::Sequential, "checkpoint run is sequential");
    ok &= check(resumed.samples == clean.samples, "resumed audio identical to a clean run");
    ok &= check(resumed.stats.reused == 3 && resumed.stats.regenerated == 2 &&
                    resumed.stats.synthesized == 5,
                "reuse accounting");
    ok &= check(resume_backend.calls() == 5, "only missing chunks synthesized");
    ok &= check(test_utils::contains_line(resumed.out_lines, "CHECKPOINT:MISSING_AUDIO:2") &&
                    test_utils::contains_line(resumed.out_lines, "CHECKPOINT:SAVED:2"),
                "missing audio regenerated and saved");
    ok &= check(test_utils::contains_line(resumed.out_lines, "CHECKPOINT:MISSING_AUDIO:3") &&
                    test_utils::contains_line(resumed.out_lines, "CHECKPOINT:SAVED:3"),
                "corrupt chunk header regenerated");
    ok &= check(test_utils::contains_line(resumed.out_lines, "CHECKPOINT:REUSED:0") &&
                    !test_utils::contains_line(resumed.out_lines, "CHECKPOINT:REUSED:2"),
                "reuse events");
    ok &= check(test_utils::contains_line(resumed.out_lines,
                                          "WORKER:0:ENCODE:Reused checkpoint chunk 1/8"),
                "reuse worker event");
    ok &= check(resume_store.state().completed_chunks.size() == n, "all chunks recorded");
    return ok;
}

}  // namespace

int main() {
    narrateforge::set_log_verbosity(narrateforge::LogVerbosity::Error);
    test_utils::TempDir tmp("coordinator");
    if (!check(tmp.ok(), "temp dir")) {
        return 1;
    }
    bool ok = true;
    ok &= test_modes_agree();
    ok &= test_failures();
    ok &= test_mode_fallback();
    ok &= test_checkpoint_reuse(tmp);
    return ok ? 0 : 1;
}
