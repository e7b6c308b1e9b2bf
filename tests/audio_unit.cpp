// PCM conversion, sinks and the in-order assembler with chapter spans.
#include <filesystem>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "audio_assembler.hpp"
#include "chapter_timing.hpp"
#include "logging.hpp"
#include "pcm_sink.hpp"
#include "test_utils.hpp"

namespace {

using narrateforge::AudioAssembler;
using narrateforge::MemorySink;

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[audio_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

// Sink that refuses writes after a given number of calls.
class FailingSink : public narrateforge::PcmSink {
public:
    explicit FailingSink(size_t allowed) : allowed_(allowed) {}
    narrateforge::RunStatus write(const std::vector<int16_t> &) override {
        if (calls_++ >= allowed_) {
            return narrateforge::make_error(narrateforge::ErrorKind::Export, "sink closed");
        }
        return narrateforge::ok_status();
    }

private:
    size_t allowed_;
    size_t calls_ = 0;
};

bool test_conversion() {
    auto pcm = narrateforge::to_pcm16({0.0f, 0.5f, -0.5f, 1.0f, -1.0f, 1.7f, -3.0f});
    bool ok = check(pcm.size() == 7, "one sample per input");
    ok &= check(pcm[0] == 0, "silence");
    ok &= check(pcm[1] == 16383, "0.5 truncates toward zero");
    ok &= check(pcm[2] == -16383, "-0.5 truncates toward zero");
    ok &= check(pcm[3] == 32767 && pcm[4] == -32767, "full scale");
    ok &= check(pcm[5] == 32767 && pcm[6] == -32767, "out of range input is clipped");
    ok &= check(narrateforge::to_pcm16({}).empty(), "empty input");
    const float inf = std::numeric_limits<float>::infinity();
    pcm = narrateforge::to_pcm16({std::numeric_limits<float>::quiet_NaN(), inf, -inf});
    ok &= check(pcm.size() == 3 && pcm[0] == 0, "nan becomes silence");
    ok &= check(pcm.size() == 3 && pcm[1] == 32767 && pcm[2] == -32767, "infinity is clipped");

    auto joined = narrateforge::concatenate_pcm({{1, 2}, {}, {3}, {4, 5, 6}});
    ok &= check(joined == std::vector<int16_t>({1, 2, 3, 4, 5, 6}), "concatenate in order");
    ok &= check(joined.capacity() == 6, "single allocation sized to total");

    std::vector<char> bytes;
    narrateforge::pcm16_to_le_bytes({0x0102, -2}, bytes);
    ok &= check(bytes.size() == 4 && bytes[0] == 0x02 && bytes[1] == 0x01 &&
                    static_cast<unsigned char>(bytes[2]) == 0xFE &&
                    static_cast<unsigned char>(bytes[3]) == 0xFF,
                "little-endian byte image");
    return ok;
}

bool test_spool(const test_utils::TempDir &tmp) {
    narrateforge::SpoolFileSink sink(tmp.file("spool.pcm"));
    bool ok = check(!sink.write({1}), "write before open fails");
    ok &= check(static_cast<bool>(sink.open()), "open");
    ok &= check(static_cast<bool>(sink.write({1, 2, 3})), "write 1");
    ok &= check(static_cast<bool>(sink.write({})), "empty write");
    ok &= check(static_cast<bool>(sink.write({-1})), "write 2");
    ok &= check(static_cast<bool>(sink.close()), "close");
    ok &= check(sink.bytes_written() == 8, "bytes counted");
    auto data = test_utils::read_bytes(sink.path());
    ok &= check(data && data->size() == 8, "spool size");
    if (data && data->size() == 8) {
        ok &= check((*data)[0] == 1 && (*data)[1] == 0 && (*data)[4] == 3, "spool content");
        ok &= check(static_cast<unsigned char>((*data)[6]) == 0xFF &&
                        static_cast<unsigned char>((*data)[7]) == 0xFF,
                    "negative sample bytes");
    }
    ok &= check(static_cast<bool>(sink.close()), "double close is harmless");
    return ok;
}

bool test_assembler() {
    std::vector<ChapterBoundary> boundaries = {{0, 0, "Opening"}, {1, 2, ""}, {2, 3, "Last"}};
    MemorySink sink;
    AudioAssembler assembler(boundaries, 4, sink);

    bool ok = check(!assembler.append(1, {1, 1}), "out-of-order chunk rejected");
    ok &= check(assembler.next_chunk() == 0 && sink.parts() == 0, "rejected chunk not forwarded");
    ok &= check(static_cast<bool>(assembler.append(0, std::vector<int16_t>(100, 1))), "chunk 0");
    ok &= check(static_cast<bool>(assembler.append(1, std::vector<int16_t>(50, 2))), "chunk 1");
    ok &= check(!assembler.append(1, {9}), "duplicate chunk rejected");
    ok &= check(static_cast<bool>(assembler.append(2, {})), "empty chunk 2");
    ok &= check(static_cast<bool>(assembler.append(3, std::vector<int16_t>(30, 4))), "chunk 3");
    ok &= check(assembler.complete(), "complete");
    auto beyond = assembler.append(4, {1});
    ok &= check(!beyond && beyond.kind == narrateforge::ErrorKind::Export, "beyond total");

    ok &= check(assembler.total_samples() == 180, "total samples");
    ok &= check(assembler.chunk_offsets() == std::vector<uint64_t>({0, 100, 150, 150}),
                "chunk offsets");
    auto spans = assembler.chapter_spans();
    ok &= check(spans.size() == 3, "three spans");
    if (spans.size() == 3) {
        ok &= check(spans[0].title == "Opening" && spans[0].start_sample == 0 &&
                        spans[0].end_sample == 150,
                    "first span");
        ok &= check(spans[1].title == "Chapter 2", "untitled chapter named by position");
        ok &= check(spans[1].start_sample == 150 && spans[1].end_sample == 150,
                    "empty chapter has zero length");
        ok &= check(spans[2].start_sample == 150 && spans[2].end_sample == 180, "last span");

        auto marks = chapter_marks_ms(spans, 1000);
        ok &= check(marks.size() == 3 && marks[2].start_ms == 150 && marks[2].end_ms == 180,
                    "marks in ms");
    }
    auto samples = sink.take_samples();
    ok &= check(samples.size() == 180 && samples[0] == 1 && samples[100] == 2 &&
                    samples[179] == 4,
                "sink received chunks in order");
    return ok;
}

bool test_assembler_sink_failure() {
    FailingSink sink(1);
    AudioAssembler assembler({{0, 0, "Only"}}, 3, sink);
    bool ok = check(static_cast<bool>(assembler.append(0, {1})), "first write");
    auto st = assembler.append(1, {2});
    ok &= check(!st && st.message == "sink closed", "sink failure propagates");
    ok &= check(assembler.next_chunk() == 1 && assembler.total_samples() == 1,
                "cursor unchanged after failed write");
    return ok;
}

}  // namespace

int main() {
    narrateforge::set_log_verbosity(narrateforge::LogVerbosity::Error);
    test_utils::TempDir tmp("audio");
    if (!check(tmp.ok(), "temp dir")) {
        return 1;
    }
    bool ok = true;
    ok &= test_conversion();
    ok &= test_spool(tmp);
    ok &= test_assembler();
    ok &= test_assembler_sink_failure();
    return ok ? 0 : 1;
}
