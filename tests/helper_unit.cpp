// Unit coverage for small helpers: log levels, image sniffing, UTF-8 counting, hashing, chapter
// timing and error names.
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "audio_assembler.hpp"
#include "chapter_timing.hpp"
#include "chunk_planner.hpp"
#include "image_info.hpp"
#include "logging.hpp"
#include "run_status.hpp"
#include "source_hash.hpp"
#include "test_utils.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[helper_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_log_levels() {
    using narrateforge::LogVerbosity;
    using narrateforge::parse_log_verbosity;
    bool ok = check(parse_log_verbosity("debug") == LogVerbosity::Debug, "debug level");
    ok &= check(parse_log_verbosity("warning") == LogVerbosity::Warn, "warning alias");
    ok &= check(parse_log_verbosity("bogus") == LogVerbosity::Error, "unknown maps to error");
    ok &= check(nf_severity_for_tag("checkpoint") == LogVerbosity::Debug,
                "custom tags are debug-level");
    return ok;
}

bool test_image_sniffing() {
    // JPEG with an SOF0 segment declaring 300x200.
    std::vector<uint8_t> jpeg = {0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x04, 0x00, 0x00, 0xFF, 0xC0,
                                 0x00, 0x11, 0x08, 0x00, 0xC8, 0x01, 0x2C, 0x03, 0x01, 0x22,
                                 0x00, 0x02, 0x11, 0x01, 0x03, 0x11, 0x01, 0xFF, 0xD9};
    auto info = sniff_image(jpeg);
    bool ok = check(info.has_value() && info->mime == "image/jpeg", "jpeg detected");
    ok &= check(info && info->width == 300 && info->height == 200, "jpeg dimensions");

    std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0, 0, 0, 13,
                                'I',  'H', 'D', 'R', 0,    0,    2,    0,    0, 0, 1, 0};
    info = sniff_image(png);
    ok &= check(info && info->mime == "image/png" && info->extension == ".png", "png detected");
    ok &= check(info && info->width == 512 && info->height == 256, "png dimensions");

    std::vector<uint8_t> gif = {'G', 'I', 'F', '8', '9', 'a', 0x10, 0x00, 0x20, 0x00};
    info = sniff_image(gif);
    ok &= check(info && info->mime == "image/gif" && info->width == 16 && info->height == 32,
                "gif detected");

    ok &= check(!sniff_image({'B', 'M', 0, 0}).has_value(), "bmp rejected");
    ok &= check(!sniff_image({}).has_value(), "empty rejected");
    return ok;
}

bool test_utf8_helpers() {
    using narrateforge::utf8_length;
    using narrateforge::utf8_prefix_bytes;
    const std::string s = "a\xC3\xA9\xE2\x82\xAC!";  // a é € !
    bool ok = check(utf8_length(s) == 4, "utf8_length counts code points");
    ok &= check(utf8_prefix_bytes(s, 2) == 3, "prefix of 2 code points spans 3 bytes");
    ok &= check(utf8_prefix_bytes(s, 3) == 6, "prefix stops after the euro sign");
    ok &= check(utf8_prefix_bytes(s, 10) == s.size(), "prefix clamps to size");
    return ok;
}

bool test_sha256() {
    bool ok = check(narrateforge::sha256_hex("abc") ==
                        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                    "sha256 of abc");
    test_utils::TempDir dir("helper");
    if (!check(dir.ok(), "temp dir")) {
        return false;
    }
    test_utils::write_text(dir.path() / "abc.txt", "abc");
    auto h = narrateforge::sha256_file(dir.file("abc.txt"));
    ok &= check(h && *h == narrateforge::sha256_hex("abc"), "file hash matches buffer hash");
    ok &= check(!narrateforge::sha256_file(dir.file("missing.txt")), "missing file has no hash");
    return ok;
}

bool test_chapter_marks() {
    std::vector<narrateforge::ChapterSpan> spans = {
        {"One", 0, 24000}, {"Two", 24000, 36000}, {"Three", 36000, 48012}};
    auto marks = chapter_marks_ms(spans, 24000);
    bool ok = check(marks.size() == 3, "three marks");
    ok &= check(marks[0].start_ms == 0 && marks[0].end_ms == 1000, "first mark 0..1000");
    ok &= check(marks[1].start_ms == 1000 && marks[1].end_ms == 1500, "second mark 1000..1500");
    ok &= check(marks[2].end_ms == 2000, "last mark truncates to 2000ms");
    ok &= check(samples_to_ms(12, 0) == 0, "zero rate is safe");
    return ok;
}

bool test_error_names() {
    using narrateforge::ErrorKind;
    bool ok = check(std::string(narrateforge::error_kind_name(ErrorKind::Backend)) == "backend",
                    "backend name");
    ok &= check(std::string(narrateforge::error_kind_name(ErrorKind::MissingAudio)) ==
                    "missing_audio",
                "missing audio name");
    auto st = narrateforge::make_error(ErrorKind::Export, "boom");
    ok &= check(!st && st.kind == ErrorKind::Export && st.message == "boom", "make_error");
    ok &= check(static_cast<bool>(narrateforge::ok_status()), "ok_status is truthy");
    return ok;
}

}  // namespace

int main() {
    narrateforge::set_log_verbosity(narrateforge::LogVerbosity::Error);
    bool ok = true;
    ok &= test_log_levels();
    ok &= test_image_sniffing();
    ok &= test_utf8_helpers();
    ok &= test_sha256();
    ok &= test_chapter_marks();
    ok &= test_error_names();
    return ok ? 0 : 1;
}
