//
//  exporter.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "book_metadata.hpp"
#include "chapter_timing.hpp"
#include "encoder_process.hpp"
#include "pcm_sink.hpp"
#include "run_status.hpp"

namespace narrateforge {

/// Output container. Mp3 can be streamed; M4b carries chapters and needs the whole file.
enum class ExportFormat { Mp3, M4b };

const char *format_name(ExportFormat format);
std::optional<ExportFormat> parse_export_format(std::string_view name);

inline bool is_streamable(ExportFormat format) { return format == ExportFormat::Mp3; }

inline constexpr const char *kLoudnormFilter = "loudnorm=I=-14:TP=-1:LRA=11";

/// Everything the encoder boundary needs for one output file. Built once per export.
struct ExportJob {
    ExportFormat format = ExportFormat::Mp3;
    std::string bitrate = "192k";
    bool normalize = false;
    uint32_t sample_rate = 0;
    std::string output_path;
    BookMetadata metadata;
    std::vector<ChapterMarkMs> chapters;  // m4b only
};

/// Where the encoder reads its inputs from.
struct EncoderInputs {
    std::string pcm;            // "pipe:0" or a spool path; empty selects generated silence
    std::string metadata_path;  // FFMETADATA1 file (m4b)
    std::string cover_path;     // cover image file (m4b, optional)
};

// FFMETADATA1 value escaping: backslash first, then '=', ';', '#' and newline.
std::string escape_ffmetadata(const std::string &text);

// Global tags (title, artist, album) followed by one [CHAPTER] block per mark.
std::string generate_ffmetadata(const BookMetadata &metadata,
                                const std::vector<ChapterMarkMs> &chapters);

std::vector<std::string> build_encoder_command(const std::filesystem::path &encoder,
                                               const ExportJob &job, const EncoderInputs &inputs);

/**
 * @brief PCM sink that pipes s16le bytes straight into a running encoder.
 *
 * Used for streamable formats without checkpointing. abort() kills the encoder; the partial
 * output is not valid.
 */
class StreamingExport : public PcmSink {
public:
    StreamingExport(std::filesystem::path encoder, ExportJob job);

    RunStatus open();
    RunStatus write(const std::vector<int16_t> &samples) override;
    RunStatus finish();
    void abort();

private:
    std::filesystem::path encoder_;
    ExportJob job_;
    EncoderProcess process_;
    uint64_t bytes_ = 0;
};

/// One-shot encode of a complete spool file. Metadata and cover temp files are removed on
/// return, whatever the outcome.
RunStatus export_spooled(const std::filesystem::path &encoder, const ExportJob &job,
                         const std::filesystem::path &spool_path);

}  // namespace narrateforge
