//
//  exporter.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "exporter.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "image_info.hpp"
#include "logging.hpp"
#include "temp_file.hpp"

namespace narrateforge {

const char *format_name(ExportFormat format) {
    switch (format) {
    case ExportFormat::Mp3:
        return "mp3";
    case ExportFormat::M4b:
        return "m4b";
    }
    return "mp3";
}

std::optional<ExportFormat> parse_export_format(std::string_view name) {
    if (name == "mp3") {
        return ExportFormat::Mp3;
    }
    if (name == "m4b") {
        return ExportFormat::M4b;
    }
    return std::nullopt;
}

std::string escape_ffmetadata(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\\' || c == '=' || c == ';' || c == '#' || c == '\n') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string generate_ffmetadata(const BookMetadata &metadata,
                                const std::vector<ChapterMarkMs> &chapters) {
    std::ostringstream oss;
    oss << ";FFMETADATA1\n";
    oss << "title=" << escape_ffmetadata(metadata.title) << "\n";
    oss << "artist=" << escape_ffmetadata(metadata.author) << "\n";
    oss << "album=" << escape_ffmetadata(metadata.title) << "\n";
    for (const auto &ch : chapters) {
        oss << "\n[CHAPTER]\n";
        oss << "TIMEBASE=1/1000\n";
        oss << "START=" << ch.start_ms << "\n";
        oss << "END=" << ch.end_ms << "\n";
        oss << "title=" << escape_ffmetadata(ch.title) << "\n";
    }
    return oss.str();
}

std::vector<std::string> build_encoder_command(const std::filesystem::path &encoder,
                                               const ExportJob &job, const EncoderInputs &inputs) {
    std::vector<std::string> cmd{encoder.string()};
    if (inputs.pcm.empty()) {
        cmd.insert(cmd.end(), {"-f", "lavfi", "-i",
                               "anullsrc=r=" + std::to_string(job.sample_rate) + ":cl=mono",
                               "-t", "0.1"});
    } else {
        cmd.insert(cmd.end(), {"-f", "s16le", "-ar", std::to_string(job.sample_rate), "-ac", "1",
                               "-i", inputs.pcm});
    }

    if (job.format == ExportFormat::M4b) {
        cmd.insert(cmd.end(), {"-i", inputs.metadata_path});
        const bool has_cover = !inputs.cover_path.empty();
        if (has_cover) {
            cmd.insert(cmd.end(), {"-i", inputs.cover_path});
        }
        cmd.insert(cmd.end(), {"-map", "0:a", "-map_metadata", "1"});
        if (has_cover) {
            cmd.insert(cmd.end(),
                       {"-map", "2:v", "-c:v", "copy", "-disposition:v:0", "attached_pic"});
        }
        if (job.normalize) {
            cmd.insert(cmd.end(), {"-af", kLoudnormFilter});
        }
        cmd.insert(cmd.end(),
                   {"-c:a", "aac", "-b:a", job.bitrate, "-movflags", "+faststart"});
    } else {
        if (job.normalize) {
            cmd.insert(cmd.end(), {"-af", kLoudnormFilter});
        }
        cmd.insert(cmd.end(), {"-b:a", job.bitrate});
    }
    cmd.insert(cmd.end(), {"-y", job.output_path});
    return cmd;
}

StreamingExport::StreamingExport(std::filesystem::path encoder, ExportJob job)
    : encoder_(std::move(encoder)), job_(std::move(job)) {}

RunStatus StreamingExport::open() {
    EncoderInputs inputs;
    inputs.pcm = "pipe:0";
    NF_LOG("info", "streaming " << format_name(job_.format) << " export to " << job_.output_path);
    return process_.start(build_encoder_command(encoder_, job_, inputs), true);
}

RunStatus StreamingExport::write(const std::vector<int16_t> &samples) {
    std::vector<char> bytes;
    pcm16_to_le_bytes(samples, bytes);
    auto st = process_.write(bytes.data(), bytes.size());
    if (st) {
        bytes_ += bytes.size();
    }
    return st;
}

RunStatus StreamingExport::finish() {
    NF_LOG("io", "closing encoder stream after " << bytes_ << " bytes");
    return process_.finish();
}

void StreamingExport::abort() { process_.abort(); }

namespace {

RunStatus write_file(const std::filesystem::path &path, const char *data, size_t size) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return make_error(ErrorKind::Io, "failed to open " + path.string());
    }
    out.write(data, static_cast<std::streamsize>(size));
    if (!out.good()) {
        return make_error(ErrorKind::Io, "failed to write " + path.string());
    }
    return ok_status();
}

}  // namespace

RunStatus export_spooled(const std::filesystem::path &encoder, const ExportJob &job,
                         const std::filesystem::path &spool_path) {
    EncoderInputs inputs;
    std::error_code ec;
    const auto spool_size = std::filesystem::file_size(spool_path, ec);
    if (!ec && spool_size > 0) {
        inputs.pcm = spool_path.string();
    } else {
        NF_LOG("warn", "spool is empty, exporting silence");
    }

    std::optional<TempFile> metadata_file;
    std::optional<TempFile> cover_file;
    if (job.format == ExportFormat::M4b) {
        metadata_file = TempFile::create(".txt");
        if (!metadata_file) {
            return make_error(ErrorKind::Io, "failed to create metadata file");
        }
        const auto doc = generate_ffmetadata(job.metadata, job.chapters);
        auto st = write_file(metadata_file->path(), doc.data(), doc.size());
        if (!st) {
            return st;
        }
        inputs.metadata_path = metadata_file->path().string();

        if (!job.metadata.cover.empty()) {
            std::string ext = ".jpg";
            if (auto info = sniff_image(job.metadata.cover)) {
                ext = info->extension;
            }
            cover_file = TempFile::create(ext);
            if (!cover_file) {
                return make_error(ErrorKind::Io, "failed to create cover file");
            }
            st = write_file(cover_file->path(),
                            reinterpret_cast<const char *>(job.metadata.cover.data()),
                            job.metadata.cover.size());
            if (!st) {
                return st;
            }
            inputs.cover_path = cover_file->path().string();
        }
    }

    NF_LOG("info", "exporting " << format_name(job.format) << " with "
                                << job.chapters.size() << " chapters to " << job.output_path);
    return run_encoder(build_encoder_command(encoder, job, inputs));
}

}  // namespace narrateforge
