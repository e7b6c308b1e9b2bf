//
//  pcm_sink.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "pcm_sink.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstring>
#include <utility>

#include "logging.hpp"

namespace narrateforge {

std::vector<int16_t> to_pcm16(const std::vector<float> &samples) {
    std::vector<int16_t> out(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        // NaN from a misbehaving engine becomes silence.
        const float clipped =
            std::isnan(samples[i]) ? 0.0f : std::clamp(samples[i], -1.0f, 1.0f);
        out[i] = static_cast<int16_t>(clipped * 32767.0f);
    }
    return out;
}

std::vector<int16_t> concatenate_pcm(const std::vector<std::vector<int16_t>> &parts) {
    size_t total = 0;
    for (const auto &p : parts) {
        total += p.size();
    }
    std::vector<int16_t> out(total);
    size_t pos = 0;
    for (const auto &p : parts) {
        std::copy(p.begin(), p.end(), out.begin() + static_cast<std::ptrdiff_t>(pos));
        pos += p.size();
    }
    return out;
}

void pcm16_to_le_bytes(const std::vector<int16_t> &samples, std::vector<char> &out) {
    out.resize(samples.size() * 2);
    if constexpr (std::endian::native == std::endian::little) {
        if (!samples.empty()) {
            std::memcpy(out.data(), samples.data(), out.size());
        }
    } else {
        for (size_t i = 0; i < samples.size(); ++i) {
            const auto u = static_cast<uint16_t>(samples[i]);
            out[2 * i] = static_cast<char>(u & 0xFF);
            out[2 * i + 1] = static_cast<char>(u >> 8);
        }
    }
}

SpoolFileSink::SpoolFileSink(std::filesystem::path path) : path_(std::move(path)) {}

RunStatus SpoolFileSink::open() {
    out_.open(path_, std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        NF_LOG("error", "open failed for " << path_.string() << " " << errno_text());
        return make_error(ErrorKind::Io, "failed to open spool file " + path_.string());
    }
    bytes_ = 0;
    return ok_status();
}

RunStatus SpoolFileSink::write(const std::vector<int16_t> &samples) {
    if (!out_.is_open()) {
        return make_error(ErrorKind::Io, "Spool writer is not available.");
    }
    std::vector<char> bytes;
    pcm16_to_le_bytes(samples, bytes);
    out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out_.good()) {
        return make_error(ErrorKind::Io, "write failed for spool file " + path_.string() +
                                             " " + errno_text());
    }
    bytes_ += bytes.size();
    return ok_status();
}

RunStatus SpoolFileSink::close() {
    if (!out_.is_open()) {
        return ok_status();
    }
    out_.flush();
    const bool good = out_.good();
    out_.close();
    if (!good) {
        return make_error(ErrorKind::Io, "flush failed for spool file " + path_.string());
    }
    NF_LOG("io", "spooled " << bytes_ << " bytes to " << path_.string());
    return ok_status();
}

RunStatus MemorySink::write(const std::vector<int16_t> &samples) {
    parts_.push_back(samples);
    return ok_status();
}

std::vector<int16_t> MemorySink::take_samples() {
    auto joined = concatenate_pcm(parts_);
    parts_.clear();
    return joined;
}

}  // namespace narrateforge
