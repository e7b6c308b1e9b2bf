//
//  pcm_sink.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

#include "run_status.hpp"

namespace narrateforge {

// Float to signed 16-bit: clip to [-1, 1], scale by 32767, truncate toward zero.
std::vector<int16_t> to_pcm16(const std::vector<float> &samples);

// Concatenate per-chunk arrays with a single allocation sized to the total.
std::vector<int16_t> concatenate_pcm(const std::vector<std::vector<int16_t>> &parts);

// Destination for ordered s16le mono PCM.
class PcmSink {
public:
    virtual ~PcmSink() = default;
    virtual RunStatus write(const std::vector<int16_t> &samples) = 0;
};

// Spool file on disk; input for the one-shot encoder invocation.
class SpoolFileSink : public PcmSink {
public:
    explicit SpoolFileSink(std::filesystem::path path);

    RunStatus open();
    RunStatus write(const std::vector<int16_t> &samples) override;
    RunStatus close();

    const std::filesystem::path &path() const { return path_; }
    uint64_t bytes_written() const { return bytes_; }

private:
    std::filesystem::path path_;
    std::ofstream out_;
    uint64_t bytes_ = 0;
};

// Keeps per-chunk arrays in memory; take_samples() joins them once.
class MemorySink : public PcmSink {
public:
    RunStatus write(const std::vector<int16_t> &samples) override;
    std::vector<int16_t> take_samples();
    size_t parts() const { return parts_.size(); }

private:
    std::vector<std::vector<int16_t>> parts_;
};

// s16le byte image of `samples` (host order swapped on big-endian machines).
void pcm16_to_le_bytes(const std::vector<int16_t> &samples, std::vector<char> &out);

}  // namespace narrateforge
