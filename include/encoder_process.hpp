//
//  encoder_process.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <sys/types.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "run_status.hpp"
#include "temp_file.hpp"

namespace narrateforge {

// Resolve an encoder executable: names containing '/' are taken as paths, others are searched
// on PATH. nullopt when nothing executable is found.
std::optional<std::filesystem::path> find_executable(const std::string &name);

/**
 * @brief External encoder subprocess with an optional stdin pipe.
 *
 * stdout is discarded and stderr is captured to a temp file so failures can be reported with
 * the encoder's own diagnostics. Destroying a running process kills it.
 */
class EncoderProcess {
public:
    EncoderProcess() = default;
    EncoderProcess(const EncoderProcess &) = delete;
    EncoderProcess &operator=(const EncoderProcess &) = delete;
    ~EncoderProcess();

    // argv[0] must already be a resolved executable path.
    RunStatus start(const std::vector<std::string> &argv, bool pipe_stdin);

    RunStatus write(const char *data, size_t size);

    // Close stdin and wait. Non-zero exit becomes an Export error carrying stderr.
    RunStatus finish();

    // Kill and reap without reporting.
    void abort();

    bool running() const { return pid_ > 0; }

private:
    int wait_child();
    std::string captured_stderr() const;

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    std::string program_;
    std::optional<TempFile> stderr_file_;
};

// Run argv to completion without stdin.
RunStatus run_encoder(const std::vector<std::string> &argv);

}  // namespace narrateforge
