//
//  narrateforge.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "chunk_planner.hpp"
#include "event_emitter.hpp"
#include "exporter.hpp"
#include "run_status.hpp"
#include "synthesis_backend.hpp"
#include "synthesis_coordinator.hpp"

namespace narrateforge {

/// @defgroup api NarrateForge Public API
/// Public, supported C++ interfaces for turning a book into narrated audio.
/// @{

/**
 * @brief Return the NarrateForge library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3`).
 */
std::string version_string();  ///< @ingroup api

/// Everything one conversion run needs. Mirrors the CLI flags one to one.
struct JobOptions {
    std::string input_path;   ///< book JSON; its SHA-256 identifies checkpoints
    std::string output_path;  ///< target file; the checkpoint lives beside it

    std::string voice = "af_heart";
    std::string lang = "a";
    double speed = 1.0;
    std::optional<int64_t> chunk_chars;  ///< backend default when unset
    std::string split_pattern = kDefaultSplitPattern;
    std::string backend = "auto";  ///< auto, mlx, pytorch or mock

    ExportFormat format = ExportFormat::Mp3;
    std::string bitrate = "192k";
    bool normalize = false;
    std::string title;   ///< override for the book title (m4b)
    std::string author;  ///< override for the author (m4b)
    std::string cover;   ///< override cover image path (m4b)

    bool checkpoint = false;
    bool resume = false;  ///< implies checkpoint
    bool check_checkpoint = false;
    bool extract_metadata = false;

    std::optional<PipelineMode> pipeline_mode;  ///< platform default when unset
    int64_t prefetch_chunks = 2;
    int64_t pcm_queue_size = 4;

    std::string encoder = "ffmpeg";  ///< executable name or path
    BackendOptions backend_options;
    std::chrono::milliseconds heartbeat_interval{5000};

    bool use_checkpoint() const { return checkpoint || resume; }
};

/**
 * @brief Run one conversion (or one of the probe/metadata modes) to completion.
 *
 * Every state transition is reported through `events`; a failure is also emitted as an `error`
 * event before it is returned. Checkpoint state is removed only after a successful export.
 *
 * @param options Run parameters.
 * @param events Event sink for the external observer.
 * @return ok, or the first fatal error (Planning, Backend, Export, Io or Config).
 */
RunStatus run_job(const JobOptions &options, EventEmitter &events);  ///< @ingroup api

/// @}

}  // namespace narrateforge
