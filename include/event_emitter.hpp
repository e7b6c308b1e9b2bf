//
//  event_emitter.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "run_status.hpp"

namespace narrateforge {

enum class EventFormat { Text, Json };

std::optional<EventFormat> parse_event_format(std::string_view name);

/**
 * @brief Serializes pipeline state transitions for an external observer.
 *
 * Text mode writes the fixed line grammar (PHASE:, METADATA:, TIMING:, HEARTBEAT:, WORKER:,
 * PROGRESS:, CHECKPOINT:, DONE); errors and warnings go to stderr. Json mode writes one object per
 * line to stdout with `type`, `ts_ms` and `job_id` plus the event fields.
 *
 * Emitting never blocks on the transport: lines are queued and written by a dedicated thread.
 * Safe to call from any thread.
 */
class EventEmitter {
public:
    EventEmitter(EventFormat format, std::string job_id, std::ostream &out = std::cout,
                 std::ostream &err = std::cerr);
    ~EventEmitter();

    EventEmitter(const EventEmitter &) = delete;
    EventEmitter &operator=(const EventEmitter &) = delete;

    // Mirror every line into `path` (appended, parent directories created).
    RunStatus open_log_file(const std::string &path);

    void phase(const std::string &name);
    void metadata(const std::string &key, const nlohmann::ordered_json &value);
    void timing(uint32_t chunk_index, int64_t ms, const std::string &stage);
    void heartbeat(int64_t ts_ms);
    void worker(int id, const std::string &status, const std::string &details);
    void progress(uint32_t current, uint32_t total);
    void checkpoint(const std::string &code);
    void checkpoint(const std::string &code, const nlohmann::ordered_json &detail);
    void info(const std::string &message);
    void warn(const std::string &message);
    void error(const std::string &message);
    void done(const std::string &output, uint32_t chunks);

    // Block until every queued line has been written.
    void flush();

    // Drain and stop the writer; later events are dropped.
    void close();

    EventFormat format() const { return format_; }

    static int64_t now_ms();

private:
    struct Line {
        std::string text;
        bool to_stderr = false;
    };

    void emit_json(const std::string &type, nlohmann::ordered_json payload);
    void enqueue(std::string text, bool to_stderr = false);
    void writer_loop();

    EventFormat format_;
    std::string job_id_;
    std::ostream &out_;
    std::ostream &err_;
    std::ofstream log_file_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    std::deque<Line> queue_;
    bool writing_ = false;
    bool stopping_ = false;
    std::thread writer_;
};

/// Emits HEARTBEAT events at a fixed interval until destroyed, independent of chunk progress.
class Heartbeat {
public:
    explicit Heartbeat(EventEmitter &events,
                       std::chrono::milliseconds interval = std::chrono::seconds(5));
    ~Heartbeat();

    Heartbeat(const Heartbeat &) = delete;
    Heartbeat &operator=(const Heartbeat &) = delete;

    void stop();

private:
    EventEmitter &events_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
    std::thread thread_;
};

}  // namespace narrateforge
