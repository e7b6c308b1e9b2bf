//
//  event_emitter.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "event_emitter.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include "logging.hpp"

namespace narrateforge {

namespace {

// Text grammar renders strings bare and everything else in its JSON form.
std::string plain(const nlohmann::ordered_json &value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

}  // namespace

std::optional<EventFormat> parse_event_format(std::string_view name) {
    if (name == "text") {
        return EventFormat::Text;
    }
    if (name == "json") {
        return EventFormat::Json;
    }
    return std::nullopt;
}

EventEmitter::EventEmitter(EventFormat format, std::string job_id, std::ostream &out,
                           std::ostream &err)
    : format_(format), job_id_(std::move(job_id)), out_(out), err_(err) {
    writer_ = std::thread([this] { writer_loop(); });
}

EventEmitter::~EventEmitter() { close(); }

RunStatus EventEmitter::open_log_file(const std::string &path) {
    std::error_code ec;
    const auto parent = std::filesystem::absolute(path, ec).parent_path();
    if (!ec && !parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    log_file_.open(path, std::ios::app);
    if (!log_file_.is_open()) {
        return make_error(ErrorKind::Io, "failed to open log file " + path);
    }
    return ok_status();
}

int64_t EventEmitter::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void EventEmitter::emit_json(const std::string &type, nlohmann::ordered_json payload) {
    nlohmann::ordered_json body;
    body["type"] = type;
    body["ts_ms"] = now_ms();
    body["job_id"] = job_id_;
    for (auto it = payload.begin(); it != payload.end(); ++it) {
        body[it.key()] = it.value();
    }
    // Replace invalid UTF-8 rather than throw from deep inside the pipeline.
    enqueue(body.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace));
}

void EventEmitter::phase(const std::string &name) {
    if (format_ == EventFormat::Json) {
        emit_json("phase", {{"phase", name}});
        return;
    }
    enqueue("PHASE:" + name);
}

void EventEmitter::metadata(const std::string &key, const nlohmann::ordered_json &value) {
    if (format_ == EventFormat::Json) {
        emit_json("metadata", {{"key", key}, {"value", value}});
        return;
    }
    enqueue("METADATA:" + key + ":" + plain(value));
}

void EventEmitter::timing(uint32_t chunk_index, int64_t ms, const std::string &stage) {
    if (format_ == EventFormat::Json) {
        emit_json("timing", {{"chunk_idx", chunk_index}, {"chunk_timing_ms", ms}, {"stage", stage}});
        return;
    }
    enqueue("TIMING:" + std::to_string(chunk_index) + ":" + std::to_string(ms));
}

void EventEmitter::heartbeat(int64_t ts_ms) {
    if (format_ == EventFormat::Json) {
        emit_json("heartbeat", {{"heartbeat_ts", ts_ms}});
        return;
    }
    enqueue("HEARTBEAT:" + std::to_string(ts_ms));
}

void EventEmitter::worker(int id, const std::string &status, const std::string &details) {
    if (format_ == EventFormat::Json) {
        emit_json("worker", {{"id", id}, {"status", status}, {"details", details}});
        return;
    }
    enqueue("WORKER:" + std::to_string(id) + ":" + status + ":" + details);
}

void EventEmitter::progress(uint32_t current, uint32_t total) {
    if (format_ == EventFormat::Json) {
        emit_json("progress", {{"current_chunk", current}, {"total_chunks", total}});
        return;
    }
    enqueue("PROGRESS:" + std::to_string(current) + "/" + std::to_string(total) + " chunks");
}

void EventEmitter::checkpoint(const std::string &code) {
    if (format_ == EventFormat::Json) {
        emit_json("checkpoint", {{"code", code}});
        return;
    }
    enqueue("CHECKPOINT:" + code);
}

void EventEmitter::checkpoint(const std::string &code, const nlohmann::ordered_json &detail) {
    if (format_ == EventFormat::Json) {
        emit_json("checkpoint", {{"code", code}, {"detail", detail}});
        return;
    }
    enqueue("CHECKPOINT:" + code + ":" + plain(detail));
}

void EventEmitter::info(const std::string &message) {
    if (format_ == EventFormat::Json) {
        emit_json("log", {{"level", "info"}, {"message", message}});
        return;
    }
    enqueue(message);
}

void EventEmitter::warn(const std::string &message) {
    if (format_ == EventFormat::Json) {
        emit_json("log", {{"level", "warning"}, {"message", message}});
        return;
    }
    enqueue("WARN: " + message, true);
}

void EventEmitter::error(const std::string &message) {
    if (format_ == EventFormat::Json) {
        emit_json("error", {{"message", message}});
        return;
    }
    enqueue(message, true);
}

void EventEmitter::done(const std::string &output, uint32_t chunks) {
    if (format_ == EventFormat::Json) {
        emit_json("done", {{"output", output}, {"chunks", chunks}});
        return;
    }
    enqueue("DONE");
}

void EventEmitter::enqueue(std::string text, bool to_stderr) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            NF_LOG("debug", "event dropped after close: " << text);
            return;
        }
        queue_.push_back(Line{std::move(text), to_stderr});
    }
    cv_.notify_one();
}

void EventEmitter::writer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        cv_.wait(lock, [&] { return !queue_.empty() || stopping_; });
        if (queue_.empty() && stopping_) {
            break;
        }
        Line line = std::move(queue_.front());
        queue_.pop_front();
        writing_ = true;
        lock.unlock();

        std::ostream &stream = line.to_stderr ? err_ : out_;
        stream << line.text << std::endl;

        lock.lock();
        if (log_file_.is_open()) {
            log_file_ << line.text << "\n";
            log_file_.flush();
        }
        writing_ = false;
        if (queue_.empty()) {
            drained_cv_.notify_all();
        }
    }
    drained_cv_.notify_all();
}

void EventEmitter::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_cv_.wait(lock, [&] { return queue_.empty() && !writing_; });
}

void EventEmitter::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    if (writer_.joinable()) {
        writer_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

Heartbeat::Heartbeat(EventEmitter &events, std::chrono::milliseconds interval)
    : events_(events), interval_(interval) {
    thread_ = std::thread([this] {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!cv_.wait_for(lock, interval_, [&] { return stopped_; })) {
            events_.heartbeat(EventEmitter::now_ms());
        }
    });
}

Heartbeat::~Heartbeat() { stop(); }

void Heartbeat::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

}  // namespace narrateforge
