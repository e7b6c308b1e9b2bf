//
//  logging.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "logging.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <mutex>

namespace narrateforge {

static std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Info)};

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

LogVerbosity parse_log_verbosity(std::string_view name) {
    if (name == "debug") return LogVerbosity::Debug;
    if (name == "info") return LogVerbosity::Info;
    if (name == "warn" || name == "warning") return LogVerbosity::Warn;
    return LogVerbosity::Error;
}

namespace {

std::mutex &log_mutex() {
    static std::mutex m;
    return m;
}

const char *source_name(const char *path) {
    const char *slash = path ? std::strrchr(path, '/') : nullptr;
    return slash ? slash + 1 : (path ? path : "?");
}

int64_t log_elapsed_ms() {
    static const auto start = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
}

}  // namespace

void write_log_line(std::string_view level, const std::string &msg, const char *file, int line,
                    const char *func) {
    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "%8.3f", static_cast<double>(log_elapsed_ms()) / 1000.0);
    std::ostringstream oss;
    oss << "[NarrateForge][" << stamp << "][" << level << "]";
    if (level == "error") {
        oss << "[" << source_name(file) << ":" << line << " " << func << "]";
    }
    oss << " " << msg << "\n";
    std::lock_guard<std::mutex> lock(log_mutex());
    std::cerr << oss.str() << std::flush;
}

}  // namespace narrateforge
