//
//  logging.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace narrateforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a CLI level name; unknown names map to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

// Write one complete diagnostic line to stderr. Lines from the pipeline threads never interleave;
// each carries the seconds since the first log call and, for errors, the call site.
void write_log_line(std::string_view level, const std::string &msg, const char *file, int line,
                    const char *func);

// errno rendered as "errno=<n> (<text>)" for io failure logs.
inline std::string errno_text(int err = errno) {
    std::ostringstream oss;
    oss << "errno=" << err << " (" << std::generic_category().message(err) << ")";
    return oss.str();
}

}  // namespace narrateforge

inline constexpr narrateforge::LogVerbosity nf_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return narrateforge::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return narrateforge::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return narrateforge::LogVerbosity::Info;
    }
    // Everything else (io/checkpoint/pipeline/etc.) treated as debug-level.
    return narrateforge::LogVerbosity::Debug;
}

inline bool nf_should_log(const char *level) {
    const auto current = narrateforge::get_log_verbosity();
    const auto sev = nf_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void nf_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    narrateforge::write_log_line(level ? level : "", msg, file, line, func);
}

#define NF_LOG(level, message)                                              \
    do {                                                                    \
        if (nf_should_log(level)) {                                         \
            std::ostringstream _nf_log_ss;                                  \
            _nf_log_ss << message;                                          \
            nf_log_impl(level, _nf_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
