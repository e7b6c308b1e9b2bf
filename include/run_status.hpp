//
//  run_status.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace narrateforge {

/// Failure classes surfaced by the pipeline. Validation and MissingAudio are resolved locally
/// (fresh run, chunk regeneration); the remaining kinds end the run.
enum class ErrorKind {
    None,
    Planning,
    Validation,
    MissingAudio,
    Backend,
    Export,
    Io,
    Config,
};

/**
 * @brief Result object with success flag, failure class and optional error message.
 *
 * When `ok == true`, `kind` is `ErrorKind::None` and `message` is empty. On failure, `message`
 * carries a short description (e.g. the backend error text or the encoder's stderr).
 */
struct RunStatus {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    std::string message;

    explicit operator bool() const { return ok; }
};

inline RunStatus ok_status() { return RunStatus{}; }

inline RunStatus make_error(ErrorKind kind, std::string msg) {
    return RunStatus{false, kind, std::move(msg)};
}

const char *error_kind_name(ErrorKind kind);

}  // namespace narrateforge
