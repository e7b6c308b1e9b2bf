//
//  run_status.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "run_status.hpp"

namespace narrateforge {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Planning:
        return "planning";
    case ErrorKind::Validation:
        return "validation";
    case ErrorKind::MissingAudio:
        return "missing_audio";
    case ErrorKind::Backend:
        return "backend";
    case ErrorKind::Export:
        return "export";
    case ErrorKind::Io:
        return "io";
    case ErrorKind::Config:
        return "config";
    }
    return "unknown";
}

}  // namespace narrateforge
