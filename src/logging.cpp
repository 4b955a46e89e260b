//
//  logging.cpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "logging.hpp"

namespace cadencefix {

static std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Info)};

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

LogVerbosity parse_log_verbosity(const std::string &s) {
    if (s == "debug") return LogVerbosity::Debug;
    if (s == "info") return LogVerbosity::Info;
    if (s == "warn" || s == "warning") return LogVerbosity::Warn;
    return LogVerbosity::Error;
}

}  // namespace cadencefix
