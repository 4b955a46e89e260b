//
//  logging.hpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace cadencefix {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a --log-level style string; unknown strings map to Error.
LogVerbosity parse_log_verbosity(const std::string &s);

// Hex-preview helper used in debug logs to dump a short prefix of binary blobs (element ids,
// block headers).
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(const uint8_t *data, size_t size,
                              size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, size);
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    return oss.str();
}

inline std::string hex_prefix(const std::vector<uint8_t> &data,
                              size_t max_len = kHexPreviewBytes) {
    return hex_prefix(data.data(), data.size(), max_len);
}

}  // namespace cadencefix

inline constexpr cadencefix::LogVerbosity cf_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return cadencefix::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return cadencefix::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return cadencefix::LogVerbosity::Info;
    }
    // Everything else (ebml/retime/io/etc.) treated as debug-level.
    return cadencefix::LogVerbosity::Debug;
}

inline bool cf_should_log(const char *level) {
    const auto current = cadencefix::get_log_verbosity();
    const auto sev = cf_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void cf_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[CadenceFix][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[CadenceFix][" << level << "] " << msg << std::endl;
    }
}

#define CF_LOG(level, message)                                              \
    do {                                                                    \
        if (cf_should_log(level)) {                                         \
            std::ostringstream _cf_log_ss;                                  \
            _cf_log_ss << message;                                          \
            cf_log_impl(level, _cf_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
