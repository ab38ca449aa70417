//
//  logging.hpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <cstddef>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace vttforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a --log-level value; unknown strings map to Error.
LogVerbosity parse_log_verbosity(std::string_view s);

// Shortens a raw subtitle line for log output (cue text can be long).
inline constexpr size_t kLinePreviewChars = 60;
inline std::string line_preview(std::string_view line, size_t max_len = kLinePreviewChars) {
    if (line.size() <= max_len) {
        return std::string(line);
    }
    std::string out(line.substr(0, max_len));
    out += "...";
    return out;
}

}  // namespace vttforge

inline constexpr vttforge::LogVerbosity vf_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return vttforge::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return vttforge::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return vttforge::LogVerbosity::Info;
    }
    // Everything else (io/parser/split/merge/etc.) treated as debug-level.
    return vttforge::LogVerbosity::Debug;
}

inline bool vf_should_log(const char* level) {
    const auto current = vttforge::get_log_verbosity();
    const auto sev = vf_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void vf_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[VttForge][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[VttForge][" << level << "] " << msg << std::endl;
    }
}

#define VF_LOG(level, message)                                              \
    do {                                                                    \
        if (vf_should_log(level)) {                                         \
            std::ostringstream _vf_log_ss;                                  \
            _vf_log_ss << message;                                          \
            vf_log_impl(level, _vf_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
