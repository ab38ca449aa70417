//
//  cue_parser.cpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "cue_parser.hpp"

#include <utility>

#include "logging.hpp"
#include "text_utils.hpp"
#include "timestamp.hpp"

namespace vttforge {

namespace {
constexpr std::string_view kArrow = "-->";
}  // namespace

std::optional<TimestampLineParts> match_timestamp_line(std::string_view line) {
    // The left side needs at least one character, so the arrow cannot open the line.
    size_t pos = line.find(kArrow, 1);
    while (pos != std::string_view::npos) {
        std::string_view rest = line.substr(pos + kArrow.size());
        if (!rest.empty()) {
            TimestampLineParts parts;
            parts.start_raw = trim(line.substr(0, pos));
            size_t b = 0;
            while (b < rest.size() && is_space(rest[b])) {
                ++b;
            }
            size_t e = b;
            while (e < rest.size() && !is_space(rest[e])) {
                ++e;
            }
            parts.end_raw = std::string(rest.substr(b, e - b));
            parts.settings = std::string(rest.substr(e));
            return parts;
        }
        pos = line.find(kArrow, pos + 1);
    }
    return std::nullopt;
}

std::optional<TimestampPair> decode_timestamp_pair(const TimestampLineParts &parts,
                                                   std::string *error) {
    auto start = decode_timestamp(parts.start_raw, error);
    if (!start) {
        return std::nullopt;
    }
    auto end = decode_timestamp(parts.end_raw, error);
    if (!end) {
        return std::nullopt;
    }
    return TimestampPair{*start, *end};
}

CueScanResult parse_cues(const std::vector<std::string> &body) {
    CueScanResult result;
    size_t i = 0;
    while (i < body.size()) {
        const std::string &line = body[i];
        auto parts = match_timestamp_line(line);
        if (!parts) {
            ++i;
            continue;
        }

        std::string reason;
        auto times = decode_timestamp_pair(*parts, &reason);
        if (!times) {
            VF_LOG("parser", "skipping cue at body line " << (i + 1) << ": " << reason);
            result.skipped.push_back(SkippedCue{i + 1, reason, line});
            ++i;
            continue;
        }

        Cue cue;
        cue.start_ms = times->start_ms;
        cue.end_ms = times->end_ms;
        cue.timestamp_line = line;
        ++i;
        while (i < body.size() && !is_blank(body[i])) {
            cue.text_lines.push_back(body[i]);
            ++i;
        }
        while (i < body.size() && is_blank(body[i])) {
            ++i;
        }
        result.cues.push_back(std::move(cue));
    }
    VF_LOG("parser", "parse_cues cues=" << result.cues.size()
                                        << " skipped=" << result.skipped.size());
    return result;
}

}  // namespace vttforge
