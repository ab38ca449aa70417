//
//  cue_parser.hpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vttforge {

/// One subtitle entry as found in a document body.
struct Cue {
    int64_t start_ms = 0;
    int64_t end_ms = 0;                  ///< may precede start_ms until the timeline is fixed
    std::vector<std::string> text_lines; ///< raw text, markup untouched
    std::string timestamp_line;          ///< the original timestamp line, verbatim
};

/// Pieces of a `<left> --> <right>[ settings]` line, before any decoding.
struct TimestampLineParts {
    std::string start_raw;  ///< left side, trimmed
    std::string end_raw;    ///< first whitespace-delimited token of the right side
    std::string settings;   ///< remainder after end_raw, leading whitespace kept
};

/// A timestamp line whose times could not be decoded.
struct SkippedCue {
    size_t line_number = 0;  ///< 1-based line within the scanned body
    std::string reason;
    std::string raw_line;
};

struct CueScanResult {
    std::vector<Cue> cues;            ///< document order, not time-sorted
    std::vector<SkippedCue> skipped;
};

/// Decoded start/end of a timestamp line.
struct TimestampPair {
    int64_t start_ms = 0;
    int64_t end_ms = 0;
};

/// Match the arrow grammar. Returns std::nullopt when the line is not a timestamp line.
std::optional<TimestampLineParts> match_timestamp_line(std::string_view line);

/// Decode both sides of a matched line; on failure @p error receives the reason.
std::optional<TimestampPair> decode_timestamp_pair(const TimestampLineParts &parts,
                                                   std::string *error = nullptr);

/// Scan body lines into cues. Undecodable blocks are skipped and reported, never fatal.
CueScanResult parse_cues(const std::vector<std::string> &body);

}  // namespace vttforge
