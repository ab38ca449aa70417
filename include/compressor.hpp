//
//  compressor.hpp
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
#include <utility>
#include <vector>

#include "cue_parser.hpp"
#include "vtt_document.hpp"

namespace vttforge {

struct CompressOptions {
    int64_t gap_ms = 500;    ///< fuse when the next cue starts at most this long after
    size_t max_chars = 130;  ///< upper bound on fused text, in code points
};

/// A cue reduced to its timing and cleaned, single-line text.
struct CompressCue {
    int64_t start_ms = 0;
    int64_t end_ms = 0;
    std::string text;
};

/// Outcome of the fusion predicate; anything but Fuse names the first failing condition.
enum class FuseDecision { Fuse, GapTooLarge, SentenceComplete, TooLong };

const char *fuse_decision_name(FuseDecision d);

/// Drop `<...>` markup, collapse whitespace runs to one space, trim.
std::string clean_cue_text(std::string_view text);

/// True when the cleaned text ends in . ? ! 。 ？ ！ or …; empty text counts as ended.
bool ends_sentence(std::string_view text);

FuseDecision fuse_decision(const CompressCue &current, const CompressCue &next,
                           const CompressOptions &options);

/**
 * @brief Running merged cue of the compression fold.
 *
 * absorb() either extends the current cue with the next one, or hands back the finished
 * cue and restarts from the next one. The last cue must be taken with finish().
 */
class CueAccumulator {
public:
    explicit CueAccumulator(CompressCue first);

    /// Returns the flushed cue when @p next could not be fused, std::nullopt otherwise.
    std::optional<CompressCue> absorb(const CompressCue &next, const CompressOptions &options);

    const CompressCue &current() const { return current_; }
    CompressCue finish() { return std::move(current_); }

private:
    CompressCue current_;
};

struct CompressScan {
    std::vector<CompressCue> cues;
    std::vector<SkippedCue> skipped;
};

/// Parse a whole document for compression: header skipped, text lines joined and cleaned.
CompressScan scan_compress_cues(const Lines &lines);

/// Sort by (start, end) and fold adjacent cues together.
std::vector<CompressCue> fuse_cues(std::vector<CompressCue> cues, const CompressOptions &options);

/// Default header followed by one canonical block per cue.
Lines render_compressed(const std::vector<CompressCue> &cues);

}  // namespace vttforge
