//
//  merger.hpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vtt_document.hpp"

namespace vttforge {

/// Sort-last sentinels for documents without cues / files without a part number.
inline constexpr int64_t kNoCueStartMs = std::numeric_limits<int64_t>::max();
inline constexpr uint64_t kNoPartNumber = std::numeric_limits<uint64_t>::max();

/// One candidate document for merging.
struct MergeInput {
    std::string name;  ///< file name (with extension), used for the part number and tie-break
    Lines lines;       ///< the raw document
};

struct MergeKey {
    int64_t first_start_ms = kNoCueStartMs;
    uint64_t part_number = kNoPartNumber;
    std::string lowered_name;
};

struct MergeResult {
    Lines lines;                     ///< merged document, ready to write
    std::vector<std::string> order;  ///< input names in merge order
};

/// Part number embedded in a file stem ("x_part2", "Part 10", "ep.part-03").
/// The "part" token must not follow an ASCII letter. First match wins.
std::optional<uint64_t> part_number_from_name(std::string_view stem);

/// Start of the first cue that parses, in document order.
std::optional<int64_t> first_cue_start_ms(const Lines &lines);

MergeKey merge_key(const MergeInput &input);

/// Order inputs chronologically (stable) and concatenate their bodies under the first
/// document's header. An empty input list yields an empty result.
MergeResult merge_documents(const std::vector<MergeInput> &inputs);

}  // namespace vttforge
