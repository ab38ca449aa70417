//
//  chunker.hpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "cue_parser.hpp"
#include "vtt_document.hpp"

namespace vttforge {

inline constexpr int64_t kMsPerMinute = 60'000;

struct ChunkOptions {
    int64_t chunk_ms = 10 * kMsPerMinute;  ///< window length, must be > 0
    bool start_at_zero = false;  ///< align windows to 00:00 instead of the first cue's window
    bool rebase = false;         ///< rewrite times relative to each window's start
};

/// Sparse bucket index -> cues in input order.
using CueBuckets = std::map<size_t, std::vector<Cue>>;

/// One rendered output document.
struct Chunk {
    size_t part_number = 0;  ///< bucket index + 1, used in the output file name
    int64_t chunk_start_ms = 0;
    size_t cue_count = 0;
    Lines lines;
};

/// Window origin: 0, or the largest multiple of chunk_ms not above the earliest cue start.
int64_t chunk_base_ms(const std::vector<Cue> &cues, const ChunkOptions &options);

/// Group cues by window. Only windows holding at least one cue appear in the result.
CueBuckets bucket_cues(const std::vector<Cue> &cues, const ChunkOptions &options);

/// Render each bucket as a standalone document. An empty @p header gets the default one.
std::vector<Chunk> render_chunks(const Lines &header, const std::vector<Cue> &cues,
                                 const ChunkOptions &options);

}  // namespace vttforge
