//
//  chunker.cpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "chunker.hpp"

#include <algorithm>

#include "logging.hpp"
#include "text_utils.hpp"
#include "timestamp.hpp"

namespace {

// Floor division; cue starts are non-negative but the base may exceed a malformed start.
static int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

}  // namespace

namespace vttforge {

int64_t chunk_base_ms(const std::vector<Cue> &cues, const ChunkOptions &options) {
    if (options.start_at_zero || cues.empty() || options.chunk_ms <= 0) {
        return 0;
    }
    const auto earliest = std::min_element(
        cues.begin(), cues.end(),
        [](const Cue &a, const Cue &b) { return a.start_ms < b.start_ms; });
    return floor_div(earliest->start_ms, options.chunk_ms) * options.chunk_ms;
}

CueBuckets bucket_cues(const std::vector<Cue> &cues, const ChunkOptions &options) {
    CueBuckets buckets;
    if (options.chunk_ms <= 0) {
        VF_LOG("error", "chunk length must be positive, got " << options.chunk_ms);
        return buckets;
    }
    const int64_t base = chunk_base_ms(cues, options);
    for (const auto &c : cues) {
        const int64_t idx = std::max<int64_t>(0, floor_div(c.start_ms - base, options.chunk_ms));
        buckets[static_cast<size_t>(idx)].push_back(c);
    }
    VF_LOG("split", "bucket_cues cues=" << cues.size() << " base_ms=" << base
                                        << " chunk_ms=" << options.chunk_ms
                                        << " buckets=" << buckets.size());
    return buckets;
}

std::vector<Chunk> render_chunks(const Lines &header, const std::vector<Cue> &cues,
                                 const ChunkOptions &options) {
    std::vector<Chunk> chunks;
    const int64_t base = chunk_base_ms(cues, options);
    const CueBuckets buckets = bucket_cues(cues, options);
    chunks.reserve(buckets.size());
    for (const auto &[idx, bucket] : buckets) {
        Chunk chunk;
        chunk.part_number = idx + 1;
        chunk.chunk_start_ms = base + static_cast<int64_t>(idx) * options.chunk_ms;
        chunk.cue_count = bucket.size();
        chunk.lines = header.empty() ? default_header() : header;

        for (const auto &c : bucket) {
            if (options.rebase) {
                chunk.lines.push_back(encode_timestamp(c.start_ms - chunk.chunk_start_ms) +
                                      " --> " +
                                      encode_timestamp(c.end_ms - chunk.chunk_start_ms));
            } else {
                chunk.lines.push_back(rtrim(c.timestamp_line));
            }
            chunk.lines.insert(chunk.lines.end(), c.text_lines.begin(), c.text_lines.end());
            chunk.lines.emplace_back();
        }
        VF_LOG("split", "chunk part=" << chunk.part_number << " start_ms="
                                      << chunk.chunk_start_ms << " cues=" << chunk.cue_count);
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

}  // namespace vttforge
