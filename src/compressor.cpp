//
//  compressor.cpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "compressor.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "logging.hpp"
#include "text_utils.hpp"
#include "timestamp.hpp"

namespace {

constexpr std::array<std::string_view, 7> kSentenceTerminals = {
    ".", "?", "!", "\xE3\x80\x82" /* 。 */, "\xEF\xBC\x9F" /* ？ */,
    "\xEF\xBC\x81" /* ！ */, "\xE2\x80\xA6" /* … */};

}  // namespace

namespace vttforge {

const char *fuse_decision_name(FuseDecision d) {
    switch (d) {
        case FuseDecision::Fuse:
            return "fuse";
        case FuseDecision::GapTooLarge:
            return "gap";
        case FuseDecision::SentenceComplete:
            return "sentence";
        case FuseDecision::TooLong:
            return "length";
    }
    return "unknown";
}

std::string clean_cue_text(std::string_view text) {
    // Pass 1: drop <tag> runs. A '<' without a closing '>' (or "<>") is kept as text.
    std::string untagged;
    untagged.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '<') {
            const size_t close = text.find('>', i + 1);
            if (close != std::string_view::npos && close > i + 1) {
                i = close;
                continue;
            }
        }
        untagged.push_back(text[i]);
    }

    // Pass 2: collapse whitespace (ASCII and Unicode spaces alike) and trim.
    std::string out;
    out.reserve(untagged.size());
    bool in_space = false;
    for (size_t i = 0; i < untagged.size();) {
        const size_t space = utf8_space_length(untagged, i);
        if (space > 0) {
            in_space = true;
            i += space;
            continue;
        }
        if (in_space && !out.empty()) {
            out.push_back(' ');
        }
        in_space = false;
        out.push_back(untagged[i]);
        ++i;
    }
    return out;
}

bool ends_sentence(std::string_view text) {
    const std::string cleaned = clean_cue_text(text);
    if (cleaned.empty()) {
        return true;
    }
    const std::string_view last = utf8_last_char(cleaned);
    return std::find(kSentenceTerminals.begin(), kSentenceTerminals.end(), last) !=
           kSentenceTerminals.end();
}

FuseDecision fuse_decision(const CompressCue &current, const CompressCue &next,
                           const CompressOptions &options) {
    const int64_t gap = next.start_ms - current.end_ms;
    if (gap > options.gap_ms) {
        return FuseDecision::GapTooLarge;
    }
    if (ends_sentence(current.text)) {
        return FuseDecision::SentenceComplete;
    }
    if (utf8_length(current.text) + 1 + utf8_length(next.text) > options.max_chars) {
        return FuseDecision::TooLong;
    }
    return FuseDecision::Fuse;
}

CueAccumulator::CueAccumulator(CompressCue first) : current_(std::move(first)) {}

std::optional<CompressCue> CueAccumulator::absorb(const CompressCue &next,
                                                  const CompressOptions &options) {
    const FuseDecision d = fuse_decision(current_, next, options);
    if (d == FuseDecision::Fuse) {
        current_.text = clean_cue_text(current_.text + " " + next.text);
        current_.end_ms = std::max(current_.end_ms, next.end_ms);
        return std::nullopt;
    }
    VF_LOG("compress", "flush at " << encode_timestamp(current_.start_ms) << " ("
                                   << fuse_decision_name(d) << ")");
    CompressCue flushed = std::exchange(current_, next);
    return flushed;
}

CompressScan scan_compress_cues(const Lines &lines) {
    CompressScan scan;
    const auto doc = split_header_and_body(lines);
    const auto &body = doc.body;
    size_t i = 0;
    while (i < body.size()) {
        auto parts = match_timestamp_line(body[i]);
        if (!parts) {
            ++i;
            continue;
        }
        std::string reason;
        auto times = decode_timestamp_pair(*parts, &reason);
        if (!times) {
            VF_LOG("warn", "compress: skipping cue at body line " << (i + 1) << ": " << reason);
            scan.skipped.push_back(SkippedCue{i + 1, reason, body[i]});
            ++i;
            continue;
        }
        ++i;
        std::string joined;
        while (i < body.size() && !is_blank(body[i])) {
            if (!joined.empty()) {
                joined.push_back(' ');
            }
            joined += trim_view(body[i]);
            ++i;
        }
        while (i < body.size() && is_blank(body[i])) {
            ++i;
        }
        scan.cues.push_back(CompressCue{times->start_ms, times->end_ms, clean_cue_text(joined)});
    }
    return scan;
}

std::vector<CompressCue> fuse_cues(std::vector<CompressCue> cues, const CompressOptions &options) {
    std::vector<CompressCue> merged;
    if (cues.empty()) {
        return merged;
    }
    std::stable_sort(cues.begin(), cues.end(), [](const CompressCue &a, const CompressCue &b) {
        if (a.start_ms != b.start_ms) {
            return a.start_ms < b.start_ms;
        }
        return a.end_ms < b.end_ms;
    });

    CueAccumulator acc(cues.front());
    for (size_t i = 1; i < cues.size(); ++i) {
        if (auto flushed = acc.absorb(cues[i], options)) {
            merged.push_back(std::move(*flushed));
        }
    }
    merged.push_back(acc.finish());
    VF_LOG("compress", "fuse_cues " << cues.size() << " -> " << merged.size());
    return merged;
}

Lines render_compressed(const std::vector<CompressCue> &cues) {
    Lines out = default_header();
    for (const auto &c : cues) {
        out.push_back(encode_timestamp(c.start_ms) + " --> " + encode_timestamp(c.end_ms));
        if (!c.text.empty()) {
            out.push_back(c.text);
        }
        out.emplace_back();
    }
    // No trailing blank line after the last block.
    while (!out.empty() && is_blank(out.back())) {
        out.pop_back();
    }
    return out;
}

}  // namespace vttforge
