//
//  timeline_fixer.cpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "timeline_fixer.hpp"

#include <sstream>
#include <utility>

#include "cue_parser.hpp"
#include "logging.hpp"
#include "text_utils.hpp"
#include "timestamp.hpp"

namespace vttforge {

const char *issue_kind_name(IssueKind kind) {
    switch (kind) {
        case IssueKind::ParseFail:
            return "PARSE_FAIL";
        case IssueKind::EndBeforeStart:
            return "END_BEFORE_START";
        case IssueKind::StartDecreased:
            return "START_DECREASED";
        case IssueKind::Overlap:
            return "OVERLAP";
    }
    return "UNKNOWN";
}

const char *fix_action_name(FixAction action) {
    switch (action) {
        case FixAction::SkipUnparseable:
            return "SKIP_UNPARSEABLE";
        case FixAction::SwapStartEnd:
            return "SWAP_START_END";
        case FixAction::Normalize:
            return "NORMALIZE";
    }
    return "UNKNOWN";
}

TimelineCheck check_timeline(const Lines &lines) {
    TimelineCheck out;
    for (size_t idx = 0; idx < lines.size(); ++idx) {
        const std::string &line = lines[idx];
        auto parts = match_timestamp_line(line);
        if (!parts) {
            continue;
        }
        const size_t line_no = idx + 1;
        std::string reason;
        auto times = decode_timestamp_pair(*parts, &reason);
        if (!times) {
            out.issues.push_back(TimelineIssue{line_no, IssueKind::ParseFail, reason, line});
            continue;
        }
        if (times->end_ms < times->start_ms) {
            std::ostringstream detail;
            detail << "start=" << times->start_ms << " end=" << times->end_ms;
            out.issues.push_back(
                TimelineIssue{line_no, IssueKind::EndBeforeStart, detail.str(), line});
        }
        out.cues.push_back(TimedLine{line_no, times->start_ms, times->end_ms, line});
    }

    // Starts should never decrease and cues should not overlap.
    for (size_t i = 1; i < out.cues.size(); ++i) {
        const auto &prev = out.cues[i - 1];
        const auto &cur = out.cues[i];
        if (cur.start_ms < prev.start_ms) {
            std::ostringstream detail;
            detail << "prev_start=" << prev.start_ms << " current_start=" << cur.start_ms
                   << " (prev line " << prev.line_number << ")";
            out.issues.push_back(TimelineIssue{cur.line_number, IssueKind::StartDecreased,
                                               detail.str(), cur.raw_line});
        }
        if (cur.start_ms < prev.end_ms) {
            std::ostringstream detail;
            detail << "prev_end=" << prev.end_ms << " current_start=" << cur.start_ms
                   << " (prev line " << prev.line_number << ")";
            out.issues.push_back(
                TimelineIssue{cur.line_number, IssueKind::Overlap, detail.str(), cur.raw_line});
        }
    }
    VF_LOG("check", "check_timeline lines=" << lines.size() << " cues=" << out.cues.size()
                                            << " issues=" << out.issues.size());
    return out;
}

FixResult fix_timeline(const Lines &lines) {
    FixResult out;
    out.lines.reserve(lines.size());
    for (size_t idx = 0; idx < lines.size(); ++idx) {
        const std::string &line = lines[idx];
        auto parts = match_timestamp_line(line);
        if (!parts) {
            out.lines.push_back(line);
            continue;
        }
        const size_t line_no = idx + 1;
        std::string reason;
        auto times = decode_timestamp_pair(*parts, &reason);
        if (!times) {
            VF_LOG("warn", "line " << line_no << " left unchanged: " << reason << " ["
                                   << line_preview(line) << "]");
            out.lines.push_back(line);
            out.log.push_back(FixLogEntry{line_no, FixAction::SkipUnparseable, reason});
            continue;
        }

        int64_t start = times->start_ms;
        int64_t end = times->end_ms;
        const bool swapped = end < start;
        if (swapped) {
            std::swap(start, end);
        }

        std::string fixed =
            rtrim(encode_timestamp(start) + " --> " + encode_timestamp(end) + parts->settings);
        const std::string detail = parts->start_raw + " --> " + parts->end_raw;
        if (swapped) {
            out.log.push_back(FixLogEntry{line_no, FixAction::SwapStartEnd, detail});
        } else if (trim_view(line) != trim_view(fixed)) {
            out.log.push_back(FixLogEntry{line_no, FixAction::Normalize, detail});
        }
        out.lines.push_back(std::move(fixed));
    }
    VF_LOG("fix", "fix_timeline lines=" << lines.size() << " log_entries=" << out.log.size());
    return out;
}

}  // namespace vttforge
