//
//  timeline_fixer.hpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "vtt_document.hpp"

namespace vttforge {

enum class IssueKind { ParseFail, EndBeforeStart, StartDecreased, Overlap };

enum class FixAction { SkipUnparseable, SwapStartEnd, Normalize };

/// Diagnostic only; the check never fails.
struct TimelineIssue {
    size_t line_number = 0;  ///< 1-based, over the whole document
    IssueKind kind = IssueKind::ParseFail;
    std::string detail;
    std::string raw_line;
};

/// A decodable timestamp line seen by the check.
struct TimedLine {
    size_t line_number = 0;
    int64_t start_ms = 0;
    int64_t end_ms = 0;
    std::string raw_line;
};

struct TimelineCheck {
    std::vector<TimelineIssue> issues;
    std::vector<TimedLine> cues;
};

struct FixLogEntry {
    size_t line_number = 0;
    FixAction action = FixAction::Normalize;
    std::string detail;
};

struct FixResult {
    Lines lines;
    std::vector<FixLogEntry> log;
};

const char *issue_kind_name(IssueKind kind);
const char *fix_action_name(FixAction action);

/// Read-only timeline check over raw document lines.
TimelineCheck check_timeline(const Lines &lines);

/// Rewrite every decodable timestamp line in canonical form, swapping reversed times.
/// Settings after the end timestamp are kept; undecodable lines pass through unchanged.
FixResult fix_timeline(const Lines &lines);

}  // namespace vttforge
