// Timeline check diagnostics and the fix pass (swap, normalize, skip, idempotence).
#include <algorithm>
#include <string>

#include "logging.hpp"
#include "test_utils.hpp"
#include "timeline_fixer.hpp"

using namespace vttforge;

namespace {

bool check(bool cond, const std::string &msg) {
    return test_utils::check("timeline_fixer_unit", cond, msg);
}

template <typename Entries, typename Kind>
size_t count_kind(const Entries &entries, Kind kind) {
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
                                             [&](const auto &e) { return e.kind == kind; }));
}

size_t count_action(const std::vector<FixLogEntry> &log, FixAction action) {
    return static_cast<size_t>(std::count_if(log.begin(), log.end(),
                                             [&](const auto &e) { return e.action == action; }));
}

bool test_swap_keeps_settings() {
    Lines lines = {"WEBVTT", "", "05:00.000 --> 02:00.000 align:start", "text", ""};
    auto fixed = fix_timeline(lines);
    bool ok = check(fixed.lines[2] == "00:02:00.000 --> 00:05:00.000 align:start",
                    "swapped and canonical, settings preserved: got " + fixed.lines[2]);
    ok &= check(fixed.log.size() == 1 && fixed.log[0].action == FixAction::SwapStartEnd,
                "one SWAP_START_END entry");
    if (!fixed.log.empty()) {
        ok &= check(fixed.log[0].line_number == 3, "entry anchored at line 3");
        ok &= check(fixed.log[0].detail == "05:00.000 --> 02:00.000", "detail keeps raw times");
    }
    ok &= check(fixed.lines[0] == "WEBVTT" && fixed.lines[3] == "text",
                "non-timestamp lines untouched");
    return ok;
}

bool test_normalize_and_skip() {
    Lines lines = {"WEBVTT",
                   "",
                   "46.550 --> 48.000",
                   "a",
                   "",
                   "00:00:50.000 --> 00:00:51.000   ",
                   "b",
                   "",
                   "x1 --> 00:00:52.000",
                   "c"};
    auto fixed = fix_timeline(lines);
    bool ok = check(fixed.lines[2] == "00:00:46.550 --> 00:00:48.000", "pure seconds normalized");
    ok &= check(fixed.lines[5] == "00:00:50.000 --> 00:00:51.000",
                "trailing whitespace trimmed from canonical line");
    ok &= check(fixed.lines[8] == "x1 --> 00:00:52.000", "unparseable line unchanged");
    ok &= check(count_action(fixed.log, FixAction::Normalize) == 1,
                "only the reformatted line is NORMALIZE");
    ok &= check(count_action(fixed.log, FixAction::SkipUnparseable) == 1, "one SKIP_UNPARSEABLE");
    ok &= check(std::string(fix_action_name(FixAction::SkipUnparseable)) == "SKIP_UNPARSEABLE",
                "action names");
    return ok;
}

bool test_fix_is_idempotent() {
    Lines lines = {"WEBVTT", "",
                   "55:56.03.800 --> 55:58.000 line:90%", "a", "",
                   "00:10.000 --> 00:05.000", "b", "",
                   "1:02:03,500 --> 1:02:04,000", "c"};
    auto first = fix_timeline(lines);
    bool ok = check(!first.log.empty(), "first pass changes something");
    auto second = fix_timeline(first.lines);
    ok &= check(count_action(second.log, FixAction::SwapStartEnd) == 0 &&
                    count_action(second.log, FixAction::Normalize) == 0,
                "second pass is a fixed point");
    ok &= check(second.lines == first.lines, "second pass output identical");
    return ok;
}

bool test_check_start_decreased() {
    Lines lines = {"WEBVTT", "",
                   "00:00.000 --> 00:01.000", "a", "",
                   "00:05.000 --> 00:06.000", "b", "",
                   "00:03.000 --> 00:04.000", "c"};
    auto report = check_timeline(lines);
    bool ok = check(report.cues.size() == 3, "three decodable cues");
    ok &= check(count_kind(report.issues, IssueKind::StartDecreased) == 1,
                "exactly one START_DECREASED");
    for (const auto &issue : report.issues) {
        if (issue.kind == IssueKind::StartDecreased) {
            ok &= check(issue.line_number == 9, "anchored at the third cue");
            ok &= check(issue.detail.find("prev_start=5000") != std::string::npos,
                        "detail names previous start");
        }
    }
    ok &= check(count_kind(report.issues, IssueKind::Overlap) == 1,
                "third cue also overlaps the second");
    return ok;
}

bool test_check_skips_unparseable_as_previous() {
    Lines lines = {"00:00:10.000 --> 00:00:05.000",
                   "nope --> 00:00:01.000",
                   "00:00:10.000 --> 00:00:11.000"};
    auto report = check_timeline(lines);
    bool ok = check(count_kind(report.issues, IssueKind::EndBeforeStart) == 1, "END_BEFORE_START");
    ok &= check(count_kind(report.issues, IssueKind::ParseFail) == 1, "PARSE_FAIL reported");
    // The unparseable line is never "previous": the third cue compares with the first.
    ok &= check(count_kind(report.issues, IssueKind::StartDecreased) == 0, "no START_DECREASED");
    ok &= check(count_kind(report.issues, IssueKind::Overlap) == 0,
                "start after the reversed cue's end is not an overlap");
    ok &= check(report.cues.size() == 2, "unparseable line is not a cue");
    return ok;
}

bool test_check_clean_document() {
    Lines lines = {"WEBVTT", "", "00:00.000 --> 00:01.000", "a", "",
                   "00:01.000 --> 00:02.000", "b"};
    auto report = check_timeline(lines);
    return check(report.issues.empty(), "well-formed timeline has no issues");
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_swap_keeps_settings();
    ok &= test_normalize_and_skip();
    ok &= test_fix_is_idempotent();
    ok &= test_check_start_decreased();
    ok &= test_check_skips_unparseable_as_previous();
    ok &= test_check_clean_document();
    if (!ok) {
        return 1;
    }
    std::cout << "timeline_fixer_unit OK\n";
    return 0;
}
