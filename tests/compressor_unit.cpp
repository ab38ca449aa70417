// Text cleanup, the fusion predicate and the compression fold.
#include <string>
#include <vector>

#include "compressor.hpp"
#include "logging.hpp"
#include "test_utils.hpp"
#include "text_utils.hpp"

using namespace vttforge;

namespace {

bool check(bool cond, const std::string &msg) { return test_utils::check("compressor_unit", cond, msg); }

bool test_clean_text() {
    bool ok = check(clean_cue_text("<v Speaker>Welcome   back</v>") == "Welcome back", "voice tag");
    ok &= check(clean_cue_text("  <i> spaced </i>  ") == "spaced", "tags then trim");
    ok &= check(clean_cue_text("a <> b") == "a <> b", "empty tag kept");
    ok &= check(clean_cue_text("3 < 4") == "3 < 4", "unclosed bracket kept");
    ok &= check(clean_cue_text("line\tone\n two") == "line one two", "whitespace collapsed");
    ok &= check(clean_cue_text("").empty(), "empty");
    ok &= check(clean_cue_text("\xE4\xBD\xA0\xE5\xA5\xBD\xE3\x80\x80\xE3\x80\x80\xE4\xB8\x96\xE7\x95\x8C") ==
                    "\xE4\xBD\xA0\xE5\xA5\xBD \xE4\xB8\x96\xE7\x95\x8C",
                "ideographic spaces collapsed");
    ok &= check(clean_cue_text("\xC2\xA0" "caf\xC3\xA9\xC2\xA0\xC2\xA0noir\xE2\x80\xAF") ==
                    "caf\xC3\xA9 noir",
                "no-break spaces collapsed and trimmed");
    ok &= check(clean_cue_text("\xC3\xA0 la") == "\xC3\xA0 la", "accented letters untouched");
    return ok;
}

bool test_sentence_end() {
    bool ok = check(ends_sentence("Done."), "period");
    ok &= check(ends_sentence("Really?</i>"), "terminal before markup");
    ok &= check(ends_sentence("\xE5\xA5\xBD\xE3\x80\x82"), "CJK full stop");
    ok &= check(ends_sentence("\xE5\x90\x97\xEF\xBC\x9F"), "full-width question mark");
    ok &= check(ends_sentence("wait\xE2\x80\xA6"), "ellipsis");
    ok &= check(ends_sentence("   "), "empty text counts as ended");
    ok &= check(!ends_sentence("and then"), "open clause");
    ok &= check(!ends_sentence("e.g,"), "comma");
    return ok;
}

bool test_decisions() {
    CompressOptions opts;
    CompressCue hello{0, 1000, "Hello"};
    bool ok = check(fuse_decision(hello, CompressCue{1200, 2000, "world."}, opts) ==
                        FuseDecision::Fuse,
                    "small gap, open clause, short text fuse");
    ok &= check(fuse_decision(hello, CompressCue{1501, 2000, "x"}, opts) ==
                    FuseDecision::GapTooLarge,
                "gap above threshold");
    ok &= check(fuse_decision(hello, CompressCue{1500, 2000, "x"}, opts) == FuseDecision::Fuse,
                "gap equal to threshold still fuses");
    ok &= check(fuse_decision(CompressCue{0, 1000, "Done."}, CompressCue{1000, 2000, "x"}, opts) ==
                    FuseDecision::SentenceComplete,
                "terminal text blocks fusion even at gap 0");
    ok &= check(fuse_decision(hello, CompressCue{500, 900, "overlap"}, opts) == FuseDecision::Fuse,
                "negative gap fuses");

    CompressOptions tight{500, 11};
    ok &= check(fuse_decision(hello, CompressCue{1000, 2000, "world"}, tight) == FuseDecision::Fuse,
                "5 + 1 + 5 fits in 11");
    ok &= check(fuse_decision(hello, CompressCue{1000, 2000, "worlds"}, tight) ==
                    FuseDecision::TooLong,
                "5 + 1 + 6 exceeds 11");
    // Code points, not bytes: three CJK characters are 9 bytes but length 3.
    CompressCue cjk{0, 1000, "\xE4\xBD\xA0\xE5\xA5\xBD\xE5\x90\x97"};
    ok &= check(utf8_length(cjk.text) == 3, "utf8 length");
    ok &= check(fuse_decision(cjk, CompressCue{1000, 2000, "abcdefg"}, tight) ==
                    FuseDecision::Fuse,
                "3 + 1 + 7 fits in 11");
    ok &= check(std::string(fuse_decision_name(FuseDecision::TooLong)) == "length", "names");
    return ok;
}

bool test_accumulator() {
    CompressOptions opts;
    CueAccumulator acc(CompressCue{0, 1000, "Hello"});
    bool ok = check(!acc.absorb(CompressCue{1200, 2000, "world."}, opts).has_value(), "fused");
    ok &= check(acc.current().text == "Hello world." && acc.current().end_ms == 2000,
                "text joined and end extended");
    auto flushed = acc.absorb(CompressCue{2000, 3000, "Next"}, opts);
    ok &= check(flushed && flushed->text == "Hello world." && flushed->start_ms == 0,
                "terminal cue flushed");
    ok &= check(acc.current().text == "Next" && acc.current().start_ms == 2000,
                "accumulator restarts from the next cue");

    CueAccumulator inner(CompressCue{0, 5000, "long"});
    (void)inner.absorb(CompressCue{1000, 2000, "short"}, opts);
    ok &= check(inner.current().end_ms == 5000, "end never shrinks");
    return ok;
}

bool test_fuse_and_render() {
    std::vector<CompressCue> cues = {CompressCue{3000, 4000, "Second sentence."},
                                     CompressCue{0, 1000, "Hello"},
                                     CompressCue{1200, 2000, "world."},
                                     CompressCue{9000, 9500, ""}};
    auto fused = fuse_cues(cues, CompressOptions{});
    bool ok = check(fused.size() == 3, "four cues fold into three: got " +
                                           std::to_string(fused.size()));
    if (fused.size() != 3) {
        return false;
    }
    ok &= check(fused[0].text == "Hello world." && fused[0].end_ms == 2000, "sorted then fused");
    ok &= check(fused[1].start_ms == 3000, "gap splits");

    auto lines = render_compressed(fused);
    Lines expected = {"WEBVTT",
                      "",
                      "00:00:00.000 --> 00:00:02.000",
                      "Hello world.",
                      "",
                      "00:00:03.000 --> 00:00:04.000",
                      "Second sentence.",
                      "",
                      "00:00:09.000 --> 00:00:09.500"};
    ok &= check(lines == expected, "canonical blocks, empty text omitted, no trailing blank");
    ok &= check(fuse_cues({}, CompressOptions{}).empty(), "no cues");
    return ok;
}

bool test_scan() {
    Lines doc = {"WEBVTT",
                 "",
                 "intro",
                 "00:00:01.000 --> 00:00:02.000 align:start",
                 "  <b>multi</b>  ",
                 "line  ",
                 "",
                 "broken --> 00:00:03.000",
                 "dropped",
                 "",
                 "00:00:04.000 --> 00:00:05.000",
                 "tail"};
    auto scan = scan_compress_cues(doc);
    bool ok = check(scan.cues.size() == 2, "two usable cues");
    ok &= check(scan.skipped.size() == 1, "malformed cue skipped");
    if (scan.cues.size() == 2) {
        ok &= check(scan.cues[0].text == "multi line", "text lines joined and cleaned");
        ok &= check(scan.cues[1].text == "tail", "last cue");
    }
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_clean_text();
    ok &= test_sentence_end();
    ok &= test_decisions();
    ok &= test_accumulator();
    ok &= test_fuse_and_render();
    ok &= test_scan();
    if (!ok) {
        return 1;
    }
    std::cout << "compressor_unit OK\n";
    return 0;
}
