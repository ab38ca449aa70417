//
//  merger.cpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "merger.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <tuple>

#include "cue_parser.hpp"
#include "logging.hpp"
#include "text_utils.hpp"

namespace {

constexpr std::string_view kPartToken = "part";

static bool is_part_separator(char c) {
    return vttforge::is_space(c) || c == '_' || c == '-' || c == '.';
}

static void trim_blank_edges(vttforge::Lines &lines) {
    auto first = std::find_if(lines.begin(), lines.end(),
                              [](const std::string &l) { return !vttforge::is_blank(l); });
    lines.erase(lines.begin(), first);
    while (!lines.empty() && vttforge::is_blank(lines.back())) {
        lines.pop_back();
    }
}

}  // namespace

namespace vttforge {

std::optional<uint64_t> part_number_from_name(std::string_view stem) {
    for (size_t i = 0; i + kPartToken.size() <= stem.size(); ++i) {
        if (i > 0 && is_ascii_alpha(stem[i - 1])) {
            continue;
        }
        if (!starts_with_ci(stem.substr(i), kPartToken)) {
            continue;
        }
        size_t p = i + kPartToken.size();
        while (p < stem.size() && is_part_separator(stem[p])) {
            ++p;
        }
        size_t digits_end = p;
        while (digits_end < stem.size() && is_digit(stem[digits_end])) {
            ++digits_end;
        }
        if (digits_end == p) {
            continue;
        }
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(stem.data() + p, stem.data() + digits_end, value);
        if (ec != std::errc() || ptr != stem.data() + digits_end) {
            continue;
        }
        return value;
    }
    return std::nullopt;
}

std::optional<int64_t> first_cue_start_ms(const Lines &lines) {
    const auto doc = split_header_and_body(lines);
    const auto scan = parse_cues(doc.body);
    if (scan.cues.empty()) {
        return std::nullopt;
    }
    return scan.cues.front().start_ms;
}

MergeKey merge_key(const MergeInput &input) {
    MergeKey key;
    key.first_start_ms = first_cue_start_ms(input.lines).value_or(kNoCueStartMs);
    const std::string stem = std::filesystem::path(input.name).stem().string();
    key.part_number = part_number_from_name(stem).value_or(kNoPartNumber);
    key.lowered_name = to_lower_ascii(input.name);
    return key;
}

MergeResult merge_documents(const std::vector<MergeInput> &inputs) {
    MergeResult result;
    if (inputs.empty()) {
        return result;
    }

    struct Keyed {
        MergeKey key;
        const MergeInput *input;
    };
    std::vector<Keyed> keyed;
    keyed.reserve(inputs.size());
    for (const auto &in : inputs) {
        keyed.push_back(Keyed{merge_key(in), &in});
        VF_LOG("merge", "candidate " << in.name << " first_start_ms="
                                     << (keyed.back().key.first_start_ms == kNoCueStartMs
                                             ? std::string("<none>")
                                             : std::to_string(keyed.back().key.first_start_ms))
                                     << " part="
                                     << (keyed.back().key.part_number == kNoPartNumber
                                             ? std::string("<none>")
                                             : std::to_string(keyed.back().key.part_number)));
    }
    std::stable_sort(keyed.begin(), keyed.end(), [](const Keyed &a, const Keyed &b) {
        return std::tie(a.key.first_start_ms, a.key.part_number, a.key.lowered_name) <
               std::tie(b.key.first_start_ms, b.key.part_number, b.key.lowered_name);
    });

    bool header_written = false;
    for (const auto &k : keyed) {
        auto doc = split_header_and_body(k.input->lines);
        if (!header_written) {
            const Lines &header = doc.header.empty() ? default_header() : doc.header;
            result.lines.insert(result.lines.end(), header.begin(), header.end());
            if (!result.lines.empty() && !is_blank(result.lines.back())) {
                result.lines.emplace_back();
            }
            header_written = true;
        }
        trim_blank_edges(doc.body);
        if (!doc.body.empty()) {
            result.lines.insert(result.lines.end(), doc.body.begin(), doc.body.end());
            result.lines.emplace_back();
        }
        result.order.push_back(k.input->name);
    }

    // The written document ends right after its last non-blank line.
    while (!result.lines.empty() && is_blank(result.lines.back())) {
        result.lines.pop_back();
    }
    if (!result.lines.empty()) {
        result.lines.back() = rtrim(result.lines.back());
    }
    VF_LOG("merge", "merge_documents inputs=" << inputs.size()
                                              << " lines=" << result.lines.size());
    return result;
}

}  // namespace vttforge
