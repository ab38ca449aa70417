//
//  timestamp.cpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "timestamp.hpp"

#include <charconv>
#include <cstdio>
#include <vector>

#include "text_utils.hpp"

namespace {

constexpr int64_t kMsPerSecond = 1000;
constexpr int64_t kMsPerMinute = 60 * kMsPerSecond;
constexpr int64_t kMsPerHour = 60 * kMsPerMinute;
// Keeps hours * kMsPerHour well inside int64_t.
constexpr int64_t kMaxField = 1'000'000'000'000LL;

static bool all_digits(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!vttforge::is_digit(c)) {
            return false;
        }
    }
    return true;
}

static std::optional<int64_t> parse_field(std::string_view s) {
    if (!all_digits(s)) {
        return std::nullopt;
    }
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size() || v > kMaxField) {
        return std::nullopt;
    }
    return v;
}

static std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

static std::optional<int64_t> fail(std::string *error, std::string msg) {
    if (error) {
        *error = std::move(msg);
    }
    return std::nullopt;
}

// "46.550" style: digits with an optional single fractional group.
static bool is_pure_seconds(std::string_view s) {
    const size_t dot = s.find('.');
    if (dot == std::string_view::npos) {
        return all_digits(s);
    }
    return all_digits(s.substr(0, dot)) && all_digits(s.substr(dot + 1));
}

static std::optional<int64_t> decode_pure_seconds(std::string_view s, std::string *error) {
    const size_t dot = s.find('.');
    auto whole = parse_field(s.substr(0, dot));
    if (!whole) {
        return fail(error, "seconds value out of range: " + std::string(s));
    }
    int64_t ms = *whole * kMsPerSecond;
    if (dot != std::string_view::npos) {
        std::string_view frac = s.substr(dot + 1);
        int64_t frac_ms = 0;
        for (size_t i = 0; i < 3; ++i) {
            frac_ms = frac_ms * 10 + (i < frac.size() ? frac[i] - '0' : 0);
        }
        if (frac.size() > 3 && frac[3] >= '5') {
            ++frac_ms;  // round half up on the fourth fractional digit
        }
        ms += frac_ms;
    }
    return ms;
}

}  // namespace

namespace vttforge {

std::optional<int64_t> decode_timestamp(std::string_view text, std::string *error) {
    std::string ts = trim(text);
    for (auto &c : ts) {
        if (c == ',') {
            c = '.';
        }
    }
    if (ts.empty()) {
        return fail(error, "empty timestamp");
    }

    if (is_pure_seconds(ts)) {
        return decode_pure_seconds(ts, error);
    }

    const auto parts = split(ts, ':');
    std::string_view hh_text = "0";
    std::string_view mm_text;
    std::string_view rest;
    if (parts.size() == 3) {
        hh_text = parts[0];
        mm_text = parts[1];
        rest = parts[2];
    } else if (parts.size() == 2) {
        mm_text = parts[0];
        rest = parts[1];
    } else {
        return fail(error, "bad timestamp structure: " + ts);
    }

    // rest is "56.800" or dirty "56.03.800".
    const size_t dot = rest.find('.');
    std::string_view ss_text = rest.substr(0, dot);
    if (ss_text.empty()) {
        ss_text = "0";
    }
    std::string ms_digits;
    if (dot != std::string_view::npos) {
        for (char c : rest.substr(dot + 1)) {
            if (is_digit(c)) {
                ms_digits.push_back(c);
            }
        }
    }
    if (ms_digits.empty()) {
        ms_digits = "0";
    }
    ms_digits.resize(3, '0');

    const auto hh = parse_field(hh_text);
    const auto mm = parse_field(mm_text);
    const auto ss = parse_field(ss_text);
    if (!hh || !mm || !ss) {
        return fail(error, "non-numeric timestamp field: " + ts);
    }
    const int64_t mmm = (ms_digits[0] - '0') * 100 + (ms_digits[1] - '0') * 10 +
                        (ms_digits[2] - '0');
    return *hh * kMsPerHour + *mm * kMsPerMinute + *ss * kMsPerSecond + mmm;
}

std::string encode_timestamp(int64_t ms) {
    if (ms < 0) {
        ms = 0;
    }
    const int64_t hh = ms / kMsPerHour;
    ms %= kMsPerHour;
    const int64_t mm = ms / kMsPerMinute;
    ms %= kMsPerMinute;
    const int64_t ss = ms / kMsPerSecond;
    const int64_t mmm = ms % kMsPerSecond;
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld.%03lld", static_cast<long long>(hh),
                  static_cast<long long>(mm), static_cast<long long>(ss),
                  static_cast<long long>(mmm));
    return buf;
}

}  // namespace vttforge
