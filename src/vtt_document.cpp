//
//  vtt_document.cpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "vtt_document.hpp"

#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "logging.hpp"
#include "text_utils.hpp"

namespace vttforge {

Lines default_header() { return {std::string(kVttSignature), ""}; }

Lines split_lines(std::string_view text) {
    text = strip_bom(text);
    Lines lines;
    std::string cur;
    bool pending = false;  // true once cur holds (possibly empty) content of an open line
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\r' || c == '\n') {
            lines.push_back(std::move(cur));
            cur.clear();
            pending = false;
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            continue;
        }
        cur.push_back(c);
        pending = true;
    }
    if (pending) {
        lines.push_back(std::move(cur));
    }
    return lines;
}

std::string join_lines(const Lines &lines) {
    std::string out;
    for (const auto &l : lines) {
        out += l;
        out += '\n';
    }
    return out;
}

SplitDocument split_header_and_body(const Lines &lines) {
    SplitDocument doc;
    size_t i = 0;
    while (i < lines.size() && is_blank(lines[i])) {
        ++i;
    }

    bool has_signature = false;
    if (i < lines.size()) {
        const std::string_view first = strip_bom(lines[i]);
        if (starts_with_ci(trim_view(first), kVttSignature)) {
            doc.header.emplace_back(first);
            has_signature = true;
            ++i;
        }
    }

    if (has_signature) {
        // Optional metadata until the first blank line.
        while (i < lines.size() && !is_blank(lines[i])) {
            doc.header.push_back(lines[i]);
            ++i;
        }
        // Separator.
        while (i < lines.size() && is_blank(lines[i])) {
            doc.header.push_back(lines[i]);
            ++i;
        }
    }

    doc.body.assign(lines.begin() + static_cast<std::ptrdiff_t>(i), lines.end());
    VF_LOG("doc", "split_header_and_body header_lines=" << doc.header.size()
                                                        << " body_lines=" << doc.body.size());
    return doc;
}

std::optional<Lines> read_vtt_lines(const std::string &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        VF_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        VF_LOG("error", "read failed for " << path);
        return std::nullopt;
    }
    return split_lines(ss.str());
}

bool write_text_file(const std::string &path, const std::string &text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        VF_LOG("error", "Failed to open output for write: " << path << " errno=" << errno
                                                            << " ("
                                                            << std::generic_category().message(errno)
                                                            << ")");
        return false;
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out.good()) {
        VF_LOG("error", "write failed for " << path);
        out.close();
        // Drop the truncated file; device nodes and the like are left alone.
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            std::filesystem::remove(path, ec);
        }
        return false;
    }
    return true;
}

bool write_vtt_lines(const std::string &path, const Lines &lines) {
    return write_text_file(path, join_lines(lines));
}

}  // namespace vttforge
