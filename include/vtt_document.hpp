//
//  vtt_document.hpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vttforge {

inline constexpr std::string_view kVttSignature = "WEBVTT";

/// Lines are stored without terminators.
using Lines = std::vector<std::string>;

/// Header = signature + metadata + blank separator; body = everything after, unparsed.
struct SplitDocument {
    Lines header;
    Lines body;
};

/// Header written when a source document carries none: signature plus one blank line.
Lines default_header();

/// Split raw text into lines: strips a leading UTF-8 BOM and treats \r\n, \r and \n alike.
/// A terminator at the very end does not produce an extra empty line.
Lines split_lines(std::string_view text);

/// Join lines for writing: every line is followed by "\n".
std::string join_lines(const Lines &lines);

/// Separate header from body. Never fails; without a signature line the header is empty
/// and the body starts at the first non-blank line.
SplitDocument split_header_and_body(const Lines &lines);

/// Read a whole document from disk. Returns std::nullopt when the file cannot be read.
std::optional<Lines> read_vtt_lines(const std::string &path);

/// Write text to disk (UTF-8, no BOM). Returns false on open/write failure.
bool write_text_file(const std::string &path, const std::string &text);

/// Write lines to disk, each followed by "\n".
bool write_vtt_lines(const std::string &path, const Lines &lines);

}  // namespace vttforge
