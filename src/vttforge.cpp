//
//  vttforge.cpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "vttforge.hpp"
#include "vttforge_version.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>

#include "cue_parser.hpp"
#include "logging.hpp"
#include "merger.hpp"
#include "vtt_document.hpp"

namespace fs = std::filesystem;

namespace vttforge {

std::string version_string() { return VTTFORGE_VERSION_DISPLAY; }

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::NoCuesFound:
            return "NoCuesFound";
        case ErrorKind::NoCuesParsed:
            return "NoCuesParsed";
        case ErrorKind::NoInputFiles:
            return "NoInputFiles";
        case ErrorKind::InvalidArgument:
            return "InvalidArgument";
        case ErrorKind::Io:
            return "Io";
    }
    return "Unknown";
}

}  // namespace vttforge

namespace {

using vttforge::ErrorKind;
using vttforge::ToolStatus;

ToolStatus make_status(bool ok, ErrorKind error = ErrorKind::None, std::string msg = {}) {
    return ToolStatus{ok, error, std::move(msg)};
}

ToolStatus failure(ErrorKind error, std::string msg) {
    VF_LOG("error", msg);
    return make_status(false, error, std::move(msg));
}

// Best-effort removal of files this invocation no longer needs; failure only warns.
void remove_intermediate(const std::string &path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) {
        VF_LOG("warn", "could not remove intermediate file " << path << ": " << ec.message());
        return;
    }
    if (removed) {
        VF_LOG("io", "removed intermediate file " << path);
    }
}

std::string merge_temp_path(const std::string &out_path) {
    const fs::path out(out_path);
    return (out.parent_path() / (out.stem().string() + "_tmp_merged.vtt")).string();
}

long long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - since)
        .count();
}

}  // namespace

namespace vttforge {

std::string derived_path(const std::string &path, std::string_view suffix) {
    const fs::path p(path);
    fs::path out = p.parent_path() / (p.stem().string() + std::string(suffix) +
                                      p.extension().string());
    return out.string();
}

std::vector<std::string> find_input_files(const std::string &dir, const std::string &pattern) {
    std::vector<std::string> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        VF_LOG("warn", "input directory not found: " << dir);
        return files;
    }
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        const std::string name = it->path().filename().string();
        if (::fnmatch(pattern.c_str(), name.c_str(), 0) == 0) {
            files.push_back(it->path().string());
        }
    }
    if (ec) {
        VF_LOG("warn", "directory scan of " << dir << " stopped early: " << ec.message());
    }
    std::sort(files.begin(), files.end());
    VF_LOG("io", "find_input_files dir=" << dir << " pattern=" << pattern
                                         << " matches=" << files.size());
    return files;
}

CleanReport clean_file(const std::string &in_path, bool fix, const std::string &out_path) {
    CleanReport report;
    auto lines = read_vtt_lines(in_path);
    if (!lines) {
        report.status = failure(ErrorKind::Io, "Failed to read " + in_path);
        return report;
    }
    report.check = check_timeline(*lines);
    if (!fix) {
        report.status = make_status(true);
        return report;
    }

    auto fixed = fix_timeline(*lines);
    report.fixed_path = out_path.empty() ? derived_path(in_path, "_fixed") : out_path;
    if (!write_vtt_lines(report.fixed_path, fixed.lines)) {
        report.status = failure(ErrorKind::Io, "Failed to write " + report.fixed_path);
        return report;
    }
    report.fixed = true;
    report.fix_log = std::move(fixed.log);
    report.status = make_status(true);
    return report;
}

SplitReport split_file(const std::string &in_path, const std::string &out_dir,
                       const ChunkOptions &options) {
    const auto t0 = std::chrono::steady_clock::now();
    SplitReport report;
    if (options.chunk_ms <= 0) {
        report.status = failure(ErrorKind::InvalidArgument,
                                "chunk length must be positive, got " +
                                    std::to_string(options.chunk_ms) + " ms");
        return report;
    }
    auto lines = read_vtt_lines(in_path);
    if (!lines) {
        report.status = failure(ErrorKind::Io, "Failed to read " + in_path);
        return report;
    }
    const auto doc = split_header_and_body(*lines);
    const auto scan = parse_cues(doc.body);
    if (scan.cues.empty()) {
        report.status = failure(ErrorKind::NoCuesFound,
                                "No cues found in " + in_path +
                                    ". Is this a valid VTT with timestamp lines?");
        return report;
    }
    if (!scan.skipped.empty()) {
        VF_LOG("warn", "split: " << scan.skipped.size() << " cue(s) with malformed timestamps "
                                 << "dropped from " << in_path);
    }

    const fs::path base_dir = out_dir.empty() ? fs::path(in_path).parent_path() : fs::path(out_dir);
    std::error_code ec;
    if (!base_dir.empty()) {
        fs::create_directories(base_dir, ec);
        if (ec) {
            report.status = failure(ErrorKind::Io, "Failed to create output directory " +
                                                       base_dir.string() + ": " + ec.message());
            return report;
        }
    }

    const std::string stem = fs::path(in_path).stem().string();
    const auto chunks = render_chunks(doc.header, scan.cues, options);
    for (const auto &chunk : chunks) {
        const std::string path =
            (base_dir / (stem + "_part" + std::to_string(chunk.part_number) + ".vtt")).string();
        if (!write_vtt_lines(path, chunk.lines)) {
            // Leave no partial set of parts behind.
            for (const auto &w : report.written) {
                remove_intermediate(w);
            }
            report.written.clear();
            report.status = failure(ErrorKind::Io, "Failed to write " + path);
            return report;
        }
        report.written.push_back(path);
    }
    VF_LOG("split", "split_file input=" << in_path << " parts=" << report.written.size()
                                       << " timings ms total=" << elapsed_ms(t0));
    report.status = make_status(true);
    return report;
}

MergeReport merge_files(const std::string &parts_dir, const std::string &pattern,
                        const std::string &out_path) {
    const auto t0 = std::chrono::steady_clock::now();
    MergeReport report;
    const auto files = find_input_files(parts_dir, pattern);
    if (files.empty()) {
        report.status = failure(ErrorKind::NoInputFiles, "No VTT files found in: " + parts_dir +
                                                             " (pattern=" + pattern + ")");
        return report;
    }

    std::vector<MergeInput> inputs;
    inputs.reserve(files.size());
    for (const auto &f : files) {
        auto lines = read_vtt_lines(f);
        if (!lines) {
            report.status = failure(ErrorKind::Io, "Failed to read " + f);
            return report;
        }
        inputs.push_back(MergeInput{fs::path(f).filename().string(), std::move(*lines)});
    }

    auto merged = merge_documents(inputs);
    if (!write_vtt_lines(out_path, merged.lines)) {
        report.status = failure(ErrorKind::Io, "Failed to write " + out_path);
        return report;
    }
    report.order = std::move(merged.order);
    VF_LOG("merge", "merge_files inputs=" << files.size() << " output=" << out_path
                                          << " timings ms total=" << elapsed_ms(t0));
    report.status = make_status(true);
    return report;
}

CompressReport compress_file(const std::string &in_path, const std::string &out_path,
                             const CompressOptions &options) {
    const auto t0 = std::chrono::steady_clock::now();
    CompressReport report;
    if (options.gap_ms < 0) {
        report.status = failure(ErrorKind::InvalidArgument,
                                "gap threshold must not be negative, got " +
                                    std::to_string(options.gap_ms) + " ms");
        return report;
    }
    auto lines = read_vtt_lines(in_path);
    if (!lines) {
        report.status = failure(ErrorKind::Io, "Failed to read " + in_path);
        return report;
    }
    auto scan = scan_compress_cues(*lines);
    report.input_cues = scan.cues.size();
    report.skipped_cues = scan.skipped.size();
    if (scan.cues.empty()) {
        report.status = failure(ErrorKind::NoCuesParsed,
                                "No cues parsed for compression in " + in_path +
                                    ". Is the input a valid VTT?");
        return report;
    }

    const auto merged = fuse_cues(std::move(scan.cues), options);
    report.output_cues = merged.size();
    if (!write_vtt_lines(out_path, render_compressed(merged))) {
        report.status = failure(ErrorKind::Io, "Failed to write " + out_path);
        return report;
    }
    VF_LOG("compress", "compress_file cues " << report.input_cues << " -> " << report.output_cues
                                             << " gap_ms=" << options.gap_ms
                                             << " max_chars=" << options.max_chars
                                             << " timings ms total=" << elapsed_ms(t0));
    report.status = make_status(true);
    return report;
}

CleanSplitReport clean_split(const std::string &in_path, const std::string &out_dir,
                             const ChunkOptions &options) {
    CleanSplitReport report;
    auto clean = clean_file(in_path, true);
    if (!clean.status.ok) {
        report.status = clean.status;
        return report;
    }
    report.fixed_path = clean.fixed_path;
    report.fix_log = std::move(clean.fix_log);

    report.split = split_file(report.fixed_path, out_dir, options);
    report.status = report.split.status;
    return report;
}

CleanSplitReport clean_compress_split(const std::string &in_path, const std::string &out_dir,
                                      const ChunkOptions &chunk_options,
                                      const CompressOptions &compress_options) {
    CleanSplitReport report;
    auto clean = clean_file(in_path, true);
    if (!clean.status.ok) {
        report.status = clean.status;
        return report;
    }
    report.fixed_path = clean.fixed_path;
    report.fix_log = std::move(clean.fix_log);

    report.compressed_path = derived_path(in_path, "_compressed");
    report.compress = compress_file(report.fixed_path, report.compressed_path, compress_options);
    remove_intermediate(report.fixed_path);
    if (!report.compress.status.ok) {
        report.status = report.compress.status;
        return report;
    }

    report.split = split_file(report.compressed_path, out_dir, chunk_options);
    remove_intermediate(report.compressed_path);
    report.status = report.split.status;
    return report;
}

MergeCompressReport merge_compress(const std::string &parts_dir, const std::string &pattern,
                                   const std::string &out_path, const CompressOptions &options) {
    MergeCompressReport report;
    const std::string tmp_merged = merge_temp_path(out_path);

    report.merge = merge_files(parts_dir, pattern, tmp_merged);
    if (!report.merge.status.ok) {
        remove_intermediate(tmp_merged);
        report.status = report.merge.status;
        return report;
    }
    report.compress = compress_file(tmp_merged, out_path, options);
    remove_intermediate(tmp_merged);
    report.status = report.compress.status;
    return report;
}

}  // namespace vttforge

#ifdef VTTFORGE_TESTING
namespace vttforge::testing {
std::string merge_temp_path_for_test(const std::string &out_path) {
    return merge_temp_path(out_path);
}
void remove_intermediate_for_test(const std::string &path) { remove_intermediate(path); }
}  // namespace vttforge::testing
#endif
