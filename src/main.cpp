//
//  main.cpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <charconv>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "logging.hpp"
#include "toolkit_config.hpp"
#include "vttforge.hpp"
#include "vttforge_version.hpp"
#include <nlohmann/json.hpp>

namespace {

struct CliArgs {
    std::string command;
    std::string in_file;
    std::string out_file;
    std::string out_dir;
    std::string parts_dir;
    std::string config_path;
    bool fix = false;
    bool json = false;
    // Overrides applied on top of the options file.
    std::optional<std::string> pattern;
    std::optional<std::string> log_level;
    std::optional<int64_t> minutes;
    std::optional<int64_t> gap_ms;
    std::optional<int64_t> max_chars;
    std::optional<int64_t> show;
    bool rebase = false;
    bool start_at_zero = false;
};

void print_usage(std::ostream &os) {
    os << "VttForge " << VTTFORGE_VERSION_DISPLAY << "\n\n"
       << "usage:\n"
       << "  vttforge clean --in FILE [--out FILE] [--fix] [--show N] [--json]\n"
       << "  vttforge split --in FILE [--out_dir DIR] [--minutes N] [--rebase] [--start_at_zero]\n"
       << "  vttforge merge --parts_dir DIR [--pattern GLOB] --out FILE\n"
       << "  vttforge compress --in FILE --out FILE [--gap_ms MS] [--max_chars N]\n"
       << "  vttforge cleansplit --in FILE --out_dir DIR [--minutes N] [--rebase] "
       << "[--start_at_zero]\n"
       << "  vttforge mergecompress --parts_dir DIR [--pattern GLOB] --out FILE [--gap_ms MS] "
       << "[--max_chars N]\n"
       << "  vttforge cleancompresssplit --in FILE --out_dir DIR [--minutes N] [--gap_ms MS] "
       << "[--max_chars N] [--rebase] [--start_at_zero]\n"
       << "Options:\n"
       << "  --fix               Write normalized/fixed timestamp lines (default *_fixed.vtt).\n"
       << "  --show N            How many issues / fix entries to print (default 50).\n"
       << "  --json              Print the clean report as JSON on stdout.\n"
       << "  --minutes N         Chunk size in minutes (default 10).\n"
       << "  --rebase            Rewrite each part's timestamps to start at 00:00.\n"
       << "  --start_at_zero     Chunk from 00:00 instead of the first cue's window.\n"
       << "  --pattern GLOB      File name pattern for merging (default \"*.vtt\").\n"
       << "  --gap_ms MS         Fuse cues starting within this gap (default 500).\n"
       << "  --max_chars N       Maximum characters per fused cue (default 130).\n"
       << "  --config FILE       JSON options file; flags override its values.\n"
       << "  --log-level LEVEL   error|warn|info|debug (default: info).\n";
}

std::optional<int64_t> parse_int(std::string_view s) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

// Returns false (after printing the reason) on a usage error.
bool parse_args(int argc, char **argv, CliArgs &args) {
    args.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next_value = [&](std::string &dst) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            dst = argv[++i];
            return true;
        };
        auto next_int = [&](std::optional<int64_t> &dst) {
            std::string raw;
            if (!next_value(raw)) {
                return false;
            }
            auto v = parse_int(raw);
            if (!v) {
                std::cerr << "Invalid integer for " << arg << ": " << raw << "\n";
                return false;
            }
            dst = *v;
            return true;
        };
        auto next_opt = [&](std::optional<std::string> &dst) {
            std::string raw;
            if (!next_value(raw)) {
                return false;
            }
            dst = std::move(raw);
            return true;
        };

        bool ok = true;
        if (arg == "--in") {
            ok = next_value(args.in_file);
        } else if (arg == "--out") {
            ok = next_value(args.out_file);
        } else if (arg == "--out_dir") {
            ok = next_value(args.out_dir);
        } else if (arg == "--parts_dir") {
            ok = next_value(args.parts_dir);
        } else if (arg == "--config") {
            ok = next_value(args.config_path);
        } else if (arg == "--pattern") {
            ok = next_opt(args.pattern);
        } else if (arg == "--log-level") {
            ok = next_opt(args.log_level);
        } else if (arg == "--minutes") {
            ok = next_int(args.minutes);
        } else if (arg == "--gap_ms") {
            ok = next_int(args.gap_ms);
        } else if (arg == "--max_chars") {
            ok = next_int(args.max_chars);
        } else if (arg == "--show") {
            ok = next_int(args.show);
        } else if (arg == "--fix") {
            args.fix = true;
        } else if (arg == "--json") {
            args.json = true;
        } else if (arg == "--rebase") {
            args.rebase = true;
        } else if (arg == "--start_at_zero") {
            args.start_at_zero = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
        if (!ok) {
            return false;
        }
    }
    return true;
}

std::optional<vttforge::ToolkitConfig> build_config(const CliArgs &args) {
    vttforge::ToolkitConfig cfg;
    if (!args.config_path.empty()) {
        std::string error;
        auto loaded = vttforge::load_config_file(args.config_path, cfg, &error);
        if (!loaded) {
            std::cerr << "Invalid options file: " << error << "\n";
            return std::nullopt;
        }
        cfg = *loaded;
    }
    if (args.pattern) cfg.pattern = *args.pattern;
    if (args.log_level) cfg.log_level = *args.log_level;
    if (args.minutes) cfg.minutes = *args.minutes;
    if (args.gap_ms) cfg.gap_ms = *args.gap_ms;
    if (args.max_chars) cfg.max_chars = *args.max_chars;
    if (args.show) cfg.show = *args.show;
    cfg.rebase = cfg.rebase || args.rebase;
    cfg.start_at_zero = cfg.start_at_zero || args.start_at_zero;

    std::string error;
    if (!vttforge::validate_config(cfg, &error)) {
        std::cerr << "Invalid options: " << error << "\n";
        return std::nullopt;
    }
    return cfg;
}

bool require(const std::string &value, const char *flag, const std::string &command) {
    if (value.empty()) {
        std::cerr << command << ": " << flag << " is required\n";
        return false;
    }
    return true;
}

void emit_clean_json(const std::string &in_path, const vttforge::CleanReport &report) {
    nlohmann::json j;
    j["input"] = in_path;
    nlohmann::json issues = nlohmann::json::array();
    for (const auto &issue : report.check.issues) {
        nlohmann::json e;
        e["line"] = issue.line_number;
        e["kind"] = vttforge::issue_kind_name(issue.kind);
        e["detail"] = issue.detail;
        e["raw"] = issue.raw_line;
        issues.push_back(e);
    }
    j["issues"] = issues;
    j["cues"] = report.check.cues.size();
    if (report.fixed) {
        j["fixed_path"] = report.fixed_path;
        nlohmann::json log = nlohmann::json::array();
        for (const auto &entry : report.fix_log) {
            nlohmann::json e;
            e["line"] = entry.line_number;
            e["action"] = vttforge::fix_action_name(entry.action);
            e["detail"] = entry.detail;
            log.push_back(e);
        }
        j["fix_log"] = log;
    }
    // Cue lines are raw bytes; invalid UTF-8 becomes U+FFFD instead of throwing.
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

void print_clean_text(const std::string &in_path, const vttforge::CleanReport &report,
                      size_t show) {
    const auto &issues = report.check.issues;
    std::cout << "Checked: " << in_path << "\n";
    std::cout << "Issues found: " << issues.size() << "\n";
    for (size_t i = 0; i < issues.size() && i < show; ++i) {
        const auto &issue = issues[i];
        std::cout << "[Line " << issue.line_number << "] "
                  << vttforge::issue_kind_name(issue.kind) << ": " << issue.detail << "\n  "
                  << issue.raw_line << "\n";
    }
    if (issues.size() > show) {
        std::cout << "... (" << (issues.size() - show) << " more)\n";
    }
    if (!report.fixed) {
        return;
    }
    const auto &log = report.fix_log;
    std::cout << "\n=== Fix mode ===\n";
    std::cout << "Wrote: " << report.fixed_path << "\n";
    std::cout << "Timestamp lines normalized/swapped/skipped: " << log.size() << "\n";
    for (size_t i = 0; i < log.size() && i < show; ++i) {
        std::cout << "[Line " << log[i].line_number << "] "
                  << vttforge::fix_action_name(log[i].action) << ": " << log[i].detail << "\n";
    }
    if (log.size() > show) {
        std::cout << "... (" << (log.size() - show) << " more)\n";
    }
}

int report_failure(const std::string &command, const vttforge::ToolStatus &status) {
    VF_LOG("error", "vttforge " << command << ": "
                                << vttforge::error_kind_name(status.error) << ": "
                                << status.message);
    return 1;
}

void print_split(const vttforge::SplitReport &report, const std::string &out_dir) {
    std::cout << "Split wrote " << report.written.size() << " file(s) -> "
              << (out_dir.empty() ? std::string("<input directory>") : out_dir) << "\n";
}

void print_compress(const vttforge::CompressReport &report, const std::string &out) {
    std::cout << "Compressed cues: " << report.input_cues << " -> " << report.output_cues
              << "   Output: " << out << "\n";
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "VttForge " << VTTFORGE_VERSION_DISPLAY << "\n";
        return 0;
    }
    if (argc < 2) {
        print_usage(std::cerr);
        return 2;
    }
    if (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h") {
        print_usage(std::cout);
        return 0;
    }

    CliArgs args;
    if (!parse_args(argc, argv, args)) {
        return 2;
    }
    auto cfg = build_config(args);
    if (!cfg) {
        return 2;
    }
    vttforge::set_log_verbosity(vttforge::parse_log_verbosity(cfg->log_level));
    const std::string &cmd = args.command;

    if (cmd == "clean") {
        if (!require(args.in_file, "--in", cmd)) return 2;
        auto report = vttforge::clean_file(args.in_file, args.fix, args.out_file);
        if (!report.status.ok) return report_failure(cmd, report.status);
        if (args.json) {
            emit_clean_json(args.in_file, report);
        } else {
            print_clean_text(args.in_file, report, static_cast<size_t>(cfg->show));
        }
        return 0;
    }

    if (cmd == "split") {
        if (!require(args.in_file, "--in", cmd)) return 2;
        auto report = vttforge::split_file(args.in_file, args.out_dir, cfg->chunk_options());
        if (!report.status.ok) return report_failure(cmd, report.status);
        print_split(report, args.out_dir);
        return 0;
    }

    if (cmd == "merge") {
        if (!require(args.parts_dir, "--parts_dir", cmd) || !require(args.out_file, "--out", cmd))
            return 2;
        auto report = vttforge::merge_files(args.parts_dir, cfg->pattern, args.out_file);
        if (!report.status.ok) return report_failure(cmd, report.status);
        std::cout << "Merge order (sorted):\n";
        for (const auto &name : report.order) {
            std::cout << "   " << name << "\n";
        }
        std::cout << "\nMerged " << report.order.size() << " files -> " << args.out_file << "\n";
        return 0;
    }

    if (cmd == "compress") {
        if (!require(args.in_file, "--in", cmd) || !require(args.out_file, "--out", cmd))
            return 2;
        auto report =
            vttforge::compress_file(args.in_file, args.out_file, cfg->compress_options());
        if (!report.status.ok) return report_failure(cmd, report.status);
        print_compress(report, args.out_file);
        return 0;
    }

    if (cmd == "cleansplit") {
        if (!require(args.in_file, "--in", cmd) || !require(args.out_dir, "--out_dir", cmd))
            return 2;
        auto report = vttforge::clean_split(args.in_file, args.out_dir, cfg->chunk_options());
        if (!report.fixed_path.empty()) {
            std::cout << "Clean+fix wrote: " << report.fixed_path << "\n";
        }
        if (!report.status.ok) return report_failure(cmd, report.status);
        print_split(report.split, args.out_dir);
        return 0;
    }

    if (cmd == "mergecompress") {
        if (!require(args.parts_dir, "--parts_dir", cmd) || !require(args.out_file, "--out", cmd))
            return 2;
        auto report = vttforge::merge_compress(args.parts_dir, cfg->pattern, args.out_file,
                                               cfg->compress_options());
        if (!report.status.ok) return report_failure(cmd, report.status);
        std::cout << "Merged " << report.merge.order.size() << " files\n";
        print_compress(report.compress, args.out_file);
        return 0;
    }

    if (cmd == "cleancompresssplit") {
        if (!require(args.in_file, "--in", cmd) || !require(args.out_dir, "--out_dir", cmd))
            return 2;
        auto report = vttforge::clean_compress_split(args.in_file, args.out_dir,
                                                     cfg->chunk_options(),
                                                     cfg->compress_options());
        if (!report.status.ok) return report_failure(cmd, report.status);
        print_compress(report.compress, report.compressed_path);
        print_split(report.split, args.out_dir);
        return 0;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    print_usage(std::cerr);
    return 2;
}
