//
//  toolkit_config.cpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "toolkit_config.hpp"

#include <cerrno>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

bool set_error(std::string *error, std::string msg) {
    if (error) {
        *error = std::move(msg);
    }
    return false;
}

}  // namespace

namespace vttforge {

ChunkOptions ToolkitConfig::chunk_options() const {
    ChunkOptions o;
    o.chunk_ms = minutes * kMsPerMinute;
    o.rebase = rebase;
    o.start_at_zero = start_at_zero;
    return o;
}

CompressOptions ToolkitConfig::compress_options() const {
    CompressOptions o;
    o.gap_ms = gap_ms;
    o.max_chars = max_chars < 0 ? 0 : static_cast<size_t>(max_chars);
    return o;
}

std::optional<ToolkitConfig> parse_config(const std::string &json_text,
                                          const ToolkitConfig &defaults, std::string *error) {
    json j = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        set_error(error, "options file is not valid JSON");
        return std::nullopt;
    }
    if (!j.is_object()) {
        set_error(error, "options file must contain a JSON object");
        return std::nullopt;
    }

    ToolkitConfig cfg = defaults;
    try {
        cfg.minutes = j.value("minutes", cfg.minutes);
        cfg.rebase = j.value("rebase", cfg.rebase);
        cfg.start_at_zero = j.value("start_at_zero", cfg.start_at_zero);
        cfg.gap_ms = j.value("gap_ms", cfg.gap_ms);
        cfg.max_chars = j.value("max_chars", cfg.max_chars);
        cfg.show = j.value("show", cfg.show);
        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.log_level = j.value("log_level", cfg.log_level);
    } catch (const json::exception &e) {
        set_error(error, std::string("bad option value: ") + e.what());
        return std::nullopt;
    }
    VF_LOG("config", "options minutes=" << cfg.minutes << " gap_ms=" << cfg.gap_ms
                                        << " max_chars=" << cfg.max_chars
                                        << " pattern=" << cfg.pattern);
    return cfg;
}

std::optional<ToolkitConfig> load_config_file(const std::string &path,
                                              const ToolkitConfig &defaults, std::string *error) {
    std::ifstream f(path);
    if (!f.is_open()) {
        set_error(error, "open failed for " + path + " (" +
                             std::generic_category().message(errno) + ")");
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    std::string reason;
    auto cfg = parse_config(ss.str(), defaults, &reason);
    if (!cfg) {
        set_error(error, path + ": " + reason);
    }
    return cfg;
}

bool validate_config(const ToolkitConfig &config, std::string *error) {
    if (config.minutes <= 0) {
        return set_error(error, "minutes must be positive");
    }
    if (config.minutes > std::numeric_limits<int64_t>::max() / kMsPerMinute) {
        return set_error(error, "minutes too large: " + std::to_string(config.minutes));
    }
    if (config.gap_ms < 0) {
        return set_error(error, "gap_ms must not be negative");
    }
    if (config.max_chars < 0) {
        return set_error(error, "max_chars must not be negative");
    }
    if (config.show < 0) {
        return set_error(error, "show must not be negative");
    }
    if (config.pattern.empty()) {
        return set_error(error, "pattern must not be empty");
    }
    const std::string &lvl = config.log_level;
    if (lvl != "error" && lvl != "warn" && lvl != "warning" && lvl != "info" && lvl != "debug") {
        return set_error(error, "unknown log level: " + lvl);
    }
    return true;
}

}  // namespace vttforge
