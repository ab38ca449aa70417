//
//  toolkit_config.hpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "chunker.hpp"
#include "compressor.hpp"
#include "logging.hpp"

namespace vttforge {

/**
 * @brief Tunables shared by all commands.
 *
 * Built from the defaults below, optionally overridden by a JSON options file, then by
 * command-line flags. Example file:
 *
 *     { "minutes": 5, "gap_ms": 300, "max_chars": 100, "pattern": "*english.vtt" }
 */
struct ToolkitConfig {
    int64_t minutes = 10;
    bool rebase = false;
    bool start_at_zero = false;
    int64_t gap_ms = 500;
    int64_t max_chars = 130;
    int64_t show = 50;  ///< how many issues / fix entries `clean` prints
    std::string pattern = "*.vtt";
    std::string log_level = "info";

    ChunkOptions chunk_options() const;
    CompressOptions compress_options() const;
};

/// Parse an options document. Unknown keys are ignored; a malformed document or a value of
/// the wrong type yields std::nullopt and @p error receives the reason.
std::optional<ToolkitConfig> parse_config(const std::string &json_text,
                                          const ToolkitConfig &defaults = {},
                                          std::string *error = nullptr);

/// Load and parse an options file.
std::optional<ToolkitConfig> load_config_file(const std::string &path,
                                              const ToolkitConfig &defaults = {},
                                              std::string *error = nullptr);

/// Range checks on the merged configuration (positive minutes, non-negative gap, ...).
bool validate_config(const ToolkitConfig &config, std::string *error = nullptr);

}  // namespace vttforge
