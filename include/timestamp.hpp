//
//  timestamp.hpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vttforge {

/**
 * @brief Decode a subtitle timestamp into milliseconds.
 *
 * Accepted forms (after trimming, commas are read as periods):
 *  - pure seconds: `46.550`, `46` (rounded to the nearest millisecond)
 *  - `HH:MM:SS.mmm` and `MM:SS.mmm`
 *  - dirty fractions such as `55:56.03.800`: everything after the first period is
 *    concatenated, non-digits dropped, then cut/padded to three digits.
 *
 * Returns std::nullopt for a malformed timestamp; when @p error is given it receives the
 * reason. A malformed timestamp is never fatal for the surrounding document.
 */
std::optional<int64_t> decode_timestamp(std::string_view text, std::string *error = nullptr);

/// Render milliseconds as canonical `HH:MM:SS.mmm` (negative input clamps to zero, hours
/// are not wrapped).
std::string encode_timestamp(int64_t ms);

}  // namespace vttforge
