//
//  vttforge.hpp
//  VttForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "chunker.hpp"
#include "compressor.hpp"
#include "timeline_fixer.hpp"

namespace vttforge {

/// @defgroup api VttForge Public API
/// File-level operations over WebVTT documents.
/// @{

/// Fatal failure kinds of a file-level operation. Malformed timestamps never show up
/// here; they are recovered per line.
enum class ErrorKind { None, NoCuesFound, NoCuesParsed, NoInputFiles, InvalidArgument, Io };

const char *error_kind_name(ErrorKind kind);

/**
 * @brief Result object with success flag, failure kind and optional message.
 *
 * When `ok == true`, `error` is `ErrorKind::None` and `message` is empty.
 */
struct ToolStatus {
    bool ok{false};
    ErrorKind error{ErrorKind::None};
    std::string message;
};

/// Return the VttForge version string (e.g. `v0.3` or `v0.3+abcd123`).
std::string version_string();  ///< @ingroup api

/// `dir/name.ext` + `_fixed` -> `dir/name_fixed.ext`.
std::string derived_path(const std::string &path, std::string_view suffix);

/// Regular files directly inside @p dir whose names match the glob @p pattern, sorted
/// by path. A missing directory yields an empty list.
std::vector<std::string> find_input_files(const std::string &dir, const std::string &pattern);

struct CleanReport {
    ToolStatus status;
    TimelineCheck check;
    bool fixed = false;
    std::string fixed_path;
    std::vector<FixLogEntry> fix_log;
};

/// Check a document's timeline; with @p fix also write the repaired document to
/// @p out_path (default `<stem>_fixed<ext>`).
CleanReport clean_file(const std::string &in_path, bool fix,
                       const std::string &out_path = {});  ///< @ingroup api

struct SplitReport {
    ToolStatus status;
    std::vector<std::string> written;  ///< chunk files in part order
};

/// Split a document into `<stem>_part<N>.vtt` files inside @p out_dir (default: the
/// input's directory). Nothing is written when the input holds no cues.
SplitReport split_file(const std::string &in_path, const std::string &out_dir,
                       const ChunkOptions &options);  ///< @ingroup api

struct MergeReport {
    ToolStatus status;
    std::vector<std::string> order;  ///< file names in merge order
};

/// Merge every file in @p parts_dir matching @p pattern into @p out_path.
MergeReport merge_files(const std::string &parts_dir, const std::string &pattern,
                        const std::string &out_path);  ///< @ingroup api

struct CompressReport {
    ToolStatus status;
    size_t input_cues = 0;
    size_t output_cues = 0;
    size_t skipped_cues = 0;
};

/// Fuse short adjacent cues of @p in_path into sentence-level cues written to @p out_path.
CompressReport compress_file(const std::string &in_path, const std::string &out_path,
                             const CompressOptions &options);  ///< @ingroup api

struct CleanSplitReport {
    ToolStatus status;
    std::string fixed_path;
    std::string compressed_path;  ///< empty unless the compress step ran
    std::vector<FixLogEntry> fix_log;
    CompressReport compress;
    SplitReport split;
};

/// Fix timestamps into `<stem>_fixed<ext>` (kept), then split the fixed document.
CleanSplitReport clean_split(const std::string &in_path, const std::string &out_dir,
                             const ChunkOptions &options);  ///< @ingroup api

/// Fix, compress, then split. The fixed and compressed intermediates are removed.
CleanSplitReport clean_compress_split(const std::string &in_path, const std::string &out_dir,
                                      const ChunkOptions &chunk_options,
                                      const CompressOptions &compress_options);  ///< @ingroup api

struct MergeCompressReport {
    ToolStatus status;
    MergeReport merge;
    CompressReport compress;
};

/// Merge into a temporary file next to @p out_path, compress it into @p out_path, then
/// remove the temporary file.
MergeCompressReport merge_compress(const std::string &parts_dir, const std::string &pattern,
                                   const std::string &out_path,
                                   const CompressOptions &options);  ///< @ingroup api

/// @}

}  // namespace vttforge

#ifdef VTTFORGE_TESTING
// Test-only wrappers around the composite operations' intermediate-file handling.
namespace vttforge::testing {
std::string merge_temp_path_for_test(const std::string &out_path);
void remove_intermediate_for_test(const std::string &path);
}  // namespace vttforge::testing
#endif
