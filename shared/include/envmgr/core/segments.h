#pragma once

// =============================================================================
// envmgr/core/segments.h - PathLike value helpers
// =============================================================================

#include <envmgr/core/types.h>
#include <string>
#include <string_view>
#include <vector>

namespace envmgr
{

    /// Split a PathLike value on ';'. Empty segments are kept, order is preserved.
    /// An empty value yields an empty list.
    std::vector<std::string> split_segments(std::string_view value);

    /// Join segments with ';'.
    std::string join_segments(const std::vector<std::string>& segments);

    /// Canonical form used to compare segments:
    /// trimmed, surrounding quotes removed, '/' as '\', trailing separators removed, lowercased.
    std::string segment_key(std::string_view segment);

    /// Clean up a user supplied segment (trim, strip quotes) without changing case or separators.
    std::string tidy_segment(std::string_view segment);

    /// Kind of a variable name: PathLike if it matches (case-insensitive) one of @p path_like_names.
    VariableKind classify(std::string_view name, const std::vector<std::string>& path_like_names);

    /// Split a ';' separated list of names from configuration.
    std::vector<std::string> parse_name_list(std::string_view list);

} // namespace envmgr
