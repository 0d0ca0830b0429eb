#pragma once

// =============================================================================
// envmgr/core/validator.h - Pure checks for names, values and path segments
// =============================================================================

#include <envmgr/core/error.h>
#include <envmgr/core/types.h>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace envmgr
{

    /// Returns true if the (already expanded or literal) path names an existing directory.
    using DirectoryProbe = std::function<bool(std::string_view)>;

    /// Probe backed by std::filesystem.
    DirectoryProbe filesystem_directory_probe();

    /// Stateless validation used identically for interactive edits and imports.
    ///
    /// Every function returns the list of findings; an empty list means valid.
    /// Findings with fatal == false are warnings and never block an operation.
    class Validator
    {
    public:
        /// Check a variable name: EmptyName, IllegalCharacter ('=' or control characters), ReservedName.
        static std::vector<ValidationIssue> validate_name(std::string_view name);

        /// Check a value: TooLong (> 32767 UTF-16 units), IllegalCharacter (NUL, CR, LF;
        /// for PathLike also <>|*? inside a segment).
        static std::vector<ValidationIssue> validate_value(VariableKind kind, std::string_view value);

        /// Check PathLike segments: EmptySegment, DuplicateSegment (later index reported),
        /// and NonExistentDirectory warnings when @p probe is set.
        static std::vector<ValidationIssue> validate_segments(const std::vector<std::string>& segments,
                                                              const DirectoryProbe& probe = {});

        /// Name, value and (for PathLike) segment checks combined.
        static std::vector<ValidationIssue> validate_variable(const Variable& variable,
                                                              const DirectoryProbe& probe = {});

        /// True if any finding is fatal.
        static bool has_fatal(const std::vector<ValidationIssue>& issues);

        /// True if @p name is a cmd.exe dynamic pseudo variable.
        static bool is_reserved_name(std::string_view name);
    };

} // namespace envmgr
