#pragma once

// =============================================================================
// envmgr/core/error.h - Error codes and typed results
// =============================================================================

#include <envmgr/core/types.h>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace envmgr
{

    enum class ErrorCode
    {
        ValidationError,
        AccessDenied,
        NotFound,
        SnapshotNotFound,
        AlreadyExists,
        ConflictDetected,
        MalformedInput,
        PartialApplyFailure,
        NothingToUndo,
        NothingToRedo,
        Cancelled,
        BackupFailed,
        InvalidName,
        IoError
    };

    const char* error_code_to_string(ErrorCode code);

    /// Category of a validation finding.
    enum class IssueKind
    {
        EmptyName,
        IllegalCharacter,
        ReservedName,
        TooLong,
        EmptySegment,
        DuplicateSegment,
        NonExistentDirectory
    };

    const char* issue_kind_to_string(IssueKind kind);

    /// A single validator finding.
    struct ValidationIssue
    {
        IssueKind kind;
        std::string message;
        std::optional<size_t> segment_index; ///< Set for segment-level findings
        bool fatal = true;                   ///< false for warnings (NonExistentDirectory)

        bool operator==(const ValidationIssue& other) const = default;
    };

    /// Failure returned from every engine boundary.
    struct Error
    {
        ErrorCode code = ErrorCode::IoError;
        std::string message;
        std::optional<Scope> scope;
        std::string name;
        std::vector<std::string> names;          ///< Conflicting names, or records applied before a partial failure
        std::vector<ValidationIssue> issues;     ///< Validator findings for ValidationError
        std::optional<std::string> snapshot_id;  ///< Pre-mutation snapshot, if one was taken

        /// Human readable one-line summary.
        std::string to_string() const;
    };

    template <typename T>
    using Result = std::expected<T, Error>;

    /// Shorthand for building an unexpected Error.
    inline std::unexpected<Error> make_error(ErrorCode code, std::string message)
    {
        return std::unexpected<Error>{Error{code, std::move(message)}};
    }

    inline std::unexpected<Error> make_error(ErrorCode code, std::string message, Scope scope, std::string name)
    {
        Error error{code, std::move(message)};
        error.scope = scope;
        error.name = std::move(name);
        return std::unexpected<Error>{std::move(error)};
    }

} // namespace envmgr
