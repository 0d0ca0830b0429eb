#include "pch.h"
#include <envmgr/core/error.h>

namespace envmgr
{

const char* error_code_to_string(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::ValidationError:
        return "ValidationError";
    case ErrorCode::AccessDenied:
        return "AccessDenied";
    case ErrorCode::NotFound:
        return "NotFound";
    case ErrorCode::SnapshotNotFound:
        return "SnapshotNotFound";
    case ErrorCode::AlreadyExists:
        return "AlreadyExists";
    case ErrorCode::ConflictDetected:
        return "ConflictDetected";
    case ErrorCode::MalformedInput:
        return "MalformedInput";
    case ErrorCode::PartialApplyFailure:
        return "PartialApplyFailure";
    case ErrorCode::NothingToUndo:
        return "NothingToUndo";
    case ErrorCode::NothingToRedo:
        return "NothingToRedo";
    case ErrorCode::Cancelled:
        return "Cancelled";
    case ErrorCode::BackupFailed:
        return "BackupFailed";
    case ErrorCode::InvalidName:
        return "InvalidName";
    case ErrorCode::IoError:
        return "IoError";
    }
    return "Unknown";
}

const char* issue_kind_to_string(IssueKind kind)
{
    switch (kind)
    {
    case IssueKind::EmptyName:
        return "EmptyName";
    case IssueKind::IllegalCharacter:
        return "IllegalCharacter";
    case IssueKind::ReservedName:
        return "ReservedName";
    case IssueKind::TooLong:
        return "TooLong";
    case IssueKind::EmptySegment:
        return "EmptySegment";
    case IssueKind::DuplicateSegment:
        return "DuplicateSegment";
    case IssueKind::NonExistentDirectory:
        return "NonExistentDirectory";
    }
    return "Unknown";
}

std::string Error::to_string() const
{
    std::string result = std::format("{}: {}", error_code_to_string(code), message);
    if (scope)
        result += std::format(" [{}{}{}]", scope_to_string(*scope), name.empty() ? "" : "\\", name);

    if (!names.empty())
        result += std::format(" ({})", pnq::string::join(names, ", "));

    if (snapshot_id)
        result += std::format(" (snapshot {})", *snapshot_id);

    return result;
}

} // namespace envmgr
