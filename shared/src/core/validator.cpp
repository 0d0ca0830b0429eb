#include "pch.h"
#include <envmgr/core/validator.h>
#include <envmgr/core/config.h>
#include <envmgr/core/segments.h>

namespace envmgr
{

namespace
{

// Dynamic variables cmd.exe synthesizes; a stored variable of the same name shadows them.
constexpr std::string_view RESERVED_NAMES[] = {
    "CD", "DATE", "TIME", "RANDOM", "ERRORLEVEL", "CMDEXTVERSION", "CMDCMDLINE", "HIGHESTNUMANODENUMBER"};

constexpr std::string_view ILLEGAL_SEGMENT_CHARS = "<>|*?";

ValidationIssue make_issue(IssueKind kind, std::string message, std::optional<size_t> index = std::nullopt, bool fatal = true)
{
    return ValidationIssue{kind, std::move(message), index, fatal};
}

} // anonymous namespace

DirectoryProbe filesystem_directory_probe()
{
    return [](std::string_view path)
    {
        std::error_code ec;
        const std::filesystem::path fs_path{pnq::string::encode_as_utf16(path)};
        return std::filesystem::is_directory(fs_path, ec);
    };
}

bool Validator::is_reserved_name(std::string_view name)
{
    for (const auto reserved : RESERVED_NAMES)
    {
        if (pnq::string::equals_nocase(reserved, name))
            return true;
    }
    return false;
}

std::vector<ValidationIssue> Validator::validate_name(std::string_view name)
{
    std::vector<ValidationIssue> issues;

    if (name.empty())
    {
        issues.push_back(make_issue(IssueKind::EmptyName, "Variable name is empty"));
        return issues;
    }

    for (const char c : name)
    {
        if (c == '=' || static_cast<unsigned char>(c) < 0x20 || c == 0x7F)
        {
            issues.push_back(make_issue(IssueKind::IllegalCharacter,
                                        std::format("Variable name contains illegal character 0x{:02X}", static_cast<unsigned char>(c))));
            break;
        }
    }

    if (is_reserved_name(name))
        issues.push_back(make_issue(IssueKind::ReservedName, std::format("'{}' is a reserved dynamic variable", name)));

    return issues;
}

std::vector<ValidationIssue> Validator::validate_value(VariableKind kind, std::string_view value)
{
    std::vector<ValidationIssue> issues;

    if (pnq::string::encode_as_utf16(value).size() > MAX_VALUE_LENGTH)
        issues.push_back(make_issue(IssueKind::TooLong, std::format("Value exceeds {} characters", MAX_VALUE_LENGTH)));

    if (value.find_first_of(std::string_view{"\0\r\n", 3}) != std::string_view::npos)
        issues.push_back(make_issue(IssueKind::IllegalCharacter, "Value contains NUL, CR or LF"));

    if (kind == VariableKind::PathLike)
    {
        const auto segments = split_segments(value);
        for (size_t i = 0; i < segments.size(); ++i)
        {
            const auto pos = segments[i].find_first_of(ILLEGAL_SEGMENT_CHARS);
            if (pos != std::string::npos)
            {
                issues.push_back(make_issue(IssueKind::IllegalCharacter,
                                            std::format("Segment '{}' contains illegal character '{}'", segments[i], segments[i][pos]), i));
            }
        }
    }

    return issues;
}

std::vector<ValidationIssue> Validator::validate_segments(const std::vector<std::string>& segments, const DirectoryProbe& probe)
{
    std::vector<ValidationIssue> issues;
    std::vector<std::string> seen;
    seen.reserve(segments.size());

    for (size_t i = 0; i < segments.size(); ++i)
    {
        const std::string key = segment_key(segments[i]);
        if (key.empty())
        {
            // "a;b;" is the common shape of a hand edited PATH
            const bool trailing = (i + 1 == segments.size()) && segments.size() > 1;
            if (!trailing)
                issues.push_back(make_issue(IssueKind::EmptySegment, std::format("Segment {} is empty", i), i));
            continue;
        }

        if (std::find(seen.begin(), seen.end(), key) != seen.end())
        {
            issues.push_back(make_issue(IssueKind::DuplicateSegment,
                                        std::format("Segment '{}' duplicates an earlier entry", segments[i]), i));
            continue;
        }
        seen.push_back(key);

        if (probe && segments[i].find('%') == std::string::npos)
        {
            const std::string path = tidy_segment(segments[i]);
            if (!probe(path))
            {
                issues.push_back(make_issue(IssueKind::NonExistentDirectory,
                                            std::format("Directory '{}' does not exist", path), i, false));
            }
        }
    }

    return issues;
}

std::vector<ValidationIssue> Validator::validate_variable(const Variable& variable, const DirectoryProbe& probe)
{
    auto issues = validate_name(variable.name);

    auto value_issues = validate_value(variable.kind, variable.value);
    issues.insert(issues.end(), value_issues.begin(), value_issues.end());

    if (variable.kind == VariableKind::PathLike)
    {
        auto segment_issues = validate_segments(split_segments(variable.value), probe);
        issues.insert(issues.end(), segment_issues.begin(), segment_issues.end());
    }

    return issues;
}

bool Validator::has_fatal(const std::vector<ValidationIssue>& issues)
{
    return std::any_of(issues.begin(), issues.end(), [](const ValidationIssue& issue) { return issue.fatal; });
}

} // namespace envmgr
