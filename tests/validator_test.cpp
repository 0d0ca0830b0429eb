#include "pch.h"
#include <envmgr/core/validator.h>
#include <gtest/gtest.h>
#include "test_helpers.h"

using namespace envmgr;
using envmgr::test::path_like;
using envmgr::test::plain;

namespace
{

bool has_issue(const std::vector<ValidationIssue>& issues, IssueKind kind)
{
    return std::any_of(issues.begin(), issues.end(), [kind](const ValidationIssue& i) { return i.kind == kind; });
}

} // namespace

TEST(ValidatorTest, AcceptsOrdinaryName)
{
    EXPECT_TRUE(Validator::validate_name("JAVA_HOME").empty());
    EXPECT_TRUE(Validator::validate_name("ProgramFiles(x86)").empty());
}

TEST(ValidatorTest, RejectsEmptyName)
{
    const auto issues = Validator::validate_name("");
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, IssueKind::EmptyName);
    EXPECT_TRUE(issues[0].fatal);
}

TEST(ValidatorTest, RejectsEqualsAndControlCharacters)
{
    EXPECT_TRUE(has_issue(Validator::validate_name("A=B"), IssueKind::IllegalCharacter));
    EXPECT_TRUE(has_issue(Validator::validate_name("A\tB"), IssueKind::IllegalCharacter));
    EXPECT_TRUE(has_issue(Validator::validate_name(std::string{"A\x7F"}), IssueKind::IllegalCharacter));
}

TEST(ValidatorTest, RejectsReservedDynamicNames)
{
    EXPECT_TRUE(has_issue(Validator::validate_name("ERRORLEVEL"), IssueKind::ReservedName));
    EXPECT_TRUE(has_issue(Validator::validate_name("random"), IssueKind::ReservedName));
    EXPECT_TRUE(Validator::is_reserved_name("Cd"));
    EXPECT_FALSE(Validator::is_reserved_name("CDPATH"));
}

TEST(ValidatorTest, RejectsOverlongValue)
{
    const std::string at_limit(MAX_VALUE_LENGTH, 'x');
    EXPECT_TRUE(Validator::validate_value(VariableKind::Plain, at_limit).empty());

    const std::string too_long(MAX_VALUE_LENGTH + 1, 'x');
    EXPECT_TRUE(has_issue(Validator::validate_value(VariableKind::Plain, too_long), IssueKind::TooLong));
}

TEST(ValidatorTest, RejectsLineBreaksInValue)
{
    EXPECT_TRUE(has_issue(Validator::validate_value(VariableKind::Plain, "a\r\nb"), IssueKind::IllegalCharacter));
}

TEST(ValidatorTest, ReportsIllegalCharacterWithSegmentIndex)
{
    const auto issues = Validator::validate_value(VariableKind::PathLike, "C:\\a;C:\\b|c");
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, IssueKind::IllegalCharacter);
    EXPECT_EQ(issues[0].segment_index, 1u);
}

TEST(ValidatorTest, PipeIsAllowedInPlainValue)
{
    EXPECT_TRUE(Validator::validate_value(VariableKind::Plain, "a|b").empty());
}

TEST(ValidatorTest, ReportsDuplicateAtLaterIndex)
{
    const auto issues = Validator::validate_variable(path_like(Scope::User, "PATH", "C:\\a;C:\\b;C:\\A\\"));
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, IssueKind::DuplicateSegment);
    EXPECT_EQ(issues[0].segment_index, 2u);
    EXPECT_TRUE(Validator::has_fatal(issues));
}

TEST(ValidatorTest, ToleratesSingleTrailingSeparator)
{
    EXPECT_TRUE(Validator::validate_variable(path_like(Scope::User, "PATH", "C:\\a;C:\\b;")).empty());
}

TEST(ValidatorTest, ReportsInteriorEmptySegment)
{
    const auto issues = Validator::validate_variable(path_like(Scope::User, "PATH", "C:\\a;;C:\\b"));
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, IssueKind::EmptySegment);
    EXPECT_EQ(issues[0].segment_index, 1u);
}

TEST(ValidatorTest, MissingDirectoryIsOnlyAWarning)
{
    const DirectoryProbe probe = [](std::string_view path) { return path == "C:\\exists"; };
    const auto issues = Validator::validate_segments({"C:\\exists", "C:\\missing", "%USERPROFILE%\\bin"}, probe);

    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, IssueKind::NonExistentDirectory);
    EXPECT_EQ(issues[0].segment_index, 1u);
    EXPECT_FALSE(issues[0].fatal);
    EXPECT_FALSE(Validator::has_fatal(issues));
}

TEST(ValidatorTest, PlainVariableSkipsSegmentChecks)
{
    EXPECT_TRUE(Validator::validate_variable(plain(Scope::User, "GREETING", "a;;a")).empty());
}
