#include "pch.h"
#include <envmgr/core/segments.h>
#include <envmgr/core/types.h>
#include <gtest/gtest.h>
#include "test_helpers.h"

using namespace envmgr;
using envmgr::test::plain;

TEST(VariableSetTest, FindIsCaseInsensitive)
{
    VariableSet set{Scope::User};
    set.upsert(plain(Scope::User, "JAVA_HOME", "C:\\Java"));

    const Variable* found = set.find("java_home");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->name, "JAVA_HOME");
    EXPECT_TRUE(set.contains("Java_Home"));
    EXPECT_FALSE(set.contains("JAVA"));
}

TEST(VariableSetTest, UpsertKeepsExistingNameCasing)
{
    VariableSet set{Scope::User};
    set.upsert(plain(Scope::User, "Temp", "C:\\Temp"));
    set.upsert(plain(Scope::User, "TEMP", "D:\\Temp"));

    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set.find("temp")->name, "Temp");
    EXPECT_EQ(set.find("temp")->value, "D:\\Temp");
}

TEST(VariableSetTest, UpsertAssignsSetScope)
{
    VariableSet set{Scope::System};
    set.upsert(plain(Scope::User, "OS", "Windows_NT"));
    EXPECT_EQ(set.find("OS")->scope, Scope::System);
}

TEST(VariableSetTest, EqualityIgnoresEntryOrder)
{
    VariableSet a{Scope::User};
    a.upsert(plain(Scope::User, "A", "1"));
    a.upsert(plain(Scope::User, "B", "2"));

    VariableSet b{Scope::User};
    b.upsert(plain(Scope::User, "B", "2"));
    b.upsert(plain(Scope::User, "A", "1"));

    EXPECT_EQ(a, b);

    b.upsert(plain(Scope::User, "A", "changed"));
    EXPECT_NE(a, b);
}

TEST(VariableSetTest, EraseReportsWhetherRemoved)
{
    VariableSet set{Scope::User};
    set.upsert(plain(Scope::User, "A", "1"));
    EXPECT_TRUE(set.erase("a"));
    EXPECT_FALSE(set.erase("a"));
    EXPECT_TRUE(set.empty());
}

TEST(ScopeTest, ParsesNamesAndHiveAliases)
{
    Scope scope = Scope::User;
    EXPECT_TRUE(parse_scope("System", scope));
    EXPECT_EQ(scope, Scope::System);
    EXPECT_TRUE(parse_scope("hkcu", scope));
    EXPECT_EQ(scope, Scope::User);
    EXPECT_TRUE(parse_scope("HKLM", scope));
    EXPECT_EQ(scope, Scope::System);
    EXPECT_FALSE(parse_scope("machine", scope));
}

TEST(ValueTypeTest, PercentReferenceMeansExpandString)
{
    EXPECT_EQ(infer_value_type("%USERPROFILE%\\bin"), ValueType::ExpandString);
    EXPECT_EQ(infer_value_type("C:\\bin"), ValueType::String);
}

TEST(SegmentsTest, SplitKeepsEmptySegmentsAndOrder)
{
    const auto segments = split_segments("C:\\a;;C:\\b;");
    ASSERT_EQ(segments.size(), 4u);
    EXPECT_EQ(segments[0], "C:\\a");
    EXPECT_EQ(segments[1], "");
    EXPECT_EQ(segments[2], "C:\\b");
    EXPECT_EQ(segments[3], "");
    EXPECT_EQ(join_segments(segments), "C:\\a;;C:\\b;");
}

TEST(SegmentsTest, EmptyValueHasNoSegments)
{
    EXPECT_TRUE(split_segments("").empty());
    EXPECT_EQ(join_segments({}), "");
}

TEST(SegmentsTest, KeyNormalizesCaseSeparatorsAndQuotes)
{
    EXPECT_EQ(segment_key("C:\\Tools\\"), segment_key("c:/tools"));
    EXPECT_EQ(segment_key("  \"C:\\Program Files\\Git\\cmd\"  "), "c:\\program files\\git\\cmd");
    EXPECT_EQ(segment_key("C:\\"), "c:\\");
    EXPECT_EQ(segment_key("   "), "");
}

TEST(SegmentsTest, ClassifyUsesConfiguredNames)
{
    const auto names = parse_name_list("PATH; PSModulePath ;;");
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(classify("Path", names), VariableKind::PathLike);
    EXPECT_EQ(classify("psmodulepath", names), VariableKind::PathLike);
    EXPECT_EQ(classify("PATHEXT", names), VariableKind::Plain);
}
