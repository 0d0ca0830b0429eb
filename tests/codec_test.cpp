#include "pch.h"
#include <envmgr/codecs/codec.h>
#include <envmgr/codecs/csv_codec.h>
#include <envmgr/codecs/reg_codec.h>
#include <envmgr/codecs/toml_codec.h>
#include <gtest/gtest.h>
#include <toml++/toml.hpp>
#include "test_helpers.h"

using namespace envmgr;
using envmgr::test::default_path_like_names;
using envmgr::test::path_like;
using envmgr::test::plain;
using envmgr::test::to_bytes;
using envmgr::test::to_string;

namespace
{

VariableSet sample_user_set()
{
    VariableSet set{Scope::User};
    set.upsert(path_like(Scope::User, "Path", "C:\\Tools;%USERPROFILE%\\bin;C:\\Program Files\\Git\\cmd;"));
    set.upsert(plain(Scope::User, "GREETING", "say \"hello\", world"));
    set.upsert(plain(Scope::User, "TEMP", "%USERPROFILE%\\AppData\\Local\\Temp"));
    set.upsert(plain(Scope::User, "EMPTY", ""));
    return set;
}

VariableSet roundtrip(const ICodec& codec, const VariableSet& set)
{
    auto batch = codec.decode(codec.encode(set));
    EXPECT_TRUE(batch.has_value()) << (batch ? "" : batch.error().message);
    return batch ? to_variable_set(*batch, set.scope()) : VariableSet{set.scope()};
}

} // namespace

// ============================================================================
// Format helpers
// ============================================================================

TEST(CodecTest, FormatFromExtension)
{
    EXPECT_EQ(format_from_extension("backup.TOML"), Format::Toml);
    EXPECT_EQ(format_from_extension("C:\\x\\vars.csv"), Format::Csv);
    EXPECT_EQ(format_from_extension("env.reg"), Format::Reg);
    EXPECT_FALSE(format_from_extension("env.txt").has_value());
    EXPECT_FALSE(format_from_extension("env").has_value());
}

TEST(CodecTest, DecodeTextHandlesBoms)
{
    EXPECT_EQ(decode_text(std::vector<uint8_t>{0xEF, 0xBB, 0xBF, 'h', 'i'}), "hi");
    EXPECT_EQ(decode_text(std::vector<uint8_t>{0xFF, 0xFE, 'h', 0, 'i', 0}), "hi");
    EXPECT_EQ(decode_text(to_bytes("plain")), "plain");
}

// ============================================================================
// TOML
// ============================================================================

TEST(TomlCodecTest, RoundTripPreservesSegmentsAndTypes)
{
    TomlCodec codec;
    const VariableSet set = sample_user_set();
    EXPECT_EQ(roundtrip(codec, set), set);
}

TEST(TomlCodecTest, WritesSegmentsAsArray)
{
    TomlCodec codec;
    VariableSet set{Scope::User};
    set.upsert(path_like(Scope::User, "PATH", "C:\\a;C:\\b"));

    const std::string text = to_string(codec.encode(set));
    EXPECT_NE(text.find("scope = "), std::string::npos);
    EXPECT_NE(text.find("user"), std::string::npos);
    EXPECT_NE(text.find("segments"), std::string::npos);
    EXPECT_EQ(text.find("value ="), std::string::npos);
}

TEST(TomlCodecTest, MultipleScopesGetOneDocumentEach)
{
    TomlCodec codec;
    VariableSet user{Scope::User};
    user.upsert(plain(Scope::User, "EDITOR", "code"));
    VariableSet system{Scope::System};
    system.upsert(plain(Scope::System, "OS", "Windows_NT"));

    const std::vector<VariableSet> sets{user, system};
    const Bytes data = codec.encode(sets);

    const toml::table root = toml::parse(to_string(data));
    EXPECT_FALSE(root.contains("variable"));
    ASSERT_NE(root["user"]["variable"].as_array(), nullptr);
    ASSERT_NE(root["system"]["variable"].as_array(), nullptr);
    EXPECT_EQ(root["user"]["variable"][0]["name"].value_or(std::string{}), "EDITOR");
    EXPECT_FALSE(root["user"]["variable"][0]["scope"]);
    EXPECT_EQ(root["system"]["variable"][0]["name"].value_or(std::string{}), "OS");

    auto batch = codec.decode(data);
    ASSERT_TRUE(batch.has_value());
    EXPECT_EQ(to_variable_set(*batch, Scope::User), user);
    EXPECT_EQ(to_variable_set(*batch, Scope::System), system);
}

TEST(TomlCodecTest, ScopeSectionMustBeTable)
{
    TomlCodec codec;
    auto batch = codec.decode(to_bytes("system = \"x\"\n"));
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error().code, ErrorCode::MalformedInput);
}

TEST(TomlCodecTest, DecodesDeleteAndDefaults)
{
    TomlCodec codec;
    auto batch = codec.decode(to_bytes(R"(
[[variable]]
name = "OBSOLETE"
action = "delete"

[[variable]]
name = "PSModulePath"
segments = ["C:\\Modules"]
)"));
    ASSERT_TRUE(batch.has_value());
    ASSERT_EQ(batch->size(), 2u);
    EXPECT_EQ((*batch)[0].action, RecordAction::Delete);
    EXPECT_EQ((*batch)[0].scope, Scope::User);
    EXPECT_EQ((*batch)[1].kind, VariableKind::PathLike);
    EXPECT_EQ((*batch)[1].value, "C:\\Modules");
}

TEST(TomlCodecTest, SyntaxErrorIsMalformedInput)
{
    TomlCodec codec;
    auto batch = codec.decode(to_bytes("[[variable]\nname = "));
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error().code, ErrorCode::MalformedInput);
}

TEST(TomlCodecTest, MissingValueIsMalformedInput)
{
    TomlCodec codec;
    auto batch = codec.decode(to_bytes("[[variable]]\nname = \"A\"\n"));
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error().code, ErrorCode::MalformedInput);
    EXPECT_NE(batch.error().message.find("#1"), std::string::npos);
}

// ============================================================================
// CSV
// ============================================================================

TEST(CsvCodecTest, RoundTripWithQuoting)
{
    CsvCodec codec{default_path_like_names()};
    const VariableSet set = sample_user_set();
    EXPECT_EQ(roundtrip(codec, set), set);
}

TEST(CsvCodecTest, ValueTypeIsInferredOnDecode)
{
    CsvCodec codec{default_path_like_names()};
    VariableSet set{Scope::User};
    set.upsert(Variable{Scope::User, "TOOLS", "C:\\Tools", VariableKind::Plain, ValueType::ExpandString});
    set.upsert(Variable{Scope::User, "HOME_BIN", "%USERPROFILE%\\bin", VariableKind::Plain, ValueType::ExpandString});

    const VariableSet decoded = roundtrip(codec, set);
    ASSERT_EQ(decoded.size(), 2u);
    EXPECT_EQ(decoded.find("TOOLS")->type, ValueType::String);
    EXPECT_EQ(decoded.find("TOOLS")->value, "C:\\Tools");
    EXPECT_EQ(*decoded.find("HOME_BIN"), *set.find("HOME_BIN"));
}

TEST(CsvCodecTest, QuotesFieldsWithCommasAndQuotes)
{
    CsvCodec codec{default_path_like_names()};
    VariableSet set{Scope::User};
    set.upsert(plain(Scope::User, "GREETING", "say \"hi\", all"));

    EXPECT_EQ(to_string(codec.encode(set)), "scope,name,value\r\nuser,GREETING,\"say \"\"hi\"\", all\"\r\n");
}

TEST(CsvCodecTest, HeaderIsCaseInsensitive)
{
    CsvCodec codec{default_path_like_names()};
    auto batch = codec.decode(to_bytes("Scope,Name,Value\nsystem,Path,C:\\a;C:\\b\n"));
    ASSERT_TRUE(batch.has_value());
    ASSERT_EQ(batch->size(), 1u);
    EXPECT_EQ((*batch)[0].scope, Scope::System);
    EXPECT_EQ((*batch)[0].kind, VariableKind::PathLike);
    EXPECT_EQ((*batch)[0].value, "C:\\a;C:\\b");
}

TEST(CsvCodecTest, UnterminatedQuoteIsMalformedInput)
{
    CsvCodec codec{default_path_like_names()};
    auto batch = codec.decode(to_bytes("scope,name,value\nuser,A,\"open\n"));
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error().code, ErrorCode::MalformedInput);
}

TEST(CsvCodecTest, MissingColumnIsMalformedInput)
{
    CsvCodec codec{default_path_like_names()};
    auto batch = codec.decode(to_bytes("scope,name,value\nuser,A\n"));
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error().code, ErrorCode::MalformedInput);
}

// ============================================================================
// .reg
// ============================================================================

TEST(RegCodecTest, RoundTripPreservesTypes)
{
    RegCodec codec{default_path_like_names()};
    const VariableSet set = sample_user_set();
    EXPECT_EQ(roundtrip(codec, set), set);
}

TEST(RegCodecTest, EncodesUtf16WithBom)
{
    RegCodec codec{default_path_like_names()};
    VariableSet set{Scope::User};
    set.upsert(plain(Scope::User, "EDITOR", "C:\\vim\\vim.exe"));

    const Bytes data = codec.encode(set);
    ASSERT_GE(data.size(), 4u);
    EXPECT_EQ(data[0], 0xFF);
    EXPECT_EQ(data[1], 0xFE);

    const std::string text = decode_text(data);
    EXPECT_TRUE(text.starts_with("Windows Registry Editor Version 5.00"));
    EXPECT_NE(text.find("[HKEY_CURRENT_USER\\Environment]"), std::string::npos);
    EXPECT_NE(text.find("\"EDITOR\"=\"C:\\\\vim\\\\vim.exe\""), std::string::npos);
}

TEST(RegCodecTest, ExpandValueIsWrittenAsHex2)
{
    RegCodec codec{default_path_like_names()};
    VariableSet set{Scope::System};
    set.upsert(Variable{Scope::System, "A", "%X%", VariableKind::Plain, ValueType::ExpandString});

    const std::string text = decode_text(codec.encode(set));
    EXPECT_NE(text.find("\"A\"=hex(2):25,00,58,00,25,00,00,00"), std::string::npos);
}

TEST(RegCodecTest, EncodesBothScopesIntoOneFile)
{
    RegCodec codec{default_path_like_names()};
    VariableSet user{Scope::User};
    user.upsert(plain(Scope::User, "EDITOR", "code"));
    VariableSet system{Scope::System};
    system.upsert(plain(Scope::System, "OS", "Windows_NT"));
    const std::vector<VariableSet> sets{user, system};

    auto batch = codec.decode(codec.encode(sets));
    ASSERT_TRUE(batch.has_value()) << batch.error().message;
    EXPECT_EQ(to_variable_set(*batch, Scope::User), user);
    EXPECT_EQ(to_variable_set(*batch, Scope::System), system);
}

TEST(RegCodecTest, DecodesRegeditStyleFile)
{
    RegCodec codec{default_path_like_names()};
    auto batch = codec.decode(to_bytes(
        "Windows Registry Editor Version 5.00\r\n"
        "\r\n"
        "; exported by hand\r\n"
        "[HKEY_CURRENT_USER\\Environment]\r\n"
        "\"Path\"=hex(2):43,00,3a,00,5c,00,61,00,3b,00,25,00,\\\r\n"
        "  58,00,25,00,00,00\r\n"
        "\"OLD\"=-\r\n"
        "\r\n"
        "[HKEY_LOCAL_MACHINE\\SYSTEM\\CurrentControlSet\\Control\\Session Manager\\Environment]\r\n"
        "\"OS\"=\"Windows_NT\"\r\n"));

    ASSERT_TRUE(batch.has_value()) << batch.error().message;
    ASSERT_EQ(batch->size(), 3u);

    const auto find = [&](std::string_view name) {
        return std::find_if(batch->begin(), batch->end(), [&](const ImportRecord& r) { return r.name == name; });
    };

    const auto path = find("Path");
    ASSERT_NE(path, batch->end());
    EXPECT_EQ(path->scope, Scope::User);
    EXPECT_EQ(path->value, "C:\\a;%X%");
    EXPECT_EQ(path->type, ValueType::ExpandString);
    EXPECT_EQ(path->kind, VariableKind::PathLike);

    const auto old = find("OLD");
    ASSERT_NE(old, batch->end());
    EXPECT_EQ(old->action, RecordAction::Delete);

    const auto os = find("OS");
    ASSERT_NE(os, batch->end());
    EXPECT_EQ(os->scope, Scope::System);
    EXPECT_EQ(os->value, "Windows_NT");
    EXPECT_EQ(os->type, ValueType::String);
}

TEST(RegCodecTest, RejectsForeignKeys)
{
    RegCodec codec{default_path_like_names()};
    auto batch = codec.decode(to_bytes("Windows Registry Editor Version 5.00\r\n\r\n[HKEY_CURRENT_USER\\Software\\X]\r\n\"A\"=\"1\"\r\n"));
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error().code, ErrorCode::MalformedInput);
}

TEST(RegCodecTest, RejectsUnsupportedValueType)
{
    RegCodec codec{default_path_like_names()};
    auto batch = codec.decode(to_bytes("Windows Registry Editor Version 5.00\r\n[HKEY_CURRENT_USER\\Environment]\r\n\"A\"=dword:00000001\r\n"));
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error().code, ErrorCode::MalformedInput);
}

TEST(RegCodecTest, RejectsMissingHeader)
{
    RegCodec codec{default_path_like_names()};
    EXPECT_FALSE(codec.decode(to_bytes("[HKEY_CURRENT_USER\\Environment]\r\n\"A\"=\"1\"\r\n")).has_value());
    EXPECT_FALSE(codec.decode(to_bytes("")).has_value());
}
