#include "pch.h"
#include <envmgr/core/segments.h>
#include <envmgr/core/config.h>

namespace envmgr
{

namespace
{

std::string_view trim(std::string_view text)
{
    constexpr std::string_view WHITESPACE = " \t";
    const auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos)
        return {};

    const auto last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

} // anonymous namespace

std::vector<std::string> split_segments(std::string_view value)
{
    std::vector<std::string> result;
    if (value.empty())
        return result;

    size_t start = 0;
    while (true)
    {
        const auto pos = value.find(SEGMENT_SEPARATOR, start);
        if (pos == std::string_view::npos)
        {
            result.emplace_back(value.substr(start));
            break;
        }
        result.emplace_back(value.substr(start, pos - start));
        start = pos + 1;
    }
    return result;
}

std::string join_segments(const std::vector<std::string>& segments)
{
    return pnq::string::join(segments, ";");
}

std::string tidy_segment(std::string_view segment)
{
    std::string_view text = trim(segment);
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"')
        text = trim(text.substr(1, text.size() - 2));
    return std::string{text};
}

std::string segment_key(std::string_view segment)
{
    std::string key = tidy_segment(segment);
    std::replace(key.begin(), key.end(), '/', '\\');

    // Keep a bare drive root ("C:\") distinct from the drive-relative "C:"
    while (key.size() > 1 && key.back() == '\\' && !(key.size() == 3 && key[1] == ':'))
        key.pop_back();

    return pnq::string::lowercase(key);
}

VariableKind classify(std::string_view name, const std::vector<std::string>& path_like_names)
{
    for (const auto& candidate : path_like_names)
    {
        if (pnq::string::equals_nocase(candidate, name))
            return VariableKind::PathLike;
    }
    return VariableKind::Plain;
}

std::vector<std::string> parse_name_list(std::string_view list)
{
    std::vector<std::string> result;
    for (const auto& item : split_segments(list))
    {
        std::string name{trim(item)};
        if (!name.empty())
            result.push_back(std::move(name));
    }
    return result;
}

EngineConfig EngineConfig::defaults()
{
    EngineConfig config;
    config.path_like_names = parse_name_list(DEFAULT_PATH_LIKE_NAMES);
    return config;
}

} // namespace envmgr
