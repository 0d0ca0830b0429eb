#include "pch.h"
#include <envmgr/codecs/csv_codec.h>
#include <envmgr/core/segments.h>

namespace envmgr
{

namespace
{

constexpr const char* CSV_HEADER[] = {"scope", "name", "value"};

void append_field(std::string& out, std::string_view field)
{
    const bool needs_quotes = field.find_first_of(",\"\r\n") != std::string_view::npos ||
                              (!field.empty() && (field.front() == ' ' || field.back() == ' '));
    if (!needs_quotes)
    {
        out.append(field);
        return;
    }

    out.push_back('"');
    for (const char c : field)
    {
        if (c == '"')
            out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
}

using Row = std::vector<std::string>;

/// Split CSV text into rows (RFC 4180). Blank lines are skipped.
/// @return rows paired with their starting line number
Result<std::vector<std::pair<size_t, Row>>> parse_rows(std::string_view text)
{
    std::vector<std::pair<size_t, Row>> rows;
    Row row;
    std::string field;
    bool in_quotes = false;
    bool field_was_quoted = false;
    bool row_has_content = false;
    size_t line = 1;
    size_t row_line = 1;

    auto end_field = [&]()
    {
        row.push_back(std::move(field));
        field.clear();
        field_was_quoted = false;
    };

    auto end_row = [&]()
    {
        if (row_has_content || !row.empty() || !field.empty())
        {
            end_field();
            rows.emplace_back(row_line, std::move(row));
            row.clear();
        }
        row_has_content = false;
    };

    for (size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];
        if (in_quotes)
        {
            if (c == '"')
            {
                if (i + 1 < text.size() && text[i + 1] == '"')
                {
                    field.push_back('"');
                    ++i;
                }
                else
                {
                    in_quotes = false;
                }
            }
            else
            {
                if (c == '\n')
                    ++line;
                field.push_back(c);
            }
            continue;
        }

        switch (c)
        {
        case '"':
            if (!field.empty() || field_was_quoted)
                return make_error(ErrorCode::MalformedInput, std::format("line {}: stray quote inside field", line));
            in_quotes = true;
            field_was_quoted = true;
            row_has_content = true;
            break;
        case ',':
            end_field();
            row_has_content = true;
            break;
        case '\r':
            break;
        case '\n':
            end_row();
            ++line;
            row_line = line;
            break;
        default:
            if (field_was_quoted)
                return make_error(ErrorCode::MalformedInput, std::format("line {}: text after closing quote", line));
            field.push_back(c);
            row_has_content = true;
            break;
        }
    }

    if (in_quotes)
        return make_error(ErrorCode::MalformedInput, std::format("line {}: unterminated quoted field", row_line));

    end_row();
    return rows;
}

} // anonymous namespace

Bytes CsvCodec::encode(std::span<const VariableSet> sets) const
{
    std::string out = "scope,name,value\r\n";
    for (const auto& set : sets)
    {
        for (const auto& variable : set)
        {
            append_field(out, scope_to_string(variable.scope));
            out.push_back(',');
            append_field(out, variable.name);
            out.push_back(',');
            append_field(out, variable.value);
            out.append("\r\n");
        }
    }
    return Bytes(out.begin(), out.end());
}

Result<ImportBatch> CsvCodec::decode(std::span<const uint8_t> data) const
{
    auto rows = parse_rows(decode_text(data));
    if (!rows)
        return std::unexpected(rows.error());

    if (rows->empty())
        return make_error(ErrorCode::MalformedInput, "missing header row");

    const Row& header = rows->front().second;
    bool header_ok = header.size() == std::size(CSV_HEADER);
    for (size_t i = 0; header_ok && i < header.size(); ++i)
        header_ok = pnq::string::equals_nocase(tidy_segment(header[i]), CSV_HEADER[i]);

    if (!header_ok)
        return make_error(ErrorCode::MalformedInput, "header must be 'scope,name,value'");

    ImportBatch batch;
    for (size_t i = 1; i < rows->size(); ++i)
    {
        const auto& [line, row] = (*rows)[i];
        if (row.size() != std::size(CSV_HEADER))
            return make_error(ErrorCode::MalformedInput, std::format("line {}: expected 3 fields, got {}", line, row.size()));

        ImportRecord record;
        if (!parse_scope(row[0], record.scope))
            return make_error(ErrorCode::MalformedInput, std::format("line {}: unknown scope '{}'", line, row[0]));

        record.name = row[1];
        record.value = row[2];
        record.kind = classify(record.name, m_path_like_names);
        record.type = infer_value_type(record.value);
        batch.push_back(std::move(record));
    }

    return batch;
}

} // namespace envmgr
