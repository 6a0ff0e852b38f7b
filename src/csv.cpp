#include "../include/csv.hpp"

#include <algorithm>
#include <fstream>
#include <ranges>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace parser
{
    namespace helpers
    {
        // well formed utf-8: no overlong forms, surrogates or code points past U+10FFFF
        static auto is_valid_utf8(std::string_view s) -> bool
        {
            std::size_t i = 0;
            while (i < s.size())
            {
                auto c = static_cast<unsigned char>(s[i]);
                std::size_t length;
                unsigned char lower = 0x80;
                unsigned char upper = 0xBF;

                if (c < 0x80)
                {
                    ++i;
                    continue;
                }
                else if (c >= 0xC2 && c <= 0xDF)
                {
                    length = 2;
                }
                else if (c >= 0xE0 && c <= 0xEF)
                {
                    length = 3;
                    if (c == 0xE0) lower = 0xA0;
                    if (c == 0xED) upper = 0x9F;
                }
                else if (c >= 0xF0 && c <= 0xF4)
                {
                    length = 4;
                    if (c == 0xF0) lower = 0x90;
                    if (c == 0xF4) upper = 0x8F;
                }
                else
                {
                    return false;
                }

                if (i + length > s.size())
                {
                    return false;
                }
                for (std::size_t k = 1; k < length; ++k)
                {
                    auto continuation = static_cast<unsigned char>(s[i + k]);
                    if (continuation < lower || continuation > upper)
                    {
                        return false;
                    }
                    lower = 0x80;
                    upper = 0xBF;
                }
                i += length;
            }
            return true;
        }
    }

    auto resolve_stt_path(const std::filesystem::path& path) -> std::filesystem::path
    {
        if (path.string().ends_with(CSV_EXTENSION))
        {
            return path;
        }
        auto resolved = path;
        resolved += CSV_EXTENSION;
        return resolved;
    }

    auto read_rows(std::istream& input) -> tl::expected<Rows_t, ParseFailure>
    {
        Rows_t rows;
        Row row;
        std::string field;
        bool in_quotes = false;
        bool field_quoted = false;
        bool row_started = false;

        auto end_field = [&]()
        {
            row.push_back(std::exchange(field, std::string{}));
            field_quoted = false;
        };

        auto end_row = [&]()
        {
            if (row_started)
            {
                end_field();
                rows.push_back(std::exchange(row, Row{}));
            }
            row_started = false;
        };

        char c;
        while (input.get(c))
        {
            if (in_quotes)
            {
                if (c == '"')
                {
                    if (input.peek() == '"')
                    {
                        input.get(c);
                        field += '"';
                    }
                    else
                    {
                        in_quotes = false;
                    }
                }
                else
                {
                    field += c;
                }
                continue;
            }

            switch (c)
            {
            case '"':
                row_started = true;
                if (field.empty() && !field_quoted)
                {
                    in_quotes = true;
                    field_quoted = true;
                }
                else
                {
                    field += c;
                }
                break;
            case ',':
                row_started = true;
                end_field();
                break;
            case '\r':
                // \r\n is a single line break
                if (input.peek() == '\n')
                {
                    input.get(c);
                }
                end_row();
                break;
            case '\n':
                end_row();
                break;
            default:
                row_started = true;
                field += c;
                break;
            }
        }

        if (in_quotes)
        {
            row.push_back(field);
            return tl::unexpected<ParseFailure>(ParseFailure(
                ParseError::MalformedRowError, row, "Unexpected end of input inside a quoted field."));
        }
        end_row();

        auto invalid = std::ranges::find_if(rows, [](const Row& r) {
            return !std::ranges::all_of(r, helpers::is_valid_utf8);
        });
        if (invalid != rows.end())
        {
            return tl::unexpected<ParseFailure>(ParseFailure(
                ParseError::InvalidEncodingError, *invalid, "The row is not valid UTF-8."));
        }

        return rows;
    }

    auto read_rows(const std::filesystem::path& path) -> tl::expected<Rows_t, ParseFailure>
    {
        if (path.empty())
        {
            return tl::unexpected<ParseFailure>(ParseFailure(
                ParseError::EmptyPath, "You provided an empty path to the state transition table."));
        }

        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file.is_open())
        {
            return tl::unexpected<ParseFailure>(ParseFailure(
                ParseError::FileOpenError,
                fmt::format("Could not open the state transition table '{}'.", path.string())
            ));
        }
        return read_rows(file);
    }
}
