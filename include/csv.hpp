#ifndef CSV_H
#define CSV_H

#include "STT_elements.hpp"
#include "parser.hpp"

#include <filesystem>
#include <istream>
#include <string_view>

#include <tl/expected.hpp>

namespace parser
{
    inline constexpr std::string_view CSV_EXTENSION = ".csv";

    // appends the .csv extension when the path does not already carry it
    [[nodiscard]]
    auto resolve_stt_path(const std::filesystem::path& path) -> std::filesystem::path;

    // splits comma separated records, honouring "quoted, fields" and "" escapes.
    // blank lines produce no record
    [[nodiscard]]
    auto read_rows(std::istream& input) -> tl::expected<Rows_t, ParseFailure>;

    [[nodiscard]]
    auto read_rows(const std::filesystem::path& path) -> tl::expected<Rows_t, ParseFailure>;
}

#endif
