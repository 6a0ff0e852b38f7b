#ifndef TABLE_BUILDER_H
#define TABLE_BUILDER_H

#include "STT_elements.hpp"
#include "parser.hpp"

#include <array>
#include <string_view>

#include <tl/expected.hpp>

namespace model
{
    inline constexpr std::array<std::string_view, 3> HEADER_ROW = {"SOURCE", "DEST", "TRIGGER"};

    // checks the header, then normalizes every following row in order. the first
    // failing row aborts the build
    [[nodiscard]]
    auto build_transition_table(const Rows_t& rows) -> tl::expected<TransitionTable, parser::ParseFailure>;

    // every transition must carry a trigger, a source and a dest
    [[nodiscard]]
    auto validate_transition_table(TransitionTable table) -> tl::expected<TransitionTable, parser::ParseFailure>;
}

#endif
