#include "../include/table_builder.hpp"
#include "../include/utility.hpp"

#include <algorithm>
#include <optional>
#include <ranges>
#include <string>

#include <fmt/format.h>

namespace model
{
    namespace ranges = std::ranges;

    namespace helpers
    {
        static auto is_header(const parser::Row& row) -> bool
        {
            return ranges::equal(row, HEADER_ROW);
        }
    }

    auto validate_transition_table(TransitionTable table) -> tl::expected<TransitionTable, parser::ParseFailure>
    {
        auto incomplete = ranges::find_if(table, [](const parser::STTTransition& t) {
            return t.m_trigger.empty() || t.m_source.empty() || t.m_dest.empty();
        });

        if (incomplete != table.end())
        {
            return tl::unexpected<parser::ParseFailure>(parser::ParseFailure(
                parser::ParseError::StructuralInvariantError,
                parser::Row{incomplete->m_source, incomplete->m_dest, incomplete->m_trigger},
                "Transition is missing one of trigger, source or dest."
            ));
        }
        return table;
    }

    auto build_transition_table(const Rows_t& rows) -> tl::expected<TransitionTable, parser::ParseFailure>
    {
        if (rows.empty() || !helpers::is_header(rows.front()))
        {
            return tl::unexpected<parser::ParseFailure>(parser::ParseFailure(
                parser::ParseError::HeaderFormatError,
                fmt::format("Invalid header format: must be: {}", utility::list_repr(HEADER_ROW))
            ));
        }

        TransitionTable table;
        table.reserve(rows.size() - 1);

        std::optional<std::string> previous_source;
        for (const auto& row : rows | std::views::drop(1))
        {
            auto transition = parser::normalize_row(row, previous_source);
            if (!transition)
            {
                return tl::unexpected<parser::ParseFailure>(transition.error());
            }
            table.push_back(std::move(transition.value()));
        }

        return validate_transition_table(std::move(table));
    }
}
