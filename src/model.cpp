#include "../include/model.hpp"
#include "../include/csv.hpp"
#include "../include/table_builder.hpp"

#include <sstream>
#include <utility>

namespace model
{
    namespace
    {
        constexpr int JSON_INDENT = 4;
    }

    auto build_adjacency(const TransitionTable& table) -> Adjacency
    {
        Adjacency adjacency;
        for (const auto& t : table)
        {
            adjacency[t.m_source][t.m_dest] = t.m_trigger;
        }
        return adjacency;
    }

    auto build_json(const TransitionTable& table) -> ordered_json
    {
        auto transitions = ordered_json::array();
        for (const auto& t : table)
        {
            ordered_json transition;
            transition["trigger"] = t.m_trigger;
            transition["source"] = t.m_source;
            transition["dest"] = t.m_dest;
            transitions.push_back(std::move(transition));
        }

        ordered_json stt;
        stt["transitions"] = std::move(transitions);
        return stt;
    }

    StateTransitionTable::StateTransitionTable(const std::filesystem::path& stt_csv_file)
        : StateTransitionTable(
            [path = parser::resolve_stt_path(stt_csv_file)]() { return parser::read_rows(path); },
            parser::resolve_stt_path(stt_csv_file).string()
          )
    {}

    StateTransitionTable::StateTransitionTable(RowSource row_source, std::string source_name)
        : m_row_source{std::move(row_source)},
          m_source_name{std::move(source_name)}
    {}

    auto StateTransitionTable::from_string(std::string csv_text) -> StateTransitionTable
    {
        return StateTransitionTable(
            [text = std::move(csv_text)]() {
                std::istringstream input(text);
                return parser::read_rows(input);
            },
            "<string>"
        );
    }

    auto StateTransitionTable::parse() -> TransitionTable
    {
        auto stt = m_row_source()
            .and_then(build_transition_table)
            .or_else(parser::HandleParseError);

        return std::move(stt.value());
    }

    auto StateTransitionTable::transitions() -> const TransitionTable &
    {
        return m_stt.get([this]() { return parse(); });
    }

    auto StateTransitionTable::dictify() -> const Adjacency &
    {
        return m_adjacency.get([this]() { return build_adjacency(transitions()); });
    }

    auto StateTransitionTable::json() -> const ordered_json &
    {
        return m_json.get([this]() { return build_json(transitions()); });
    }

    auto StateTransitionTable::jsonify() -> const std::string &
    {
        return m_json_string.get([this]() { return json().dump(JSON_INDENT, ' ', true); });
    }

    auto StateTransitionTable::digraph() -> const graph::Digraph &
    {
        return m_digraph.get([this]() { return graph::build_digraph(transitions()); });
    }

    auto StateTransitionTable::dotify() -> const std::string &
    {
        return m_dot.get([this]() { return digraph().source(); });
    }
}
