#ifndef MODEL_H
#define MODEL_H

#include "STT_elements.hpp"
#include "parser.hpp"
#include "graph.hpp"
#include "lazy.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <string>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace model
{
    using ordered_json = nlohmann::ordered_json;

    // source -> (dest -> trigger)
    using Adjacency = std::map<std::string, std::map<std::string, std::string>>;

    // later transitions between the same pair of states overwrite earlier ones
    [[nodiscard]]
    auto build_adjacency(const TransitionTable& table) -> Adjacency;

    // {"transitions": [{"trigger", "source", "dest"}, ...]} in exactly that key order
    [[nodiscard]]
    auto build_json(const TransitionTable& table) -> ordered_json;

    class StateTransitionTable
    {
    public:
        using RowSource = std::function<tl::expected<Rows_t, parser::ParseFailure>()>;

        // the file is not read until one of the views below is first requested
        explicit StateTransitionTable(const std::filesystem::path& stt_csv_file);

        // a table backed by csv text already in memory
        [[nodiscard]]
        static auto from_string(std::string csv_text) -> StateTransitionTable;

        // all of the views below parse on first use and throw parser::ParseException
        // if the table is invalid
        auto transitions() -> const TransitionTable &;
        auto dictify() -> const Adjacency &;
        auto json() -> const ordered_json &;
        auto jsonify() -> const std::string &;
        auto digraph() -> const graph::Digraph &;
        auto dotify() -> const std::string &;

        auto source_name() const -> const std::string & { return m_source_name; }

    private:
        StateTransitionTable(RowSource row_source, std::string source_name);

        auto parse() -> TransitionTable;

        RowSource m_row_source;
        std::string m_source_name;

        utility::Lazy<TransitionTable> m_stt;
        utility::Lazy<Adjacency> m_adjacency;
        utility::Lazy<ordered_json> m_json;
        utility::Lazy<std::string> m_json_string;
        utility::Lazy<graph::Digraph> m_digraph;
        utility::Lazy<std::string> m_dot;
    };
}

#endif
