#ifndef GRAPH_H
#define GRAPH_H

#include "STT_elements.hpp"

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>
#include <compare>

namespace graph
{
    struct Edge
    {
        Edge() = default;
        Edge(
            std::string_view source,
            std::string_view dest,
            std::string_view label
        )
            : m_source{source},
              m_dest{dest},
              m_label{label} {}

        auto operator<=>(const Edge &) const = default;

        std::string m_source;
        std::string m_dest;
        std::string m_label;
    };

    // a directed multigraph in registration order, the form handed to graphviz
    class Digraph
    {
    public:
        // registering a node twice is a no-op
        auto node(std::string_view name) -> void;

        // parallel edges are kept, never merged
        auto edge(std::string_view source, std::string_view dest, std::string_view label) -> void;

        auto nodes() const -> const std::vector<std::string> & { return m_nodes; }
        auto edges() const -> const std::vector<Edge> & { return m_edges; }

        // the DOT language source, one statement per line in registration order
        auto source() const -> std::string;

    private:
        std::vector<std::string> m_nodes;
        std::unordered_set<std::string> m_known_nodes;
        std::vector<Edge> m_edges;

        // node and edge statements, interleaved as they were registered
        std::vector<std::string> m_body;
    };

    // a DOT identifier, quoted unless it is a plain ID or numeral
    [[nodiscard]]
    auto dot_id(std::string_view s) -> std::string;

    [[nodiscard]]
    auto build_digraph(const TransitionTable& table) -> Digraph;
}

#endif
