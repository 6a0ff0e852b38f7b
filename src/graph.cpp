#include "../include/graph.hpp"
#include "../include/utility.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ranges>

#include <fmt/format.h>

namespace graph
{
    namespace ranges = std::ranges;

    namespace helpers
    {
        constexpr std::array<std::string_view, 6> DOT_KEYWORDS = {
            "node", "edge", "graph", "digraph", "subgraph", "strict"
        };

        // letters, underscore and any byte of a multibyte utf-8 sequence
        static auto is_id_start(unsigned char c) -> bool
        {
            return std::isalpha(c) || c == '_' || c >= 0x80;
        }

        static auto is_id_char(unsigned char c) -> bool
        {
            return is_id_start(c) || std::isdigit(c);
        }

        static auto is_plain_id(std::string_view s) -> bool
        {
            return !s.empty()
                && is_id_start(static_cast<unsigned char>(s.front()))
                && ranges::all_of(s, [](char c) { return is_id_char(static_cast<unsigned char>(c)); });
        }

        // -?(\.[0-9]+|[0-9]+(\.[0-9]*)?)
        static auto is_numeral(std::string_view s) -> bool
        {
            if (!s.empty() && s.front() == '-')
            {
                s.remove_prefix(1);
            }
            if (s.empty())
            {
                return false;
            }

            auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
            auto dot = s.find('.');
            auto integral = s.substr(0, dot);
            if (dot == std::string_view::npos)
            {
                return ranges::all_of(integral, is_digit);
            }
            auto fraction = s.substr(dot + 1);
            if (integral.empty() && fraction.empty())
            {
                return false;
            }
            return ranges::all_of(integral, is_digit) && ranges::all_of(fraction, is_digit);
        }

        static auto is_keyword(std::string_view s) -> bool
        {
            return ranges::any_of(DOT_KEYWORDS, [s](std::string_view keyword) {
                return ranges::equal(s, keyword, [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) == b;
                });
            });
        }
    }

    auto dot_id(std::string_view s) -> std::string
    {
        if (!helpers::is_keyword(s) && (helpers::is_plain_id(s) || helpers::is_numeral(s)))
        {
            return std::string(s);
        }
        return utility::quote(s);
    }

    auto Digraph::node(std::string_view name) -> void
    {
        auto [it, inserted] = m_known_nodes.emplace(name);
        if (inserted)
        {
            m_nodes.emplace_back(name);
            m_body.push_back(dot_id(name));
        }
    }

    auto Digraph::edge(std::string_view source, std::string_view dest, std::string_view label) -> void
    {
        m_edges.emplace_back(source, dest, label);
        m_body.push_back(fmt::format("{} -> {} [label={}]", dot_id(source), dot_id(dest), dot_id(label)));
    }

    auto Digraph::source() const -> std::string
    {
        if (m_body.empty())
        {
            return "digraph {\n}\n";
        }
        return fmt::format(
            "digraph {{\n"
            "\t{}\n"
            "}}\n",
            utility::join_non_empty_strings(m_body, "\n\t")
        );
    }

    auto build_digraph(const TransitionTable& table) -> Digraph
    {
        Digraph dot;
        for (const auto& transition : table)
        {
            dot.node(transition.m_source);
            dot.node(transition.m_dest);
            dot.edge(transition.m_source, transition.m_dest, transition.m_trigger);
        }
        return dot;
    }
}
