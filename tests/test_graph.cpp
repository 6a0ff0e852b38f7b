#include <doctest/doctest.h>
#include "../include/graph.hpp"

using namespace graph;

TEST_CASE("Graph - node registration is idempotent")
{
    Digraph dot;
    dot.node("A");
    dot.node("B");
    dot.node("A");
    CHECK(dot.nodes() == std::vector<std::string>{"A", "B"});
}

TEST_CASE("Graph - parallel edges are preserved")
{
    TransitionTable table{
        parser::STTTransition("x", "A", "B"),
        parser::STTTransition("y", "A", "B"),
        parser::STTTransition("back", "B", "A"),
    };
    auto dot = build_digraph(table);
    CHECK(dot.nodes() == std::vector<std::string>{"A", "B"});
    REQUIRE(dot.edges().size() == 3);
    CHECK(dot.edges()[0] == Edge("A", "B", "x"));
    CHECK(dot.edges()[1] == Edge("A", "B", "y"));
    CHECK(dot.edges()[2] == Edge("B", "A", "back"));
}

TEST_CASE("Graph - DOT identifiers")
{
    CHECK(dot_id("Idle") == "Idle");
    CHECK(dot_id("_x1") == "_x1");
    CHECK(dot_id("42") == "42");
    CHECK(dot_id("-3.5") == "-3.5");
    CHECK(dot_id(".5") == ".5");
    CHECK(dot_id("Caf\xc3\xa9") == "Caf\xc3\xa9");

    CHECK(dot_id("") == "\"\"");
    CHECK(dot_id("two words") == "\"two words\"");
    CHECK(dot_id("(after 5 sec.)") == "\"(after 5 sec.)\"");
    CHECK(dot_id("1abc") == "\"1abc\"");
    CHECK(dot_id("-") == "\"-\"");
    CHECK(dot_id(".") == "\".\"");
    CHECK(dot_id("say \"hi\"") == "\"say \\\"hi\\\"\"");

    // escaped quotes stay as they are, a dangling backslash is doubled
    CHECK(dot_id(R"(say \hi\")") == R"("say \hi\"")");
    CHECK(dot_id(R"(end\)") == R"("end\\")");
    CHECK(dot_id(R"(two\\)") == R"("two\\")");
    CHECK(dot_id(R"(a\\"b)") == R"("a\\\"b")");

    // keywords are quoted whatever their case
    CHECK(dot_id("node") == "\"node\"");
    CHECK(dot_id("Graph") == "\"Graph\"");
    CHECK(dot_id("nodes") == "nodes");
}

TEST_CASE("Graph - DOT source")
{
    SUBCASE("empty")
    {
        Digraph dot;
        CHECK(dot.source() == "digraph {\n}\n");
    }

    SUBCASE("statements follow registration order")
    {
        auto dot = build_digraph({
            parser::STTTransition("go", "A", "B"),
            parser::STTTransition("EVT_C", "B", "C"),
            parser::STTTransition("(after 1 sec.)", "C", "A"),
        });
        CHECK(dot.source() ==
            "digraph {\n"
            "\tA\n"
            "\tB\n"
            "\tA -> B [label=go]\n"
            "\tC\n"
            "\tB -> C [label=EVT_C]\n"
            "\tC -> A [label=\"(after 1 sec.)\"]\n"
            "}\n");
    }
}
