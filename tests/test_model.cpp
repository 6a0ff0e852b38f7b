#include <doctest/doctest.h>
#include "../include/model.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace model;

static constexpr auto TRAFFIC_LIGHT =
    "SOURCE,DEST,TRIGGER\n"
    "Idle,Running,_start\n"
    ",Running,__10\n"
    "Running,Idle,stop\n";

TEST_CASE("Model - transitions are parsed lazily and once")
{
    auto stt = StateTransitionTable::from_string(TRAFFIC_LIGHT);
    const auto& first = stt.transitions();
    const auto& second = stt.transitions();
    CHECK(&first == &second);
    REQUIRE(first.size() == 3);
    CHECK(first[0] == parser::STTTransition("EVT_start", "Idle", "Running"));
    CHECK(first[1] == parser::STTTransition("(after 10 sec.)", "Idle", "Running"));
    CHECK(first[2] == parser::STTTransition("stop", "Running", "Idle"));
}

TEST_CASE("Model - invalid tables throw on access")
{
    auto stt = StateTransitionTable::from_string("SOURCE,DEST,TRIGGER\nRunning,,stop\n");
    CHECK_THROWS_AS(stt.transitions(), parser::ParseException);
    CHECK_THROWS_AS(stt.jsonify(), parser::ParseException);
    CHECK_THROWS_WITH_AS(stt.dotify(), "Invalid row: ['Running', '', 'stop']. Undefined destination state.",
                         parser::ParseException);

    auto bad_header = StateTransitionTable::from_string("FROM,TO,ON\n");
    CHECK_THROWS_WITH_AS(bad_header.dictify(),
                         "Invalid header format: must be: ['SOURCE', 'DEST', 'TRIGGER']",
                         parser::ParseException);
}

TEST_CASE("Model - adjacency is last write wins")
{
    auto stt = StateTransitionTable::from_string(
        "SOURCE,DEST,TRIGGER\n"
        "A,B,x\n"
        ",C,\n"
        "A,B,y\n");
    const auto& adjacency = stt.dictify();
    REQUIRE(adjacency.size() == 1);
    CHECK(adjacency.at("A").at("B") == "y");
    CHECK(adjacency.at("A").at("C") == "EVT_C");

    // the other views keep both
    CHECK(stt.transitions().size() == 3);
    CHECK(stt.digraph().edges().size() == 3);
}

TEST_CASE("Model - json export")
{
    auto stt = StateTransitionTable::from_string(TRAFFIC_LIGHT);

    const std::string expected =
        "{\n"
        "    \"transitions\": [\n"
        "        {\n"
        "            \"trigger\": \"EVT_start\",\n"
        "            \"source\": \"Idle\",\n"
        "            \"dest\": \"Running\"\n"
        "        },\n"
        "        {\n"
        "            \"trigger\": \"(after 10 sec.)\",\n"
        "            \"source\": \"Idle\",\n"
        "            \"dest\": \"Running\"\n"
        "        },\n"
        "        {\n"
        "            \"trigger\": \"stop\",\n"
        "            \"source\": \"Running\",\n"
        "            \"dest\": \"Idle\"\n"
        "        }\n"
        "    ]\n"
        "}";
    CHECK(stt.jsonify() == expected);

    SUBCASE("repeated exports are identical")
    {
        auto again = StateTransitionTable::from_string(TRAFFIC_LIGHT);
        CHECK(again.jsonify() == stt.jsonify());
        CHECK(stt.jsonify() == expected);
    }

    SUBCASE("keys keep their order")
    {
        const auto& transition = stt.json().at("transitions").at(0);
        auto key = transition.begin();
        CHECK(key.key() == "trigger");
        ++key;
        CHECK(key.key() == "source");
        ++key;
        CHECK(key.key() == "dest");
    }
}

TEST_CASE("Model - json export of an empty table")
{
    auto stt = StateTransitionTable::from_string("SOURCE,DEST,TRIGGER\n");
    CHECK(stt.jsonify() == "{\n    \"transitions\": []\n}");
}

TEST_CASE("Model - json escapes non ascii states")
{
    auto stt = StateTransitionTable::from_string("SOURCE,DEST,TRIGGER\nCaf\xc3\xa9,\"say \"\"hi\"\"\",go\n");
    auto json = stt.jsonify();
    CHECK(json.find("\"source\": \"Caf\\u00e9\"") != std::string::npos);
    CHECK(json.find("\"dest\": \"say \\\"hi\\\"\"") != std::string::npos);
}

TEST_CASE("Model - dot export")
{
    auto stt = StateTransitionTable::from_string(TRAFFIC_LIGHT);
    CHECK(stt.dotify() ==
        "digraph {\n"
        "\tIdle\n"
        "\tRunning\n"
        "\tIdle -> Running [label=EVT_start]\n"
        "\tIdle -> Running [label=\"(after 10 sec.)\"]\n"
        "\tRunning -> Idle [label=stop]\n"
        "}\n");
}

TEST_CASE("Model - reading from a file")
{
    auto dir = std::filesystem::temp_directory_path() / "sttp_model_test";
    std::filesystem::create_directories(dir);
    {
        std::ofstream file(dir / "light.csv");
        file << TRAFFIC_LIGHT;
    }

    SUBCASE("the .csv extension is optional")
    {
        StateTransitionTable stt(dir / "light");
        CHECK(stt.source_name() == (dir / "light.csv").string());
        CHECK(stt.transitions().size() == 3);
    }

    SUBCASE("a missing file throws")
    {
        StateTransitionTable stt(dir / "missing.csv");
        CHECK_THROWS_AS(stt.transitions(), parser::ParseException);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Model - invalid utf-8 is a parse error for every view")
{
    auto stt = StateTransitionTable::from_string("SOURCE,DEST,TRIGGER\nA\xff,B,go\n");
    CHECK_THROWS_AS(stt.jsonify(), parser::ParseException);
    CHECK_THROWS_AS(stt.dotify(), parser::ParseException);

    auto error = parser::ParseError::EmptyPath;
    try
    {
        (void)stt.transitions();
    }
    catch (const parser::ParseException& e)
    {
        error = e.failure().m_error;
    }
    CHECK(error == parser::ParseError::InvalidEncodingError);
}

TEST_CASE("Model - adjacency iterates in sorted state order")
{
    auto stt = StateTransitionTable::from_string(
        "SOURCE,DEST,TRIGGER\n"
        "Zulu,Mike,a\n"
        "Alpha,Yankee,b\n"
        ",Bravo,c\n");
    const auto& adjacency = stt.dictify();

    std::vector<std::string> sources;
    for (const auto& [source, dests] : adjacency)
    {
        sources.push_back(source);
    }
    CHECK(sources == std::vector<std::string>{"Alpha", "Zulu"});

    std::vector<std::string> dests;
    for (const auto& [dest, trigger] : adjacency.at("Alpha"))
    {
        dests.push_back(dest);
    }
    CHECK(dests == std::vector<std::string>{"Bravo", "Yankee"});
    CHECK(adjacency.at("Alpha").at("Yankee") == "b");
}
