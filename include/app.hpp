#ifndef APP_H
#define APP_H

#include "render.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace app
{
    // print the json representation of the state machine
    struct Jsonify {};

    // print the DOT language source of the state machine
    struct Dotify {};

    // render the state machine with graphviz
    struct Visualize
    {
        std::filesystem::path filename;
        std::string format{render::DEFAULT_FORMAT};
        bool view{false};
    };

    using Command = std::variant<Jsonify, Dotify, Visualize>;

    struct Options
    {
        Command command;
        // jsonify and dotify write here instead of stdout
        std::optional<std::filesystem::path> out_file;
        bool verbose{false};
    };

    auto run(const std::filesystem::path& path, Options options) -> void;
}

#endif
