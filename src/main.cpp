#include "../include/app.hpp"
#include "../include/render.hpp"

#include <argparse/argparse.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdio>
#include <iostream>

auto main(const int argc, char const * const * const argv) -> int
{
    argparse::ArgumentParser program("sttp", "0.1.0");

    program.add_argument("stt_file")
        .help(".csv state transition table file");
    program.add_argument("-o", "--outfile")
        .help("Specify the file you wish to write the jsonify/dotify output to (optional)");
    program.add_argument("--verbose")
        .help("Log what the parser is doing")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser jsonify_command("jsonify");
    jsonify_command.add_description("Print the json representation of the state machine.");

    argparse::ArgumentParser dotify_command("dotify");
    dotify_command.add_description("Print the DOT language source of the state machine.");

    argparse::ArgumentParser visualize_command("visualize");
    visualize_command.add_description("Visualize the state machine.");
    visualize_command.add_argument("filename")
        .help("The file to render to, the format extension is added when missing");
    visualize_command.add_argument("--format")
        .help("'pdf', 'png', 'svg', etc.")
        .default_value(std::string{render::DEFAULT_FORMAT});
    visualize_command.add_argument("--view")
        .help("Automatically open the resulting file")
        .default_value(false)
        .implicit_value(true);

    program.add_subparser(jsonify_command);
    program.add_subparser(dotify_command);
    program.add_subparser(visualize_command);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    // set up the command and its options
    app::Options options;
    if (program.is_subcommand_used(jsonify_command))
    {
        options.command = app::Jsonify{};
    }
    else if (program.is_subcommand_used(dotify_command))
    {
        options.command = app::Dotify{};
    }
    else if (program.is_subcommand_used(visualize_command))
    {
        auto format = visualize_command.get<std::string>("--format");
        if (!render::is_supported_format(format))
        {
            fmt::print(stderr, "invalid choice for --format: '{}' (choose from {})\n",
                format, fmt::join(render::FORMATS, ", "));
            return 1;
        }
        options.command = app::Visualize{
            visualize_command.get<std::string>("filename"),
            format,
            visualize_command.get<bool>("--view")
        };
    }
    else
    {
        std::cerr << "a subcommand is required: jsonify, dotify or visualize" << std::endl;
        std::cerr << program;
        return 1;
    }

    if (auto o = program.present("-o"))
    {
        options.out_file = std::filesystem::path{*o};
    }
    options.verbose = program.get<bool>("--verbose");

    // run with the options and the required arguments
    try {
        const std::filesystem::path infile{program.get("stt_file")};
        app::run(infile, options);
    }
    catch (const std::exception& err) {
        fmt::print(stderr, "{}\n", err.what());
        return 1;
    }
    return 0;
}
