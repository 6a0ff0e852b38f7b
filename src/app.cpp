#include "../include/app.hpp"

#include "../include/model.hpp"
#include "../include/render.hpp"
#include "../include/utility.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace app
{
    namespace helpers
    {
        static auto write(const std::string& text, const std::optional<std::filesystem::path>& out_file) -> void
        {
            if (out_file.has_value())
            {
                std::ofstream output_file;
                output_file.open(out_file.value(), std::ios::out | std::ios::trunc);
                if (!output_file.is_open())
                {
                    throw std::runtime_error(fmt::format(
                        "<OUTPUT FILE ERROR> : could not open '{}' for writing", out_file.value().string()));
                }
                output_file << text;
                output_file.close();
                spdlog::debug("wrote {} bytes to {}", text.size(), out_file.value().string());
            }
            else
            {
                fmt::print("{}", text);
            }
        }
    }

    auto run(const std::filesystem::path &path, Options options) -> void
    {
        spdlog::set_level(options.verbose ? spdlog::level::debug : spdlog::level::warn);

        model::StateTransitionTable stt(path);
        spdlog::debug("reading state transition table {}", stt.source_name());

        const auto& transitions = stt.transitions();
        spdlog::debug("parsed {} transitions", transitions.size());

        std::visit(utility::overloaded{
            [&](const Jsonify&) {
                helpers::write(stt.jsonify() + "\n", options.out_file);
            },
            [&](const Dotify&) {
                helpers::write(stt.dotify(), options.out_file);
            },
            [&](const Visualize& visualize) {
                render::RenderOptions render_options;
                render_options.m_format = visualize.format;
                render_options.m_view = visualize.view;

                spdlog::debug("rendering {} as {}",
                    render::output_file(visualize.filename, visualize.format).string(), visualize.format);

                auto rendered = render::render(stt.dotify(), visualize.filename, render_options)
                    .or_else(render::HandleRenderError);

                spdlog::info("rendered {}", rendered.value().string());
            }
        }, options.command);
    }
}
