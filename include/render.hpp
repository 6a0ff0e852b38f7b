#ifndef RENDER_H
#define RENDER_H

#include <array>
#include <filesystem>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace render
{
    // the output formats accepted by graphviz's -T flag
    inline constexpr std::array<std::string_view, 55> FORMATS = {
        "bmp", "canon", "dot", "gv", "xdot", "xdot1.2", "xdot1.4",
        "cgimage", "cmap", "eps", "exr", "fig", "gd", "gd2", "gif",
        "gtk", "ico", "imap", "cmapx", "imap_np", "cmapx_np", "ismap",
        "jp2", "jpg", "jpeg", "jpe", "json", "json0", "dot_json",
        "xdot_json", "pct", "pict", "pdf", "pic", "plain", "plain-ext",
        "png", "pov", "ps", "ps2", "psd", "sgi", "svg", "svgz", "tga",
        "tif", "tiff", "tk", "vml", "vmlz", "vrml", "wbmp", "webp",
        "xlib", "x11"
    };

    inline constexpr std::string_view DEFAULT_FORMAT = "pdf";

    enum class RenderError
    {
        EmptyFilename,
        UnsupportedFormat,
        WriteSourceError,
        EngineNotFound,
        EngineFailed,
        ViewerFailed
    };

    struct RenderOptions
    {
        std::string m_format{DEFAULT_FORMAT};
        // open the rendered file with the desktop's default viewer
        bool m_view{false};
        std::string m_engine{"dot"};
        std::string m_viewer{"xdg-open"};
    };

    [[nodiscard]]
    auto is_supported_format(std::string_view format) -> bool;

    // the filename with a trailing ".<format>" removed; the DOT source is written here
    [[nodiscard]]
    auto output_stem(const std::filesystem::path& filename, std::string_view format) -> std::filesystem::path;

    // "<stem>.<format>"
    [[nodiscard]]
    auto output_file(const std::filesystem::path& filename, std::string_view format) -> std::filesystem::path;

    // writes dot_source to the stem, runs the layout engine on it and returns the rendered file
    [[nodiscard]]
    auto render(
        std::string_view dot_source,
        const std::filesystem::path& filename,
        const RenderOptions& options
    ) -> tl::expected<std::filesystem::path, RenderError>;

    [[nodiscard]]
    auto to_string(RenderError err) -> std::string_view;

    // throws a std::runtime_error describing err
    void HandleRenderError(const RenderError err);
}

#endif
