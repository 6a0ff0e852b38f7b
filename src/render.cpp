#include "../include/render.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace render
{
    namespace helpers
    {
        constexpr int EXEC_FAILED = 127;

        // runs argv[0] with the given arguments and waits for it to finish
        static auto run_process(std::vector<std::string> args) -> tl::expected<int, RenderError>
        {
            std::vector<char *> argv;
            for (auto& arg : args)
            {
                argv.push_back(arg.data());
            }
            argv.push_back(nullptr);

            pid_t pid = fork();
            if (pid < 0)
            {
                return tl::unexpected<RenderError>(RenderError::EngineFailed);
            }
            if (pid == 0)
            {
                execvp(argv[0], argv.data());
                _exit(EXEC_FAILED);
            }

            int status = 0;
            while (waitpid(pid, &status, 0) < 0)
            {
                if (errno != EINTR)
                {
                    return tl::unexpected<RenderError>(RenderError::EngineFailed);
                }
            }
            if (!WIFEXITED(status))
            {
                return tl::unexpected<RenderError>(RenderError::EngineFailed);
            }
            return WEXITSTATUS(status);
        }

        static auto write_source(const std::filesystem::path& path, std::string_view dot_source) -> bool
        {
            std::ofstream output_file;
            output_file.open(path, std::ios::out | std::ios::trunc);
            if (!output_file.is_open())
            {
                return false;
            }
            output_file << dot_source;
            output_file.close();
            return !output_file.fail();
        }
    }

    auto is_supported_format(std::string_view format) -> bool
    {
        return std::ranges::find(FORMATS, format) != FORMATS.end();
    }

    auto output_stem(const std::filesystem::path& filename, std::string_view format) -> std::filesystem::path
    {
        auto name = filename.string();
        auto suffix = fmt::format(".{}", format);
        if (name.size() > suffix.size() && name.ends_with(suffix))
        {
            name.erase(name.size() - suffix.size());
        }
        return std::filesystem::path{name};
    }

    auto output_file(const std::filesystem::path& filename, std::string_view format) -> std::filesystem::path
    {
        auto rendered = output_stem(filename, format);
        rendered += fmt::format(".{}", format);
        return rendered;
    }

    auto render(
        std::string_view dot_source,
        const std::filesystem::path& filename,
        const RenderOptions& options
    ) -> tl::expected<std::filesystem::path, RenderError>
    {
        if (filename.empty())
        {
            return tl::unexpected<RenderError>(RenderError::EmptyFilename);
        }
        if (!is_supported_format(options.m_format))
        {
            return tl::unexpected<RenderError>(RenderError::UnsupportedFormat);
        }

        auto stem = output_stem(filename, options.m_format);
        auto rendered = output_file(filename, options.m_format);

        if (!helpers::write_source(stem, dot_source))
        {
            return tl::unexpected<RenderError>(RenderError::WriteSourceError);
        }

        auto status = helpers::run_process({
            options.m_engine,
            fmt::format("-T{}", options.m_format),
            "-o", rendered.string(),
            stem.string()
        });

        // the DOT source is only an intermediate
        std::error_code ec;
        std::filesystem::remove(stem, ec);

        if (!status)
        {
            return tl::unexpected<RenderError>(status.error());
        }
        if (status.value() == helpers::EXEC_FAILED)
        {
            return tl::unexpected<RenderError>(RenderError::EngineNotFound);
        }
        if (status.value() != 0)
        {
            return tl::unexpected<RenderError>(RenderError::EngineFailed);
        }

        if (options.m_view)
        {
            auto viewed = helpers::run_process({options.m_viewer, rendered.string()});
            if (!viewed || viewed.value() != 0)
            {
                return tl::unexpected<RenderError>(RenderError::ViewerFailed);
            }
        }

        return rendered;
    }

    auto to_string(RenderError err) -> std::string_view
    {
        switch (err)
        {
        case RenderError::EmptyFilename:
            return "EmptyFilename";
        case RenderError::UnsupportedFormat:
            return "UnsupportedFormat";
        case RenderError::WriteSourceError:
            return "WriteSourceError";
        case RenderError::EngineNotFound:
            return "EngineNotFound";
        case RenderError::EngineFailed:
            return "EngineFailed";
        case RenderError::ViewerFailed:
            return "ViewerFailed";
        }
        return "UnknownRenderError";
    }

    void HandleRenderError(const RenderError err)
    {
        switch (err)
        {
        case RenderError::EmptyFilename:
            throw std::runtime_error(
                "<EMPTY FILENAME> : you must name the file to render the state machine to");
            break;
        case RenderError::UnsupportedFormat:
            throw std::runtime_error(fmt::format(
                "<UNSUPPORTED FORMAT> : the format must be one of: {}", fmt::join(FORMATS, ", ")));
            break;
        case RenderError::WriteSourceError:
            throw std::runtime_error(
                "<WRITE SOURCE ERROR> : could not write the DOT source next to the output file");
            break;
        case RenderError::EngineNotFound:
            throw std::runtime_error(
                "<ENGINE NOT FOUND> : could not run the graphviz 'dot' executable"
                " - is graphviz installed and on your PATH?");
            break;
        case RenderError::EngineFailed:
            throw std::runtime_error(
                "<ENGINE FAILED> : graphviz could not render the state machine");
            break;
        case RenderError::ViewerFailed:
            throw std::runtime_error(
                "<VIEWER FAILED> : the rendered file could not be opened");
            break;
        default:
            throw std::runtime_error(
                "Something unexpected went wrong ... try again.");
            break;
        }
    }
}
