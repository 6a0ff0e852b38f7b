#ifndef UTILITY_H
#define UTILITY_H

#include <string>
#include <string_view>
#include <numeric>
#include <ranges>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace utility
{
    namespace ranges = std::ranges;
    namespace views = std::views;

    auto join_non_empty_strings(auto&& container, std::string_view delim) -> std::string
    {
        return fmt::format("{}", fmt::join(
                container | views::filter([](std::string_view s){ return !s.empty(); }), //filter the length zero elements
                delim
            )
        );
    }

    // visitor helper for the trigger variant
    template <typename... Ts>
    struct overloaded : Ts...
    {
        using Ts::operator()...;
    };

    template <typename... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    // surrounds s with double quotes. a quote already escaped with a backslash is kept,
    // any other gets one, and a dangling backslash at the end is doubled
    inline auto quote(std::string_view s) -> std::string
    {
        std::string quoted{"\""};
        std::size_t backslashes = 0;
        for (char c : s)
        {
            if (c == '"' && backslashes % 2 == 0)
            {
                quoted += '\\';
            }
            backslashes = (c == '\\') ? backslashes + 1 : 0;
            quoted += c;
        }
        if (backslashes % 2 == 1)
        {
            quoted += '\\';
        }
        quoted += '"';
        return quoted;
    }

    // a python-like rendering of a list of strings, e.g. ['A', '', 'go']
    inline auto list_repr(const auto& container) -> std::string
    {
        return fmt::format("[{}]", fmt::join(
                container | views::transform([](std::string_view s){ return fmt::format("'{}'", s); }),
                ", "
            )
        );
    }
}

#endif
