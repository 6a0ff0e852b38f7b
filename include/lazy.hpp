#ifndef LAZY_H
#define LAZY_H

#include <concepts>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace utility
{
    // a value computed on first read and kept for the lifetime of the owner
    template <std::movable T>
    class Lazy
    {
    public:
        Lazy() : m_value{std::nullopt} {}

        // returns the cached value, computing it first if this is the first read.
        // if compute throws nothing is cached and the next read tries again
        template <std::invocable F>
        requires std::convertible_to<std::invoke_result_t<F>, T>
        auto get(F&& compute) -> const T &
        {
            if (!m_value.has_value())
            {
                m_value.emplace(std::invoke(std::forward<F>(compute)));
            }
            return m_value.value();
        }

        auto computed() const -> bool
        {
            return m_value.has_value();
        }

    private:
        std::optional<T> m_value;
    };
}

#endif
