#include "../include/parser.hpp"
#include "../include/STT_elements.hpp"
#include "../include/utility.hpp"

#include <charconv>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

#include <fmt/format.h>

namespace parser
{
    // naming of the table cells and trigger encodings
    namespace
    {
        constexpr std::string_view EVENT_PREFIX = "_";
        constexpr std::string_view EVENT_STR = "EVT";
        constexpr std::string_view TIMED_TRANSITION_PREFIX = "__";
        constexpr std::string_view INVALID_ROW_MSG = "Invalid row";

        constexpr std::size_t SOURCE_COLUMN = 0;
        constexpr std::size_t DEST_COLUMN = 1;
        constexpr std::size_t TRIGGER_COLUMN = 2;
    }

    // helper functions
    namespace helpers
    {
        static auto is_space(char c) -> bool
        {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        static auto trim(std::string_view s) -> std::string_view
        {
            while (!s.empty() && is_space(s.front()))
            {
                s.remove_prefix(1);
            }
            while (!s.empty() && is_space(s.back()))
            {
                s.remove_suffix(1);
            }
            return s;
        }

        // an integer the way a human writes it: optional sign, digits, optional padding
        static auto to_seconds(std::string_view str) -> std::optional<long long>
        {
            auto digits = trim(str);
            if (!digits.empty() && digits.front() == '+')
            {
                digits.remove_prefix(1);
                if (!digits.empty() && digits.front() == '-')
                {
                    return std::nullopt;
                }
            }
            if (digits.empty())
            {
                return std::nullopt;
            }

            long long value = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
            if (ec != std::errc{} || ptr != digits.data() + digits.size())
            {
                return std::nullopt;
            }
            return value;
        }
    }

    ParseException::ParseException(const ParseFailure &failure)
        : std::runtime_error{describe(failure)},
          m_failure{failure}
    {}

    auto to_string(ParseError err) -> std::string_view
    {
        switch (err)
        {
        case ParseError::EmptyPath:
            return "EmptyPath";
        case ParseError::FileOpenError:
            return "FileOpenError";
        case ParseError::MalformedRowError:
            return "MalformedRowError";
        case ParseError::InvalidEncodingError:
            return "InvalidEncodingError";
        case ParseError::HeaderFormatError:
            return "HeaderFormatError";
        case ParseError::MissingSourceError:
            return "MissingSourceError";
        case ParseError::MissingDestinationError:
            return "MissingDestinationError";
        case ParseError::InvalidTimedTriggerError:
            return "InvalidTimedTriggerError";
        case ParseError::StructuralInvariantError:
            return "StructuralInvariantError";
        }
        return "UnknownParseError";
    }

    auto describe(const ParseFailure &failure) -> std::string
    {
        switch (failure.m_error)
        {
        case ParseError::MalformedRowError:
        case ParseError::InvalidEncodingError:
        case ParseError::MissingSourceError:
        case ParseError::MissingDestinationError:
        case ParseError::InvalidTimedTriggerError:
        case ParseError::StructuralInvariantError:
            return fmt::format("{}: {}. {}", INVALID_ROW_MSG, utility::list_repr(failure.m_row), failure.m_message);
        default:
            return failure.m_message;
        }
    }

    void HandleParseError(const ParseFailure &failure)
    {
        throw ParseException(failure);
    }

    auto classify_trigger(std::string_view raw_trigger, std::string_view dest) -> tl::expected<Trigger, ParseFailure>
    {
        if (raw_trigger.starts_with(TIMED_TRANSITION_PREFIX))
        {
            auto trigger_suffix = raw_trigger.substr(TIMED_TRANSITION_PREFIX.size());
            auto seconds = helpers::to_seconds(trigger_suffix);
            if (!seconds)
            {
                return tl::unexpected<ParseFailure>(ParseFailure(
                    ParseError::InvalidTimedTriggerError,
                    fmt::format(
                        "A '{}' prefix indicates a timed transition and must be "
                        "followed by a number (seconds). Invalid value: {}",
                        TIMED_TRANSITION_PREFIX,
                        trigger_suffix
                    )
                ));
            }
            return TimedTrigger{seconds.value()};
        }

        // an omitted trigger is the event of entering dest
        if (raw_trigger.empty())
        {
            return EventTrigger{std::string(dest)};
        }

        if (raw_trigger.starts_with(EVENT_PREFIX))
        {
            return EventTrigger{std::string(raw_trigger.substr(EVENT_PREFIX.size()))};
        }

        return PlainTrigger{std::string(raw_trigger)};
    }

    auto trigger_label(const Trigger &trigger) -> std::string
    {
        return std::visit(utility::overloaded{
            [](const PlainTrigger &t) { return t.m_label; },
            [](const EventTrigger &t) { return fmt::format("{}_{}", EVENT_STR, t.m_name); },
            [](const TimedTrigger &t) { return fmt::format("(after {} sec.)", t.m_seconds); }
        }, trigger);
    }

    auto normalize_row(const Row &row, std::optional<std::string> &previous_source)
        -> tl::expected<STTTransition, ParseFailure>
    {
        if (row.size() <= TRIGGER_COLUMN)
        {
            return tl::unexpected<ParseFailure>(ParseFailure(
                ParseError::MalformedRowError,
                row,
                fmt::format("Expected {} columns (source, dest, trigger), found {}.", TRIGGER_COLUMN + 1, row.size())
            ));
        }

        const auto &raw_source = row[SOURCE_COLUMN];
        const auto &dest = row[DEST_COLUMN];
        const auto &raw_trigger = row[TRIGGER_COLUMN];

        std::string source;
        if (raw_source.empty() && !previous_source.has_value())
        {
            return tl::unexpected<ParseFailure>(ParseFailure(
                ParseError::MissingSourceError, row, "Undefined previous source state."));
        }
        else if (raw_source.empty())
        {
            source = previous_source.value();
        }
        else
        {
            source = raw_source;
            previous_source = raw_source;
        }

        if (dest.empty())
        {
            return tl::unexpected<ParseFailure>(ParseFailure(
                ParseError::MissingDestinationError, row, "Undefined destination state."));
        }

        return classify_trigger(raw_trigger, dest)
            .map([&](const Trigger &trigger) {
                return STTTransition(trigger_label(trigger), source, dest);
            })
            .map_error([&row](ParseFailure failure) {
                failure.m_row = row;
                return failure;
            });
    }
}
