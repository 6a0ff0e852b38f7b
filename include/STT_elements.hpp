#ifndef STT_ELEMENTS_H
#define STT_ELEMENTS_H

#include <vector>
#include <string>
#include <string_view>
#include <variant>
#include <compare>

namespace parser
{
    // the raw cells of one csv record
    using Row = std::vector<std::string>;

    // a trigger label written verbatim in the table, e.g. "stop"
    struct PlainTrigger
    {
        auto operator<=>(const PlainTrigger &) const = default;

        std::string m_label;
    };

    // a "_name" trigger, or the one synthesised from the destination when omitted
    struct EventTrigger
    {
        auto operator<=>(const EventTrigger &) const = default;

        std::string m_name;
    };

    // a "__<seconds>" trigger
    struct TimedTrigger
    {
        auto operator<=>(const TimedTrigger &) const = default;

        long long m_seconds;
    };

    using Trigger = std::variant<PlainTrigger, EventTrigger, TimedTrigger>;

    struct STTTransition
    {
        STTTransition() = default;
        STTTransition(
            std::string_view trigger,
            std::string_view source,
            std::string_view dest
        )
            : m_trigger{trigger},
              m_source{source},
              m_dest{dest} {}

        auto operator<=>(const STTTransition &) const = default;

        // field order is the export order
        std::string m_trigger;
        std::string m_source;
        std::string m_dest;
    };
}

using Rows_t = std::vector<parser::Row>;
using TransitionTable = std::vector<parser::STTTransition>;

#endif
