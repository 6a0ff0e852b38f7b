#ifndef PARSER_H
#define PARSER_H

#include "STT_elements.hpp"

#include <string>
#include <string_view>
#include <optional>
#include <stdexcept>

#include <tl/expected.hpp>

namespace parser
{

    enum class ParseError
    {
        EmptyPath,
        FileOpenError,
        MalformedRowError,
        InvalidEncodingError,
        HeaderFormatError,
        MissingSourceError,
        MissingDestinationError,
        InvalidTimedTriggerError,
        StructuralInvariantError
    };

    // what went wrong, on which raw row (empty when the failure is not tied to a row)
    struct ParseFailure
    {
        ParseFailure(ParseError error, std::string_view message)
            : m_error{error},
              m_row{},
              m_message{message} {}

        ParseFailure(ParseError error, const Row &row, std::string_view message)
            : m_error{error},
              m_row{row},
              m_message{message} {}

        ParseError m_error;
        Row m_row;
        std::string m_message;
    };

    class ParseException : public std::runtime_error
    {
    public:
        explicit ParseException(const ParseFailure &failure);

        auto failure() const -> const ParseFailure & { return m_failure; }

    private:
        ParseFailure m_failure;
    };

    [[nodiscard]]
    auto to_string(ParseError err) -> std::string_view;

    // the user facing text of a failure, e.g. "Invalid row: ['A', '', 'go']. Undefined destination state."
    [[nodiscard]]
    auto describe(const ParseFailure &failure) -> std::string;

    // throws a ParseException for the failure; usable as the or_else of a parse chain
    void HandleParseError(const ParseFailure &failure);

    // classifies a raw trigger cell; an empty trigger becomes an event named after dest
    [[nodiscard]]
    auto classify_trigger(std::string_view raw_trigger, std::string_view dest) -> tl::expected<Trigger, ParseFailure>;

    [[nodiscard]]
    auto trigger_label(const Trigger &trigger) -> std::string;

    // resolves one (source, dest, trigger) row. previous_source is read when the source
    // cell is empty and replaced when it is not
    [[nodiscard]]
    auto normalize_row(const Row &row, std::optional<std::string> &previous_source)
        -> tl::expected<STTTransition, ParseFailure>;
}

#endif
