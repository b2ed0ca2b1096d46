#ifndef UUID_ERRORS_HPP
#define UUID_ERRORS_HPP
#include "uuid.hpp"
#include <cstddef>
#include <ostream>
#include <system_error>
#include <type_traits>
#include <variant>

namespace UUID{
    // Fixed width fields of the canonical form:
    // TimeLow-TimeMid-VersionAndTimeHigh-ClockSeqHiAndReservedClockSeqLow-Node
    // Separator names a hyphen position (strict parsing only).
    // Document is the enclosing value when a uuid is embedded in
    // another format.
    enum class Section
    {
        TIME_LOW,
        TIME_MID,
        VERSION_AND_TIME_HIGH,
        CLOCK_SEQ_HI_AND_RESERVED,
        CLOCK_SEQ_LOW,
        NODE,
        SEPARATOR,
        DOCUMENT
    };
    const char* section_name(Section section);
    std::ostream& operator<<(std::ostream& os, const Section& section);

    struct InvalidLength
    {
        std::size_t expected;
        std::size_t actual;
    };

    // expected and actual count characters.
    struct InvalidFormat
    {
        Section section;
        std::size_t expected;
        std::size_t actual;
    };

    // Only reported by strict parsing.
    struct InvalidVersion
    {
        unsigned int expected;
        unsigned int actual;
    };

    // The underlying character stream failed.
    struct ReadError
    {
        std::error_code ec;
    };

    using ParseError = std::variant<InvalidLength, InvalidFormat, InvalidVersion, ReadError>;
    std::ostream& operator<<(std::ostream& os, const ParseError& error);

    // Error codes for each ParseError alternative, in variant order.
    enum class ParseErrc
    {
        INVALID_LENGTH = 1,
        INVALID_FORMAT,
        INVALID_VERSION,
        READ_ERROR
    };
    const std::error_category& parse_category();
    std::error_code make_error_code(ParseErrc e);
    ParseErrc kind(const ParseError& error);

    // Holds either a parsed Uuid or the reason parsing failed.
    class ParseResult
    {
    public:
        ParseResult(const Uuid& uuid): result_{uuid} {}
        ParseResult(const ParseError& error): result_{error} {}

        explicit operator bool() const { return std::holds_alternative<Uuid>(result_); }

        // Both accessors throw std::bad_variant_access if the
        // result holds the other alternative.
        const Uuid& value() const { return std::get<Uuid>(result_); }
        const ParseError& error() const { return std::get<ParseError>(result_); }

    private:
        std::variant<Uuid, ParseError> result_;
    };
}

namespace std{
    template<>
    struct is_error_code_enum<UUID::ParseErrc>: true_type {};
}
#endif
