#ifndef UUID_CODEC_HPP
#define UUID_CODEC_HPP
#include "uuid.hpp"
#include "uuid-errors.hpp"
#include <array>
#include <iostream>
#include <string>
#include <string_view>

namespace UUID{
    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    constexpr std::size_t CANONICAL_LENGTH = 36;

    // Lenient parsing skips the hyphen positions without looking at them
    // and decodes any non hex character as 0.
    // Strict parsing rejects both with InvalidFormat.
    enum class ParseMode
    {
        LENIENT,
        STRICT
    };

    // '0'-'9', 'a'-'f' and 'A'-'F' map to 0-15. Everything else maps to 0.
    unsigned char hex_value(char c);
    bool is_hex_digit(char c);
    // Lowercase hex digit of the low nibble.
    char hex_digit(unsigned char nibble);

    ParseResult parse(std::string_view text);
    // Same as parse() in strict mode, and the version nibble must equal
    // expected_version.
    ParseResult parse_strict(std::string_view text, unsigned int expected_version);
    // Reads exactly one canonical uuid (36 characters) from the stream.
    ParseResult read_from(std::istream& is, ParseMode mode = ParseMode::LENIENT);

    using FormatBuffer = std::array<char, CANONICAL_LENGTH>;
    // Writes the lowercase canonical form into buf and returns a view of it.
    // No allocation. buflen must be exactly CANONICAL_LENGTH, any other
    // length throws std::length_error.
    std::string_view format(const Uuid& uuid, char* buf, std::size_t buflen);
    std::string_view format(const Uuid& uuid, FormatBuffer& buf);
    std::string to_string(const Uuid& uuid);

    std::ostream& operator<<(std::ostream& os, const Uuid& uuid);
    // Lenient read_from(). Sets failbit and leaves uuid untouched on error.
    std::istream& operator>>(std::istream& is, Uuid& uuid);
}
#endif
