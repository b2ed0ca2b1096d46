#include "uuid-codec.hpp"
#include <sstream>
#include <stdexcept>

namespace UUID{
    namespace {
        // Canonical layout of the uuid fields.
        // offset is the first byte of the field in Uuid::bytes,
        // num_chars is the number of hex characters in the string,
        // separated is true if a hyphen precedes the field.
        struct Field
        {
            Section section;
            std::size_t offset;
            std::size_t num_chars;
            bool separated;
        };
        constexpr Field FIELDS[] = {
            {Section::TIME_LOW, 0, 8, false},
            {Section::TIME_MID, 4, 4, true},
            {Section::VERSION_AND_TIME_HIGH, 6, 4, true},
            {Section::CLOCK_SEQ_HI_AND_RESERVED, 8, 2, true},
            {Section::CLOCK_SEQ_LOW, 9, 2, false},
            {Section::NODE, 10, 12, true}
        };
        constexpr std::size_t MAX_FIELD_CHARS = 12;

        ParseError stream_error(){
            return ParseError{ReadError{std::make_error_code(std::io_errc::stream)}};
        }
    }

    unsigned char hex_value(char c){
        if(c >= '0' && c <= '9'){
            return static_cast<unsigned char>(c - '0');
        } else if (c >= 'a' && c <= 'f'){
            return static_cast<unsigned char>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F'){
            return static_cast<unsigned char>(c - 'A' + 10);
        }
        return 0;
    }

    bool is_hex_digit(char c){
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    }

    char hex_digit(unsigned char nibble){
        static const char digits[] = "0123456789abcdef";
        return digits[nibble & 0x0F];
    }

    ParseResult read_from(std::istream& is, ParseMode mode){
        Uuid uuid;
        char hex_str[MAX_FIELD_CHARS] = {};
        for(const Field& field: FIELDS){
            if(field.separated){
                if(mode == ParseMode::STRICT){
                    char c = 0;
                    is.get(c);
                    if(is.bad()){
                        return stream_error();
                    }
                    if(!is || c != '-'){
                        return ParseError{InvalidFormat{Section::SEPARATOR, 1, 0}};
                    }
                } else {
                    // The hyphen position is consumed without checking it.
                    is.ignore(1);
                    if(is.bad()){
                        return stream_error();
                    }
                }
            }

            is.read(hex_str, field.num_chars);
            std::size_t length = static_cast<std::size_t>(is.gcount());
            if(is.bad()){
                return stream_error();
            }
            if(length != field.num_chars){
                return ParseError{InvalidFormat{field.section, field.num_chars, length}};
            }
            if(mode == ParseMode::STRICT){
                std::size_t num_digits = 0;
                while(num_digits < length && is_hex_digit(hex_str[num_digits])){
                    ++num_digits;
                }
                if(num_digits != field.num_chars){
                    return ParseError{InvalidFormat{field.section, field.num_chars, num_digits}};
                }
            }

            // Two characters per byte, most significant first.
            for(std::size_t i=0; i < field.num_chars; i+=2){
                uuid.bytes[field.offset + (i>>1)] = static_cast<unsigned char>(
                    (hex_value(hex_str[i]) << 4) | hex_value(hex_str[i+1])
                );
            }
        }
        return uuid;
    }

    ParseResult parse(std::string_view text){
        if(text.size() != CANONICAL_LENGTH){
            return ParseError{InvalidLength{CANONICAL_LENGTH, text.size()}};
        }
        std::istringstream ss{std::string(text)};
        return read_from(ss, ParseMode::LENIENT);
    }

    ParseResult parse_strict(std::string_view text, unsigned int expected_version){
        if(text.size() != CANONICAL_LENGTH){
            return ParseError{InvalidLength{CANONICAL_LENGTH, text.size()}};
        }
        std::istringstream ss{std::string(text)};
        ParseResult res = read_from(ss, ParseMode::STRICT);
        if(!res){
            return res;
        }
        unsigned int actual = res.value().version();
        if(actual != expected_version){
            return ParseError{InvalidVersion{expected_version, actual}};
        }
        return res;
    }

    std::string_view format(const Uuid& uuid, char* buf, std::size_t buflen){
        if(buflen != CANONICAL_LENGTH){
            std::cerr << "uuid-codec.cpp:130:format buffer must be " << CANONICAL_LENGTH << " bytes, got " << buflen << "." << std::endl;
            throw std::length_error("uuid format buffer has the wrong length.");
        }
        std::size_t pos = 0;
        for(const Field& field: FIELDS){
            if(field.separated){
                buf[pos++] = '-';
            }
            for(std::size_t i=0; i < (field.num_chars>>1); ++i){
                unsigned char byte = uuid.bytes[field.offset + i];
                buf[pos++] = hex_digit(byte >> 4);
                buf[pos++] = hex_digit(byte);
            }
        }
        return std::string_view(buf, CANONICAL_LENGTH);
    }

    std::string_view format(const Uuid& uuid, FormatBuffer& buf){
        return format(uuid, buf.data(), buf.size());
    }

    std::string to_string(const Uuid& uuid){
        FormatBuffer buf;
        return std::string(format(uuid, buf));
    }

    std::ostream& operator<<(std::ostream& os, const Uuid& uuid){
        FormatBuffer buf;
        os << format(uuid, buf);
        return os;
    }

    std::istream& operator>>(std::istream& is, Uuid& uuid){
        ParseResult res = read_from(is, ParseMode::LENIENT);
        if(res){
            uuid = res.value();
        } else {
            is.setstate(std::ios_base::failbit);
        }
        return is;
    }
}
