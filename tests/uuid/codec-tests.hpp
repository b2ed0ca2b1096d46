#ifndef UUID_CODEC_TESTS_HPP
#define UUID_CODEC_TESTS_HPP
#include "../../src/uuid/uuid-codec.hpp"
namespace tests{
    class CodecTests
    {
    public:
        constexpr static struct HexValue{} test_hex_value{};
        constexpr static struct ParseVector{} test_parse_vector{};
        constexpr static struct InvalidLength{} test_invalid_length{};
        constexpr static struct UuidRoundTrip{} test_uuid_round_trip{};
        constexpr static struct TextRoundTrip{} test_text_round_trip{};
        constexpr static struct CaseInsensitive{} test_case_insensitive{};
        constexpr static struct LenientHex{} test_lenient_hex{};
        constexpr static struct LenientSeparator{} test_lenient_separator{};
        constexpr static struct Strict{} test_strict{};
        constexpr static struct FormatBuffer{} test_format_buffer{};
        constexpr static struct FormatBufferLength{} test_format_buffer_length{};
        constexpr static struct StreamInsertion{} test_stream_insertion{};
        constexpr static struct StreamExtraction{} test_stream_extraction{};
        constexpr static struct ReadError{} test_read_error{};
        constexpr static struct ErrorCodes{} test_error_codes{};

        explicit CodecTests(HexValue);
        explicit CodecTests(ParseVector);
        explicit CodecTests(InvalidLength);
        explicit CodecTests(UuidRoundTrip);
        explicit CodecTests(TextRoundTrip);
        explicit CodecTests(CaseInsensitive);
        explicit CodecTests(LenientHex);
        explicit CodecTests(LenientSeparator);
        explicit CodecTests(Strict);
        explicit CodecTests(FormatBuffer);
        explicit CodecTests(FormatBufferLength);
        explicit CodecTests(StreamInsertion);
        explicit CodecTests(StreamExtraction);
        explicit CodecTests(ReadError);
        explicit CodecTests(ErrorCodes);

        operator bool(){ return passed_; }
    private:
        bool passed_;
        UUID::Uuid uuid_;
    };
}
#endif
