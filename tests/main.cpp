#include "uuid/uuid-tests.hpp"
#include "uuid/codec-tests.hpp"
#include "test-report.hpp"
#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[]){
    std::size_t failures = 0;
    {
        // UUID tests.
        using namespace tests;
        std::size_t test_num = 1;
        report("Uuid", test_num, failures, UuidTests());
        report("Uuid", test_num, failures, UuidTests(UuidTests::test_version4));
        report("Uuid", test_num, failures, UuidTests(UuidTests::test_fixed_bytes));
        report("Uuid", test_num, failures, UuidTests(UuidTests::test_short_reads));
        report("Uuid", test_num, failures, UuidTests(UuidTests::test_exhausted));
        report("Uuid", test_num, failures, UuidTests(UuidTests::test_seeded));
        report("Uuid", test_num, failures, UuidTests(UuidTests::test_uniqueness));
        report("Uuid", test_num, failures, UuidTests(UuidTests::test_threads));
        report("Uuid", test_num, failures, UuidTests(UuidTests::test_version_accessor));
        report("Uuid", test_num, failures, UuidTests(UuidTests::test_fields));
        report("Uuid", test_num, failures, UuidTests(UuidTests::test_variants));
        report("Uuid", test_num, failures, UuidTests(UuidTests::test_copy));
    }
    {
        // Codec tests.
        using namespace tests;
        std::size_t test_num = 1;
        report("Codec", test_num, failures, CodecTests(CodecTests::test_hex_value));
        report("Codec", test_num, failures, CodecTests(CodecTests::test_parse_vector));
        report("Codec", test_num, failures, CodecTests(CodecTests::test_invalid_length));
        report("Codec", test_num, failures, CodecTests(CodecTests::test_uuid_round_trip));
        report("Codec", test_num, failures, CodecTests(CodecTests::test_text_round_trip));
        report("Codec", test_num, failures, CodecTests(CodecTests::test_case_insensitive));
        report("Codec", test_num, failures, CodecTests(CodecTests::test_lenient_hex));
        report("Codec", test_num, failures, CodecTests(CodecTests::test_lenient_separator));
        report("Codec", test_num, failures, CodecTests(CodecTests::test_strict));
        report("Codec", test_num, failures, CodecTests(CodecTests::test_format_buffer));
        report("Codec", test_num, failures, CodecTests(CodecTests::test_format_buffer_length));
        report("Codec", test_num, failures, CodecTests(CodecTests::test_stream_insertion));
        report("Codec", test_num, failures, CodecTests(CodecTests::test_stream_extraction));
        report("Codec", test_num, failures, CodecTests(CodecTests::test_read_error));
        report("Codec", test_num, failures, CodecTests(CodecTests::test_error_codes));
    }
    return (failures == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
