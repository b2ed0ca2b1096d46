#include "../uuid/uuid.hpp"
#include "../uuid/uuid-codec.hpp"
#include "../uuid/random-source.hpp"
#include <unistd.h>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string_view>
#include <system_error>

static void usage(){
    std::cerr << "Usage: uuidgen [-n count] [-s seed] | uuidgen -p uuid_string [-S] [-v version]" << std::endl;
}

// Parses a decimal option value, returns false on garbage or overflow.
template<typename T>
static bool parse_number(const char* arg, T& value){
    std::string_view str(arg);
    std::from_chars_result fcres = std::from_chars(str.data(), str.data()+str.size(), value, 10);
    if(fcres.ec != std::errc() || fcres.ptr != str.data()+str.size()){
        std::cerr << "main.cpp:22:" << str << ":" << std::make_error_code(fcres.ec == std::errc() ? std::errc::invalid_argument : fcres.ec).message() << std::endl;
        return false;
    }
    return true;
}

// Prints the canonical form and the decoded fields of a parsed uuid.
static int inspect(const char* uuid_arg, bool strict, unsigned int expected_version){
    UUID::ParseResult res = (strict) ? UUID::parse_strict(uuid_arg, expected_version) : UUID::parse(uuid_arg);
    if(!res){
        std::cerr << "main.cpp:32:" << uuid_arg << ":" << res.error() << std::endl;
        return EXIT_FAILURE;
    }
    const UUID::Uuid& uuid = res.value();
    std::cout << uuid << std::endl;
    std::cout << "version: " << uuid.version() << std::endl;
    std::cout << "variant: " << uuid.variant() << std::endl;
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    int opt;
    const char* count = nullptr;
    const char* seed = nullptr;
    const char* uuid_arg = nullptr;
    const char* version = nullptr;
    bool strict = false;
    while((opt = getopt(argc, argv, "n:s:p:Sv:")) != -1){
        switch(opt)
        {
            case 'n':
                count = optarg;
                break;
            case 's':
                seed = optarg;
                break;
            case 'p':
                uuid_arg = optarg;
                break;
            case 'S':
                strict = true;
                break;
            case 'v':
                version = optarg;
                break;
            default:
                usage();
                exit(EXIT_FAILURE);
        }
    }
    if(optind != argc){
        usage();
        exit(EXIT_FAILURE);
    }
    // Generation options and inspection options are exclusive.
    if(uuid_arg != nullptr && (count != nullptr || seed != nullptr)){
        usage();
        exit(EXIT_FAILURE);
    }
    if(uuid_arg == nullptr && (strict || version != nullptr)){
        usage();
        exit(EXIT_FAILURE);
    }
    // Flags take precedence over the environment.
    if(count == nullptr){
        count = getenv("UUIDGEN_COUNT");
    }
    if(seed == nullptr){
        seed = getenv("UUIDGEN_SEED");
    }

    if(uuid_arg != nullptr){
        unsigned int expected_version = 4;
        if(version != nullptr && !parse_number(version, expected_version)){
            usage();
            exit(EXIT_FAILURE);
        }
        return inspect(uuid_arg, strict, expected_version);
    }

    std::size_t num_uuids = 1;
    if(count != nullptr && !parse_number(count, num_uuids)){
        usage();
        exit(EXIT_FAILURE);
    }

    std::unique_ptr<UUID::RandomSource> seeded;
    if(seed != nullptr){
        std::uint64_t seed_value = 0;
        if(!parse_number(seed, seed_value)){
            usage();
            exit(EXIT_FAILURE);
        }
        seeded = std::make_unique<UUID::SeededRandomSource>(seed_value);
    }
    UUID::RandomSource& source = (seeded) ? *seeded : UUID::default_source();

    UUID::FormatBuffer buf;
    for(std::size_t i=0; i < num_uuids; ++i){
        UUID::Uuid uuid(UUID::Uuid::v4, source);
        std::cout << UUID::format(uuid, buf) << '\n';
    }
    std::cout.flush();
    return 0;
}
