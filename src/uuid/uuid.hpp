#ifndef UUID_HPP
#define UUID_HPP
#include <cstdint>
#include <cstddef>
#include <iostream>
namespace UUID{
    /*Forward declarations*/
    class RandomSource;

    struct Node {
        const static std::size_t length = 6;
        unsigned char bytes[length];
    };
    bool operator==(const Node& lhs, const Node& rhs);
    bool operator!=(const Node& lhs, const Node& rhs);

    // Variant field of clock_seq_hi_and_reserved, RFC 4122 section 4.1.1.
    enum class Variant
    {
        NCS,
        RFC4122,
        MICROSOFT,
        FUTURE
    };

    // UUID binary fields as defined in IETF RFC 4122:
    // https://datatracker.ietf.org/doc/html/rfc4122#section-4.1.2
    // This is 16 octets of data in network byte order.
    // A default constructed Uuid is the nil uuid (all zeros).
    struct Uuid{
        constexpr static struct Version4{} v4{};
        constexpr static std::size_t size = 16; // UUID is always a 16 byte array.

        Uuid():bytes{}{}; // 0 initializing default constructor.
        explicit Uuid(Uuid::Version4 v); // version 4 from the default random source.
        explicit Uuid(Uuid::Version4 v, RandomSource& source); // version 4 from an explicit random source.

        // Public Member bytes.
        unsigned char bytes[Uuid::size];

        // Fields are decoded big-endian.
        std::uint32_t time_low() const;
        std::uint16_t time_mid() const;
        std::uint16_t time_hi_and_version() const;
        unsigned char clock_seq_hi_and_reserved() const;
        unsigned char clock_seq_low() const;
        Node node() const;

        // High nibble of byte 6. Not validated against known versions.
        unsigned int version() const { return static_cast<unsigned int>(bytes[6] >> 4); }
        Variant variant() const;
        bool is_nil() const;
    };
    bool operator==(const Uuid& lhs, const Uuid& rhs);
    bool operator!=(const Uuid& lhs, const Uuid& rhs);

    Uuid generate_v4();
    Uuid generate_v4(RandomSource& source);
    unsigned int version(const Uuid& uuid);

    std::ostream& operator<<(std::ostream& os, const Variant& variant);

}// uuid namespace
#endif
