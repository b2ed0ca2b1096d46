#include "uuid.hpp"
#include "random-source.hpp"
#include <cstring>
#include <stdexcept>

/*bit masks for the version 4 and variant bits.*/
#define UUID_VERSION_MASK 0x0F
#define UUID_VERSION_4 0x40
#define UUID_VARIANT_MASK 0x3F
#define UUID_VARIANT_RFC4122 0x80

namespace UUID{
    /*UUID.Node POD*/
    bool operator==(const Node& lhs, const Node& rhs){
        return std::memcmp(lhs.bytes, rhs.bytes, Node::length) == 0;
    }

    bool operator!=(const Node& lhs, const Node& rhs){
        return !(lhs == rhs);
    }

    /*UUID*/
    Uuid::Uuid(Uuid::Version4)
      : Uuid(Uuid::v4, default_source())
    {}

    Uuid::Uuid(Uuid::Version4, RandomSource& source)
      : bytes{}
    {
        // Sources are allowed to return short reads (getrandom(2) can be
        // interrupted), so keep asking until all 16 bytes are filled.
        // A source that returns no bytes at all is exhausted.
        std::size_t filled = 0;
        while(filled < Uuid::size){
            std::size_t length = source.fill(&bytes[filled], Uuid::size - filled);
            if(length == 0){
                std::cerr << "uuid.cpp:37:random source exhausted after " << filled << " of " << Uuid::size << " bytes." << std::endl;
                throw std::runtime_error("random source exhausted.");
            }
            filled += length;
        }
        // Time hi and version are bytes 6 and 7.
        // Set the version 4 bits in the high nibble of byte 6.
        unsigned char& time_hi_and_version = bytes[6];
        time_hi_and_version &= UUID_VERSION_MASK;
        time_hi_and_version |= UUID_VERSION_4;
        // UUID clock_seq_hi_and_reserved is byte 8.
        // Set the two high bits to 10.
        unsigned char& clock_seq_hi_and_reserved = bytes[8];
        clock_seq_hi_and_reserved &= UUID_VARIANT_MASK;
        clock_seq_hi_and_reserved |= UUID_VARIANT_RFC4122;
        return;
    }

    std::uint32_t Uuid::time_low() const {
        return (static_cast<std::uint32_t>(bytes[0]) << 24) |
            (static_cast<std::uint32_t>(bytes[1]) << 16) |
            (static_cast<std::uint32_t>(bytes[2]) << 8) |
            static_cast<std::uint32_t>(bytes[3]);
    }
    std::uint16_t Uuid::time_mid() const {
        return static_cast<std::uint16_t>((bytes[4] << 8) | bytes[5]);
    }
    std::uint16_t Uuid::time_hi_and_version() const {
        return static_cast<std::uint16_t>((bytes[6] << 8) | bytes[7]);
    }
    unsigned char Uuid::clock_seq_hi_and_reserved() const {
        return bytes[8];
    }
    unsigned char Uuid::clock_seq_low() const {
        return bytes[9];
    }
    Node Uuid::node() const {
        Node tmp = {};
        std::memcpy(tmp.bytes, &bytes[10], Node::length);
        return tmp;
    }

    Variant Uuid::variant() const {
        unsigned char reserved = bytes[8];
        if((reserved & 0x80) == 0){
            return Variant::NCS;
        } else if ((reserved & 0xC0) == 0x80){
            return Variant::RFC4122;
        } else if ((reserved & 0xE0) == 0xC0){
            return Variant::MICROSOFT;
        }
        return Variant::FUTURE;
    }

    bool Uuid::is_nil() const {
        for(std::size_t i=0; i < Uuid::size; ++i){
            if(bytes[i] != 0){
                return false;
            }
        }
        return true;
    }

    bool operator==(const Uuid& lhs, const Uuid& rhs){
        return std::memcmp(lhs.bytes, rhs.bytes, Uuid::size) == 0;
    }

    bool operator!=(const Uuid&lhs, const Uuid& rhs){
        return !(lhs == rhs);
    }

    Uuid generate_v4(){
        return Uuid(Uuid::v4);
    }

    Uuid generate_v4(RandomSource& source){
        return Uuid(Uuid::v4, source);
    }

    unsigned int version(const Uuid& uuid){
        return uuid.version();
    }

    std::ostream& operator<<(std::ostream& os, const Variant& variant){
        switch(variant)
        {
            case Variant::NCS:
                os << "ncs";
                break;
            case Variant::RFC4122:
                os << "rfc4122";
                break;
            case Variant::MICROSOFT:
                os << "microsoft";
                break;
            case Variant::FUTURE:
                os << "future";
                break;
        }
        return os;
    }
}
