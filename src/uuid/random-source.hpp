#ifndef UUID_RANDOM_SOURCE_HPP
#define UUID_RANDOM_SOURCE_HPP
#include <cstddef>
#include <cstdint>
#include <random>

namespace UUID{
    // Random sources supply the bytes of version 4 uuids.
    // fill() writes at most buflen bytes into buf and returns the number
    // of bytes written. Short writes are allowed, the generator asks again
    // for the remainder. Returning 0 means the source is exhausted.
    class RandomSource
    {
    public:
        virtual std::size_t fill(unsigned char* buf, std::size_t buflen) =0;
        virtual ~RandomSource() = default;
    };

    // Reads from the kernel with getrandom(2).
    // Keeps no state in user space so a single instance can be shared
    // between threads.
    class SystemRandomSource: public RandomSource
    {
    public:
        std::size_t fill(unsigned char* buf, std::size_t buflen) override;
    };

    // Deterministic mt19937_64 stream. Two sources constructed with
    // the same seed produce the same bytes.
    // Not synchronized, each caller should own its own instance.
    class SeededRandomSource: public RandomSource
    {
    public:
        explicit SeededRandomSource(std::uint64_t seed): engine_(seed), word_{0}, available_{0} {}
        std::size_t fill(unsigned char* buf, std::size_t buflen) override;

    private:
        std::mt19937_64 engine_;
        std::uint64_t word_;
        // Number of unread bytes left in word_.
        std::size_t available_;
    };

    // Process wide source used when no source is passed to the generator.
    RandomSource& default_source();
}
#endif
