#ifndef UNIK_CLOCK_SEQ_HPP
#define UNIK_CLOCK_SEQ_HPP
#include <atomic>
#include <cstdint>

namespace unik{
    // Process wide clock sequence (RFC 4122 section 4.1.5).
    // Distinguishes identifiers built from the same timestamp, e.g. after
    // the system clock has been set backwards.
    class ClockSeq
    {
    public:
        constexpr static std::uint16_t mask = 0x3FFF; // 14 significant bits.

        // Atomically advances the counter and returns the previous value,
        // masked to 14 bits. The counter is seeded from the kernel random
        // source on first use and wraps silently.
        static std::uint16_t next();

    private:
        static std::atomic<std::uint16_t>& counter();
    };
}// unik namespace
#endif
