#include "clock-seq.hpp"
#include <random/random.hpp>

#ifdef DEBUG
#include <iostream>
#endif

namespace unik{
    std::atomic<std::uint16_t>& ClockSeq::counter(){
        // Function local statics are initialized exactly once, even when
        // the first calls race.
        static std::atomic<std::uint16_t> counter_([](){
            std::uint16_t seed = 0;
            random::fill(&seed, sizeof(seed));
            #ifdef DEBUG
            std::cerr << "clock-seq.cpp:16:CLOCK_SEQ_SEED:" << seed << std::endl;
            #endif
            return seed;
        }());
        return counter_;
    }

    std::uint16_t ClockSeq::next(){
        std::uint16_t prev = counter().fetch_add(1, std::memory_order_seq_cst);
        return static_cast<std::uint16_t>(prev & mask);
    }
}
