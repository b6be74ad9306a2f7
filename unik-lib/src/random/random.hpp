#ifndef UNIK_RANDOM_HPP
#define UNIK_RANDOM_HPP
#include <cstddef>

namespace unik{
namespace random{
    // Fills buf with len bytes from the kernel CSPRNG (getrandom(2)).
    // Throws std::system_error if the kernel source fails.
    void fill(void* buf, std::size_t len);
}// namespace random
}// namespace unik
#endif
