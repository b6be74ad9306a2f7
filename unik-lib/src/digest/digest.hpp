#ifndef UNIK_DIGEST_HPP
#define UNIK_DIGEST_HPP
#include <array>
#include <initializer_list>
#include <string_view>

// Thin adapter over the OpenSSL EVP digest interface.
namespace unik{
namespace digest{
    using Sha1 = std::array<unsigned char, 20>;

    // Each part is fed to the digest in order, which hashes
    // their concatenation without building it first.
    Sha1 sha1(std::initializer_list<std::string_view> parts);
}// namespace digest
}// namespace unik
#endif
