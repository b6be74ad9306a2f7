#ifndef UNIK_RFC4122_HPP
#define UNIK_RFC4122_HPP
#include <uuid/uuid.hpp>
#include <cstdint>
#include <string_view>

// Generators for the RFC 4122 versions. Each one returns a Layout
// stamped with its version and the RFC 4122 variant.
namespace unik{
namespace rfc4122{
    // uid for PERSON, gid for GROUP.
    std::uint32_t identity(Domain domain);

    // Time based: 60 bit timestamp, 14 bit clock sequence and node.
    Layout v1(const Timestamp& time, const Node& node);

    // DCE security: the local identity replaces time_low, only the
    // low 24 bits of the timestamp are kept and clock_seq_low holds the domain.
    Layout v2(const Timestamp& time, const Node& node, Domain domain);

    // Name based. The digest is taken over the namespace's hyphenated
    // lowercase string followed by the name. v3 is stamped as the MD5 version
    // but hashes with SHA-1, which existing identifiers depend on.
    Layout v3(const Uuid& ns, std::string_view name);

    // Random.
    Layout v4();

    // Name based, SHA-1.
    Layout v5(const Uuid& ns, std::string_view name);
}// namespace rfc4122
}// namespace unik
#endif
