#ifndef UNIK_UUID_HPP
#define UNIK_UUID_HPP
#include <array>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include "uuid-errors.hpp"

namespace unik{
    // IEEE 802 node address. Either the MAC address of a local interface
    // or a random substitute with the multicast bit set (RFC 4122 section 4.5).
    struct Node {
        const static std::size_t length = 6;
        unsigned char bytes[length];

        static Node hardware(std::error_code& ec);
        static Node random();
    };
    std::ostream& operator<<(std::ostream& os, const Node& node);
    bool operator==(const Node& lhs, const Node& rhs);
    bool operator!=(const Node& lhs, const Node& rhs);

    // Count of 100ns intervals since 1582-10-15 00:00:00 UTC.
    // Only 60 bits are meaningful, wider values are truncated to the low 60 bits.
    struct Timestamp {
        constexpr static std::uint64_t mask = 0x0FFFFFFFFFFFFFFFULL;
        // 100ns intervals between the gregorian reform and the unix epoch.
        constexpr static std::uint64_t gregorian_offset = 0x01B21DD213814000ULL;

        Timestamp(): count{0} {}
        explicit Timestamp(std::uint64_t intervals): count{intervals & mask} {}
        explicit Timestamp(std::chrono::system_clock::time_point tp);
        static Timestamp from_utc();

        std::uint64_t count;
    };

    // Algorithm used to build a Layout, stored in the top nibble of
    // time_hi_and_version.
    enum class Version
    {
        TIME = 1,
        DCE,
        MD5,
        RAND,
        SHA1
    };
    std::string to_string(Version version);
    std::ostream& operator<<(std::ostream& os, Version version);

    // Interpretation of the layout, stored as a 1 to 3 bit prefix
    // of clock_seq_hi_and_reserved.
    enum class Variant
    {
        NCS = 0,
        RFC4122,
        MS,
        FUT
    };
    std::string to_string(Variant variant);
    std::ostream& operator<<(std::ostream& os, Variant variant);

    // Local domains for DCE security identifiers.
    enum class Domain
    {
        PERSON = 0,
        GROUP = 1
    };

    enum class Format
    {
        simple,     // 32 lowercase hex digits.
        hyphenated, // 8-4-4-4-12 lowercase.
        upper       // 8-4-4-4-12 uppercase.
    };

    struct Layout;

    // UUID binary fields as defined in IETF RFC 4122:
    // https://datatracker.ietf.org/doc/html/rfc4122#section-4.1.2
    // This is 16 octets of data in network byte order.
    // The default constructed Uuid is the nil UUID.
    struct Uuid{
        constexpr static struct Version1{} v1{};
        constexpr static struct Version2{} v2{};
        constexpr static struct Version3{} v3{};
        constexpr static struct Version4{} v4{};
        constexpr static struct Version5{} v5{};
        constexpr static std::size_t size = 16; // UUID is always a 16 byte array.

        Uuid():bytes{}{}; // 0 initializing default constructor.
        explicit Uuid(const std::array<unsigned char, Uuid::size>& data);
        explicit Uuid(Uuid::Version1 v); // current time, hardware node.
        explicit Uuid(Uuid::Version2 v, Domain domain); // current time, hardware node, uid or gid.
        explicit Uuid(Uuid::Version3 v, const Uuid& ns, std::string_view name);
        explicit Uuid(Uuid::Version4 v);
        explicit Uuid(Uuid::Version5 v, const Uuid& ns, std::string_view name);
        explicit Uuid(std::string_view uuid); // byte exact parse, throws std::system_error.

        static Uuid from_bytes(const unsigned char* data, std::size_t len, std::error_code& ec);
        static Uuid parse(std::string_view uuid, std::error_code& ec);

        // Public Member bytes.
        unsigned char bytes[Uuid::size];

        std::string str(Format fmt = Format::hyphenated) const;
        Layout layout() const;
        bool is_nil() const;
    };
    std::ostream& operator<<(std::ostream& os, const Uuid& uuid);
    std::istream& operator>>(std::istream& is, Uuid& uuid);
    bool operator==(const Uuid& lhs, const Uuid& rhs);
    bool operator!=(const Uuid& lhs, const Uuid& rhs);
    bool operator<(const Uuid& lhs, const Uuid& rhs);

    // Field view of a Uuid. Converting to and from a Uuid is lossless;
    // reading the version or variant may fail for foreign identifiers.
    struct Layout{
        Layout();
        explicit Layout(const Uuid& uuid);

        // Accepts the 32 digit compact form and the 36 character hyphenated form.
        // The variant is normalized to RFC 4122.
        static Layout parse(std::string_view str, std::error_code& ec);
        static Layout parse(std::string_view str);

        Uuid serialize() const;

        Version version(std::error_code& ec) const;
        Version version() const;
        Variant variant(std::error_code& ec) const;
        Variant variant() const;

        // Writes the version nibble and the RFC 4122 variant bits.
        Layout& stamp(Version version);

        std::uint32_t time_low;
        std::uint16_t time_mid;
        std::uint16_t time_hi_and_version;
        unsigned char clock_seq_hi_and_reserved;
        unsigned char clock_seq_low;
        Node node;
    };
    bool operator==(const Layout& lhs, const Layout& rhs);
    bool operator!=(const Layout& lhs, const Layout& rhs);

    // Well known namespace identifiers from RFC 4122 appendix C.
    namespace namespaces{
        extern const Uuid dns;
        extern const Uuid url;
        extern const Uuid oid;
        extern const Uuid x500;
    }
}// unik namespace
#endif
