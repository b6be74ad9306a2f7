#include "uuid.hpp"
#include <rfc4122/rfc4122.hpp>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <charconv>

/*bit masks for the version and variant fields.*/
#define UNIK_VERSION_MASK 0x0FFF
#define UNIK_VARIANT_RFC4122 0x80

namespace unik{
    namespace {
        // Decodes the compact or hyphenated string form into 16 bytes.
        // No whitespace is accepted in either form.
        bool decode_hex(std::string_view str, unsigned char (&out)[Uuid::size], std::error_code& ec){
            std::string digits;
            digits.reserve(2*Uuid::size);
            if(str.size() == 2*Uuid::size){
                digits.append(str.data(), str.size());
            } else if(str.size() == 2*Uuid::size + 4){
                for(std::size_t i=0; i < str.size(); ++i){
                    bool hyphen_pos = (i == 8 || i == 13 || i == 18 || i == 23);
                    if(hyphen_pos != (str[i] == '-')){
                        ec = errc::invalid_character;
                        return false;
                    }
                    if(!hyphen_pos){
                        digits.push_back(str[i]);
                    }
                }
            } else {
                ec = errc::invalid_length;
                return false;
            }

            for(std::size_t i=0; i < Uuid::size; ++i){
                const char* first = digits.data() + 2*i;
                unsigned char byte = 0;
                std::from_chars_result res = std::from_chars(first, first+2, byte, 16);
                // from_chars stops at the first non hex digit, so both
                // characters must have been consumed.
                if(res.ec != std::errc{} || res.ptr != first+2){
                    ec = errc::invalid_character;
                    return false;
                }
                out[i] = byte;
            }
            ec.clear();
            return true;
        }
    }

    /*Node*/
    std::ostream& operator<<(std::ostream& os, const Node& node) {
        std::ios::fmtflags flags(os.flags());
        for(std::size_t i=0; i < Node::length; ++i){
            os << std::setfill('0') << std::setw(2) << std::hex << static_cast<unsigned int>(node.bytes[i]);
        }
        os.flags(flags);
        return os;
    }

    bool operator==(const Node& lhs, const Node& rhs){
        return std::memcmp(lhs.bytes, rhs.bytes, Node::length) == 0;
    }

    bool operator!=(const Node& lhs, const Node& rhs){
        return !(lhs == rhs);
    }

    /*Timestamp*/
    Timestamp::Timestamp(std::chrono::system_clock::time_point tp)
    {
        std::int64_t nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
        count = (static_cast<std::uint64_t>(nanos/100) + gregorian_offset) & mask;
    }

    Timestamp Timestamp::from_utc(){
        return Timestamp(std::chrono::system_clock::now());
    }

    /*Version and Variant*/
    std::string to_string(Version version){
        switch(version){
            case Version::TIME:
                return "TIME";
            case Version::DCE:
                return "DCE";
            case Version::MD5:
                return "MD5";
            case Version::RAND:
                return "RAND";
            case Version::SHA1:
                return "SHA1";
        }
        return "UNKNOWN";
    }

    std::ostream& operator<<(std::ostream& os, Version version){
        return os << to_string(version);
    }

    std::string to_string(Variant variant){
        switch(variant){
            case Variant::NCS:
                return "NCS";
            case Variant::RFC4122:
                return "RFC";
            case Variant::MS:
                return "MS";
            case Variant::FUT:
                return "FUT";
        }
        return "UNKNOWN";
    }

    std::ostream& operator<<(std::ostream& os, Variant variant){
        return os << to_string(variant);
    }

    /*UUID*/
    Uuid::Uuid(const std::array<unsigned char, Uuid::size>& data)
    {
        std::memcpy(bytes, data.data(), Uuid::size);
    }

    Uuid::Uuid(Uuid::Version1)
      : bytes{}
    {
        std::error_code ec;
        Node node = Node::hardware(ec);
        if(ec){
            node = Node::random();
        }
        *this = rfc4122::v1(Timestamp::from_utc(), node).serialize();
    }

    Uuid::Uuid(Uuid::Version2, Domain domain)
      : bytes{}
    {
        std::error_code ec;
        Node node = Node::hardware(ec);
        if(ec){
            node = Node::random();
        }
        *this = rfc4122::v2(Timestamp::from_utc(), node, domain).serialize();
    }

    Uuid::Uuid(Uuid::Version3, const Uuid& ns, std::string_view name)
      : bytes{}
    {
        *this = rfc4122::v3(ns, name).serialize();
    }

    Uuid::Uuid(Uuid::Version4)
      : bytes{}
    {
        *this = rfc4122::v4().serialize();
    }

    Uuid::Uuid(Uuid::Version5, const Uuid& ns, std::string_view name)
      : bytes{}
    {
        *this = rfc4122::v5(ns, name).serialize();
    }

    Uuid::Uuid(std::string_view uuid)
      : bytes{}
    {
        std::error_code ec;
        Uuid tmp = Uuid::parse(uuid, ec);
        if(ec){
            throw std::system_error(ec, std::string(uuid));
        }
        std::memcpy(bytes, tmp.bytes, Uuid::size);
    }

    Uuid Uuid::from_bytes(const unsigned char* data, std::size_t len, std::error_code& ec){
        Uuid uuid;
        if(data == nullptr || len < Uuid::size){
            ec = errc::truncated_buffer;
            return uuid;
        }
        std::memcpy(uuid.bytes, data, Uuid::size);
        ec.clear();
        return uuid;
    }

    Uuid Uuid::parse(std::string_view uuid, std::error_code& ec){
        Uuid tmp;
        if(!decode_hex(uuid, tmp.bytes, ec)){
            return Uuid();
        }
        return tmp;
    }

    std::string Uuid::str(Format fmt) const {
        std::ostringstream ss;
        if(fmt == Format::upper){
            ss << std::uppercase;
        }
        for(std::size_t i=0; i < Uuid::size; ++i){
            if(fmt != Format::simple && (i == 4 || i == 6 || i == 8 || i == 10)){
                ss << '-';
            }
            ss << std::setfill('0') << std::setw(2) << std::hex << static_cast<unsigned int>(bytes[i]);
        }
        return ss.str();
    }

    Layout Uuid::layout() const {
        return Layout(*this);
    }

    bool Uuid::is_nil() const {
        for(std::size_t i=0; i < Uuid::size; ++i){
            if(bytes[i] != 0){
                return false;
            }
        }
        return true;
    }

    std::ostream& operator<<(std::ostream& os, const Uuid& uuid){
        return os << uuid.str();
    }

    std::istream& operator>>(std::istream& is, Uuid& uuid){
        std::string token;
        if(!(is >> token)){
            return is;
        }
        std::error_code ec;
        Uuid tmp = Uuid::parse(token, ec);
        if(ec){
            is.setstate(std::ios::failbit);
            return is;
        }
        uuid = tmp;
        return is;
    }

    bool operator==(const Uuid& lhs, const Uuid& rhs){
        return std::memcmp(lhs.bytes, rhs.bytes, Uuid::size) == 0;
    }

    bool operator!=(const Uuid&lhs, const Uuid& rhs){
        return !(lhs == rhs);
    }

    bool operator<(const Uuid& lhs, const Uuid& rhs){
        return std::memcmp(lhs.bytes, rhs.bytes, Uuid::size) < 0;
    }

    /*Layout*/
    Layout::Layout()
      : time_low{0},
        time_mid{0},
        time_hi_and_version{0},
        clock_seq_hi_and_reserved{0},
        clock_seq_low{0},
        node{}
    {}

    Layout::Layout(const Uuid& uuid)
      : time_low{
            (static_cast<std::uint32_t>(uuid.bytes[0]) << 24) |
            (static_cast<std::uint32_t>(uuid.bytes[1]) << 16) |
            (static_cast<std::uint32_t>(uuid.bytes[2]) << 8) |
            static_cast<std::uint32_t>(uuid.bytes[3])
        },
        time_mid{static_cast<std::uint16_t>((uuid.bytes[4] << 8) | uuid.bytes[5])},
        time_hi_and_version{static_cast<std::uint16_t>((uuid.bytes[6] << 8) | uuid.bytes[7])},
        clock_seq_hi_and_reserved{uuid.bytes[8]},
        clock_seq_low{uuid.bytes[9]},
        node{}
    {
        std::memcpy(node.bytes, &uuid.bytes[10], Node::length);
    }

    Layout Layout::parse(std::string_view str, std::error_code& ec){
        Uuid tmp = Uuid::parse(str, ec);
        if(ec){
            return Layout();
        }
        Layout layout(tmp);
        // Only the two variant bits are rewritten so RFC 4122 input is unchanged.
        layout.clock_seq_hi_and_reserved = (layout.clock_seq_hi_and_reserved & 0x3F) | UNIK_VARIANT_RFC4122;
        return layout;
    }

    Layout Layout::parse(std::string_view str){
        std::error_code ec;
        Layout layout = Layout::parse(str, ec);
        if(ec){
            throw std::system_error(ec, std::string(str));
        }
        return layout;
    }

    Uuid Layout::serialize() const {
        Uuid uuid;
        uuid.bytes[0] = static_cast<unsigned char>(time_low >> 24);
        uuid.bytes[1] = static_cast<unsigned char>(time_low >> 16);
        uuid.bytes[2] = static_cast<unsigned char>(time_low >> 8);
        uuid.bytes[3] = static_cast<unsigned char>(time_low);
        uuid.bytes[4] = static_cast<unsigned char>(time_mid >> 8);
        uuid.bytes[5] = static_cast<unsigned char>(time_mid);
        uuid.bytes[6] = static_cast<unsigned char>(time_hi_and_version >> 8);
        uuid.bytes[7] = static_cast<unsigned char>(time_hi_and_version);
        uuid.bytes[8] = clock_seq_hi_and_reserved;
        uuid.bytes[9] = clock_seq_low;
        std::memcpy(&uuid.bytes[10], node.bytes, Node::length);
        return uuid;
    }

    Version Layout::version(std::error_code& ec) const {
        unsigned int code = time_hi_and_version >> 12;
        if(code < static_cast<unsigned int>(Version::TIME) || code > static_cast<unsigned int>(Version::SHA1)){
            ec = errc::unrecognized_version;
            return Version::TIME;
        }
        ec.clear();
        return static_cast<Version>(code);
    }

    Version Layout::version() const {
        std::error_code ec;
        Version v = version(ec);
        if(ec){
            throw std::system_error(ec);
        }
        return v;
    }

    Variant Layout::variant(std::error_code& ec) const {
        // The variant is a prefix code of 1 to 3 bits:
        // 0xx NCS, 10x RFC 4122, 110 Microsoft, 111 future.
        ec.clear();
        if((clock_seq_hi_and_reserved & 0x80) == 0x00){
            return Variant::NCS;
        } else if((clock_seq_hi_and_reserved & 0xC0) == 0x80){
            return Variant::RFC4122;
        } else if((clock_seq_hi_and_reserved & 0xE0) == 0xC0){
            return Variant::MS;
        } else if((clock_seq_hi_and_reserved & 0xE0) == 0xE0){
            return Variant::FUT;
        }
        ec = errc::unrecognized_variant;
        return Variant::NCS;
    }

    Variant Layout::variant() const {
        std::error_code ec;
        Variant v = variant(ec);
        if(ec){
            throw std::system_error(ec);
        }
        return v;
    }

    Layout& Layout::stamp(Version version){
        time_hi_and_version &= UNIK_VERSION_MASK;
        time_hi_and_version |= static_cast<std::uint16_t>(static_cast<unsigned int>(version) << 12);
        // Leaves the top three bits at 100.
        clock_seq_hi_and_reserved &= 0x1F;
        clock_seq_hi_and_reserved |= UNIK_VARIANT_RFC4122;
        return *this;
    }

    bool operator==(const Layout& lhs, const Layout& rhs){
        return (
            lhs.time_low == rhs.time_low &&
            lhs.time_mid == rhs.time_mid &&
            lhs.time_hi_and_version == rhs.time_hi_and_version &&
            lhs.clock_seq_hi_and_reserved == rhs.clock_seq_hi_and_reserved &&
            lhs.clock_seq_low == rhs.clock_seq_low &&
            lhs.node == rhs.node
        );
    }

    bool operator!=(const Layout& lhs, const Layout& rhs){
        return !(lhs == rhs);
    }

    namespace namespaces{
        const Uuid dns(std::array<unsigned char, Uuid::size>{
            0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
        });
        const Uuid url(std::array<unsigned char, Uuid::size>{
            0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
        });
        const Uuid oid(std::array<unsigned char, Uuid::size>{
            0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
        });
        const Uuid x500(std::array<unsigned char, Uuid::size>{
            0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
        });
    }
}
