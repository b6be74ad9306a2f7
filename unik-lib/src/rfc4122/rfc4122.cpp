#include "rfc4122.hpp"
#include <clock-seq/clock-seq.hpp>
#include <digest/digest.hpp>
#include <random/random.hpp>
#include <cstring>
#include <unistd.h>

namespace unik{
namespace rfc4122{
    namespace {
        // Copies the first 16 digest bytes into a Layout.
        template<std::size_t N>
        Layout from_digest(const std::array<unsigned char, N>& hash){
            std::array<unsigned char, Uuid::size> data = {};
            std::memcpy(data.data(), hash.data(), Uuid::size);
            return Layout(Uuid(data));
        }
    }

    std::uint32_t identity(Domain domain){
        switch(domain){
            case Domain::PERSON:
                return static_cast<std::uint32_t>(getuid());
            case Domain::GROUP:
                return static_cast<std::uint32_t>(getgid());
        }
        return static_cast<std::uint32_t>(getpid());
    }

    Layout v1(const Timestamp& time, const Node& node){
        Layout layout;
        std::uint16_t clock_seq = ClockSeq::next();
        layout.time_low = static_cast<std::uint32_t>(time.count & 0xFFFFFFFF);
        layout.time_mid = static_cast<std::uint16_t>((time.count >> 32) & 0xFFFF);
        layout.time_hi_and_version = static_cast<std::uint16_t>((time.count >> 48) & 0x0FFF);
        layout.clock_seq_hi_and_reserved = static_cast<unsigned char>(clock_seq >> 8);
        layout.clock_seq_low = static_cast<unsigned char>(clock_seq & 0xFF);
        layout.node = node;
        return layout.stamp(Version::TIME);
    }

    Layout v2(const Timestamp& time, const Node& node, Domain domain){
        Layout layout;
        layout.time_low = identity(domain);
        layout.time_mid = static_cast<std::uint16_t>(time.count & 0xFFFF);
        layout.time_hi_and_version = static_cast<std::uint16_t>((time.count >> 16) & 0xFF);
        layout.clock_seq_hi_and_reserved = static_cast<unsigned char>(ClockSeq::next() & 0xFF);
        layout.clock_seq_low = static_cast<unsigned char>(domain);
        layout.node = node;
        return layout.stamp(Version::DCE);
    }

    Layout v3(const Uuid& ns, std::string_view name){
        std::string ns_str = ns.str(Format::hyphenated);
        Layout layout = from_digest(digest::sha1({ns_str, name}));
        return layout.stamp(Version::MD5);
    }

    Layout v4(){
        std::array<unsigned char, Uuid::size> data = {};
        random::fill(data.data(), data.size());
        Layout layout{Uuid(data)};
        return layout.stamp(Version::RAND);
    }

    Layout v5(const Uuid& ns, std::string_view name){
        std::string ns_str = ns.str(Format::hyphenated);
        Layout layout = from_digest(digest::sha1({ns_str, name}));
        return layout.stamp(Version::SHA1);
    }
}// namespace rfc4122
}// namespace unik
