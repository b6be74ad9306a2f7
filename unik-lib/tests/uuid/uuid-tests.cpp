#include "uuid-tests.hpp"
#include "../../src/random/random.hpp"
#include <cstring>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

namespace tests{
    Uuid::Uuid()
      : passed_{false},
        uuid_()
    {
        for(std::size_t i=0; i < (unik::Uuid::size); ++i){
            if(uuid_.bytes[i] != 0){
                return;
            }
        }
        passed_ = uuid_.is_nil();
        return;
    }

    Uuid::Uuid(Uuid::TestFromBytes)
      : passed_{false},
        uuid_()
    {
        std::vector<unsigned char> buf(20);
        for(std::size_t i=0; i < buf.size(); ++i){
            buf[i] = static_cast<unsigned char>(i);
        }
        std::error_code ec;
        uuid_ = unik::Uuid::from_bytes(buf.data(), buf.size(), ec);
        if(ec){
            return;
        }
        // Only the first 16 bytes are used.
        for(std::size_t i=0; i < unik::Uuid::size; ++i){
            if(uuid_.bytes[i] != i){
                return;
            }
        }
        passed_ = true;
        return;
    }

    Uuid::Uuid(Uuid::TestTruncatedBuffer)
      : passed_{false},
        uuid_()
    {
        unsigned char buf[15] = {1,2,3,4,5,6,7,8,9,10,11,12,13,14,15};
        std::error_code ec;
        uuid_ = unik::Uuid::from_bytes(buf, sizeof(buf), ec);
        if(ec != unik::errc::truncated_buffer || !uuid_.is_nil()){
            return;
        }
        unik::Uuid::from_bytes(nullptr, 16, ec);
        if(ec != unik::errc::truncated_buffer){
            return;
        }
        passed_ = true;
        return;
    }

    Uuid::Uuid(Uuid::TestByteRoundTrip)
      : passed_{false},
        uuid_()
    {
        std::vector<unik::Uuid> corpus;
        corpus.push_back(unik::Uuid());
        std::array<unsigned char, unik::Uuid::size> ones;
        ones.fill(0xFF);
        corpus.push_back(unik::Uuid(ones));
        for(std::size_t i=0; i < 1024; ++i){
            std::array<unsigned char, unik::Uuid::size> data = {};
            unik::random::fill(data.data(), data.size());
            corpus.push_back(unik::Uuid(data));
        }
        for(const unik::Uuid& uuid: corpus){
            unik::Layout layout(uuid);
            if(layout.serialize() != uuid){
                std::cerr << "uuid-tests.cpp:79:byte round trip failed:" << uuid << std::endl;
                return;
            }
            if(unik::Layout(layout.serialize()) != layout){
                std::cerr << "uuid-tests.cpp:83:layout round trip failed:" << uuid << std::endl;
                return;
            }
        }
        passed_ = true;
        return;
    }

    Uuid::Uuid(Uuid::TestFieldMapping)
      : passed_{false},
        uuid_(std::array<unsigned char, unik::Uuid::size>{
            0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77,
            0x88, 0x99, 0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff
        })
    {
        unik::Layout layout = uuid_.layout();
        const unsigned char node[unik::Node::length] = {0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff};
        passed_ = (
            layout.time_low == 0x00112233 &&
            layout.time_mid == 0x4455 &&
            layout.time_hi_and_version == 0x6677 &&
            layout.clock_seq_hi_and_reserved == 0x88 &&
            layout.clock_seq_low == 0x99 &&
            std::memcmp(layout.node.bytes, node, unik::Node::length) == 0
        );
        return;
    }

    Uuid::Uuid(Uuid::TestNamespaces)
      : passed_{false},
        uuid_(unik::namespaces::dns)
    {
        const unsigned char dns[unik::Uuid::size] = {
            0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
            0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
        };
        if(std::memcmp(uuid_.bytes, dns, unik::Uuid::size) != 0){
            return;
        }
        passed_ = (
            unik::namespaces::url.str() == "6ba7b811-9dad-11d1-80b4-00c04fd430c8" &&
            unik::namespaces::oid.str() == "6ba7b812-9dad-11d1-80b4-00c04fd430c8" &&
            unik::namespaces::x500.str() == "6ba7b814-9dad-11d1-80b4-00c04fd430c8"
        );
        return;
    }

    Uuid::Uuid(Uuid::TestFormat)
      : passed_{false},
        uuid_("ab720268-b83f-11ec-b909-0242ac120002")
    {
        std::string simple = uuid_.str(unik::Format::simple);
        std::string hyphenated = uuid_.str(unik::Format::hyphenated);
        std::string upper = uuid_.str(unik::Format::upper);
        if(simple != "ab720268b83f11ecb9090242ac120002"
            || hyphenated != "ab720268-b83f-11ec-b909-0242ac120002"
            || upper != "AB720268-B83F-11EC-B909-0242AC120002"){
            std::cerr << "uuid-tests.cpp:140:unexpected format:" << simple << "," << hyphenated << "," << upper << std::endl;
            return;
        }
        std::error_code ec;
        if(unik::Uuid::parse(upper, ec) != uuid_ || ec){
            return;
        }
        if(unik::Uuid::parse(simple, ec) != uuid_ || ec){
            return;
        }
        passed_ = (unik::Layout::parse(hyphenated, ec).serialize().str() == hyphenated && !ec);
        return;
    }

    Uuid::Uuid(Uuid::TestStreams)
      : passed_{false},
        uuid_()
    {
        std::istringstream is("6ba7b810-9dad-11d1-80b4-00c04fd430c8 not-a-uuid");
        is >> uuid_;
        if(!is || uuid_ != unik::namespaces::dns){
            return;
        }
        unik::Uuid other;
        is >> other;
        if(!is.fail() || !other.is_nil()){
            return;
        }
        std::ostringstream os;
        os << uuid_ << ' ' << unik::Version::SHA1 << ' ' << unik::Variant::RFC4122;
        passed_ = (os.str() == "6ba7b810-9dad-11d1-80b4-00c04fd430c8 SHA1 RFC");
        return;
    }

    /*Layout*/
    Layout::Layout(Layout::TestParseVersions)
      : passed_{false},
        layout_()
    {
        const std::vector<std::pair<std::string, unik::Version> > cols = {
            {"ab720268-b83f-11ec-b909-0242ac120002", unik::Version::TIME},
            {"000003e8-c22b-21ec-bd01-d4bed9408ecc", unik::Version::DCE},
            {"2448bd95-00ca-3650-160f-3301a691b26c", unik::Version::MD5},
            {"6a665038-24cf-4cf6-9b61-05f0c2fc6c08", unik::Version::RAND},
            {"991da866-83b0-5550-1bef-37a1a5b1fb30", unik::Version::SHA1}
        };
        for(const auto& item: cols){
            std::error_code ec;
            layout_ = unik::Layout::parse(item.first, ec);
            if(ec){
                std::cerr << "uuid-tests.cpp:189:parse failed:" << ec.message() << ":" << item.first << std::endl;
                return;
            }
            if(layout_.version(ec) != item.second || ec){
                std::cerr << "uuid-tests.cpp:193:wrong version:" << item.first << std::endl;
                return;
            }
            if(layout_.variant(ec) != unik::Variant::RFC4122 || ec){
                std::cerr << "uuid-tests.cpp:197:wrong variant:" << item.first << std::endl;
                return;
            }
        }
        passed_ = true;
        return;
    }

    Layout::Layout(Layout::TestParseCompact)
      : passed_{false},
        layout_()
    {
        std::error_code ec;
        layout_ = unik::Layout::parse("AB720268B83F11ECB9090242AC120002", ec);
        if(ec){
            return;
        }
        passed_ = (
            layout_.time_low == 0xab720268 &&
            layout_.time_mid == 0xb83f &&
            layout_.time_hi_and_version == 0x11ec &&
            layout_.clock_seq_hi_and_reserved == 0xb9 &&
            layout_.clock_seq_low == 0x09 &&
            layout_.version() == unik::Version::TIME
        );
        return;
    }

    Layout::Layout(Layout::TestParseLength)
      : passed_{false},
        layout_()
    {
        const std::vector<std::string> inputs = {
            "",
            "ab720268b83f11ecb9090242ac12000",   // 31 characters.
            "ab720268b83f11ecb9090242ac1200021", // 33 characters.
            "ab720268-b83f-11ec-b909-0242ac12000",
            "ab720268-b83f-11ec-b909-0242ac1200022",
            "{ab720268-b83f-11ec-b909-0242ac120002}"
        };
        for(const std::string& input: inputs){
            std::error_code ec;
            unik::Layout::parse(input, ec);
            if(ec != unik::errc::invalid_length){
                std::cerr << "uuid-tests.cpp:240:length not rejected:" << input << std::endl;
                return;
            }
        }
        try{
            unik::Layout::parse("ab720268");
            return;
        } catch(const std::system_error& e){
            if(e.code() != unik::errc::invalid_length){
                return;
            }
        }
        passed_ = true;
        return;
    }

    Layout::Layout(Layout::TestParseCharacters)
      : passed_{false},
        layout_()
    {
        const std::vector<std::string> inputs = {
            "zz720268-b83f-11ec-b909-0242ac120002",
            "ab720268-b83f-11ec-b909-0242ac12000g",
            "ab720268 b83f-11ec-b909-0242ac120002", // whitespace in place of a hyphen.
            "ab720268-b83f-11ecb-909-0242ac120002", // misplaced hyphen.
            "ab720268b83f11ecb9090242ac12000 ",    // whitespace in the compact form.
            "0x720268b83f11ecb9090242ac12000a",
            "+b720268b83f11ecb9090242ac120002",
            "-b720268b83f11ecb9090242ac120002"
        };
        for(const std::string& input: inputs){
            std::error_code ec;
            unik::Layout::parse(input, ec);
            if(ec != unik::errc::invalid_character){
                std::cerr << "uuid-tests.cpp:274:character not rejected:" << input << std::endl;
                return;
            }
        }
        passed_ = true;
        return;
    }

    Layout::Layout(Layout::TestVariantNormalized)
      : passed_{false},
        layout_()
    {
        const std::string ncs = "991da866-83b0-5550-1bef-37a1a5b1fb30";
        std::error_code ec;
        unik::Uuid exact = unik::Uuid::parse(ncs, ec);
        if(ec || exact.str() != ncs || exact.layout().variant() != unik::Variant::NCS){
            return;
        }
        layout_ = unik::Layout::parse(ncs, ec);
        if(ec || layout_.clock_seq_hi_and_reserved != 0x9b || layout_.variant() != unik::Variant::RFC4122){
            return;
        }
        // Identifiers already carrying the RFC 4122 variant are unchanged.
        const std::string rfc = "6a665038-24cf-4cf6-9b61-05f0c2fc6c08";
        layout_ = unik::Layout::parse(rfc, ec);
        passed_ = (!ec && layout_.serialize().str() == rfc);
        return;
    }

    Layout::Layout(Layout::TestUnrecognizedVersion)
      : passed_{false},
        layout_()
    {
        std::error_code ec;
        for(std::uint16_t code: {0x0, 0x6, 0x7, 0x8, 0xF}){
            layout_.time_hi_and_version = static_cast<std::uint16_t>(code << 12);
            layout_.version(ec);
            if(ec != unik::errc::unrecognized_version){
                return;
            }
        }
        try{
            layout_.version();
            return;
        } catch(const std::system_error& e){
            if(e.code() != unik::errc::unrecognized_version){
                return;
            }
        }
        layout_.time_hi_and_version = 0x5FFF;
        passed_ = (layout_.version(ec) == unik::Version::SHA1 && !ec);
        return;
    }

    Layout::Layout(Layout::TestVariantPrefix)
      : passed_{false},
        layout_()
    {
        for(unsigned int b=0; b < 256; ++b){
            layout_.clock_seq_hi_and_reserved = static_cast<unsigned char>(b);
            unik::Variant expected;
            if(b < 0x80){
                expected = unik::Variant::NCS;
            } else if(b < 0xC0){
                expected = unik::Variant::RFC4122;
            } else if(b < 0xE0){
                expected = unik::Variant::MS;
            } else {
                expected = unik::Variant::FUT;
            }
            std::error_code ec;
            if(layout_.variant(ec) != expected || ec){
                std::cerr << "uuid-tests.cpp:345:wrong variant for byte:" << b << std::endl;
                return;
            }
        }
        passed_ = true;
        return;
    }

    Layout::Layout(Layout::TestStamp)
      : passed_{false},
        layout_()
    {
        layout_.time_hi_and_version = 0xFFFF;
        layout_.clock_seq_hi_and_reserved = 0xFF;
        layout_.stamp(unik::Version::SHA1);
        if(layout_.time_hi_and_version != 0x5FFF || layout_.clock_seq_hi_and_reserved != 0x9F){
            return;
        }
        layout_.stamp(unik::Version::TIME);
        passed_ = (
            layout_.time_hi_and_version == 0x1FFF &&
            layout_.version() == unik::Version::TIME &&
            layout_.variant() == unik::Variant::RFC4122 &&
            (layout_.clock_seq_hi_and_reserved & 0xE0) == 0x80
        );
        return;
    }
}
