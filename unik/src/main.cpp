#include <uuid/uuid.hpp>
#include <boost/json.hpp>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string_view>
#include <unistd.h>

static void usage(){
    std::cerr << "Usage: unik [-v version] [-n namespace] [-N name] [-d person|group] [-c count] [-f simple|hyphenated|upper] [-j] [-i uuid]" << std::endl;
}

static bool parse_namespace(std::string_view str, unik::Uuid& ns){
    if(str == "dns"){
        ns = unik::namespaces::dns;
    } else if(str == "oid"){
        ns = unik::namespaces::oid;
    } else if(str == "url"){
        ns = unik::namespaces::url;
    } else if(str == "x500"){
        ns = unik::namespaces::x500;
    } else {
        std::error_code ec;
        ns = unik::Uuid::parse(str, ec);
        if(ec){
            std::cerr << "main.cpp:27:invalid namespace:" << ec.message() << ":value=" << str << std::endl;
            return false;
        }
    }
    return true;
}

static std::string version_str(const unik::Layout& layout){
    std::error_code ec;
    unik::Version version = layout.version(ec);
    return ec ? std::string("unrecognized") : unik::to_string(version);
}

static std::string variant_str(const unik::Layout& layout){
    std::error_code ec;
    unik::Variant variant = layout.variant(ec);
    return ec ? std::string("unrecognized") : unik::to_string(variant);
}

static void print(const unik::Uuid& uuid, unik::Format fmt, bool json){
    if(json){
        unik::Layout layout = uuid.layout();
        boost::json::object jo;
        jo.emplace("uuid", boost::json::string(uuid.str(fmt)));
        jo.emplace("version", boost::json::string(version_str(layout)));
        jo.emplace("variant", boost::json::string(variant_str(layout)));
        std::cout << boost::json::serialize(jo) << std::endl;
    } else {
        std::cout << uuid.str(fmt) << std::endl;
    }
}

int main(int argc, char* argv[])
{
    int opt;
    const char* version = nullptr;
    const char* ns_str = nullptr;
    const char* name = nullptr;
    const char* domain_str = nullptr;
    const char* count_str = nullptr;
    const char* format_str = nullptr;
    const char* inspect = nullptr;
    bool json = false;
    while((opt = getopt(argc, argv, "v:n:N:d:c:f:ji:")) != -1){
        switch(opt)
        {
            case 'v':
                version = optarg;
                break;
            case 'n':
                ns_str = optarg;
                break;
            case 'N':
                name = optarg;
                break;
            case 'd':
                domain_str = optarg;
                break;
            case 'c':
                count_str = optarg;
                break;
            case 'f':
                format_str = optarg;
                break;
            case 'j':
                json = true;
                break;
            case 'i':
                inspect = optarg;
                break;
            default:
                usage();
                exit(EXIT_FAILURE);
        }
    }
    if(version == nullptr){
        version = "4";
    }
    if(ns_str == nullptr){
        ns_str = "dns";
    }
    if(domain_str == nullptr){
        domain_str = "person";
    }
    if(count_str == nullptr){
        count_str = "1";
    }
    if(format_str == nullptr){
        format_str = "hyphenated";
    }

    unik::Format fmt;
    std::string_view fmt_view(format_str);
    if(fmt_view == "simple"){
        fmt = unik::Format::simple;
    } else if(fmt_view == "hyphenated"){
        fmt = unik::Format::hyphenated;
    } else if(fmt_view == "upper"){
        fmt = unik::Format::upper;
    } else {
        usage();
        exit(EXIT_FAILURE);
    }

    if(inspect != nullptr){
        std::error_code ec;
        unik::Uuid uuid = unik::Uuid::parse(inspect, ec);
        if(ec){
            std::cerr << "main.cpp:137:" << ec.message() << ":value=" << inspect << std::endl;
            exit(EXIT_FAILURE);
        }
        if(json){
            print(uuid, fmt, json);
        } else {
            unik::Layout layout = uuid.layout();
            std::cout << uuid.str(fmt) << " version=" << version_str(layout) << " variant=" << variant_str(layout) << std::endl;
        }
        return 0;
    }

    std::string_view version_view(version);
    unsigned int v = 0;
    std::from_chars_result fcres = std::from_chars(version_view.data(), version_view.data()+version_view.size(), v, 10);
    if(fcres.ec != std::errc() || fcres.ptr != version_view.data()+version_view.size() || v < 1 || v > 5){
        std::cerr << "main.cpp:153:invalid version:value=" << version << std::endl;
        usage();
        exit(EXIT_FAILURE);
    }
    std::string_view count_view(count_str);
    std::size_t count = 0;
    fcres = std::from_chars(count_view.data(), count_view.data()+count_view.size(), count, 10);
    if(fcres.ec != std::errc() || fcres.ptr != count_view.data()+count_view.size()){
        std::cerr << "main.cpp:161:invalid count:" << std::make_error_code(fcres.ec).message() << ":value=" << count_str << std::endl;
        usage();
        exit(EXIT_FAILURE);
    }

    unik::Domain domain;
    std::string_view domain_view(domain_str);
    if(domain_view == "person"){
        domain = unik::Domain::PERSON;
    } else if(domain_view == "group"){
        domain = unik::Domain::GROUP;
    } else {
        usage();
        exit(EXIT_FAILURE);
    }

    unik::Uuid ns;
    if(v == 3 || v == 5){
        if(name == nullptr){
            std::cerr << "main.cpp:180:version " << v << " requires a name (-N)." << std::endl;
            exit(EXIT_FAILURE);
        }
        if(!parse_namespace(ns_str, ns)){
            exit(EXIT_FAILURE);
        }
    }

    for(std::size_t i=0; i < count; ++i){
        unik::Uuid uuid;
        switch(v){
            case 1:
                uuid = unik::Uuid(unik::Uuid::v1);
                break;
            case 2:
                uuid = unik::Uuid(unik::Uuid::v2, domain);
                break;
            case 3:
                uuid = unik::Uuid(unik::Uuid::v3, ns, name);
                break;
            case 4:
                uuid = unik::Uuid(unik::Uuid::v4);
                break;
            case 5:
                uuid = unik::Uuid(unik::Uuid::v5, ns, name);
                break;
        }
        print(uuid, fmt, json);
    }
    return 0;
}
