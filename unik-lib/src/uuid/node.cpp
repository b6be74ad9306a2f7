#include "uuid.hpp"
#include <random/random.hpp>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <net/if_arp.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace unik{
    Node Node::hardware(std::error_code& ec){
        Node node = {};
        struct ifaddrs* ifaphead = nullptr;
        if(getifaddrs(&ifaphead) == -1){
            ec = std::make_error_code(std::errc(errno));
            return node;
        }
        int sock = socket(PF_INET, SOCK_DGRAM, 0);
        if(sock == -1){
            ec = std::make_error_code(std::errc(errno));
            freeifaddrs(ifaphead);
            return node;
        }

        bool found = false;
        for(struct ifaddrs* ifap = ifaphead; ifap != nullptr && !found; ifap = ifap->ifa_next){
            if(ifap->ifa_flags & IFF_LOOPBACK){
                continue;
            }
            struct ifreq ifr = {};
            std::strncpy(ifr.ifr_name, ifap->ifa_name, IFNAMSIZ-1);
            if(ioctl(sock, SIOCGIFHWADDR, &ifr) == -1){
                continue;
            }
            if(ifr.ifr_hwaddr.sa_family != ARPHRD_ETHER){
                continue;
            }
            // An all zero address is a virtual interface without a MAC.
            unsigned char zero[Node::length] = {};
            if(std::memcmp(ifr.ifr_hwaddr.sa_data, zero, Node::length) == 0){
                continue;
            }
            std::memcpy(node.bytes, ifr.ifr_hwaddr.sa_data, Node::length);
            found = true;
        }
        close(sock);
        freeifaddrs(ifaphead);

        if(!found){
            ec = std::make_error_code(std::errc::no_such_device);
            return node;
        }
        ec.clear();
        return node;
    }

    Node Node::random(){
        Node node = {};
        unik::random::fill(node.bytes, Node::length);
        // Multicast bit marks the address as not belonging to a NIC.
        node.bytes[0] |= 0x01;
        return node;
    }
}
