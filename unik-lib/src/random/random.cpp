#include "random.hpp"
#include <cerrno>
#include <iostream>
#include <system_error>
#include <sys/random.h>

namespace unik{
namespace random{
    void fill(void* buf, std::size_t len){
        unsigned char* data = static_cast<unsigned char*>(buf);
        std::size_t offset = 0;
        // getrandom may return fewer bytes than requested when interrupted
        // by a signal handler, so keep reading until the buffer is full.
        while(offset < len){
            ssize_t n = getrandom(data + offset, len - offset, 0);
            if(n == -1){
                if(errno == EINTR){
                    continue;
                }
                std::error_code ec = std::make_error_code(std::errc(errno));
                std::cerr << "random.cpp:21:getrandom failed:" << ec.message() << std::endl;
                throw std::system_error(ec, "getrandom");
            }
            offset += static_cast<std::size_t>(n);
        }
        return;
    }
}// namespace random
}// namespace unik
