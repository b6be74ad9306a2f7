#include "digest.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <openssl/evp.h>

namespace unik{
namespace digest{
    namespace {
        template<std::size_t N>
        std::array<unsigned char, N> compute(const EVP_MD* md, std::initializer_list<std::string_view> parts){
            std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
            if(!ctx){
                std::cerr << "digest.cpp:14:EVP_MD_CTX_new failed." << std::endl;
                throw std::runtime_error("EVP_MD_CTX_new failed.");
            }
            if(EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1){
                std::cerr << "digest.cpp:18:EVP_DigestInit_ex failed." << std::endl;
                throw std::runtime_error("EVP_DigestInit_ex failed.");
            }
            for(std::string_view part: parts){
                if(EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1){
                    std::cerr << "digest.cpp:23:EVP_DigestUpdate failed." << std::endl;
                    throw std::runtime_error("EVP_DigestUpdate failed.");
                }
            }
            unsigned char buf[EVP_MAX_MD_SIZE] = {};
            unsigned int len = 0;
            if(EVP_DigestFinal_ex(ctx.get(), buf, &len) != 1 || len != N){
                std::cerr << "digest.cpp:30:EVP_DigestFinal_ex failed:len=" << len << std::endl;
                throw std::runtime_error("EVP_DigestFinal_ex failed.");
            }
            std::array<unsigned char, N> out = {};
            std::copy(buf, buf + N, out.begin());
            return out;
        }
    }

    Sha1 sha1(std::initializer_list<std::string_view> parts){
        return compute<20>(EVP_sha1(), parts);
    }
}// namespace digest
}// namespace unik
