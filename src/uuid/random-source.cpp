#include "random-source.hpp"
#include <sys/random.h>
#include <cerrno>
#include <iostream>
#include <system_error>

namespace UUID{
    std::size_t SystemRandomSource::fill(unsigned char* buf, std::size_t buflen){
        ssize_t length = 0;
        do{
            length = getrandom(buf, buflen, 0);
        } while(length == -1 && errno == EINTR);
        if(length == -1){
            std::cerr << "random-source.cpp:14:getrandom failed:" << std::make_error_code(std::errc(errno)).message() << std::endl;
            return 0;
        }
        return static_cast<std::size_t>(length);
    }

    std::size_t SeededRandomSource::fill(unsigned char* buf, std::size_t buflen){
        // Bytes are taken from each 64 bit word least significant first.
        // Leftover bytes are kept for the next call so the byte stream
        // does not depend on how the caller splits its requests.
        for(std::size_t i=0; i < buflen; ++i){
            if(available_ == 0){
                word_ = engine_();
                available_ = sizeof(word_);
            }
            buf[i] = static_cast<unsigned char>(word_ & 0xFF);
            word_ >>= 8;
            --available_;
        }
        return buflen;
    }

    RandomSource& default_source(){
        static SystemRandomSource source;
        return source;
    }
}
