#include "codec.hpp"
#include <array>
#include <cerrno>
#include <charconv>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <sys/random.h>

static std::mt19937 seeded_engine(){
    std::array<std::uint32_t, std::mt19937::state_size> seed = {};
    unsigned char* buf = reinterpret_cast<unsigned char*>(seed.data());
    const std::size_t buflen = sizeof(seed);
    std::size_t bytes_read = 0;
    do{
        ssize_t len = getrandom(buf + bytes_read, buflen - bytes_read, 0);
        if(len == -1){
            int err = errno;
            switch(err)
            {
                case EINTR:
                    break;
                default:
                    std::cerr << "codec.cpp:16:getrandom() failed:" << std::make_error_code(std::errc(err)).message() << std::endl;
                    throw std::system_error(err, std::generic_category(), "getrandom");
            }
        } else {
            bytes_read += len;
        }
    } while(bytes_read < buflen);
    std::seed_seq seq(seed.begin(), seed.end());
    return std::mt19937(seq);
}

namespace UUID{
namespace codec{
    std::mt19937& engine(){
        thread_local std::mt19937 eng = seeded_engine();
        return eng;
    }

    std::uint64_t random_bits(int width){
        if(width < 0 || width > max_random_width){
            std::cerr << "codec.cpp:43:random_bits() width out of range:" << width << std::endl;
            throw std::out_of_range("random_bits: width must be in [0, 53]");
        }
        if(width <= 30){
            std::uniform_int_distribution<std::uint32_t> dist(0, (std::uint32_t{1} << width) - 1);
            return dist(engine());
        }
        // Compose the low 30 bits and the remaining high bits from two draws.
        std::uniform_int_distribution<std::uint32_t> low(0, (std::uint32_t{1} << 30) - 1);
        std::uniform_int_distribution<std::uint32_t> high(0, (std::uint32_t{1} << (width - 30)) - 1);
        std::uint64_t lo = low(engine());
        std::uint64_t hi = high(engine());
        return lo + (hi << 30);
    }

    std::string align_number(std::uint64_t value, std::size_t length, int radix){
        if(radix < 2 || radix > 36){
            throw std::invalid_argument("align_number: radix must be in [2, 36]");
        }
        // 64 binary digits is the longest possible rendering.
        char digits[64] = {};
        std::to_chars_result res = std::to_chars(digits, digits + sizeof(digits), value, radix);
        std::size_t num_digits = static_cast<std::size_t>(res.ptr - digits);
        std::string aligned;
        if(num_digits < length){
            aligned.assign(length - num_digits, '0');
        }
        aligned.append(digits, num_digits);
        return aligned;
    }
}// codec namespace
}// uuid namespace
