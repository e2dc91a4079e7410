#ifndef UUID_CODEC_HPP
#define UUID_CODEC_HPP
#include <cstdint>
#include <random>
#include <string>

namespace UUID{
namespace codec{
    // Largest width random_bits() accepts. Wider draws are composed
    // from two samples of at most 30 bits each.
    constexpr int max_random_width = 53;

    // Per-thread pseudo-random engine, seeded from getrandom(2) the
    // first time a thread touches it. Not suitable for secrets.
    std::mt19937& engine();

    // Returns an unsigned integer uniformly distributed in [0, 2^width).
    // Throws std::out_of_range if width is outside [0, 53].
    std::uint64_t random_bits(int width);

    // Renders value in the given radix (2-36, lowercase) and left pads it
    // with '0' to length characters. Longer renderings are not truncated.
    std::string align_number(std::uint64_t value, std::size_t length, int radix);
}// codec namespace
}// uuid namespace
#endif
