#include "generators.hpp"
#include "../codec/codec.hpp"
#include <chrono>
#include <random>

namespace UUID{
    Uuid generate_v4(){
        return Uuid(
            codec::random_bits(32),
            codec::random_bits(16),
            UUID_VERSION_4 | codec::random_bits(12),
            UUID_VARIANT_RFC4122 | codec::random_bits(6),
            codec::random_bits(8),
            codec::random_bits(48)
        );
    }

    std::string generate(){
        return generate_v4().str();
    }

    /*TimeBasedGenerator*/
    TimeBasedGenerator::TimeBasedGenerator()
      : TimeBasedGenerator(&TimeBasedGenerator::system_clock, initial_state())
    {}

    TimeBasedGenerator::TimeBasedGenerator(clock_type clock)
      : TimeBasedGenerator(std::move(clock), initial_state())
    {}

    TimeBasedGenerator::TimeBasedGenerator(clock_type clock, const State& state)
      : mtx_{},
        clock_(std::move(clock)),
        state_(state)
    {}

    std::int64_t TimeBasedGenerator::system_clock(){
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }

    TimeBasedGenerator::State TimeBasedGenerator::initial_state(){
        State state = {};
        state.timestamp = 0;
        state.sequence = static_cast<std::uint16_t>(codec::random_bits(14));
        // No hardware address is read, so set the multicast bit to keep
        // the node out of the IEEE 802 address space.
        state.node = (codec::random_bits(8) | 1) * (std::uint64_t{1} << 40) + codec::random_bits(40);
        state.tick = 0;
        return state;
    }

    TimeBasedGenerator::State TimeBasedGenerator::state() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return state_;
    }

    Uuid TimeBasedGenerator::next(){
        std::int64_t regression = 0;
        std::uint64_t intervals = 0;
        std::uint16_t sequence = 0;
        std::uint64_t node = 0;
        {
            // Clock readings must reach state_ in the order they were taken.
            std::lock_guard<std::mutex> lk(mtx_);
            std::int64_t now = clock_();
            if(now != state_.timestamp){
                if(now < state_.timestamp){
                    regression = state_.timestamp - now;
                    ++state_.sequence;
                }
                state_.timestamp = now;
                state_.tick = 0;
            } else {
                std::bernoulli_distribution advance_tick(tick_ratio);
                if(advance_tick(codec::engine()) && state_.tick < max_tick){
                    ++state_.tick;
                } else {
                    ++state_.sequence;
                }
            }
            state_.sequence &= 0x3FFF;
            // 100ns intervals since the Gregorian calendar reform. A tick that
            // overflows time_low carries into time_mid.
            intervals = static_cast<std::uint64_t>(state_.timestamp + gregorian_offset_ms) * 10000 + state_.tick;
            sequence = state_.sequence;
            node = state_.node;
        }
        if(regression > 0){
            std::cerr << "generators.cpp:69:system clock moved backwards by " << regression << "ms, advancing clock sequence." << std::endl;
        }

        std::uint64_t time_low = intervals & 0xFFFFFFFF;
        std::uint64_t time_mid = (intervals >> 32) & 0xFFFF;
        std::uint64_t time_hi_and_version = ((intervals >> 48) & 0x0FFF) | UUID_VERSION_1;
        std::uint64_t clock_seq_hi_and_reserved = (sequence >> 8) | UUID_VARIANT_RFC4122;
        std::uint64_t clock_seq_low = sequence & 0xFF;

        return Uuid(
            time_low,
            time_mid,
            time_hi_and_version,
            clock_seq_hi_and_reserved,
            clock_seq_low,
            node
        );
    }

    TimeBasedGenerator& default_generator(){
        static TimeBasedGenerator generator;
        return generator;
    }

    Uuid generate_v1(){
        return default_generator().next();
    }
}// uuid namespace
