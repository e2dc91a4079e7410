#ifndef UUID_GENERATORS_HPP
#define UUID_GENERATORS_HPP
#include "../uuid/uuid.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace UUID{
    // bit masks for UUID Versions and the RFC 4122 variant.
    enum{
        UUID_VERSION_1 = 0x1000,
        UUID_VERSION_4 = 0x4000,
        UUID_VARIANT_RFC4122 = 0x80
    };

    // Random (version 4) UUID. Reentrant.
    Uuid generate_v4();

    // Canonical string of a fresh version 4 UUID.
    std::string generate();

    // Version 1 (time-based) UUID generator.
    // The wall clock only offers millisecond resolution, so a sub-millisecond
    // tick is synthesized and the clock sequence is advanced whenever the
    // clock stalls or moves backwards. All state is guarded by one mutex.
    class TimeBasedGenerator
    {
    public:
        // Milliseconds since 1970-01-01T00:00:00Z.
        using clock_type = std::function<std::int64_t()>;

        struct State {
            std::int64_t timestamp; // last clock reading used, in ms.
            std::uint16_t sequence; // 14 bits.
            std::uint64_t node;     // 48 bits.
            std::uint16_t tick;     // 100ns intervals within timestamp.
        };

        // Probability of advancing tick rather than sequence when the clock
        // has not moved since the previous call.
        constexpr static double tick_ratio = 1.0 / 8;
        constexpr static std::uint16_t max_tick = 9999;
        // Milliseconds between 1582-10-15 and 1970-01-01.
        constexpr static std::int64_t gregorian_offset_ms = 12219292800000;

        TimeBasedGenerator();
        explicit TimeBasedGenerator(clock_type clock);
        TimeBasedGenerator(clock_type clock, const State& state);

        Uuid next();
        Uuid operator()() { return next(); }

        State state() const;

        static std::int64_t system_clock();
        static State initial_state();
    private:
        mutable std::mutex mtx_;
        clock_type clock_;
        State state_;
    };

    // Process-wide version 1 generator, created on first use.
    TimeBasedGenerator& default_generator();

    // Time-based (version 1) UUID from default_generator().
    Uuid generate_v1();
}// uuid namespace
#endif
