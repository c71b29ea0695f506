#pragma once

#include <cstdint>
#include <optional>
#include <random>

namespace jamgame {
namespace model {

/**
 * Linear congruential generator for reproducible runs.
 *
 * state = (state * 1103515245 + 12345) & 0x7fffffff, output in [0, 1].
 * Gains and random initialization must reproduce exactly for a given seed
 * on every platform.
 */
class SeededRandom {
public:
    explicit SeededRandom(std::optional<uint64_t> seed) {
        if (seed) {
            state_ = *seed & MASK;
        } else {
            std::random_device rd;
            state_ = (static_cast<uint64_t>(rd()) << 16 ^ rd()) & MASK;
        }
    }

    double next() {
        state_ = (state_ * 1103515245ULL + 12345ULL) & MASK;
        return static_cast<double>(state_) / static_cast<double>(MASK);
    }

private:
    static constexpr uint64_t MASK = 0x7fffffffULL;
    uint64_t state_ = 0;
};

} // namespace model
} // namespace jamgame
