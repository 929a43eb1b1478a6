/**
 * Tactics Battle Engine - Random Source
 *
 * Injectable randomness for the AI planner, card creation, crits,
 * dodges and jams. Tests substitute a scripted source.
 */

#pragma once

#include <random>
#include <vector>
#include <cstdint>

namespace tactics {

class Rng {
public:
    virtual ~Rng() = default;

    /**
     * Uniform value in [0, 1).
     */
    virtual double next_double() = 0;

    /**
     * Uniform integer in [lo, hi] (inclusive).
     */
    virtual int next_int(int lo, int hi) = 0;

    /**
     * Fisher-Yates shuffle driven by next_int().
     */
    template <typename T>
    void shuffle(std::vector<T>& items) {
        if (items.size() < 2) return;
        for (size_t i = items.size() - 1; i > 0; --i) {
            size_t j = static_cast<size_t>(next_int(0, static_cast<int>(i)));
            std::swap(items[i], items[j]);
        }
    }
};

/**
 * Default generator backed by std::mt19937.
 */
class MersenneRng : public Rng {
public:
    explicit MersenneRng(uint32_t seed = std::random_device{}()) : engine_(seed) {}

    double next_double() override {
        return std::uniform_real_distribution<double>(0.0, 1.0)(engine_);
    }

    int next_int(int lo, int hi) override {
        if (hi <= lo) return lo;
        return std::uniform_int_distribution<int>(lo, hi)(engine_);
    }

    void seed(uint32_t value) { engine_.seed(value); }

private:
    std::mt19937 engine_;
};

} // namespace tactics
