// utils/noise.hpp
#pragma once

#include <cstdint>
#include <random>

namespace utils {

/**
 * NoiseGenerator - Seedable random source for synthetic profiles
 *
 * One instance per generator; not shared between threads.
 * seed == 0 draws a non-deterministic seed.
 */
class NoiseGenerator {
public:
    explicit NoiseGenerator(uint64_t seed = 0)
        : gen_(seed == 0 ? std::random_device{}() : seed),
          normal_(0.0, 1.0),
          unit_(0.0, 1.0)
    {}

    /**
     * Gaussian white noise: N(0, stddev)
     */
    double gaussian(double stddev) {
        if (stddev <= 0.0) return 0.0;
        return normal_(gen_) * stddev;
    }

    /**
     * Uniform random in [lo, hi)
     */
    double uniform(double lo, double hi) {
        if (hi <= lo) return lo;
        return lo + unit_(gen_) * (hi - lo);
    }

    /**
     * Bernoulli trial with probability p
     */
    bool chance(double p) {
        if (p <= 0.0) return false;
        if (p >= 1.0) return true;
        return unit_(gen_) < p;
    }

private:
    std::mt19937_64 gen_;
    std::normal_distribution<double> normal_;
    std::uniform_real_distribution<double> unit_;
};

} // namespace utils
