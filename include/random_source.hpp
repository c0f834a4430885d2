/**
 * Monster Battle Engine - Random Source
 *
 * Uniform draws in [0, 1) for damage variance, critical hits, escape and
 * capture rolls, and enemy decisions. Substitutable so battles can be
 * replayed deterministically.
 */

#pragma once

#include <cstdint>
#include <algorithm>
#include <random>
#include <vector>

namespace monsters {

/**
 * RandomSource - interface for uniform draws.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * Next uniform draw in [0, 1).
     */
    virtual double next_double() = 0;
};

/**
 * Mersenne-twister backed source.
 *
 * Two sources built with the same seed produce the same sequence.
 */
class Mt19937RandomSource : public RandomSource {
public:
    /**
     * Seeded from the high resolution clock.
     */
    Mt19937RandomSource();

    explicit Mt19937RandomSource(uint64_t seed);

    double next_double() override;

    void reseed(uint64_t seed);

    uint64_t seed() const { return seed_; }

private:
    uint64_t seed_ = 0;
    std::mt19937 rng_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

/**
 * Replays a fixed list of draws, then repeats a fallback value.
 *
 * Values are clamped into [0, 1).
 */
class SequenceRandomSource : public RandomSource {
public:
    explicit SequenceRandomSource(std::vector<double> values, double fallback = 0.5);

    double next_double() override;

    /**
     * Number of draws consumed so far.
     */
    size_t draws() const { return draws_; }

    /**
     * Draws left before the fallback value kicks in.
     */
    size_t remaining() const { return values_.size() - std::min(values_.size(), draws_); }

private:
    std::vector<double> values_;
    double fallback_;
    size_t draws_ = 0;
};

} // namespace monsters
