/**
 * Monster Battle Engine - Random Source Implementation
 */

#include "random_source.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

namespace monsters {

namespace {

// Largest double strictly below 1.0
const double BELOW_ONE = std::nextafter(1.0, 0.0);

double clamp_unit(double value) {
    if (std::isnan(value)) return 0.0;
    return std::clamp(value, 0.0, BELOW_ONE);
}

} // anonymous namespace

// ============================================================================
// MT19937
// ============================================================================

Mt19937RandomSource::Mt19937RandomSource() {
    // Seed RNG with current time
    auto seed = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    reseed(static_cast<uint64_t>(seed));
}

Mt19937RandomSource::Mt19937RandomSource(uint64_t seed) {
    reseed(seed);
}

void Mt19937RandomSource::reseed(uint64_t seed) {
    seed_ = seed;
    rng_.seed(static_cast<std::mt19937::result_type>(seed));
    dist_.reset();
}

double Mt19937RandomSource::next_double() {
    // uniform_real_distribution may round up to 1.0 on some implementations
    return clamp_unit(dist_(rng_));
}

// ============================================================================
// SEQUENCE
// ============================================================================

SequenceRandomSource::SequenceRandomSource(std::vector<double> values, double fallback)
    : values_(std::move(values))
    , fallback_(clamp_unit(fallback))
{}

double SequenceRandomSource::next_double() {
    double value = draws_ < values_.size() ? clamp_unit(values_[draws_]) : fallback_;
    draws_++;
    return value;
}

} // namespace monsters
