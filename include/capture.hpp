/**
 * Monster Battle Engine - Capture Resolver
 *
 * Capture probability for a wild target and a capture item.
 * The engine consumes the interface; DefaultCaptureResolver is the
 * standard rate formula.
 */

#pragma once

#include "monster.hpp"

namespace monsters {

class CaptureResolver {
public:
    virtual ~CaptureResolver() = default;

    /**
     * Probability in [0, 1] that using `item_id` on `target` succeeds.
     */
    virtual double probability(const Monster& target, const ItemID& item_id) const = 0;
};

/**
 * Rate formula:
 *   (capture_rate / 255) * ((1 - hp_fraction) * 0.5 + 0.5) * item_modifier
 * capped at 0.95.
 */
class DefaultCaptureResolver : public CaptureResolver {
public:
    static constexpr double MAX_PROBABILITY = 0.95;

    double probability(const Monster& target, const ItemID& item_id) const override;

    /**
     * basic_capture 1.0, great_capture 1.5, ultra_capture 2.0,
     * master_capture 3.0, anything else 1.0.
     */
    static double item_modifier(const ItemID& item_id);
};

} // namespace monsters
