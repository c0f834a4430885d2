/**
 * Monster Battle Engine - Default Capture Resolver
 */

#include "capture.hpp"

namespace monsters {

double DefaultCaptureResolver::item_modifier(const ItemID& item_id) {
    if (item_id == "basic_capture") return 1.0;
    if (item_id == "great_capture") return 1.5;
    if (item_id == "ultra_capture") return 2.0;
    if (item_id == "master_capture") return 3.0;
    return 1.0;
}

double DefaultCaptureResolver::probability(const Monster& target, const ItemID& item_id) const {
    double base_rate = std::clamp(target.capture_rate, 0, 255) / 255.0;

    // Lower HP increases capture rate
    double hp_modifier = (1.0 - target.hp_fraction()) * 0.5 + 0.5;

    double rate = base_rate * hp_modifier * item_modifier(item_id);
    return std::clamp(rate, 0.0, MAX_PROBABILITY);
}

} // namespace monsters
