/**
 * Monster Battle Engine - Presentation Pacing
 *
 * The engine pauses between applied actions and before handing the next
 * turn back, so a presentation layer can animate. Pauses never touch
 * battle state; a headless run uses NullPacing.
 */

#pragma once

#include <chrono>
#include <thread>

namespace monsters {

class PacingScheduler {
public:
    virtual ~PacingScheduler() = default;

    virtual void pause(std::chrono::milliseconds interval) = 0;
};

/**
 * No-op pacing (tests, simulations, bindings).
 */
class NullPacing : public PacingScheduler {
public:
    void pause(std::chrono::milliseconds /*interval*/) override {}
};

/**
 * Blocks the calling thread for the interval (interactive console).
 */
class SleepPacing : public PacingScheduler {
public:
    void pause(std::chrono::milliseconds interval) override {
        if (interval.count() > 0) {
            std::this_thread::sleep_for(interval);
        }
    }
};

} // namespace monsters
