/*
 * Pico_Clock - Clock_Source backed by the RP2350 64-bit system timer
 */

#ifndef PICO_CLOCK_HPP
#define PICO_CLOCK_HPP

#include "logic/debounce_scheduler.hpp"
#include <cstdint>

class Pico_Clock final : public Clock_Source {
public:
    /* Milliseconds since boot, wraps after ~49.7 days */
    uint32_t now_ms() override;
};

#endif // PICO_CLOCK_HPP
