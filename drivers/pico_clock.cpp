/*
 * Pico_Clock Implementation
 */

#include "drivers/pico_clock.hpp"

#include "pico/time.h"

uint32_t Pico_Clock::now_ms() {
    return to_ms_since_boot(get_absolute_time());
}
