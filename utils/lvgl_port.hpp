/*
 * LVGL Port - LVGL tick source and frame-boundary hook
 * Drives Frame_Timer_Backend from the LVGL refresh cadence
 */

#ifndef LVGL_PORT_HPP
#define LVGL_PORT_HPP

#include <cstdint>

class Frame_Timer_Backend;

bool lvgl_port_init(Frame_Timer_Backend &frames);
void lvgl_port_task_handler();

/* Refresh period in ms, 0 before init */
uint32_t lvgl_port_frame_period_ms();

#endif // LVGL_PORT_HPP
