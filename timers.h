#pragma once

#include <cstdint>

constexpr uint32_t TimerRateHz = 60;

struct Timers
{
    uint8_t delay = 0;
    uint8_t sound = 0;

    void tick()
    {
        if(delay > 0) {
            delay--;
        }
        if(sound > 0) {
            sound--;
        }
    }

    uint8_t getDelay() const { return delay; }
    void setDelay(uint8_t v) { delay = v; }
    uint8_t getSound() const { return sound; }
    void setSound(uint8_t v) { sound = v; }
};
