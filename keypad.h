#pragma once

#include <atomic>
#include <cstdint>

constexpr int KeyCount = 16;

// Written by the input side (possibly another thread), read by the
// interpreter.  Each update touches a single bit of an atomic word.
struct Keypad
{
    std::atomic<uint16_t> pressedKeys{0};
    std::atomic<uint16_t> newPresses{0};

    void setPressed(uint8_t key, bool isPressed)
    {
        uint16_t bit = 1u << (key & 0xF);
        if(isPressed) {
            uint16_t before = pressedKeys.fetch_or(bit);
            if(!(before & bit)) {
                newPresses.fetch_or(bit);
            }
        } else {
            pressedKeys.fetch_and((uint16_t)~bit);
        }
    }

    void setReleased(uint8_t key)
    {
        setPressed(key, false);
    }

    bool isPressed(uint8_t key) const
    {
        return pressedKeys.load() & (1u << (key & 0xF));
    }

    // Forget presses seen so far; only keys going down after this count
    // toward waitForAnyPress().
    void beginWait()
    {
        newPresses.store(0);
    }

    bool waitForAnyPress(uint8_t& key)
    {
        uint16_t presses = newPresses.exchange(0);
        if(presses == 0) {
            return false;
        }
        for(uint8_t i = 0; i < KeyCount; i++) {
            if(presses & (1u << i)) {
                key = i;
                break;
            }
        }
        return true;
    }
};
