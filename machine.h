#pragma once

#include "memory.h"
#include "display.h"
#include "keypad.h"
#include "timers.h"

struct Config
{
    uint32_t instructionRateHz = 1000;
    uint32_t frameRateHz = 60;
    float beepFrequencyHz = 553.0f;
    bool gradientColoring = false;      // renderer only
};

// Everything a running program can touch.  One per emulated machine.
struct Machine
{
    Memory memory;
    RegisterFile registers;
    Display display;
    Keypad keypad;
    Timers timers;
};
