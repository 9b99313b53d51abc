#pragma once

#include <algorithm>
#include <stdexcept>
#include <cstdio>
#include <cstdint>

#include "chip8.h"
#include "machine.h"
#include "interpreter.h"

typedef uint64_t clk_t;

// The system clock counts microseconds; every other rate is expressed as a
// number of events per SystemClockRate system clocks.
constexpr clk_t SystemClockRate = 1000000;

// Something that happens "rate" times per second of system clock.  Event k
// (counting from 1) is due at ceil(k * systemRate / rate), computed from the
// count rather than accumulated, so the schedule never drifts.
struct PeriodicActivity
{
    clk_t systemRate;
    clk_t rate;
    uint64_t events = 0;

    PeriodicActivity(clk_t systemRate, clk_t rate) :
        systemRate(systemRate),
        rate(rate)
    {}

    // Return the system clock at which the next event is due.
    clk_t calculateNextActivity() const
    {
        return ((events + 1) * systemRate + rate - 1) / rate;
    }

    void advance()
    {
        events++;
    }
};

// Drives one Machine.  INTERFACE receives the frame-ready and beep signals:
//     void present(const Display& display);
//     void startSound(float frequency);
//     void stopSound();
template <class INTERFACE>
struct Scheduler
{
    enum State {
        RUNNING,
        WAITING_FOR_KEY,
        HALTED,
    };

    Machine& machine;
    Interpreter& interpreter;
    INTERFACE& interface;
    Config config;

    State state = RUNNING;
    clk_t systemClock = 0;
    PeriodicActivity cpu;
    PeriodicActivity timers;
    PeriodicActivity frames;
    bool beeping = false;
    Fault fault;

    uint64_t stepsExecuted = 0;
    uint64_t ticksApplied = 0;
    uint64_t framesSignaled = 0;

    Scheduler(Machine& machine, Interpreter& interpreter, INTERFACE& interface, const Config& config) :
        machine(machine),
        interpreter(interpreter),
        interface(interface),
        config(config),
        cpu(SystemClockRate, config.instructionRateHz),
        timers(SystemClockRate, TimerRateHz),
        frames(SystemClockRate, config.frameRateHz)
    {
        if((config.instructionRateHz == 0) || (config.frameRateHz == 0)) {
            throw std::runtime_error("Scheduler: instruction and frame rates must be positive");
        }
    }

    // Do all work due after the most recent system clock up to and including
    // "until".  Missed instructions and timer ticks are all run; each frame
    // boundary passed gets exactly one frame-ready signal.  At equal
    // deadlines timers go first, then the CPU, then the frame.
    State updatePastClock(clk_t until)
    {
        while(state != HALTED) {
            clk_t nextCPU = cpu.calculateNextActivity();
            clk_t nextTimer = timers.calculateNextActivity();
            clk_t nextFrame = frames.calculateNextActivity();
            clk_t next = std::min(std::min(nextCPU, nextTimer), nextFrame);
            if(next > until) {
                break;
            }
            systemClock = next;
            if(nextTimer == next) {
                tick();
            } else if(nextCPU == next) {
                instruction();
            } else {
                frame();
            }
        }
        if(state != HALTED) {
            systemClock = std::max(systemClock, until);
        }
        return state;
    }

    State advance(clk_t elapsed)
    {
        return updatePastClock(systemClock + elapsed);
    }

    void tick()
    {
        machine.timers.tick();
        timers.advance();
        ticksApplied++;
    }

    void instruction()
    {
        cpu.advance();
        if(state == WAITING_FOR_KEY) {
            uint8_t key;
            if(machine.keypad.waitForAnyPress(key)) {
                interpreter.completeKeyWait(machine, key);
                state = RUNNING;
            }
            return;
        }
        Interpreter::StepResult result = interpreter.step(machine);
        stepsExecuted++;
        if(result == Interpreter::WAIT_FOR_KEY) {
            state = WAITING_FOR_KEY;
        } else if(result == Interpreter::FAULT) {
            fault = interpreter.fault;
            state = HALTED;
        }
    }

    void frame()
    {
        frames.advance();
        framesSignaled++;
        if(debug & DEBUG_TIMING) {
            printf("frame %llu at %llu us: %llu steps, %llu ticks, DT %d ST %d\n",
                (unsigned long long)framesSignaled, (unsigned long long)systemClock,
                (unsigned long long)stepsExecuted, (unsigned long long)ticksApplied,
                machine.timers.getDelay(), machine.timers.getSound());
        }
        interface.present(machine.display);
        machine.display.changed = false;
        if(machine.timers.getSound() > 0) {
            interface.startSound(config.beepFrequencyHz);
            beeping = true;
        } else if(beeping) {
            interface.stopSound();
            beeping = false;
        }
    }
};
