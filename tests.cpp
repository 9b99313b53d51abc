#undef NDEBUG

#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <cassert>
#include <stdexcept>

#include "chip8.h"
#include "machine.h"
#include "interpreter.h"
#include "scheduler.h"

void loadWords(Machine& machine, const std::vector<uint16_t>& words)
{
    std::vector<uint8_t> image;
    for(auto word : words) {
        image.push_back(word >> 8);
        image.push_back(word & 0xFF);
    }
    bool loaded = machine.memory.loadProgram(image);
    assert(loaded && "load test program");
}

// Run one instruction placed at the current pc.
Interpreter::StepResult runOne(Machine& machine, Interpreter& interpreter, uint16_t word)
{
    uint16_t pc = machine.registers.pc;
    machine.memory.bytes[pc] = word >> 8;
    machine.memory.bytes[pc + 1] = word & 0xFF;
    return interpreter.step(machine);
}

struct RecordingInterface
{
    const Machine& machine;
    uint64_t presents = 0;
    std::vector<uint8_t> soundAtPresent;
    int soundStarts = 0;
    int soundStops = 0;
    float lastFrequency = 0;

    RecordingInterface(const Machine& machine) :
        machine(machine)
    {}
    void present(const Display& display)
    {
        presents++;
        soundAtPresent.push_back(machine.timers.getSound());
    }
    void startSound(float frequency)
    {
        soundStarts++;
        lastFrequency = frequency;
    }
    void stopSound()
    {
        soundStops++;
    }
};

void TestMemory()
{
    {
        if(debug) printf("Memory initial state test\n");
        Memory memory;
        for(uint16_t i = 0; i < digitSprites.size(); i++) {
            assert((memory.bytes[FontAddress + i] == digitSprites[i]) && "font loaded at reset");
        }
        assert((memory.getDigitLocation(0x0) == FontAddress) && "digit 0 location");
        assert((memory.getDigitLocation(0xA) == FontAddress + 50) && "digit A location");
        assert((memory.getDigitLocation(0x1F) == FontAddress + 75) && "digit location uses low nybble");
    }

    {
        if(debug) printf("Memory read/write test\n");
        Memory memory;
        uint8_t data = 0;
        assert(memory.write(0x200, 0x5A) && "write at load address");
        assert(memory.write(0xFFF, 0xA5) && "write last byte");
        assert(memory.read(0x200, data) && (data == 0x5A) && "read back at load address");
        assert(memory.read(0xFFF, data) && (data == 0xA5) && "read back last byte");
        assert(!memory.read(0x1000, data) && "read past end fails");
        assert(!memory.write(0x1000, 0) && "write past end fails");
        assert(!memory.write(0x1FF, 0x11) && "write below load address fails");
        assert((memory.bytes[0x1FF] == 0) && "reserved area untouched");
        assert(memory.read(0x000, data) && (data == 0xF0) && "reserved area readable");
    }

    {
        if(debug) printf("Memory word test\n");
        Memory memory;
        uint16_t word = 0;
        memory.write(0x300, 0x12);
        memory.write(0x301, 0x34);
        assert(memory.readWord(0x300, word) && (word == 0x1234) && "big-endian word");
        assert(!memory.readWord(0xFFF, word) && "word straddling the end fails");
    }

    {
        if(debug) printf("Program load test\n");
        Memory memory;
        std::vector<uint8_t> fits(MemorySize - ProgramLoadAddress, 0x77);
        assert(memory.loadProgram(fits) && "largest image loads");
        assert((memory.bytes[ProgramLoadAddress] == 0x77) && "image copied at load address");
        assert((memory.bytes[MemorySize - 1] == 0x77) && "image copied to the end");
        assert((memory.bytes[0] == 0xF0) && "font not overwritten");

        Memory memory2;
        std::vector<uint8_t> tooLarge(MemorySize - ProgramLoadAddress + 1, 0x77);
        assert(!memory2.loadProgram(tooLarge) && "oversized image rejected");
        assert((memory2.bytes[ProgramLoadAddress] == 0) && "rejected image not copied");
    }
}

void TestRegisters()
{
    {
        if(debug) printf("Register round trip test\n");
        RegisterFile registers;
        assert((registers.pc == ProgramLoadAddress) && "pc starts at load address");
        assert((registers.sp == 0) && "stack starts empty");
        for(int r = 0; r < RegisterCount; r++) {
            for(int v = 0; v < 256; v++) {
                registers.set(r, v);
                assert((registers.get(r) == v) && "register round trip");
            }
        }
    }

    {
        if(debug) printf("Stack test\n");
        RegisterFile registers;
        uint16_t address = 0;
        assert(!registers.pop(address) && "pop on empty stack fails");
        for(int i = 0; i < StackDepth; i++) {
            assert(registers.push(0x200 + i * 2) && "push within depth");
        }
        assert(!registers.push(0x300) && "17th push fails");
        assert((registers.sp == StackDepth) && "sp stays at depth");
        for(int i = StackDepth - 1; i >= 0; i--) {
            assert(registers.pop(address) && (address == 0x200 + i * 2) && "pop in reverse order");
        }
        assert(!registers.pop(address) && "pop after draining fails");
    }

    {
        if(debug) printf("PC advance test\n");
        RegisterFile registers;
        registers.advancePC();
        assert((registers.pc == 0x202) && "advance by 2");
        registers.pc = 0xFFE;
        registers.advancePC();
        assert((registers.pc == 0x000) && "advance wraps within memory");
    }
}

void TestDisplay()
{
    {
        if(debug) printf("Sprite XOR test\n");
        Display display;
        const uint8_t sprite[] = {0xF0, 0x90, 0x90, 0x90, 0xF0, 0x3C, 0x81};
        display.drawSprite(3, 4, sprite, 2);
        auto before = display.pixels;
        bool erased = display.drawSprite(60, 29, sprite, 7);
        assert(!erased && "no collision on empty area");
        erased = display.drawSprite(60, 29, sprite, 7);
        assert(erased && "second draw erases");
        assert((display.pixels == before) && "drawing twice restores the framebuffer");
    }

    {
        if(debug) printf("Sprite wrap test\n");
        Display display;
        const uint8_t row[] = {0xFF};
        display.drawSprite(60, 31, row, 1);
        for(int x = 60; x < 64; x++) {
            assert(display.pixel(x, 31) && "right edge pixels set");
        }
        for(int x = 0; x < 4; x++) {
            assert(display.pixel(x, 31) && "pixels wrapped to left edge");
        }
        assert(!display.pixel(4, 31) && "sprite is 8 wide");

        const uint8_t column[] = {0x80, 0x80, 0x80};
        display.clear();
        display.drawSprite(10, 31, column, 3);
        assert(display.pixel(10, 31) && display.pixel(10, 0) && display.pixel(10, 1) && "rows wrap to top");

        display.clear();
        display.drawSprite(64 + 5, 32 + 2, row, 1);
        assert(display.pixel(5, 2) && "origin taken modulo the grid");
    }

    {
        if(debug) printf("Collision test\n");
        Display display;
        const uint8_t a[] = {0x80};
        const uint8_t b[] = {0x40};
        assert(!display.drawSprite(0, 0, a, 1) && "first draw");
        assert(!display.drawSprite(0, 0, b, 1) && "adjacent pixel does not collide");
        assert(display.drawSprite(0, 0, a, 1) && "overlapping pixel collides");
        assert(!display.pixel(0, 0) && display.pixel(1, 0) && "only the overlapping pixel toggled");
    }

    {
        if(debug) printf("Clear test\n");
        Display display;
        const uint8_t row[] = {0xFF};
        display.drawSprite(0, 0, row, 1);
        display.changed = false;
        display.clear();
        assert(display.changed && "clear marks display changed");
        for(int y = 0; y < DisplayHeight; y++) {
            for(int x = 0; x < DisplayWidth; x++) {
                assert(!display.pixel(x, y) && "cleared");
            }
        }
    }
}

void TestTimers()
{
    if(debug) printf("Timer tick test\n");
    Timers timers;
    timers.tick();
    assert((timers.getDelay() == 0) && (timers.getSound() == 0) && "tick at zero stays zero");
    timers.setDelay(255);
    timers.setSound(1);
    timers.tick();
    assert((timers.getDelay() == 254) && "delay decrements");
    assert((timers.getSound() == 0) && "sound decrements to zero");
    timers.tick();
    assert((timers.getDelay() == 253) && (timers.getSound() == 0) && "sound does not underflow");
}

void TestKeypad()
{
    {
        if(debug) printf("Keypad state test\n");
        Keypad keypad;
        for(uint8_t k = 0; k < KeyCount; k++) {
            assert(!keypad.isPressed(k) && "keys start released");
        }
        keypad.setPressed(0xB, true);
        assert(keypad.isPressed(0xB) && "pressed");
        assert(!keypad.isPressed(0xA) && "others unaffected");
        keypad.setReleased(0xB);
        assert(!keypad.isPressed(0xB) && "released");
    }

    {
        if(debug) printf("Keypad wait test\n");
        Keypad keypad;
        uint8_t key = 0xFF;
        keypad.setPressed(0x3, true);
        keypad.beginWait();
        assert(!keypad.waitForAnyPress(key) && "key already held does not count");
        keypad.setPressed(0x3, true);
        assert(!keypad.waitForAnyPress(key) && "repeat of held key does not count");
        keypad.setReleased(0x3);
        keypad.setPressed(0x3, true);
        assert(keypad.waitForAnyPress(key) && (key == 0x3) && "press after release counts");
        assert(!keypad.waitForAnyPress(key) && "press consumed");
        keypad.setPressed(0xE, true);
        assert(keypad.waitForAnyPress(key) && (key == 0xE) && "new key counts");
    }

    {
        if(debug) printf("Keypad concurrent writer test\n");
        Keypad keypad;
        keypad.setPressed(0x5, true);
        std::atomic<bool> done{false};
        std::thread writer([&]{
            for(int i = 0; i < 200000; i++) {
                keypad.setPressed(i % 2 ? 0x9 : 0x0, (i / 2) % 2 == 0);
            }
            done = true;
        });
        int reads = 0;
        while(!done.load()) {
            assert(keypad.isPressed(0x5) && "held key never lost by concurrent writes");
            reads++;
        }
        writer.join();
        assert(keypad.isPressed(0x5) && "held key still pressed");
        if(debug) printf("    %d reads\n", reads);
    }
}

void TestInterpreter()
{
    {
        if(debug) printf("Clear and draw scenario\n");
        Machine machine;
        Interpreter interpreter(1);
        loadWords(machine, {0x00E0, 0xD011, 0xFF00});
        machine.registers.I = 0x204;
        machine.display.pixels[5][5] = 1;
        assert((interpreter.step(machine) == Interpreter::CONTINUE) && "CLS");
        assert(!machine.display.pixel(5, 5) && "CLS cleared");
        assert((interpreter.step(machine) == Interpreter::CONTINUE) && "DRW");
        for(int x = 0; x < 8; x++) {
            assert(machine.display.pixel(x, 0) && "top-left row set");
        }
        assert(!machine.display.pixel(8, 0) && !machine.display.pixel(0, 1) && "only 8x1 drawn");
        assert((machine.registers.get(0xF) == 0) && "no collision");
        assert((machine.registers.pc == 0x204) && "pc after two steps");

        machine.registers.pc = 0x202;
        interpreter.step(machine);
        assert((machine.registers.get(0xF) == 1) && "redraw collides");
        assert(!machine.display.pixel(0, 0) && "redraw erased");
    }

    {
        if(debug) printf("Non-control-flow pc test\n");
        const std::vector<uint16_t> words = {
            0x6012, 0x7101, 0x8120, 0x8121, 0x8122, 0x8123, 0x8124, 0x8125, 0x8126, 0x8127, 0x812E,
            0xA300, 0xC0FF, 0xF007, 0xF015, 0xF018, 0xF01E, 0xF029, 0x00E0,
        };
        for(auto word : words) {
            Machine machine;
            Interpreter interpreter(7);
            machine.registers.pc = 0x400;
            machine.registers.I = 0x600;
            assert((runOne(machine, interpreter, word) == Interpreter::CONTINUE) && "step");
            assert((machine.registers.pc == 0x402) && "pc advanced by 2");

            machine.registers.pc = 0xFFE;
            machine.registers.I = 0x600;
            assert((runOne(machine, interpreter, word) == Interpreter::CONTINUE) && "step at end");
            assert((machine.registers.pc == 0x000) && "pc wrapped within memory");
        }
    }

    {
        if(debug) printf("Jump, call and return test\n");
        Machine machine;
        Interpreter interpreter(1);
        loadWords(machine, {0x2208, 0x0000, 0x0000, 0x0000, 0x1234});
        interpreter.step(machine);
        assert((machine.registers.pc == 0x208) && "CALL jumps");
        assert((machine.registers.sp == 1) && (machine.registers.stack[0] == 0x202) && "CALL pushes return address");
        interpreter.step(machine);
        assert((machine.registers.pc == 0x234) && "JP");
        runOne(machine, interpreter, 0x00EE);
        assert((machine.registers.pc == 0x202) && (machine.registers.sp == 0) && "RET");

        machine.registers.set(0, 0x10);
        runOne(machine, interpreter, 0xB300);
        assert((machine.registers.pc == 0x310) && "JP V0");
    }

    {
        if(debug) printf("Skip test\n");
        Machine machine;
        Interpreter interpreter(1);
        auto& V = machine.registers.V;
        struct Case { uint16_t word; uint8_t vx; uint8_t vy; bool skips; };
        const Case cases[] = {
            {0x3142, 0x42, 0, true}, {0x3142, 0x41, 0, false},
            {0x4142, 0x41, 0, true}, {0x4142, 0x42, 0, false},
            {0x5120, 0x33, 0x33, true}, {0x5120, 0x33, 0x34, false},
            {0x9120, 0x33, 0x34, true}, {0x9120, 0x33, 0x33, false},
        };
        for(const auto& c : cases) {
            machine.registers.pc = 0x300;
            V[1] = c.vx;
            V[2] = c.vy;
            runOne(machine, interpreter, c.word);
            assert((machine.registers.pc == (c.skips ? 0x304 : 0x302)) && "skip condition");
        }

        V[1] = 0x7;
        machine.registers.pc = 0x300;
        runOne(machine, interpreter, 0xE19E);
        assert((machine.registers.pc == 0x302) && "SKP key up");
        machine.keypad.setPressed(0x7, true);
        machine.registers.pc = 0x300;
        runOne(machine, interpreter, 0xE19E);
        assert((machine.registers.pc == 0x304) && "SKP key down");
        machine.registers.pc = 0x300;
        runOne(machine, interpreter, 0xE1A1);
        assert((machine.registers.pc == 0x302) && "SKNP key down");
        machine.keypad.setReleased(0x7);
        machine.registers.pc = 0x300;
        runOne(machine, interpreter, 0xE1A1);
        assert((machine.registers.pc == 0x304) && "SKNP key up");

        machine.registers.pc = 0xFFC;
        V[1] = 0x42;
        runOne(machine, interpreter, 0x3142);
        assert((machine.registers.pc == 0x000) && "skip wraps within memory");
    }

    {
        if(debug) printf("ALU test\n");
        Machine machine;
        Interpreter interpreter(1);
        auto& V = machine.registers.V;
        auto alu = [&](const char *what, uint16_t word, uint8_t vx, uint8_t vy, uint8_t result, int flag) {
            if(debug) printf("    %s\n", what);
            machine.registers.pc = 0x300;
            V[0xF] = 0xAA;
            V[1] = vx;
            V[2] = vy;
            runOne(machine, interpreter, word);
            assert((V[1] == result) && "ALU result");
            if(flag >= 0) {
                assert((V[0xF] == flag) && "ALU flag");
            } else {
                assert((V[0xF] == 0xAA) && "ALU leaves VF alone");
            }
        };
        alu("LD", 0x8120, 0x11, 0x22, 0x22, -1);
        alu("OR", 0x8121, 0xF0, 0x0F, 0xFF, -1);
        alu("AND", 0x8122, 0xF3, 0x3F, 0x33, -1);
        alu("XOR", 0x8123, 0xFF, 0x0F, 0xF0, -1);
        alu("ADD no carry", 0x8124, 0x10, 0x20, 0x30, 0);
        alu("ADD carry", 0x8124, 0xF0, 0x20, 0x10, 1);
        alu("ADD exactly 256", 0x8124, 0x80, 0x80, 0x00, 1);
        alu("SUB no borrow", 0x8125, 0x30, 0x10, 0x20, 1);
        alu("SUB equal", 0x8125, 0x30, 0x30, 0x00, 0);
        alu("SUB borrow", 0x8125, 0x10, 0x30, 0xE0, 0);
        alu("SUBN no borrow", 0x8127, 0x10, 0x30, 0x20, 1);
        alu("SUBN borrow", 0x8127, 0x30, 0x10, 0xE0, 0);
        alu("SUBN equal", 0x8127, 0x30, 0x30, 0x00, 0);
        alu("SHR reads Vy", 0x8126, 0xFF, 0x05, 0x02, 1);
        alu("SHR even", 0x8126, 0x00, 0x04, 0x02, 0);
        alu("SHL reads Vy", 0x812E, 0x00, 0x81, 0x02, 1);
        alu("SHL no carry", 0x812E, 0xFF, 0x41, 0x82, 0);

        machine.registers.pc = 0x300;
        V[0] = 0xFF;
        runOne(machine, interpreter, 0x7002);
        assert((V[0] == 0x01) && "ADD immediate wraps");
        assert((V[0xF] == 0xAA) && "ADD immediate leaves VF alone");

        machine.registers.pc = 0x300;
        V[0xF] = 0xF0;
        V[1] = 0x20;
        runOne(machine, interpreter, 0x8F14);
        assert((V[0xF] == 0x10) && "sum wins over carry when VF is the destination");

        machine.registers.pc = 0x300;
        V[0xF] = 0x30;
        V[1] = 0x10;
        runOne(machine, interpreter, 0x8F15);
        assert((V[0xF] == 0x20) && "difference wins over borrow flag when VF is the destination");

        machine.registers.pc = 0x300;
        V[1] = 0x04;
        runOne(machine, interpreter, 0x8F16);
        assert((V[0xF] == 0x02) && "shifted value wins over shifted-out bit when VF is the destination");
    }

    {
        if(debug) printf("Random test\n");
        Machine machine;
        Interpreter interpreter(1234);
        bool sawNonZero = false;
        for(int i = 0; i < 64; i++) {
            machine.registers.pc = 0x300;
            runOne(machine, interpreter, 0xC30F);
            assert(((machine.registers.get(3) & 0xF0) == 0) && "RND masked");
            sawNonZero = sawNonZero || (machine.registers.get(3) != 0);
        }
        assert(sawNonZero && "RND produces values");
    }

    {
        if(debug) printf("Timer opcode test\n");
        Machine machine;
        Interpreter interpreter(1);
        machine.registers.set(4, 0x3C);
        runOne(machine, interpreter, 0xF415);
        assert((machine.timers.getDelay() == 0x3C) && "LD DT, Vx");
        runOne(machine, interpreter, 0xF418);
        assert((machine.timers.getSound() == 0x3C) && "LD ST, Vx");
        machine.timers.tick();
        runOne(machine, interpreter, 0xF507);
        assert((machine.registers.get(5) == 0x3B) && "LD Vx, DT");
    }

    {
        if(debug) printf("Index and memory opcode test\n");
        Machine machine;
        Interpreter interpreter(1);
        auto& V = machine.registers.V;

        runOne(machine, interpreter, 0xA123);
        assert((machine.registers.I == 0x123) && "LD I");
        V[2] = 0x10;
        runOne(machine, interpreter, 0xF21E);
        assert((machine.registers.I == 0x133) && "ADD I, Vx");

        V[2] = 0x0C;
        runOne(machine, interpreter, 0xF229);
        assert((machine.registers.I == machine.memory.getDigitLocation(0xC)) && "LD F, Vx");

        machine.registers.I = 0x500;
        V[2] = 254;
        runOne(machine, interpreter, 0xF233);
        assert((machine.memory.bytes[0x500] == 2) && (machine.memory.bytes[0x501] == 5) && (machine.memory.bytes[0x502] == 4) && "BCD 254");
        assert((machine.registers.I == 0x500) && "BCD leaves I alone");
        V[2] = 7;
        runOne(machine, interpreter, 0xF233);
        assert((machine.memory.bytes[0x500] == 0) && (machine.memory.bytes[0x501] == 0) && (machine.memory.bytes[0x502] == 7) && "BCD 7");

        for(int i = 0; i < RegisterCount; i++) {
            V[i] = 0x40 + i;
        }
        machine.registers.I = 0x600;
        runOne(machine, interpreter, 0xF355);
        for(int i = 0; i <= 3; i++) {
            assert((machine.memory.bytes[0x600 + i] == 0x40 + i) && "LD [I], Vx stores V0..Vx");
        }
        assert((machine.memory.bytes[0x604] == 0) && "LD [I], Vx stops at Vx");
        assert((machine.registers.I == 0x604) && "LD [I], Vx advances I by x + 1");

        for(int i = 0; i < RegisterCount; i++) {
            V[i] = 0;
        }
        machine.registers.I = 0x600;
        runOne(machine, interpreter, 0xF265);
        assert((V[0] == 0x40) && (V[1] == 0x41) && (V[2] == 0x42) && "LD Vx, [I] loads V0..Vx");
        assert((V[3] == 0) && "LD Vx, [I] stops at Vx");
        assert((machine.registers.I == 0x603) && "LD Vx, [I] advances I by x + 1");

        machine.registers.I = 0x000;
        runOne(machine, interpreter, 0xF465);
        assert((V[0] == 0xF0) && "font readable by LD Vx, [I]");
    }

    {
        if(debug) printf("Key wait opcode test\n");
        Machine machine;
        Interpreter interpreter(1);
        machine.keypad.setPressed(0x2, true);
        assert((runOne(machine, interpreter, 0xF60A) == Interpreter::WAIT_FOR_KEY) && "LD Vx, K suspends");
        assert((machine.registers.pc == 0x202) && "pc past the wait");
        uint8_t key;
        assert(!machine.keypad.waitForAnyPress(key) && "held key ignored");
        machine.keypad.setPressed(0x9, true);
        assert(machine.keypad.waitForAnyPress(key) && "new press seen");
        interpreter.completeKeyWait(machine, key);
        assert((machine.registers.get(6) == 0x9) && "key stored in Vx");
    }
}

void TestFaults()
{
    {
        if(debug) printf("Unknown opcode test\n");
        const uint16_t words[] = {0x0000, 0x0123, 0x00E1, 0x5121, 0x8008, 0x800F, 0x9121, 0xE000, 0xE19F, 0xF000, 0xF0FF, 0xFFFF};
        for(auto word : words) {
            Machine machine;
            Interpreter interpreter(1);
            assert((runOne(machine, interpreter, word) == Interpreter::FAULT) && "unknown opcode faults");
            assert((interpreter.fault.kind == UNKNOWN_OPCODE) && "fault kind");
            assert((interpreter.fault.pc == 0x200) && (interpreter.fault.instructionWord == word) && "fault location");
            assert((machine.registers.pc == 0x200) && "pc not advanced past unknown opcode");
        }
    }

    {
        if(debug) printf("Stack fault test\n");
        Machine machine;
        Interpreter interpreter(1);
        loadWords(machine, {0x2200});
        for(int i = 0; i < StackDepth; i++) {
            assert((interpreter.step(machine) == Interpreter::CONTINUE) && "nested CALL");
        }
        assert((interpreter.step(machine) == Interpreter::FAULT) && "17th CALL faults");
        assert((interpreter.fault.kind == STACK_OVERFLOW) && "overflow kind");

        Machine machine2;
        Interpreter interpreter2(1);
        loadWords(machine2, {0x00EE});
        assert((interpreter2.step(machine2) == Interpreter::FAULT) && "RET on empty stack faults");
        assert((interpreter2.fault.kind == STACK_UNDERFLOW) && "underflow kind");
    }

    {
        if(debug) printf("Address fault test\n");
        Machine machine;
        Interpreter interpreter(1);
        machine.registers.I = 0x1FE;
        assert((runOne(machine, interpreter, 0xF155) == Interpreter::FAULT) && "store below load address faults");
        assert((interpreter.fault.kind == ADDRESS_OUT_OF_RANGE) && "store fault kind");

        Machine machine2;
        Interpreter interpreter2(1);
        machine2.registers.I = 0xFFE;
        assert((runOne(machine2, interpreter2, 0xF233) == Interpreter::FAULT) && "BCD past end faults");

        Machine machine3;
        Interpreter interpreter3(1);
        machine3.registers.I = 0xFFC;
        assert((runOne(machine3, interpreter3, 0xD018) == Interpreter::FAULT) && "sprite past end faults");
        assert((interpreter3.fault.kind == ADDRESS_OUT_OF_RANGE) && "sprite fault kind");

        Machine machine4;
        Interpreter interpreter4(1);
        machine4.registers.set(0, 0x10);
        assert((runOne(machine4, interpreter4, 0xBFF8) == Interpreter::FAULT) && "JP V0 past end faults");

        Machine machine5;
        Interpreter interpreter5(1);
        loadWords(machine5, {0x1203});
        interpreter5.step(machine5);
        assert((interpreter5.step(machine5) == Interpreter::FAULT) && "misaligned fetch faults");
        assert((interpreter5.fault.kind == ADDRESS_OUT_OF_RANGE) && (interpreter5.fault.pc == 0x203) && "misaligned fetch fault");
        assert(interpreter5.fault.fetchFailed && "misaligned fetch marked as fetch fault");

        Machine machine6;
        Interpreter interpreter6(1);
        machine6.registers.pc = 0x1000;
        assert((interpreter6.step(machine6) == Interpreter::FAULT) && "fetch past end of memory faults");
        assert((interpreter6.fault.kind == ADDRESS_OUT_OF_RANGE) && (interpreter6.fault.pc == 0x1000) && "fetch past end fault");
        assert(interpreter6.fault.fetchFailed && "fetch past end marked as fetch fault");

        Machine machine7;
        Interpreter interpreter7(1);
        machine7.registers.I = 0x1FE;
        runOne(machine7, interpreter7, 0xF155);
        assert(!interpreter7.fault.fetchFailed && "execute fault keeps its instruction word");
        assert((interpreter7.fault.instructionWord == 0xF155) && "execute fault instruction word");
    }

    {
        if(debug) printf("Empty sprite test\n");
        Machine machine;
        Interpreter interpreter(1);
        machine.registers.set(0xF, 1);
        machine.registers.I = 0x300;
        machine.memory.bytes[0x300] = 0xFF;
        assert((runOne(machine, interpreter, 0xD010) == Interpreter::CONTINUE) && "DRW with no rows");
        assert((machine.registers.get(0xF) == 0) && "DRW with no rows clears VF");
        for(int y = 0; y < DisplayHeight; y++) {
            for(int x = 0; x < DisplayWidth; x++) {
                assert(!machine.display.pixel(x, y) && "DRW with no rows draws nothing");
            }
        }
    }

    {
        if(debug) printf("Fault description test\n");
        Fault fault;
        fault.kind = UNKNOWN_OPCODE;
        fault.pc = 0x2A4;
        fault.instructionWord = 0xFFFF;
        std::string text = describeFault(fault);
        assert((text.find("02A4") != std::string::npos) && "description names pc");
        assert((text.find("unknown opcode") != std::string::npos) && "description names kind");
        Fault fetchFault;
        fetchFault.kind = ADDRESS_OUT_OF_RANGE;
        fetchFault.pc = 0x1000;
        fetchFault.fetchFailed = true;
        text = describeFault(fetchFault);
        assert((text.find("1000") != std::string::npos) && "fetch fault names pc");
        assert((text.find("fetching") != std::string::npos) && "fetch fault says so");
        assert((text.find("???") == std::string::npos) && "fetch fault has no disassembly");

        assert((disassemble(0xD125) == "DRW V1, V2, 5") && "disassemble DRW");
        assert((disassemble(0xF10A) == "LD V1, K") && "disassemble key wait");
    }
}

void TestParsing()
{
    if(debug) printf("Rate parsing test\n");
    uint32_t value = 0;
    assert(parsePositiveInteger("1000", value) && (value == 1000) && "plain rate");
    assert(parsePositiveInteger("4294967295", value) && (value == UINT32_MAX) && "largest rate");
    value = 7;
    assert(!parsePositiveInteger("4294967296", value) && "rate past 32 bits rejected");
    assert(!parsePositiveInteger("18446744073709551616", value) && "rate past 64 bits rejected");
    assert((value == 7) && "rejected rate leaves value alone");
    assert(!parsePositiveInteger("0", value) && "zero rejected");
    assert(!parsePositiveInteger("", value) && "empty rejected");
    assert(!parsePositiveInteger("-5", value) && "negative rejected");
    assert(!parsePositiveInteger("+5", value) && "sign rejected");
    assert(!parsePositiveInteger(" 5", value) && "leading space rejected");
    assert(!parsePositiveInteger("60hz", value) && "trailing text rejected");
}

void TestScheduler()
{
    Config config;
    config.instructionRateHz = 1000;
    config.frameRateHz = 60;

    {
        if(debug) printf("One second in one jump test\n");
        Machine machine;
        Interpreter interpreter(1);
        RecordingInterface interface(machine);
        loadWords(machine, {0x1200});
        Scheduler<RecordingInterface> scheduler(machine, interpreter, interface, config);
        scheduler.advance(SystemClockRate);
        assert((scheduler.stepsExecuted == 1000) && "1000 steps in 1 s");
        assert((scheduler.ticksApplied == 60) && "60 ticks in 1 s");
        assert((scheduler.framesSignaled == 60) && (interface.presents == 60) && "60 frames in 1 s");
        assert((scheduler.state == Scheduler<RecordingInterface>::RUNNING) && "still running");
    }

    {
        if(debug) printf("One second in small steps test\n");
        Machine machine;
        Interpreter interpreter(1);
        RecordingInterface interface(machine);
        loadWords(machine, {0x1200});
        Scheduler<RecordingInterface> scheduler(machine, interpreter, interface, config);
        for(clk_t t = 0; t < SystemClockRate; t++) {
            scheduler.advance(1);
        }
        assert((scheduler.stepsExecuted == 1000) && "1000 steps in 1 s of 1 us increments");
        assert((scheduler.ticksApplied == 60) && "60 ticks in 1 s of 1 us increments");
        assert((scheduler.framesSignaled == 60) && "60 frames in 1 s of 1 us increments");

        const clk_t uneven[] = {7, 333, 16666, 1, 49999, 2};
        clk_t total = 0;
        for(int i = 0; total < SystemClockRate; i++) {
            clk_t step = std::min(uneven[i % 6], SystemClockRate - total);
            scheduler.advance(step);
            total += step;
        }
        assert((scheduler.stepsExecuted == 2000) && "2000 steps after 2 s of uneven increments");
        assert((scheduler.ticksApplied == 120) && "120 ticks after 2 s of uneven increments");
        assert((scheduler.framesSignaled == 120) && "120 frames after 2 s of uneven increments");
    }

    {
        if(debug) printf("Independent rates test\n");
        Config other;
        other.instructionRateHz = 700;
        other.frameRateHz = 30;
        Machine machine;
        Interpreter interpreter(1);
        RecordingInterface interface(machine);
        loadWords(machine, {0x1200});
        Scheduler<RecordingInterface> scheduler(machine, interpreter, interface, other);
        scheduler.advance(SystemClockRate / 2);
        scheduler.advance(SystemClockRate * 5 / 2);
        assert((scheduler.stepsExecuted == 2100) && "700 Hz for 3 s");
        assert((scheduler.ticksApplied == 180) && "timers stay at 60 Hz");
        assert((scheduler.framesSignaled == 90) && "30 Hz frames for 3 s");
    }

    {
        if(debug) printf("Sound timer decay test\n");
        Machine machine;
        Interpreter interpreter(1);
        RecordingInterface interface(machine);
        loadWords(machine, {0x600A, 0xF018, 0x1204});
        Scheduler<RecordingInterface> scheduler(machine, interpreter, interface, config);
        scheduler.advance(2000);
        assert((machine.timers.getSound() == 10) && "sound timer set by LD ST, Vx");
        uint64_t ticksAtSet = scheduler.ticksApplied;
        while(scheduler.ticksApplied < ticksAtSet + 10) {
            scheduler.advance(1);
        }
        assert((machine.timers.getSound() == 0) && "sound timer reaches 0 after 10 ticks");
        size_t presentsAtZero = interface.soundAtPresent.size();
        scheduler.advance(SystemClockRate);
        assert((interface.soundAtPresent.size() > presentsAtZero) && "frames keep coming");
        for(size_t i = presentsAtZero; i < interface.soundAtPresent.size(); i++) {
            assert((interface.soundAtPresent[i] == 0) && "no later frame reports sound");
        }
        assert((interface.soundStarts > 0) && (interface.lastFrequency == config.beepFrequencyHz) && "beep started at configured frequency");
        assert((interface.soundStops == 1) && "beep stopped once");
        assert(!scheduler.beeping && "not beeping");
    }

    {
        if(debug) printf("Key wait suspension test\n");
        Machine machine;
        Interpreter interpreter(1);
        RecordingInterface interface(machine);
        loadWords(machine, {0x6078, 0xF015, 0xF30A, 0x1206});
        Scheduler<RecordingInterface> scheduler(machine, interpreter, interface, config);
        machine.keypad.setPressed(0x1, true);
        scheduler.advance(3000);
        assert((scheduler.state == Scheduler<RecordingInterface>::WAITING_FOR_KEY) && "waiting for key");
        assert((scheduler.stepsExecuted == 3) && "three steps run");

        scheduler.advance(SystemClockRate);
        assert((scheduler.state == Scheduler<RecordingInterface>::WAITING_FOR_KEY) && "held key does not resume");
        assert((scheduler.stepsExecuted == 3) && "no steps while waiting");
        assert((scheduler.ticksApplied == 60) && "timers tick while waiting");
        assert((scheduler.framesSignaled == 60) && "frames signaled while waiting");
        assert((machine.timers.getDelay() == 0x78 - 60) && "delay timer decays while waiting");

        machine.keypad.setPressed(0xA, true);
        scheduler.advance(1000);
        assert((scheduler.state == Scheduler<RecordingInterface>::RUNNING) && "press resumes");
        assert((machine.registers.get(3) == 0xA) && "pressed key stored");
        scheduler.advance(10000);
        assert((scheduler.stepsExecuted == 13) && "steps resume after the wait");
        assert((machine.registers.pc == 0x206) && "looping after the wait");
    }

    {
        if(debug) printf("Halt on fault test\n");
        Machine machine;
        Interpreter interpreter(1);
        RecordingInterface interface(machine);
        loadWords(machine, {0x6001, 0xFFFF});
        Scheduler<RecordingInterface> scheduler(machine, interpreter, interface, config);
        assert((scheduler.advance(SystemClockRate) == Scheduler<RecordingInterface>::HALTED) && "unknown opcode halts");
        assert((scheduler.fault.kind == UNKNOWN_OPCODE) && (scheduler.fault.pc == 0x202) && "fault reported with pc");
        assert((scheduler.stepsExecuted == 2) && "no steps after the fault");
        uint64_t ticks = scheduler.ticksApplied;
        uint64_t frames = scheduler.framesSignaled;
        scheduler.advance(SystemClockRate);
        assert((scheduler.ticksApplied == ticks) && (scheduler.framesSignaled == frames) && "halted scheduler stays halted");
    }

    {
        if(debug) printf("Halt on stack overflow test\n");
        Machine machine;
        Interpreter interpreter(1);
        RecordingInterface interface(machine);
        loadWords(machine, {0x6001, 0x2204, 0x2204});
        Scheduler<RecordingInterface> scheduler(machine, interpreter, interface, config);
        assert((scheduler.advance(SystemClockRate) == Scheduler<RecordingInterface>::HALTED) && "stack overflow halts");
        assert((scheduler.fault.kind == STACK_OVERFLOW) && (scheduler.fault.pc == 0x204) && "overflow reported with pc");
        assert((scheduler.stepsExecuted == 2 + StackDepth) && "halted on the 17th nested CALL");
        assert((machine.registers.sp == StackDepth) && "stack left full");
        uint64_t frames = scheduler.framesSignaled;
        scheduler.advance(SystemClockRate);
        assert((scheduler.framesSignaled == frames) && "no frames after the halt");
    }

    {
        if(debug) printf("Zero rate test\n");
        Config bad;
        bad.frameRateHz = 0;
        Machine machine;
        Interpreter interpreter(1);
        RecordingInterface interface(machine);
        bool threw = false;
        try {
            Scheduler<RecordingInterface> scheduler(machine, interpreter, interface, bad);
        } catch(const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "zero frame rate rejected");
    }
}

int main(int argc, char **argv)
{
    if((argc > 1) && (strcmp(argv[1], "-v") == 0)) {
        debug = DEBUG_KEYS;
    }

    TestMemory();
    TestRegisters();
    TestDisplay();
    TestTimers();
    TestKeypad();
    TestInterpreter();
    TestFaults();
    TestParsing();
    TestScheduler();

    printf("all tests passed\n");
    return EXIT_SUCCESS;
}
