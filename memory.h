#pragma once

#include <array>
#include <algorithm>
#include <vector>
#include <cstdint>

constexpr uint16_t MemorySize = 4096;
constexpr uint16_t ProgramLoadAddress = 0x200;
constexpr uint16_t FontAddress = 0x000;
constexpr uint16_t FontGlyphSize = 5;
constexpr int RegisterCount = 16;
constexpr int StackDepth = 16;
constexpr int FlagRegister = 0xF;

constexpr std::array<uint8_t, 80> digitSprites = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80, // F
};

struct Memory
{
    std::array<uint8_t, MemorySize> bytes;

    Memory()
    {
        bytes.fill(0);
        for(uint16_t i = 0; i < digitSprites.size(); i++) {
            bytes[FontAddress + i] = digitSprites[i];
        }
    }

    bool read(uint32_t address, uint8_t& data) const
    {
        if(address >= MemorySize) {
            return false;
        }
        data = bytes[address];
        return true;
    }

    // Writes from the running program; the interpreter area below the load
    // address is off limits.
    bool write(uint32_t address, uint8_t data)
    {
        if((address < ProgramLoadAddress) || (address >= MemorySize)) {
            return false;
        }
        bytes[address] = data;
        return true;
    }

    // Instruction words are stored big-endian.
    bool readWord(uint32_t address, uint16_t& word) const
    {
        uint8_t hi, lo;
        if(!read(address, hi) || !read(address + 1, lo)) {
            return false;
        }
        word = hi << 8 | lo;
        return true;
    }

    uint16_t getDigitLocation(uint8_t digit) const
    {
        return FontAddress + (digit & 0xF) * FontGlyphSize;
    }

    bool loadProgram(const std::vector<uint8_t>& image)
    {
        if(image.size() > MemorySize - ProgramLoadAddress) {
            return false;
        }
        std::copy(image.begin(), image.end(), bytes.begin() + ProgramLoadAddress);
        return true;
    }
};

struct RegisterFile
{
    std::array<uint8_t, RegisterCount> V;
    uint16_t I = 0;
    uint16_t pc = ProgramLoadAddress;
    uint8_t sp = 0;
    std::array<uint16_t, StackDepth> stack;

    RegisterFile()
    {
        V.fill(0);
        stack.fill(0);
    }

    uint8_t get(int r) const
    {
        return V.at(r);
    }
    void set(int r, uint8_t value)
    {
        V.at(r) = value;
    }

    void advancePC()
    {
        pc = (pc + 2) % MemorySize;
    }

    bool push(uint16_t address)
    {
        if(sp >= StackDepth) {
            return false;
        }
        stack[sp++] = address;
        return true;
    }
    bool pop(uint16_t& address)
    {
        if(sp == 0) {
            return false;
        }
        address = stack[--sp];
        return true;
    }
};
