#pragma once

#include <array>
#include <cstdio>
#include <cstdint>

#include "chip8.h"

constexpr int DisplayWidth = 64;
constexpr int DisplayHeight = 32;
constexpr int MaxSpriteRows = 15;

struct Display
{
    std::array<std::array<uint8_t, DisplayWidth>, DisplayHeight> pixels;
    bool changed = true;

    Display()
    {
        clear();
    }

    void clear()
    {
        for(auto& rowOfPixels : pixels) {
            rowOfPixels.fill(0);
        }
        changed = true;
    }

    bool pixel(int x, int y) const
    {
        return pixels.at(y).at(x) != 0;
    }

    // XOR each sprite row onto the grid starting at (x, y), wrapping each
    // pixel independently.  Returns true if any set pixel was erased.
    bool drawSprite(uint8_t x, uint8_t y, const uint8_t *rows, int rowCount)
    {
        bool erased = false;
        int left = x % DisplayWidth;
        int top = y % DisplayHeight;
        for(int rowIndex = 0; rowIndex < rowCount; rowIndex++) {
            uint8_t byte = rows[rowIndex];
            for(int bitIndex = 0; bitIndex < 8; bitIndex++) {
                if(!((byte >> (7 - bitIndex)) & 0x1)) {
                    continue;
                }
                int px = (left + bitIndex) % DisplayWidth;
                int py = (top + rowIndex) % DisplayHeight;
                if(debug & DEBUG_DRAW) {
                    printf("draw %d %d (%d)\n", px, py, px + py * DisplayWidth);
                }
                auto& p = pixels[py][px];
                if(p) {
                    erased = true;
                }
                p ^= 1;
            }
        }
        changed = true;
        return erased;
    }
};
