#pragma once

#include <map>
#include <string>
#include <cstdint>

constexpr int DEBUG_STATE = 0x01;
constexpr int DEBUG_ASM = 0x02;
constexpr int DEBUG_DRAW = 0x04;
constexpr int DEBUG_KEYS = 0x08;
constexpr int DEBUG_TIMING = 0x10;
extern std::map<std::string, int> keywordsToDebugFlags;
extern int debug;

enum FaultKind
{
    NO_FAULT,
    ADDRESS_OUT_OF_RANGE,
    STACK_OVERFLOW,
    STACK_UNDERFLOW,
    UNKNOWN_OPCODE,
    PROGRAM_TOO_LARGE,
};

// Machine faults are terminal; pc is the address of the instruction that
// faulted (or the load address for PROGRAM_TOO_LARGE).
struct Fault
{
    FaultKind kind = NO_FAULT;
    uint16_t pc = 0;
    uint16_t instructionWord = 0;
    bool fetchFailed = false;       // no instructionWord was read
};

const char *faultName(FaultKind kind);
std::string describeFault(const Fault& fault);

// Decimal integer in [1, UINT32_MAX]; anything else, including trailing
// characters and a leading sign, is rejected.
bool parsePositiveInteger(const char *text, uint32_t& value);
