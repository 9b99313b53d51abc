#pragma once

#include <random>
#include <string>
#include <cstdint>

#include "chip8.h"
#include "machine.h"

enum Operation
{
    OP_CLS,         // 00E0
    OP_RET,         // 00EE
    OP_JP,          // 1nnn
    OP_CALL,        // 2nnn
    OP_SE_IMM,      // 3xkk
    OP_SNE_IMM,     // 4xkk
    OP_SE_REG,      // 5xy0
    OP_LD_IMM,      // 6xkk
    OP_ADD_IMM,     // 7xkk
    OP_LD_REG,      // 8xy0
    OP_OR,          // 8xy1
    OP_AND,         // 8xy2
    OP_XOR,         // 8xy3
    OP_ADD_REG,     // 8xy4
    OP_SUB,         // 8xy5
    OP_SHR,         // 8xy6
    OP_SUBN,        // 8xy7
    OP_SHL,         // 8xyE
    OP_SNE_REG,     // 9xy0
    OP_LD_I,        // Annn
    OP_JP_V0,       // Bnnn
    OP_RND,         // Cxkk
    OP_DRW,         // Dxyn
    OP_SKP,         // Ex9E
    OP_SKNP,        // ExA1
    OP_GET_DELAY,   // Fx07
    OP_KEYWAIT,     // Fx0A
    OP_SET_DELAY,   // Fx15
    OP_SET_SOUND,   // Fx18
    OP_ADD_INDEX,   // Fx1E
    OP_LD_DIGIT,    // Fx29
    OP_LD_BCD,      // Fx33
    OP_STORE_REGS,  // Fx55
    OP_LOAD_REGS,   // Fx65
};

// One decoded instruction word.  Only the operands meaningful for the
// operation are of interest, the rest are still filled from the word.
struct Instruction
{
    Operation operation;
    uint16_t word;
    uint8_t x;
    uint8_t y;
    uint8_t n;
    uint8_t kk;
    uint16_t nnn;
};

bool decode(uint16_t word, Instruction& instruction);
std::string disassemble(uint16_t word);

struct Interpreter
{
    enum StepResult {
        CONTINUE,
        WAIT_FOR_KEY,
        FAULT,
    };

    uint64_t clock = 0;
    int keyDestinationRegister = 0;
    Fault fault;

    std::default_random_engine e1;
    std::uniform_int_distribution<int> uniform_dist;

    Interpreter();
    explicit Interpreter(uint32_t seed);

    StepResult step(Machine& machine);

    // Finish a Fx0A that returned WAIT_FOR_KEY.
    void completeKeyWait(Machine& machine, uint8_t key);

private:
    StepResult raise(FaultKind kind, uint16_t pc, uint16_t word, bool fetchFailed = false);
    void storeALUResult(RegisterFile& registers, int destination, uint8_t result, bool f);
};
