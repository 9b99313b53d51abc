#include <cstdio>
#include <cstdint>

#include "interpreter.h"

enum InstructionHighNybble
{
    INSN_SYS = 0x0,
    INSN_JP = 0x1,
    INSN_CALL = 0x2,
    INSN_SE_IMM = 0x3,
    INSN_SNE_IMM = 0x4,
    INSN_SE_REG = 0x5,
    INSN_LD_IMM = 0x6,
    INSN_ADD_IMM = 0x7,
    INSN_ALU = 0x8,
    INSN_SNE_REG = 0x9,
    INSN_LD_I = 0xA,
    INSN_JP_V0 = 0xB,
    INSN_RND = 0xC,
    INSN_DRW = 0xD,
    INSN_SKP = 0xE,
    INSN_LD_SPECIAL = 0xF,
};

bool decode(uint16_t word, Instruction& instruction)
{
    instruction.word = word;
    instruction.x = (word & 0x0F00) >> 8;
    instruction.y = (word & 0x00F0) >> 4;
    instruction.n = word & 0x000F;
    instruction.kk = word & 0x00FF;
    instruction.nnn = word & 0x0FFF;

    switch(word >> 12) {
        case INSN_SYS: {
            if(word == 0x00E0) {
                instruction.operation = OP_CLS;
            } else if(word == 0x00EE) {
                instruction.operation = OP_RET;
            } else {
                return false;   // 0nnn SYS is not supported
            }
            return true;
        }
        case INSN_JP: instruction.operation = OP_JP; return true;
        case INSN_CALL: instruction.operation = OP_CALL; return true;
        case INSN_SE_IMM: instruction.operation = OP_SE_IMM; return true;
        case INSN_SNE_IMM: instruction.operation = OP_SNE_IMM; return true;
        case INSN_SE_REG: {
            instruction.operation = OP_SE_REG;
            return instruction.n == 0;
        }
        case INSN_LD_IMM: instruction.operation = OP_LD_IMM; return true;
        case INSN_ADD_IMM: instruction.operation = OP_ADD_IMM; return true;
        case INSN_ALU: {
            switch(instruction.n) {
                case 0x0: instruction.operation = OP_LD_REG; return true;
                case 0x1: instruction.operation = OP_OR; return true;
                case 0x2: instruction.operation = OP_AND; return true;
                case 0x3: instruction.operation = OP_XOR; return true;
                case 0x4: instruction.operation = OP_ADD_REG; return true;
                case 0x5: instruction.operation = OP_SUB; return true;
                case 0x6: instruction.operation = OP_SHR; return true;
                case 0x7: instruction.operation = OP_SUBN; return true;
                case 0xE: instruction.operation = OP_SHL; return true;
                default: return false;
            }
        }
        case INSN_SNE_REG: {
            instruction.operation = OP_SNE_REG;
            return instruction.n == 0;
        }
        case INSN_LD_I: instruction.operation = OP_LD_I; return true;
        case INSN_JP_V0: instruction.operation = OP_JP_V0; return true;
        case INSN_RND: instruction.operation = OP_RND; return true;
        case INSN_DRW: instruction.operation = OP_DRW; return true;
        case INSN_SKP: {
            switch(instruction.kk) {
                case 0x9E: instruction.operation = OP_SKP; return true;
                case 0xA1: instruction.operation = OP_SKNP; return true;
                default: return false;
            }
        }
        case INSN_LD_SPECIAL: {
            switch(instruction.kk) {
                case 0x07: instruction.operation = OP_GET_DELAY; return true;
                case 0x0A: instruction.operation = OP_KEYWAIT; return true;
                case 0x15: instruction.operation = OP_SET_DELAY; return true;
                case 0x18: instruction.operation = OP_SET_SOUND; return true;
                case 0x1E: instruction.operation = OP_ADD_INDEX; return true;
                case 0x29: instruction.operation = OP_LD_DIGIT; return true;
                case 0x33: instruction.operation = OP_LD_BCD; return true;
                case 0x55: instruction.operation = OP_STORE_REGS; return true;
                case 0x65: instruction.operation = OP_LOAD_REGS; return true;
                default: return false;
            }
        }
    }
    return false;
}

std::string disassemble(uint16_t word)
{
    Instruction insn;
    char text[32];

    if(!decode(word, insn)) {
        snprintf(text, sizeof(text), "??? %04X", word);
        return text;
    }

    switch(insn.operation) {
        case OP_CLS: snprintf(text, sizeof(text), "CLS"); break;
        case OP_RET: snprintf(text, sizeof(text), "RET"); break;
        case OP_JP: snprintf(text, sizeof(text), "JP %03X", insn.nnn); break;
        case OP_CALL: snprintf(text, sizeof(text), "CALL %03X", insn.nnn); break;
        case OP_SE_IMM: snprintf(text, sizeof(text), "SE V%X, %02X", insn.x, insn.kk); break;
        case OP_SNE_IMM: snprintf(text, sizeof(text), "SNE V%X, %02X", insn.x, insn.kk); break;
        case OP_SE_REG: snprintf(text, sizeof(text), "SE V%X, V%X", insn.x, insn.y); break;
        case OP_LD_IMM: snprintf(text, sizeof(text), "LD V%X, %02X", insn.x, insn.kk); break;
        case OP_ADD_IMM: snprintf(text, sizeof(text), "ADD V%X, %02X", insn.x, insn.kk); break;
        case OP_LD_REG: snprintf(text, sizeof(text), "LD V%X, V%X", insn.x, insn.y); break;
        case OP_OR: snprintf(text, sizeof(text), "OR V%X, V%X", insn.x, insn.y); break;
        case OP_AND: snprintf(text, sizeof(text), "AND V%X, V%X", insn.x, insn.y); break;
        case OP_XOR: snprintf(text, sizeof(text), "XOR V%X, V%X", insn.x, insn.y); break;
        case OP_ADD_REG: snprintf(text, sizeof(text), "ADD V%X, V%X", insn.x, insn.y); break;
        case OP_SUB: snprintf(text, sizeof(text), "SUB V%X, V%X", insn.x, insn.y); break;
        case OP_SHR: snprintf(text, sizeof(text), "SHR V%X, V%X", insn.x, insn.y); break;
        case OP_SUBN: snprintf(text, sizeof(text), "SUBN V%X, V%X", insn.x, insn.y); break;
        case OP_SHL: snprintf(text, sizeof(text), "SHL V%X, V%X", insn.x, insn.y); break;
        case OP_SNE_REG: snprintf(text, sizeof(text), "SNE V%X, V%X", insn.x, insn.y); break;
        case OP_LD_I: snprintf(text, sizeof(text), "LD I, %03X", insn.nnn); break;
        case OP_JP_V0: snprintf(text, sizeof(text), "JP V0, %03X", insn.nnn); break;
        case OP_RND: snprintf(text, sizeof(text), "RND V%X, %02X", insn.x, insn.kk); break;
        case OP_DRW: snprintf(text, sizeof(text), "DRW V%X, V%X, %X", insn.x, insn.y, insn.n); break;
        case OP_SKP: snprintf(text, sizeof(text), "SKP V%X", insn.x); break;
        case OP_SKNP: snprintf(text, sizeof(text), "SKNP V%X", insn.x); break;
        case OP_GET_DELAY: snprintf(text, sizeof(text), "LD V%X, DT", insn.x); break;
        case OP_KEYWAIT: snprintf(text, sizeof(text), "LD V%X, K", insn.x); break;
        case OP_SET_DELAY: snprintf(text, sizeof(text), "LD DT, V%X", insn.x); break;
        case OP_SET_SOUND: snprintf(text, sizeof(text), "LD ST, V%X", insn.x); break;
        case OP_ADD_INDEX: snprintf(text, sizeof(text), "ADD I, V%X", insn.x); break;
        case OP_LD_DIGIT: snprintf(text, sizeof(text), "LD F, V%X", insn.x); break;
        case OP_LD_BCD: snprintf(text, sizeof(text), "LD B, V%X", insn.x); break;
        case OP_STORE_REGS: snprintf(text, sizeof(text), "LD [I], V%X", insn.x); break;
        case OP_LOAD_REGS: snprintf(text, sizeof(text), "LD V%X, [I]", insn.x); break;
    }
    return text;
}

Interpreter::Interpreter() :
    e1(std::random_device()()),
    uniform_dist(0, 255)
{
}

Interpreter::Interpreter(uint32_t seed) :
    e1(seed),
    uniform_dist(0, 255)
{
}

// Reporting the fault is left to whoever drives the interpreter.
Interpreter::StepResult Interpreter::raise(FaultKind kind, uint16_t pc, uint16_t word, bool fetchFailed)
{
    fault.kind = kind;
    fault.pc = pc;
    fault.instructionWord = word;
    fault.fetchFailed = fetchFailed;
    if(debug & DEBUG_STATE) {
        printf("CHIP8: fault %s\n", describeFault(fault).c_str());
    }
    return FAULT;
}

// The flag is written before the result, so with VF as the destination the
// result wins.
void Interpreter::storeALUResult(RegisterFile& registers, int destination, uint8_t result, bool f)
{
    registers.set(FlagRegister, f ? 1 : 0);
    registers.set(destination, result);
}

Interpreter::StepResult Interpreter::step(Machine& machine)
{
    RegisterFile& registers = machine.registers;
    Memory& memory = machine.memory;
    auto& V = registers.V;
    uint16_t pc = registers.pc;

    uint16_t instructionWord = 0;
    if((pc & 0x1) || !memory.readWord(pc, instructionWord)) {
        return raise(ADDRESS_OUT_OF_RANGE, pc, 0, true);
    }

    Instruction insn;
    if(!decode(instructionWord, insn)) {
        return raise(UNKNOWN_OPCODE, pc, instructionWord);
    }

    if(debug & DEBUG_STATE) {
        printf("CHIP8: clk:%llu pc:%04X I:%04X ", (unsigned long long)clock, pc, registers.I);
        for(int i = 0; i < RegisterCount; i++) {
            printf("%02X ", V[i]);
        }
        puts("");
    }
    if(debug & DEBUG_ASM) {
        printf("%04X: (%04X) %s\n", pc, instructionWord, disassemble(instructionWord).c_str());
    }

    StepResult stepResult = CONTINUE;
    uint16_t nextPC = (pc + 2) % MemorySize;
    auto skipNext = [&]() { nextPC = (nextPC + 2) % MemorySize; };

    switch(insn.operation) {
        case OP_CLS: {
            machine.display.clear();
            break;
        }
        case OP_RET: {
            if(!registers.pop(nextPC)) {
                return raise(STACK_UNDERFLOW, pc, instructionWord);
            }
            break;
        }
        case OP_JP: {
            nextPC = insn.nnn;
            break;
        }
        case OP_CALL: {
            if(!registers.push(nextPC)) {
                return raise(STACK_OVERFLOW, pc, instructionWord);
            }
            nextPC = insn.nnn;
            break;
        }
        case OP_SE_IMM: {
            if(V[insn.x] == insn.kk) {
                skipNext();
            }
            break;
        }
        case OP_SNE_IMM: {
            if(V[insn.x] != insn.kk) {
                skipNext();
            }
            break;
        }
        case OP_SE_REG: {
            if(V[insn.x] == V[insn.y]) {
                skipNext();
            }
            break;
        }
        case OP_LD_IMM: {
            V[insn.x] = insn.kk;
            break;
        }
        case OP_ADD_IMM: {
            V[insn.x] = V[insn.x] + insn.kk;
            break;
        }
        case OP_LD_REG: {
            V[insn.x] = V[insn.y];
            break;
        }
        case OP_OR: {
            V[insn.x] |= V[insn.y];
            break;
        }
        case OP_AND: {
            V[insn.x] &= V[insn.y];
            break;
        }
        case OP_XOR: {
            V[insn.x] ^= V[insn.y];
            break;
        }
        case OP_ADD_REG: {
            uint16_t sum = V[insn.x] + V[insn.y];
            storeALUResult(registers, insn.x, sum & 0xFF, sum > 0xFF);
            break;
        }
        case OP_SUB: {
            uint8_t result = V[insn.x] - V[insn.y];
            storeALUResult(registers, insn.x, result, V[insn.x] > V[insn.y]);
            break;
        }
        case OP_SUBN: {
            uint8_t result = V[insn.y] - V[insn.x];
            storeALUResult(registers, insn.x, result, V[insn.y] > V[insn.x]);
            break;
        }
        case OP_SHR: { // Vx = Vy >> 1, VF = bit shifted out of Vy
            uint8_t source = V[insn.y];
            storeALUResult(registers, insn.x, source >> 1, source & 0x01);
            break;
        }
        case OP_SHL: { // Vx = Vy << 1, VF = bit shifted out of Vy
            uint8_t source = V[insn.y];
            storeALUResult(registers, insn.x, source << 1, source & 0x80);
            break;
        }
        case OP_SNE_REG: {
            if(V[insn.x] != V[insn.y]) {
                skipNext();
            }
            break;
        }
        case OP_LD_I: {
            registers.I = insn.nnn;
            break;
        }
        case OP_JP_V0: {
            uint16_t target = insn.nnn + V[0];
            if(target >= MemorySize) {
                return raise(ADDRESS_OUT_OF_RANGE, pc, instructionWord);
            }
            nextPC = target;
            break;
        }
        case OP_RND: {
            V[insn.x] = uniform_dist(e1) & insn.kk;
            break;
        }
        case OP_DRW: {
            uint8_t rows[MaxSpriteRows];
            for(int i = 0; i < insn.n; i++) {
                if(!memory.read(registers.I + i, rows[i])) {
                    return raise(ADDRESS_OUT_OF_RANGE, pc, instructionWord);
                }
            }
            bool erased = machine.display.drawSprite(V[insn.x], V[insn.y], rows, insn.n);
            V[FlagRegister] = erased ? 1 : 0;
            break;
        }
        case OP_SKP: {
            if(machine.keypad.isPressed(V[insn.x])) {
                if(debug & DEBUG_KEYS) {
                    printf("clock %llu, pc %04X, SKP, key %d pressed\n", (unsigned long long)clock, pc, V[insn.x]);
                }
                skipNext();
            }
            break;
        }
        case OP_SKNP: {
            if(!machine.keypad.isPressed(V[insn.x])) {
                skipNext();
            } else if(debug & DEBUG_KEYS) {
                printf("clock %llu, pc %04X, SKNP, key %d pressed\n", (unsigned long long)clock, pc, V[insn.x]);
            }
            break;
        }
        case OP_GET_DELAY: {
            V[insn.x] = machine.timers.getDelay();
            break;
        }
        case OP_KEYWAIT: {
            if(debug & DEBUG_KEYS) {
                printf("waiting for key\n");
            }
            keyDestinationRegister = insn.x;
            machine.keypad.beginWait();
            stepResult = WAIT_FOR_KEY;
            break;
        }
        case OP_SET_DELAY: {
            machine.timers.setDelay(V[insn.x]);
            break;
        }
        case OP_SET_SOUND: {
            machine.timers.setSound(V[insn.x]);
            break;
        }
        case OP_ADD_INDEX: {
            registers.I = registers.I + V[insn.x];
            break;
        }
        case OP_LD_DIGIT: {
            registers.I = memory.getDigitLocation(V[insn.x]);
            break;
        }
        case OP_LD_BCD: {
            uint8_t value = V[insn.x];
            if(!memory.write(registers.I + 0, value / 100) ||
                !memory.write(registers.I + 1, (value % 100) / 10) ||
                !memory.write(registers.I + 2, value % 10)) {
                return raise(ADDRESS_OUT_OF_RANGE, pc, instructionWord);
            }
            break;
        }
        case OP_STORE_REGS: { // I is left pointing past the last byte stored
            for(int i = 0; i <= insn.x; i++) {
                if(!memory.write(registers.I + i, V[i])) {
                    return raise(ADDRESS_OUT_OF_RANGE, pc, instructionWord);
                }
            }
            registers.I = registers.I + insn.x + 1;
            break;
        }
        case OP_LOAD_REGS: { // I is left pointing past the last byte loaded
            for(int i = 0; i <= insn.x; i++) {
                if(!memory.read(registers.I + i, V[i])) {
                    return raise(ADDRESS_OUT_OF_RANGE, pc, instructionWord);
                }
            }
            registers.I = registers.I + insn.x + 1;
            break;
        }
    }

    registers.pc = nextPC;
    clock++;
    return stepResult;
}

void Interpreter::completeKeyWait(Machine& machine, uint8_t key)
{
    if(debug & DEBUG_KEYS) {
        printf("key wait over, V%X = %X\n", keyDestinationRegister, key);
    }
    machine.registers.set(keyDestinationRegister, key);
}
