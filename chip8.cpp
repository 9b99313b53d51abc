#include <cerrno>
#include <cstdio>
#include <cstdlib>

#include "chip8.h"
#include "interpreter.h"

std::map<std::string, int> keywordsToDebugFlags = {
    {"state", DEBUG_STATE},
    {"asm", DEBUG_ASM},
    {"draw", DEBUG_DRAW},
    {"keys", DEBUG_KEYS},
    {"timing", DEBUG_TIMING},
};
int debug = 0;

const char *faultName(FaultKind kind)
{
    switch(kind) {
        case NO_FAULT: return "no fault";
        case ADDRESS_OUT_OF_RANGE: return "address out of range";
        case STACK_OVERFLOW: return "stack overflow";
        case STACK_UNDERFLOW: return "stack underflow";
        case UNKNOWN_OPCODE: return "unknown opcode";
        case PROGRAM_TOO_LARGE: return "program too large";
    }
    return "unknown fault";
}

std::string describeFault(const Fault& fault)
{
    char text[96];
    if(fault.kind == PROGRAM_TOO_LARGE) {
        snprintf(text, sizeof(text), "%s: image exceeds %d bytes at %04X", faultName(fault.kind), MemorySize - ProgramLoadAddress, fault.pc);
    } else if(fault.fetchFailed) {
        snprintf(text, sizeof(text), "%04X: %s fetching instruction", fault.pc, faultName(fault.kind));
    } else {
        snprintf(text, sizeof(text), "%04X: %s (%04X %s)", fault.pc, faultName(fault.kind), fault.instructionWord, disassemble(fault.instructionWord).c_str());
    }
    return text;
}

bool parsePositiveInteger(const char *text, uint32_t& value)
{
    if((text[0] < '0') || (text[0] > '9')) {
        return false;
    }
    char *end;
    errno = 0;
    unsigned long long v = strtoull(text, &end, 10);
    if((*end != '\0') || (errno == ERANGE) || (v == 0) || (v > UINT32_MAX)) {
        return false;
    }
    value = (uint32_t)v;
    return true;
}
