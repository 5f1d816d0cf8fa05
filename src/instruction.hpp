#ifndef INSTRUCTION_HPP
#define INSTRUCTION_HPP

#include <cstdint>
#include <optional>

namespace kumo {

// Instruction opcodes. The enumerator value is the byte in the instruction stream.
enum class Opcode : uint8_t {
    LOAD_STRING = 0x01,     // string operand
    LOAD_FLOAT64 = 0x02,    // 8 byte double operand
    LOAD_BOOL = 0x03,       // 1 byte operand, 0x01 is true
    POP = 0x04,
    LOAD_NULL = 0x05,
    LOAD_REGEX = 0x06,      // pattern string, flags string
    LOAD_UNDEFINED = 0x07,
    RETURN = 0x08,
    STORE_VAR = 0x09,       // name string
    LOAD_VAR = 0x0A,        // name string
    CALL = 0x0B,            // u16 function index
};

// Map an instruction byte to its opcode, or nothing if the byte is not one.
std::optional<Opcode> byte_to_opcode(uint8_t byte);

// Get the instruction name for tracing.
const char* opcode_to_string(Opcode opcode);

} // namespace kumo

#endif // INSTRUCTION_HPP
