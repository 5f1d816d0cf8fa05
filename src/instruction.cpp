#include "instruction.hpp"

namespace kumo {

std::optional<Opcode> byte_to_opcode(uint8_t byte) {
    if (byte >= static_cast<uint8_t>(Opcode::LOAD_STRING) && byte <= static_cast<uint8_t>(Opcode::CALL)) {
        return static_cast<Opcode>(byte);
    }
    return std::nullopt;
}

const char* opcode_to_string(Opcode opcode) {
    switch (opcode) {
        case Opcode::LOAD_STRING: return "LOAD_STRING";
        case Opcode::LOAD_FLOAT64: return "LOAD_FLOAT64";
        case Opcode::LOAD_BOOL: return "LOAD_BOOL";
        case Opcode::POP: return "POP";
        case Opcode::LOAD_NULL: return "LOAD_NULL";
        case Opcode::LOAD_REGEX: return "LOAD_REGEX";
        case Opcode::LOAD_UNDEFINED: return "LOAD_UNDEFINED";
        case Opcode::RETURN: return "RETURN";
        case Opcode::STORE_VAR: return "STORE_VAR";
        case Opcode::LOAD_VAR: return "LOAD_VAR";
        case Opcode::CALL: return "CALL";
    }
    return "UNKNOWN";
}

} // namespace kumo
