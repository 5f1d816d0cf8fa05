#include "disassemble.hpp"
#include "decoder.hpp"
#include "fault.hpp"
#include "instruction.hpp"
#include "value.hpp"
#include <fmt/core.h>

namespace kumo {

static std::string operands_to_string(Opcode opcode, Decoder& decoder) {
    switch (opcode) {
        case Opcode::LOAD_STRING:
            return value_to_string(make_string(decoder.read_string()));
        case Opcode::LOAD_FLOAT64:
            return value_to_string(make_float(decoder.read_f64()));
        case Opcode::LOAD_BOOL:
            return decoder.read_u8() == 0x01 ? "true" : "false";
        case Opcode::LOAD_REGEX: {
            std::string source = decoder.read_string();
            std::string flags = decoder.read_string();
            return value_to_string(make_pattern(source, flags));
        }
        case Opcode::STORE_VAR:
        case Opcode::LOAD_VAR:
            return decoder.read_string();
        case Opcode::CALL:
            return fmt::format("#{}", decoder.read_u16());
        case Opcode::POP:
        case Opcode::LOAD_NULL:
        case Opcode::LOAD_UNDEFINED:
        case Opcode::RETURN:
            return "";
    }
    return "";
}

std::vector<std::string> disassemble(const FunctionObject& func) {
    std::vector<std::string> lines;
    Decoder decoder(func.code);
    while (!decoder.at_end()) {
        size_t offset = decoder.position();
        uint8_t byte = decoder.read_u8();
        std::optional<Opcode> opcode = byte_to_opcode(byte);
        if (!opcode) {
            lines.push_back(fmt::format("{:04x} <unknown 0x{:02x}>", offset, byte));
            break;
        }
        try {
            std::string operands = operands_to_string(*opcode, decoder);
            if (operands.empty()) {
                lines.push_back(fmt::format("{:04x} {}", offset, opcode_to_string(*opcode)));
            } else {
                lines.push_back(fmt::format("{:04x} {} {}", offset, opcode_to_string(*opcode), operands));
            }
        } catch (const Fault&) {
            lines.push_back(fmt::format("{:04x} {} <truncated>", offset, opcode_to_string(*opcode)));
            break;
        }
    }
    return lines;
}

} // namespace kumo
