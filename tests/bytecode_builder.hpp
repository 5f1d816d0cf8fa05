#ifndef BYTECODE_BUILDER_HPP
#define BYTECODE_BUILDER_HPP

#include "../src/instruction.hpp"
#include "../src/module.hpp"
#include <bit>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kumo::test {

// Emits instruction bytes the way the compiler does.
class Bytecode {
private:
    std::vector<uint8_t> bytes_;

public:
    Bytecode& op(Opcode opcode) { return u8(static_cast<uint8_t>(opcode)); }

    Bytecode& u8(uint8_t value) {
        bytes_.push_back(value);
        return *this;
    }

    Bytecode& u16(uint16_t value) {
        u8(value & 0xFF);
        return u8(value >> 8);
    }

    Bytecode& u32(uint32_t value) {
        for (int i = 0; i < 4; i++) {
            u8((value >> (8 * i)) & 0xFF);
        }
        return *this;
    }

    Bytecode& f64(double value) {
        uint64_t bits = std::bit_cast<uint64_t>(value);
        for (int i = 0; i < 8; i++) {
            u8((bits >> (8 * i)) & 0xFF);
        }
        return *this;
    }

    Bytecode& str(const std::string& value) {
        bytes_.insert(bytes_.end(), value.begin(), value.end());
        return u8(0x00);
    }

    Bytecode& load_string(const std::string& value) { return op(Opcode::LOAD_STRING).str(value); }
    Bytecode& load_float(double value) { return op(Opcode::LOAD_FLOAT64).f64(value); }
    Bytecode& load_bool(bool value) { return op(Opcode::LOAD_BOOL).u8(value ? 0x01 : 0x00); }
    Bytecode& pop() { return op(Opcode::POP); }
    Bytecode& load_null() { return op(Opcode::LOAD_NULL); }
    Bytecode& load_regex(const std::string& source, const std::string& flags) {
        return op(Opcode::LOAD_REGEX).str(source).str(flags);
    }
    Bytecode& load_undefined() { return op(Opcode::LOAD_UNDEFINED); }
    Bytecode& ret() { return op(Opcode::RETURN); }
    Bytecode& store_var(const std::string& name) { return op(Opcode::STORE_VAR).str(name); }
    Bytecode& load_var(const std::string& name) { return op(Opcode::LOAD_VAR).str(name); }
    Bytecode& call(uint16_t function_index) { return op(Opcode::CALL).u16(function_index); }

    const std::vector<uint8_t>& bytes() const { return bytes_; }
};

inline std::shared_ptr<const Module> make_module(const std::vector<std::vector<uint8_t>>& functions) {
    return std::make_shared<const Module>(functions);
}

} // namespace kumo::test

#endif // BYTECODE_BUILDER_HPP
