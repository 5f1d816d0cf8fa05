#ifndef DISASSEMBLE_HPP
#define DISASSEMBLE_HPP

#include "function_object.hpp"
#include <string>
#include <vector>

namespace kumo {

// One line per instruction: "offset NAME operands". Listing stops at the
// first unknown opcode or truncated operand, which gets a line of its own.
std::vector<std::string> disassemble(const FunctionObject& func);

} // namespace kumo

#endif // DISASSEMBLE_HPP
