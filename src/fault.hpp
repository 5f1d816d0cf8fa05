#ifndef FAULT_HPP
#define FAULT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace kumo {

enum class FaultKind {
    UnknownOpcode,
    StackUnderflow,
    TruncatedOperand,
    InvalidPatternFlags,
    UndefinedVariable,
    BadFunctionIndex,
    StackOverflow,
    CallDepthExceeded,
    StepLimitExceeded,
};

const char* fault_kind_to_string(FaultKind kind);

// Raised by the decoder and the value stack, which do not know where in the
// program they are. The machine turns it into a MachineFault.
class Fault : public std::runtime_error {
public:
    Fault(FaultKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

    FaultKind kind() const { return kind_; }

private:
    FaultKind kind_;
};

// A fatal execution fault with its location. Always ends the run.
class MachineFault : public Fault {
public:
    MachineFault(FaultKind kind, std::optional<uint8_t> opcode, size_t function_index, size_t ip,
                 const std::string& detail);

    // The opcode byte being executed when the fault happened. Empty for the
    // implicit return at the end of a function's buffer.
    std::optional<uint8_t> opcode() const { return opcode_; }

    size_t function_index() const { return function_index_; }

    // Position of the opcode byte within the function's buffer.
    size_t ip() const { return ip_; }

private:
    std::optional<uint8_t> opcode_;
    size_t function_index_;
    size_t ip_;
};

} // namespace kumo

#endif // FAULT_HPP
