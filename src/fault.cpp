#include "fault.hpp"
#include <fmt/core.h>

namespace kumo {

const char* fault_kind_to_string(FaultKind kind) {
    switch (kind) {
        case FaultKind::UnknownOpcode: return "UnknownOpcode";
        case FaultKind::StackUnderflow: return "StackUnderflow";
        case FaultKind::TruncatedOperand: return "TruncatedOperand";
        case FaultKind::InvalidPatternFlags: return "InvalidPatternFlags";
        case FaultKind::UndefinedVariable: return "UndefinedVariable";
        case FaultKind::BadFunctionIndex: return "BadFunctionIndex";
        case FaultKind::StackOverflow: return "StackOverflow";
        case FaultKind::CallDepthExceeded: return "CallDepthExceeded";
        case FaultKind::StepLimitExceeded: return "StepLimitExceeded";
    }
    return "UNKNOWN";
}

static std::string describe_opcode(std::optional<uint8_t> opcode) {
    return opcode ? fmt::format("opcode 0x{:02x}", *opcode) : "implicit return";
}

MachineFault::MachineFault(FaultKind kind, std::optional<uint8_t> opcode, size_t function_index, size_t ip,
                           const std::string& detail)
    : Fault(kind, fmt::format("{} at function {}, ip {} ({}): {}",
                              fault_kind_to_string(kind), function_index, ip, describe_opcode(opcode), detail)),
      opcode_(opcode),
      function_index_(function_index),
      ip_(ip) {
}

} // namespace kumo
