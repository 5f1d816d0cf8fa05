#include "machine.hpp"
#include "decoder.hpp"
#include "fault.hpp"
#include "instruction.hpp"
#include "trace.hpp"
#include <fmt/core.h>
#include <optional>
#include <stdexcept>

namespace kumo {

const char* state_to_string(State state) {
    switch (state) {
        case State::Running: return "Running";
        case State::Returned: return "Returned";
        case State::Faulted: return "Faulted";
    }
    return "UNKNOWN";
}

Machine::Machine(std::shared_ptr<const Module> module, MachineOptions options)
    : module_(std::move(module)),
      options_(options),
      operand_stack_(options.max_stack_size),
      sink_(&NullSink::instance()),
      state_(State::Running),
      steps_(0) {
    if (!module_) {
        throw std::invalid_argument("Machine requires a module");
    }
    // The entry function starts at the beginning of its buffer.
    call_stack_.push_back(Frame{0, 0});
}

// Stack operations.
void Machine::push(Value value) {
    operand_stack_.push(std::move(value));
}

Value Machine::pop() {
    return operand_stack_.pop();
}

const Value& Machine::peek() const {
    return operand_stack_.peek();
}

bool Machine::empty() const {
    return operand_stack_.empty();
}

size_t Machine::stack_size() const {
    return operand_stack_.size();
}

// Global dictionary operations.
void Machine::define_global(const std::string& name, Value value) {
    if constexpr (TRACE_GLOBALS) {
        fmt::print("DEFINING global: {} = {}\n", name, value_to_string(value));
    }
    globals_[name] = std::move(value);
}

Value Machine::lookup_global(const std::string& name) const {
    auto it = globals_.find(name);
    if (it == globals_.end()) {
        throw std::runtime_error(fmt::format("Undefined global: {}", name));
    }
    return it->second;
}

bool Machine::has_global(const std::string& name) const {
    return globals_.find(name) != globals_.end();
}

Value Machine::run() {
    if (state_ != State::Running) {
        throw std::logic_error(fmt::format("Machine has already finished ({})", state_to_string(state_)));
    }
    while (state_ == State::Running) {
        step();
    }
    return result_;
}

void Machine::call_function(size_t function_index) {
    if (module_->find_function(function_index) == nullptr) {
        throw Fault(FaultKind::BadFunctionIndex,
                    fmt::format("No function {}, module has {}", function_index, module_->size()));
    }
    if (call_stack_.size() >= options_.max_call_depth) {
        throw Fault(FaultKind::CallDepthExceeded,
                    fmt::format("Call depth limit of {} reached", options_.max_call_depth));
    }
    if constexpr (TRACE_FRAMES) {
        fmt::print("CALL function {} from depth {}\n", function_index, call_stack_.size());
    }
    call_stack_.push_back(Frame{function_index, 0});
}

// Pops the current frame. The value goes back to the caller, or becomes the
// result of the run when the entry frame returns. The frame stays in place if
// the caller's push overflows.
void Machine::return_from_function(Value value) {
    if constexpr (TRACE_FRAMES) {
        fmt::print("RETURN from function {} at depth {}\n", call_stack_.back().function_index, call_stack_.size());
    }
    if (call_stack_.size() == 1) {
        result_ = std::move(value);
        state_ = State::Returned;
    } else {
        operand_stack_.push(std::move(value));
    }
    call_stack_.pop_back();
}

void Machine::step() {
    const size_t function_index = call_stack_.back().function_index;
    const size_t start = call_stack_.back().ip;
    const std::vector<uint8_t>& code = module_->find_function(function_index)->code;
    std::optional<uint8_t> byte;
    if (start < code.size()) {
        byte = code[start];
    }

    try {
        if (!byte) {
            // Running off the end of a buffer returns undefined without
            // popping anything.
            return_from_function(make_undef());
            return;
        }

        if (options_.max_steps != 0 && steps_ >= options_.max_steps) {
            throw Fault(FaultKind::StepLimitExceeded,
                        fmt::format("Step limit of {} reached", options_.max_steps));
        }

        std::optional<Opcode> opcode = byte_to_opcode(*byte);
        if (!opcode) {
            throw Fault(FaultKind::UnknownOpcode, fmt::format("Unknown opcode: 0x{:02x}", *byte));
        }
        steps_++;

        Decoder decoder(code, start + 1);
        switch (*opcode) {
            case Opcode::LOAD_STRING: {
                Value value = make_string(decoder.read_string());
                call_stack_.back().ip = decoder.position();
                push(std::move(value));
                break;
            }
            case Opcode::LOAD_FLOAT64: {
                Value value = make_float(decoder.read_f64());
                call_stack_.back().ip = decoder.position();
                push(std::move(value));
                break;
            }
            case Opcode::LOAD_BOOL: {
                Value value = make_bool(decoder.read_u8() == 0x01);
                call_stack_.back().ip = decoder.position();
                push(std::move(value));
                break;
            }
            case Opcode::POP: {
                call_stack_.back().ip = decoder.position();
                pop();
                break;
            }
            case Opcode::LOAD_NULL: {
                call_stack_.back().ip = decoder.position();
                push(make_null());
                break;
            }
            case Opcode::LOAD_REGEX: {
                std::string source = decoder.read_string();
                std::string flags = decoder.read_string();
                if (!validate_pattern_flags(flags)) {
                    throw Fault(FaultKind::InvalidPatternFlags,
                                fmt::format("Invalid flags '{}' for pattern /{}/", flags, source));
                }
                call_stack_.back().ip = decoder.position();
                push(make_pattern(std::move(source), std::move(flags)));
                break;
            }
            case Opcode::LOAD_UNDEFINED: {
                call_stack_.back().ip = decoder.position();
                push(make_undef());
                break;
            }
            case Opcode::RETURN: {
                Value value = pop();
                return_from_function(std::move(value));
                break;
            }
            case Opcode::STORE_VAR: {
                std::string name = decoder.read_string();
                call_stack_.back().ip = decoder.position();
                define_global(name, pop());
                break;
            }
            case Opcode::LOAD_VAR: {
                std::string name = decoder.read_string();
                auto it = globals_.find(name);
                if (it == globals_.end()) {
                    throw Fault(FaultKind::UndefinedVariable, fmt::format("Undefined variable: {}", name));
                }
                call_stack_.back().ip = decoder.position();
                push(it->second);
                break;
            }
            case Opcode::CALL: {
                uint16_t callee = decoder.read_u16();
                // The caller resumes after the operand.
                call_stack_.back().ip = decoder.position();
                call_function(callee);
                break;
            }
        }

        sink_->on_instruction(*opcode, operand_stack_.top());
    } catch (const Fault& e) {
        state_ = State::Faulted;
        throw MachineFault(e.kind(), byte, function_index, start, e.what());
    }
}

} // namespace kumo
