#ifndef MACHINE_HPP
#define MACHINE_HPP

#include "value.hpp"
#include "value_stack.hpp"
#include "module.hpp"
#include "instruction_sink.hpp"
#include <vector>
#include <unordered_map>
#include <string>
#include <memory>

namespace kumo {

enum class State {
    Running,
    Returned,
    Faulted,
};

const char* state_to_string(State state);

struct MachineOptions {
    // Instructions executed before the run faults with StepLimitExceeded. 0 = unlimited.
    size_t max_steps = 0;
    size_t max_stack_size = 65536;
    size_t max_call_depth = 1024;
};

// One active invocation. The ip of a suspended frame is where it resumes.
struct Frame {
    size_t function_index;
    size_t ip;
};

// The virtual machine. Executes the functions of a shared read-only module,
// starting at function 0, with one evaluation stack shared by all frames.
class Machine {
private:
    std::shared_ptr<const Module> module_;
    MachineOptions options_;

    // Operand stack (main data stack).
    ValueStack operand_stack_;

    // Call stack. Never empty while Running.
    std::vector<Frame> call_stack_;

    // Global variables (STORE_VAR / LOAD_VAR).
    std::unordered_map<std::string, Value> globals_;

    // Not owned.
    InstructionSink* sink_;

    State state_;
    size_t steps_;
    Value result_;

public:
    explicit Machine(std::shared_ptr<const Module> module, MachineOptions options = MachineOptions());

    Machine(const Machine&) = delete;
    Machine& operator=(const Machine&) = delete;

    // The sink must outlive the run, or be detached with reset_sink first.
    void set_sink(InstructionSink& sink) { sink_ = &sink; }
    void reset_sink() { sink_ = &NullSink::instance(); }

    // Runs until the entry function returns, and returns its value. Throws
    // MachineFault on a fault, and std::logic_error if the machine has
    // already finished.
    Value run();

    State state() const { return state_; }
    size_t steps() const { return steps_; }

    // Stack operations.
    void push(Value value);
    Value pop();
    const Value& peek() const;
    bool empty() const;
    size_t stack_size() const;

    // Call stack inspection.
    size_t call_depth() const { return call_stack_.size(); }
    const std::vector<Frame>& frames() const { return call_stack_; }

    // Global dictionary operations.
    void define_global(const std::string& name, Value value);
    Value lookup_global(const std::string& name) const;
    bool has_global(const std::string& name) const;

private:
    // Executes one instruction, or the implicit return at the end of a buffer.
    void step();

    void call_function(size_t function_index);
    void return_from_function(Value value);
}; // class Machine

} // namespace kumo

#endif // MACHINE_HPP
