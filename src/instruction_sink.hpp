#ifndef INSTRUCTION_SINK_HPP
#define INSTRUCTION_SINK_HPP

#include "instruction.hpp"
#include "value.hpp"
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace kumo {

// Observer for executed instructions. Called once per instruction after its
// effect, with the resulting top of the evaluation stack (null if empty).
class InstructionSink {
public:
    virtual ~InstructionSink() = default;
    virtual void on_instruction(Opcode opcode, const Value* top) = 0;
};

// Does nothing. The default sink of every machine.
class NullSink : public InstructionSink {
public:
    void on_instruction(Opcode, const Value*) override {}

    static NullSink& instance();
};

// Prints "NAME top" lines.
class PrintingSink : public InstructionSink {
private:
    std::FILE* out_;

public:
    explicit PrintingSink(std::FILE* out = stdout) : out_(out) {}
    void on_instruction(Opcode opcode, const Value* top) override;
};

// Keeps every (opcode, rendered top) pair.
class RecordingSink : public InstructionSink {
private:
    std::vector<std::pair<Opcode, std::string>> entries_;

public:
    void on_instruction(Opcode opcode, const Value* top) override;

    const std::vector<std::pair<Opcode, std::string>>& entries() const { return entries_; }
};

} // namespace kumo

#endif // INSTRUCTION_SINK_HPP
