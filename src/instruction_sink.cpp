#include "instruction_sink.hpp"
#include <fmt/core.h>

namespace kumo {

NullSink& NullSink::instance() {
    static NullSink sink;
    return sink;
}

static std::string render_top(const Value* top) {
    return top ? value_to_string(*top) : "<empty>";
}

void PrintingSink::on_instruction(Opcode opcode, const Value* top) {
    fmt::print(out_, "{} {}\n", opcode_to_string(opcode), render_top(top));
}

void RecordingSink::on_instruction(Opcode opcode, const Value* top) {
    entries_.emplace_back(opcode, render_top(top));
}

} // namespace kumo
