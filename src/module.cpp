#include "module.hpp"
#include "decoder.hpp"
#include "fault.hpp"
#include "trace.hpp"
#include <fmt/core.h>

namespace kumo {

Module::Module(std::vector<FunctionObject> functions)
    : functions_(std::move(functions)) {
    if (functions_.empty()) {
        throw ModuleError("Module has no functions, an entry function is required");
    }
}

static std::vector<FunctionObject> to_functions(const std::vector<std::vector<uint8_t>>& buffers) {
    std::vector<FunctionObject> functions;
    functions.reserve(buffers.size());
    for (const auto& buffer : buffers) {
        functions.push_back(FunctionObject{buffer});
    }
    return functions;
}

Module::Module(const std::vector<std::vector<uint8_t>>& buffers)
    : Module(to_functions(buffers)) {
}

const FunctionObject* Module::find_function(size_t index) const {
    if (index >= functions_.size()) {
        return nullptr;
    }
    return &functions_[index];
}

Module Module::decode_container(std::span<const uint8_t> bytes) {
    Decoder decoder(bytes);
    std::vector<FunctionObject> functions;
    try {
        uint32_t count = decoder.read_u32();
        if constexpr (TRACE_LOADER) {
            fmt::print("Container declares {} function(s)\n", count);
        }
        for (uint32_t i = 0; i < count; i++) {
            uint32_t length = decoder.read_u32();
            if (decoder.remaining() < length) {
                throw ModuleError(fmt::format(
                    "Function {} declares {} byte(s) but only {} remain", i, length, decoder.remaining()));
            }
            auto start = bytes.begin() + decoder.position();
            functions.push_back(FunctionObject{std::vector<uint8_t>(start, start + length)});
            decoder.seek(decoder.position() + length);
        }
    } catch (const Fault& e) {
        throw ModuleError(fmt::format("Truncated module container: {}", e.what()));
    }
    if (!decoder.at_end()) {
        throw ModuleError(fmt::format("{} trailing byte(s) after the last function", decoder.remaining()));
    }
    return Module(std::move(functions));
}

} // namespace kumo
