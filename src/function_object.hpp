#ifndef FUNCTION_OBJECT_HPP
#define FUNCTION_OBJECT_HPP

#include <vector>
#include <cstdint>

namespace kumo {

// FunctionObject is one compiled function: its raw instruction stream.
struct FunctionObject {
    std::vector<uint8_t> code;
};

} // namespace kumo

#endif // FUNCTION_OBJECT_HPP
