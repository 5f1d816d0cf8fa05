#ifndef MODULE_HPP
#define MODULE_HPP

#include "function_object.hpp"
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace kumo {

class ModuleError : public std::runtime_error {
public:
    explicit ModuleError(const std::string& msg) : std::runtime_error(msg) {}
};

// The function table. An ordered, immutable list of compiled functions where
// index 0 is the entry point. A Module can be shared read-only by any number
// of machines.
class Module {
private:
    std::vector<FunctionObject> functions_;

public:
    // Throws ModuleError if there are no functions.
    explicit Module(std::vector<FunctionObject> functions);
    explicit Module(const std::vector<std::vector<uint8_t>>& buffers);

    size_t size() const { return functions_.size(); }

    // Null if the index is out of range.
    const FunctionObject* find_function(size_t index) const;

    const FunctionObject& entry() const { return functions_[0]; }

    // Container format: u32 function count, then for each function a u32
    // length followed by that many code bytes. All integers little-endian.
    static Module decode_container(std::span<const uint8_t> bytes);
};

} // namespace kumo

#endif // MODULE_HPP
