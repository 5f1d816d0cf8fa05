#include "parse_module_json.hpp"
#include "trace.hpp"
#include <nlohmann/json.hpp>
#include <fmt/core.h>

using json = nlohmann::json;

namespace kumo {

static std::vector<uint8_t> parse_code(const json& j, size_t function_index) {
    if (!j.is_array()) {
        throw ModuleError(fmt::format("Function {} must be an array of bytes", function_index));
    }
    std::vector<uint8_t> code;
    code.reserve(j.size());
    for (const auto& item : j) {
        if (!item.is_number_integer() || item.get<int64_t>() < 0 || item.get<int64_t>() > 255) {
            throw ModuleError(fmt::format("Function {} byte {} is not in 0..255: {}",
                                          function_index, code.size(), item.dump()));
        }
        code.push_back(static_cast<uint8_t>(item.get<int64_t>()));
    }
    return code;
}

static bool is_array_of_arrays(const json& j) {
    return !j.empty() && j.front().is_array();
}

Module parse_module_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        std::vector<FunctionObject> functions;
        if (j.is_object()) {
            const json& list = j.at("functions");
            if (!list.is_array()) {
                throw ModuleError("\"functions\" must be an array");
            }
            for (const auto& item : list) {
                functions.push_back(FunctionObject{parse_code(item, functions.size())});
            }
        } else if (is_array_of_arrays(j)) {
            for (const auto& item : j) {
                functions.push_back(FunctionObject{parse_code(item, functions.size())});
            }
        } else {
            functions.push_back(FunctionObject{parse_code(j, 0)});
        }

        if constexpr (TRACE_LOADER) {
            fmt::print("Parsed {} function(s) from JSON\n", functions.size());
        }
        return Module(std::move(functions));
    } catch (const json::exception& e) {
        throw ModuleError(fmt::format("JSON parsing error: {}", e.what()));
    }
}

} // namespace kumo
