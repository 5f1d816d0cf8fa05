#ifndef PARSE_MODULE_JSON_HPP
#define PARSE_MODULE_JSON_HPP

#include "module.hpp"
#include <string>

namespace kumo {

// Parse a JSON module. Accepted shapes:
//   [1, 0, 8]                        a single (entry) function
//   [[11, 1, 0, 8], [2, ...]]        one array per function
//   {"functions": [[...], [...]]}    the same, wrapped in an object
// Throws ModuleError on malformed JSON or bytes outside 0..255.
Module parse_module_json(const std::string& json_str);

} // namespace kumo

#endif // PARSE_MODULE_JSON_HPP
