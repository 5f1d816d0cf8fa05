#include "value.hpp"
#include <fmt/format.h>
#include <cmath>
#include <stdexcept>

namespace kumo {

static void must_have_tag(const Value& value, Tag expected) {
    if (value.tag() != expected) {
        throw std::runtime_error(fmt::format("Expected {} value, got {}",
                                             tag_to_string(expected), tag_to_string(value.tag())));
    }
}

bool as_bool(const Value& value) {
    must_have_tag(value, Tag::Bool);
    return value.bits_ != 0;
}

double as_float(const Value& value) {
    must_have_tag(value, Tag::Float);
    return std::bit_cast<double>(value.bits_);
}

uint64_t as_float_bits(const Value& value) {
    must_have_tag(value, Tag::Float);
    return value.bits_;
}

const std::string& as_string(const Value& value) {
    must_have_tag(value, Tag::String);
    return *value.text_;
}

const Pattern& as_pattern(const Value& value) {
    must_have_tag(value, Tag::Pattern);
    return *value.pattern_;
}

bool validate_pattern_flags(const std::string& flags) {
    static const std::string allowed = "dgimsuvy";
    bool seen[8] = {};
    for (char c : flags) {
        auto pos = allowed.find(c);
        if (pos == std::string::npos || seen[pos]) {
            return false;
        }
        seen[pos] = true;
    }
    // Unicode mode and unicode-sets mode cannot be combined.
    return !(seen[allowed.find('u')] && seen[allowed.find('v')]);
}

bool identical(const Value& lhs, const Value& rhs) {
    if (lhs.tag() != rhs.tag()) {
        return false;
    }
    switch (lhs.tag()) {
        case Tag::Undefined:
        case Tag::Null:
            return true;
        case Tag::Bool:
            return as_bool(lhs) == as_bool(rhs);
        case Tag::Float:
            return as_float_bits(lhs) == as_float_bits(rhs);
        case Tag::String:
            return as_string(lhs) == as_string(rhs);
        case Tag::Pattern:
            return as_pattern(lhs).source == as_pattern(rhs).source &&
                   as_pattern(lhs).flags == as_pattern(rhs).flags;
    }
    return false;
}

const char* tag_to_string(Tag tag) {
    switch (tag) {
        case Tag::Undefined: return "undefined";
        case Tag::Null: return "null";
        case Tag::Bool: return "bool";
        case Tag::Float: return "float";
        case Tag::String: return "string";
        case Tag::Pattern: return "pattern";
    }
    return "unknown";
}

static std::string float_to_string(double d) {
    if (std::isnan(d)) {
        return "NaN";
    } else if (std::isinf(d)) {
        return d < 0 ? "-Infinity" : "Infinity";
    }
    return fmt::format("{}", d);
}

std::string value_to_string(const Value& value) {
    switch (value.tag()) {
        case Tag::Undefined:
            return "undefined";
        case Tag::Null:
            return "null";
        case Tag::Bool:
            return as_bool(value) ? "true" : "false";
        case Tag::Float:
            return float_to_string(as_float(value));
        case Tag::String:
            // Quoted, with quotes, backslashes and control bytes escaped.
            return fmt::format("{:?}", as_string(value));
        case Tag::Pattern:
            return fmt::format("/{}/{}", as_pattern(value).source, as_pattern(value).flags);
    }
    return "<unknown value>";
}

} // namespace kumo
