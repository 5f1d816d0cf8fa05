#ifndef VALUE_HPP
#define VALUE_HPP

#include <cstdint>
#include <bit>
#include <memory>
#include <string>
#include <utility>

namespace kumo {

// Value tags.
enum class Tag : uint8_t {
    Undefined,
    Null,
    Bool,
    Float,
    String,
    Pattern,
};

// A regular-expression-like literal. Not compiled, only carried around.
struct Pattern {
    std::string source;
    std::string flags;
};

// Value is the unit held by the evaluation stack and the globals table.
// Scalars live in bits_, strings and patterns are shared immutable storage.
class Value {
public:
    Value() : tag_(Tag::Undefined), bits_(0) {}

    Tag tag() const { return tag_; }

    friend Value make_null();
    friend Value make_bool(bool value);
    friend Value make_float(double value);
    friend Value make_string(std::string value);
    friend Value make_pattern(std::string source, std::string flags);

    friend bool as_bool(const Value& value);
    friend double as_float(const Value& value);
    friend uint64_t as_float_bits(const Value& value);
    friend const std::string& as_string(const Value& value);
    friend const Pattern& as_pattern(const Value& value);

private:
    Tag tag_;
    uint64_t bits_;  // Bool and float payload.
    std::shared_ptr<const std::string> text_;
    std::shared_ptr<const Pattern> pattern_;
};

inline Value make_undef() {
    return Value();
}

inline Value make_null() {
    Value v;
    v.tag_ = Tag::Null;
    return v;
}

inline Value make_bool(bool value) {
    Value v;
    v.tag_ = Tag::Bool;
    v.bits_ = value ? 1 : 0;
    return v;
}

// Floats are kept as their raw bit pattern so NaN payloads and -0.0 survive.
inline Value make_float(double value) {
    Value v;
    v.tag_ = Tag::Float;
    v.bits_ = std::bit_cast<uint64_t>(value);
    return v;
}

inline Value make_string(std::string value) {
    Value v;
    v.tag_ = Tag::String;
    v.text_ = std::make_shared<const std::string>(std::move(value));
    return v;
}

// Does not validate the flags, see validate_pattern_flags.
inline Value make_pattern(std::string source, std::string flags) {
    Value v;
    v.tag_ = Tag::Pattern;
    v.pattern_ = std::make_shared<const Pattern>(Pattern{std::move(source), std::move(flags)});
    return v;
}

inline bool is_undef(const Value& value) { return value.tag() == Tag::Undefined; }
inline bool is_null(const Value& value) { return value.tag() == Tag::Null; }
inline bool is_bool(const Value& value) { return value.tag() == Tag::Bool; }
inline bool is_float(const Value& value) { return value.tag() == Tag::Float; }
inline bool is_string(const Value& value) { return value.tag() == Tag::String; }
inline bool is_pattern(const Value& value) { return value.tag() == Tag::Pattern; }

// The as_* accessors throw std::runtime_error on a tag mismatch.
bool as_bool(const Value& value);
double as_float(const Value& value);
uint64_t as_float_bits(const Value& value);
const std::string& as_string(const Value& value);
const Pattern& as_pattern(const Value& value);

// Checks flags the way a host regular-expression engine does: only the
// letters d g i m s u v y, each at most once, and never both u and v.
bool validate_pattern_flags(const std::string& flags);

// Same tag and same payload. Floats compare by bit pattern.
bool identical(const Value& lhs, const Value& rhs);

const char* tag_to_string(Tag tag);

// Helper for tracing and printing results.
std::string value_to_string(const Value& value);

} // namespace kumo

#endif // VALUE_HPP
