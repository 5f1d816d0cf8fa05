#include "decoder.hpp"
#include "fault.hpp"
#include <fmt/core.h>
#include <bit>

namespace kumo {

void Decoder::require(size_t n) const {
    if (remaining() < n) {
        throw Fault(
            FaultKind::TruncatedOperand,
            fmt::format("Need {} byte(s) at position {}, buffer length is {}", n, position_, bytes_.size())
        );
    }
}

uint8_t Decoder::read_u8() {
    require(1);
    return bytes_[position_++];
}

uint16_t Decoder::read_u16() {
    require(2);
    uint16_t value = static_cast<uint16_t>(bytes_[position_]) |
                     static_cast<uint16_t>(bytes_[position_ + 1] << 8);
    position_ += 2;
    return value;
}

uint32_t Decoder::read_u32() {
    require(4);
    uint32_t value = 0;
    for (int i = 3; i >= 0; i--) {
        value = (value << 8) | bytes_[position_ + i];
    }
    position_ += 4;
    return value;
}

double Decoder::read_f64() {
    require(8);
    uint64_t bits = 0;
    for (int i = 7; i >= 0; i--) {
        bits = (bits << 8) | bytes_[position_ + i];
    }
    position_ += 8;
    return std::bit_cast<double>(bits);
}

std::string Decoder::read_string() {
    size_t end = position_;
    while (end < bytes_.size() && bytes_[end] != 0x00) {
        end++;
    }
    if (end >= bytes_.size()) {
        throw Fault(
            FaultKind::TruncatedOperand,
            fmt::format("Unterminated string at position {}", position_)
        );
    }
    std::string value(reinterpret_cast<const char*>(bytes_.data() + position_), end - position_);
    // Skip the terminator.
    position_ = end + 1;
    return value;
}

} // namespace kumo
