#ifndef DECODER_HPP
#define DECODER_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace kumo {

// Decoder is a cursor over a byte buffer. Every read consumes bytes left to
// right and advances the position by exactly the number of bytes read.
// Multi-byte integers and floats are little-endian.
//
// A read that would run past the end of the buffer throws a Fault of
// kind TruncatedOperand and leaves the position unchanged.
class Decoder {
private:
    std::span<const uint8_t> bytes_;
    size_t position_;

    void require(size_t n) const;

public:
    explicit Decoder(std::span<const uint8_t> bytes, size_t position = 0)
        : bytes_(bytes), position_(position) {}

    uint8_t read_u8();
    uint16_t read_u16();
    uint32_t read_u32();
    double read_f64();

    // Reads up to the next 0x00 and consumes the terminator as well. The
    // terminator is not part of the result. A string that reaches the end
    // of the buffer without a terminator is truncated.
    std::string read_string();

    size_t position() const { return position_; }
    void seek(size_t position) { position_ = position; }

    size_t remaining() const { return position_ < bytes_.size() ? bytes_.size() - position_ : 0; }
    bool at_end() const { return position_ >= bytes_.size(); }
};

} // namespace kumo

#endif // DECODER_HPP
