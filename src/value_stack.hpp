#ifndef VALUE_STACK_HPP
#define VALUE_STACK_HPP

#include "value.hpp"
#include "fault.hpp"
#include <vector>
#include <cstddef>
#include <fmt/core.h>

namespace kumo {

// Evaluation stack shared by every frame of a run.
// Grows on demand up to a fixed capacity.
class ValueStack {
private:
    static constexpr size_t DEFAULT_CAPACITY = 65536;
    std::vector<Value> data_;
    size_t capacity_;

public:
    explicit ValueStack(size_t capacity = DEFAULT_CAPACITY)
        : capacity_(capacity) {
    }

    // Stacks belong to exactly one machine.
    ValueStack(const ValueStack&) = delete;
    ValueStack& operator=(const ValueStack&) = delete;

    inline void push(Value value) {
        if (data_.size() >= capacity_) {
            throw Fault(FaultKind::StackOverflow,
                        fmt::format("Stack overflow, capacity is {}", capacity_));
        }
        data_.push_back(std::move(value));
    }

    inline Value pop() {
        if (data_.empty()) {
            throw Fault(FaultKind::StackUnderflow, "Stack underflow");
        }
        Value value = std::move(data_.back());
        data_.pop_back();
        return value;
    }

    inline const Value& peek() const {
        if (data_.empty()) {
            throw Fault(FaultKind::StackUnderflow, "Stack is empty");
        }
        return data_.back();
    }

    // Null when the stack is empty.
    inline const Value* top() const {
        return data_.empty() ? nullptr : &data_.back();
    }

    // Peek at an arbitrary position (0 = bottom, size()-1 = top).
    inline const Value& peek_at(size_t index) const {
        if (index >= data_.size()) {
            throw Fault(FaultKind::StackUnderflow,
                        fmt::format("Stack index {} out of bounds, size is {}", index, data_.size()));
        }
        return data_[index];
    }

    inline size_t size() const {
        return data_.size();
    }

    inline bool empty() const {
        return data_.empty();
    }
};

} // namespace kumo

#endif // VALUE_STACK_HPP
