#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Rolling window of daily crime flags (most recent N days).
// Slots are allocated once by reset(); push() overwrites the oldest slot,
// so the window can never grow past its capacity.
class CrimeHistory {
public:
    CrimeHistory() = default;
    explicit CrimeHistory(std::size_t capacity) { reset(capacity); }

    void reset(std::size_t capacity) {
        slots_.assign(capacity, 0);
        head_ = 0;
        size_ = 0;
        total_ = 0;
    }

    // Append today's outcome, evicting the oldest once the window is full.
    void push(bool crime) {
        if (slots_.empty()) {
            throw std::logic_error("CrimeHistory::push on a zero-capacity window");
        }
        const std::uint8_t flag = crime ? 1 : 0;
        if (size_ == slots_.size()) {
            total_ -= slots_[head_];
        } else {
            ++size_;
        }
        slots_[head_] = flag;
        total_ += flag;
        head_ = (head_ + 1) % slots_.size();
    }

    std::size_t capacity() const { return slots_.size(); }
    std::size_t size() const { return size_; }
    bool full() const { return size_ == slots_.size() && !slots_.empty(); }

    // Crime days currently in the window
    std::uint32_t count() const { return total_; }

    // i = 0 is the oldest retained day
    bool at(std::size_t i) const {
        if (i >= size_) {
            throw std::out_of_range("CrimeHistory::at index " + std::to_string(i));
        }
        const std::size_t start = full() ? head_ : 0;
        return slots_[(start + i) % slots_.size()] != 0;
    }

    bool newest() const { return size_ > 0 && at(size_ - 1); }

private:
    std::vector<std::uint8_t> slots_;
    std::size_t head_ = 0;   // next write position
    std::size_t size_ = 0;
    std::uint32_t total_ = 0;
};
