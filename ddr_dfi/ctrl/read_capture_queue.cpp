#include "read_capture_queue.hpp"

#include <stdexcept>

namespace ddr_dfi {

ReadCaptureQueue::ReadCaptureQueue(size_t capacity, OverflowPolicy policy)
    : slots_(capacity), policy_(policy) {
    if (capacity == 0) {
        throw std::invalid_argument("read capture queue capacity must be > 0");
    }
}

bool ReadCaptureQueue::push(uint64_t word) {
    if (full()) {
        overflow_count_++;
        return false;
    }
    slots_[(head_ + count_) % slots_.size()] = word;
    count_++;
    return true;
}

std::optional<uint64_t> ReadCaptureQueue::pop() {
    if (empty()) {
        return std::nullopt;
    }
    uint64_t word = slots_[head_];
    head_ = (head_ + 1) % slots_.size();
    count_--;
    return word;
}

std::vector<uint64_t> ReadCaptureQueue::drain() {
    std::vector<uint64_t> words;
    words.reserve(count_);
    while (auto word = pop()) {
        words.push_back(*word);
    }
    return words;
}

bool ReadCaptureQueue::can_accept_burst(uint32_t beats) const {
    if (policy_ == OverflowPolicy::REJECT_NEW) {
        return true;
    }
    return slots_.size() - count_ >= beats;
}

void ReadCaptureQueue::clear() {
    head_ = 0;
    count_ = 0;
    overflow_count_ = 0;
}

} // namespace ddr_dfi
