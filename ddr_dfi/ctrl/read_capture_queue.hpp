// Bounded ring buffer holding captured read beats in arrival order.
//
// Appended only by the mission sequencer, drained by one external
// consumer. The overflow policy decides what happens when the consumer
// falls behind:
//   - REJECT_NEW:   a beat arriving at a full queue is dropped and counted.
//   - BACKPRESSURE: the mission sequencer refuses a READ command unless a
//                   whole burst fits (can_accept_burst()), so no beat is
//                   ever dropped.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace ddr_dfi {

enum class OverflowPolicy : uint8_t {
    REJECT_NEW,
    BACKPRESSURE,
};

class ReadCaptureQueue {
public:
    static constexpr size_t DEFAULT_CAPACITY = 64;

    /// @throws std::invalid_argument if capacity is 0.
    explicit ReadCaptureQueue(
        size_t capacity = DEFAULT_CAPACITY, OverflowPolicy policy = OverflowPolicy::BACKPRESSURE
    );

    /// Append a captured word. Returns false (and counts an overflow) when
    /// the queue is full.
    bool push(uint64_t word);

    /// Remove and return the oldest word, if any.
    std::optional<uint64_t> pop();

    /// Remove and return every queued word, oldest first.
    std::vector<uint64_t> drain();

    /// True if `beats` more words fit, or the policy never blocks.
    bool can_accept_burst(uint32_t beats) const;

    void clear();

    size_t size() const {
        return count_;
    }

    size_t capacity() const {
        return slots_.size();
    }

    bool empty() const {
        return count_ == 0;
    }

    bool full() const {
        return count_ == slots_.size();
    }

    OverflowPolicy policy() const {
        return policy_;
    }

    /// Number of words dropped since construction or clear().
    uint64_t overflow_count() const {
        return overflow_count_;
    }

private:
    std::vector<uint64_t> slots_;
    size_t head_ = 0;  ///< Index of the oldest word
    size_t count_ = 0;
    OverflowPolicy policy_;
    uint64_t overflow_count_ = 0;
};

} // namespace ddr_dfi
