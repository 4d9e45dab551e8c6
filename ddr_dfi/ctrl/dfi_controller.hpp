// Controller top level: global reset, mode select and output composition.
//
// Both sequencers are ticked every cycle from the same pre-tick input
// snapshot. The mode flag then selects which sequencer's frame reaches the
// shared DFI drivers; the other frame is discarded, so the two can never
// drive the same signal in one cycle. Two signals are composed rather than
// selected:
//   - reset_n is held de-asserted.
//   - odt follows the mission sequencer's WRITE state, in MISSION mode only.
//
// Global reset is checked before any state evaluation and returns both
// sequencers, every counter, the read capture queue and the drivers to
// their idle values within the same tick.

#pragma once

#include <cstdint>

#include "dfi_signals.hpp"
#include "mission_sequencer.hpp"
#include "read_capture_queue.hpp"
#include "timing_config.hpp"
#include "training_sequencer.hpp"

namespace ddr_dfi {

/// Complete controller configuration.
struct ControllerConfig {
    TimingConfig timing;
    TrainingConfig training;
    DfiGeometry geometry;
    size_t queue_capacity = ReadCaptureQueue::DEFAULT_CAPACITY;
    OverflowPolicy overflow_policy = OverflowPolicy::BACKPRESSURE;
};

class DfiController {
public:
    /// @throws std::invalid_argument if any part of the configuration is invalid.
    explicit DfiController(const ControllerConfig& config = ControllerConfig{});

    DfiController(const DfiController&) = delete;
    DfiController& operator=(const DfiController&) = delete;

    /// Advance one clock cycle.
    void tick(const ControllerInputs& in);

    /// The composed frame driven during the last tick.
    const DfiOutputs& outputs() const {
        return outputs_;
    }

    /// Captured read beats, drained by the command issuer.
    ReadCaptureQueue& read_queue() {
        return queue_;
    }
    const ReadCaptureQueue& read_queue() const {
        return queue_;
    }

    const MissionSequencer& mission() const {
        return mission_;
    }

    const TrainingSequencer& training() const {
        return training_;
    }

    /// Re-arm calibration for the next TRAINING-mode tick.
    void restart_training() {
        training_.restart();
    }

    const ControllerConfig& config() const {
        return config_;
    }

    /// Ticks since construction (not cleared by reset).
    uint64_t cycle() const {
        return cycle_;
    }

private:
    void apply_reset();

    ControllerConfig config_;
    ReadCaptureQueue queue_;
    MissionSequencer mission_;
    TrainingSequencer training_;
    DfiOutputs outputs_;
    uint64_t cycle_ = 0;
};

} // namespace ddr_dfi
