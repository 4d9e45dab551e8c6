// Mission-mode command sequencer.
//
// Accepts one READ or WRITE transaction at a time and walks it through
// ACTIVATE -> (READ | WRITE) -> PRECHARGE -> IDLE, holding each phase for
// its JEDEC minimum and for the number of data beats in a burst.
//
// tick() evaluates the current state against the pre-tick counters and
// this cycle's inputs, drives the output frame for the current state, and
// commits the next state. Outputs are therefore registered: the frame
// returned by outputs() after tick N reflects the state held during tick N.
//
// A command is captured by value when it is accepted in IDLE; later edits
// to the issuer's copy do not affect the transaction in flight.

#pragma once

#include <cstdint>
#include <optional>

#include "dfi_signals.hpp"
#include "read_capture_queue.hpp"
#include "timing_config.hpp"

namespace ddr_dfi {

/// Mission sequencer state machine states.
enum class MissionState : uint8_t {
    IDLE,      ///< Waiting for a command and PHY init complete
    ACTIVATE,  ///< Row open, tRCD dwell
    READ,      ///< READ command, read data capture
    WRITE,     ///< WRITE command, write data after tCWL
    PRECHARGE, ///< Row close, tRP dwell
};

/// Per-phase elapsed-cycle and per-burst beat counters.
struct MissionCounters {
    uint32_t activate_cycles = 0;
    uint32_t write_cycles = 0;
    uint32_t read_cycles = 0;
    uint32_t precharge_cycles = 0;
    uint32_t wr_beats = 0;
    uint32_t rd_beats = 0;
};

const char* to_string(MissionState state);

class MissionSequencer {
public:
    /// The queue must outlive the sequencer.
    MissionSequencer(const TimingConfig& timing, const DfiGeometry& geometry, ReadCaptureQueue& queue);

    /// Evaluate one clock cycle.
    ///
    /// @param cmd_valid  A command is presented this cycle.
    /// @param cmd        The presented command (only read when accepted).
    /// @param phy        PHY inputs sampled this cycle.
    void tick(bool cmd_valid, const Command& cmd, const PhyInputs& phy);

    /// Force IDLE, zero every counter and return all drivers to idle levels.
    void reset();

    /// True if `cmd` is well-formed and could be accepted from IDLE
    /// (ignoring PHY init state).
    bool accepts(const Command& cmd) const;

    const DfiOutputs& outputs() const {
        return outputs_;
    }

    MissionState current_state() const {
        return state_;
    }

    const MissionCounters& counters() const {
        return counters_;
    }

    /// The captured command, present from acceptance until IDLE.
    const std::optional<Command>& in_flight() const {
        return in_flight_;
    }

    bool busy() const {
        return state_ != MissionState::IDLE;
    }

    /// Sticky liveness-watchdog status; cleared by reset().
    bool stalled() const {
        return stalled_;
    }

    // -- Diagnostic command counts (not cleared by reset) --
    uint64_t activate_count() const {
        return activate_count_;
    }
    uint64_t read_count() const {
        return read_count_;
    }
    uint64_t write_count() const {
        return write_count_;
    }
    uint64_t precharge_count() const {
        return precharge_count_;
    }

    /// Overwrite the state register without touching counters.
    /// Used by fault-injection tests to reach unreachable encodings.
    void inject_state(MissionState state) {
        state_ = state;
    }

private:
    void drive_address(DfiOutputs& out, bool command_cycle) const;
    void flag_stall(const char* reason);

    TimingConfig timing_;
    DfiGeometry geometry_;
    ReadCaptureQueue& queue_;

    MissionState state_ = MissionState::IDLE;
    MissionCounters counters_;
    std::optional<Command> in_flight_;
    DfiOutputs outputs_;

    uint32_t init_wait_cycles_ = 0; ///< Cycles a command waited on init_complete
    bool stalled_ = false;

    uint64_t activate_count_ = 0;
    uint64_t read_count_ = 0;
    uint64_t write_count_ = 0;
    uint64_t precharge_count_ = 0;
};

} // namespace ddr_dfi
