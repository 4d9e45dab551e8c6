// Cycle-level testbench: DfiController wired to a PhyModel.
//
// One tick():
//   1. Present the PHY's current signals to the controller.
//   2. Tick the controller with the pending mode/command/reset inputs.
//   3. Evaluate the PHY against the controller's new output frame.
//   4. Append the frame to the VCD trace, if one is open.
//
// The higher-level helpers (run_command, write, read, run_training) drive
// the command handshake the way an issuer would: present the command until
// the mission sequencer leaves IDLE, then wait for it to return to IDLE.
// They report a timeout by return value and never throw for it.

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "dfi_controller.hpp"
#include "phy_model.hpp"
#include "vcd_writer.hpp"

namespace ddr_dfi {

class DfiTestbench {
public:
    /// Default budget for one command or one training run.
    static constexpr uint64_t DEFAULT_MAX_CYCLES = 10'000;

    /// PHY configuration matching the controller's timing (read latency = tCL).
    static PhyConfig matching_phy(const ControllerConfig& config);

    explicit DfiTestbench(const ControllerConfig& config = ControllerConfig{});
    DfiTestbench(const ControllerConfig& config, const PhyConfig& phy);

    /// Advance one clock cycle.
    void tick();

    /// Advance `n` clock cycles.
    void tick(uint64_t n);

    /// Hold global reset for `cycles` ticks, then release it. The PHY model
    /// is reset alongside (stored memory survives).
    void reset(int cycles = 1);

    /// Present `cmd` until it is accepted, then wait for the transaction to
    /// complete. Switches to MISSION mode first.
    ///
    /// @return false if the command was not accepted or did not finish
    ///         within `max_cycles`.
    bool run_command(const Command& cmd, uint64_t max_cycles = DEFAULT_MAX_CYCLES);

    /// Issue one WRITE burst.
    bool write(
        uint8_t rank,
        uint8_t bank,
        uint8_t bank_group,
        uint32_t address,
        const std::vector<uint64_t>& data,
        const std::vector<uint8_t>& mask = {},
        uint64_t max_cycles = DEFAULT_MAX_CYCLES
    );

    /// Issue one READ burst and drain the capture queue.
    ///
    /// @return every word captured since the last drain (the burst is the
    ///         tail), or std::nullopt on timeout.
    std::optional<std::vector<uint64_t>> read(
        uint8_t rank,
        uint8_t bank,
        uint8_t bank_group,
        uint32_t address,
        uint64_t max_cycles = DEFAULT_MAX_CYCLES
    );

    /// Run one calibration sequence in TRAINING mode, re-arming it if a
    /// previous run completed. Returns to MISSION mode afterwards.
    ///
    /// @return false if the sequence did not complete within `max_cycles`.
    bool run_training(uint64_t max_cycles = DEFAULT_MAX_CYCLES);

    /// Remove and return every captured read word.
    std::vector<uint64_t> drain() {
        return controller_.read_queue().drain();
    }

    void set_mode(Mode mode) {
        inputs_.mode = mode;
    }

    Mode mode() const {
        return inputs_.mode;
    }

    /// Start recording a VCD trace of every subsequent tick.
    ///
    /// @throws std::runtime_error if the file cannot be created.
    void open_trace(const std::string& filename);

    /// Flush and close the VCD trace, if open.
    void close_trace();

    /// Write the DIAG summary (cycles, command counts, violations).
    void print_summary(std::ostream& os) const;

    DfiController& controller() {
        return controller_;
    }
    const DfiController& controller() const {
        return controller_;
    }

    PhyModel& phy() {
        return phy_;
    }
    const PhyModel& phy() const {
        return phy_;
    }

    uint64_t cycle() const {
        return controller_.cycle();
    }

private:
    bool wait_idle(uint64_t& budget);

    DfiController controller_;
    PhyModel phy_;
    ControllerInputs inputs_;
    std::unique_ptr<VcdWriter> trace_;
};

} // namespace ddr_dfi
